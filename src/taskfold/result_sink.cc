#include "result_sink.h"

#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <glog/logging.h>

namespace Taskfold {

namespace {

size_t CheckedCapacity(size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("ResultSink: channel capacity must be at least 1");
    }
    return capacity;
}

} // namespace

ResultSink::ResultSink(size_t channel_capacity, bool flush_every_record)
    : flush_every_record_(flush_every_record),
      channel_(CheckedCapacity(channel_capacity)) {}

ResultSink::~ResultSink() {
    Finish();
}

bool ResultSink::Start(std::unique_ptr<IOutputResource> output) {
    {
        absl::MutexLock lock(&mu_);
        if (state_ != State::kIdle) {
            LOG(ERROR) << "[ResultSink]: Start() called more than once";
            return false;
        }
    }

    if (output == nullptr) {
        LOG(ERROR) << "[ResultSink]: no output resource, records will be discarded";
    } else if (!output->Open()) {
        LOG(ERROR) << "[ResultSink]: output " << output->Describe()
                   << " unavailable, records will be discarded";
        output.reset();
    } else {
        VLOG(1) << "[ResultSink]: writing to " << output->Describe();
        output_ = std::move(output);
    }
    resource_available_.store(output_ != nullptr, std::memory_order_release);

    try {
        writer_ = std::thread(&ResultSink::WriterThread, this);
    } catch (const std::system_error& e) {
        LOG(ERROR) << "[ResultSink]: failed to start writer thread: " << e.what();
        ReleaseOutput();
        resource_available_.store(false, std::memory_order_release);
        absl::MutexLock lock(&mu_);
        state_ = State::kFinished;
        return false;
    }

    absl::MutexLock lock(&mu_);
    state_ = State::kRunning;
    return resource_available_.load(std::memory_order_acquire);
}

bool ResultSink::Accept(ResultRecord record) {
    {
        absl::MutexLock lock(&mu_);
        if (state_ != State::kRunning) {
            VLOG(1) << "[ResultSink]: rejected Task-" << record.task_id << " from Worker-"
                    << record.worker_id << ", sink not running";
            return false;
        }
        ++pending_accepts_;
    }

    accepted_.fetch_add(1, std::memory_order_relaxed);
    // No lock is held while waiting for channel space.
    channel_.blockingWrite(std::optional<ResultRecord>(std::move(record)));

    absl::MutexLock lock(&mu_);
    --pending_accepts_;
    return true;
}

void ResultSink::Finish() {
    {
        absl::MutexLock lock(&mu_);
        switch (state_) {
            case State::kIdle:
                state_ = State::kFinished;
                return;
            case State::kFinished:
                return;
            case State::kFinishing:
                mu_.Await(absl::Condition(
                    +[](State* s) { return *s == State::kFinished; }, &state_));
                return;
            case State::kRunning:
                break;
        }
        state_ = State::kFinishing;
        mu_.Await(absl::Condition(+[](int* n) { return *n == 0; }, &pending_accepts_));
    }

    channel_.blockingWrite(std::nullopt);
    if (writer_.joinable()) {
        writer_.join();
    }

    SinkStats stats = GetStats();
    LOG(INFO) << "[ResultSink]: closed. accepted=" << stats.accepted
              << " written=" << stats.written
              << " discarded=" << stats.discarded
              << " write_failures=" << stats.write_failures;

    absl::MutexLock lock(&mu_);
    state_ = State::kFinished;
}

bool ResultSink::IsRunning() const {
    absl::MutexLock lock(&mu_);
    return state_ == State::kRunning;
}

SinkStats ResultSink::GetStats() const {
    SinkStats stats;
    stats.accepted = accepted_.load(std::memory_order_relaxed);
    stats.written = written_.load(std::memory_order_relaxed);
    stats.discarded = discarded_.load(std::memory_order_relaxed);
    stats.write_failures = write_failures_.load(std::memory_order_relaxed);
    stats.resource_available = resource_available_.load(std::memory_order_acquire);
    return stats;
}

// Runs until the end-of-stream marker is read
void ResultSink::WriterThread() {
    std::optional<ResultRecord> maybe_record;
    while (true) {
        channel_.blockingRead(maybe_record);
        if (!maybe_record.has_value()) {
            break;
        }
        if (output_ == nullptr) {
            discarded_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        WriteRecord(*maybe_record);
    }
    ReleaseOutput();
    VLOG(2) << "[ResultSink]: writer thread exiting";
}

void ResultSink::WriteRecord(const ResultRecord& record) {
    try {
        std::string line = FormatResultLine(record);
        if (!output_->Write(line.data(), line.size())) {
            write_failures_.fetch_add(1, std::memory_order_relaxed);
            LOG(ERROR) << "[ResultSink]: lost Task-" << record.task_id << " from Worker-"
                       << record.worker_id << ", write failed";
            return;
        }
    } catch (const std::exception& e) {
        write_failures_.fetch_add(1, std::memory_order_relaxed);
        LOG(ERROR) << "[ResultSink]: lost Task-" << record.task_id << ": " << e.what();
        return;
    }
    written_.fetch_add(1, std::memory_order_relaxed);

    if (flush_every_record_ && !output_->Flush()) {
        LOG(WARNING) << "[ResultSink]: flush after Task-" << record.task_id << " failed";
    }
}

void ResultSink::ReleaseOutput() {
    if (output_ == nullptr) {
        return;
    }
    if (!output_->Flush()) {
        LOG(ERROR) << "[ResultSink]: final flush of " << output_->Describe() << " failed";
    }
    if (!output_->Close()) {
        LOG(ERROR) << "[ResultSink]: close of " << output_->Describe() << " failed";
    }
    output_.reset();
}

} // namespace Taskfold
