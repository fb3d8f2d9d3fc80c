#ifndef TASKFOLD_RESULT_SINK_H_
#define TASKFOLD_RESULT_SINK_H_

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "folly/MPMCQueue.h"

#include "output_resource.h"
#include "result_record.h"

namespace Taskfold {

struct SinkStats {
    size_t accepted = 0;
    size_t written = 0;
    // Accepted while the output resource was unavailable.
    size_t discarded = 0;
    size_t write_failures = 0;
    bool resource_available = false;
};

/**
 * Sole owner of the output resource.
 *
 * Producers hand records to Accept(), which places them on a bounded
 * folly::MPMCQueue. A single writer thread drains the queue and writes each
 * record as one whole line, so lines from different workers never interleave.
 * std::nullopt on the queue marks end of stream.
 *
 * Lifecycle: Start() once, Accept() from any number of threads, Finish() once
 * every producer is done. If the output cannot be opened the sink still runs
 * and discards records, so producers never block on it forever.
 */
class ResultSink {
public:
    /**
     * @param channel_capacity Records buffered between producers and the writer (>= 1)
     * @param flush_every_record Flush the output after every line instead of once at Finish()
     */
    explicit ResultSink(size_t channel_capacity = 64, bool flush_every_record = false);
    ~ResultSink();

    ResultSink(const ResultSink&) = delete;
    ResultSink& operator=(const ResultSink&) = delete;

    /**
     * Takes ownership of the output, opens it and starts the writer thread.
     * @return true if the output was acquired; false means records will be discarded
     */
    bool Start(std::unique_ptr<IOutputResource> output);

    /**
     * Queues one record for the writer. May block while the channel is full.
     * @return false if the sink is not running (not started, or Finish() has begun)
     */
    bool Accept(ResultRecord record);

    /**
     * Stops admission, waits for in-flight Accept() calls, drains the channel,
     * then flushes and closes the output. Later calls return once the first
     * one has completed.
     */
    void Finish();

    bool IsRunning() const;
    SinkStats GetStats() const;

private:
    enum class State { kIdle, kRunning, kFinishing, kFinished };

    void WriterThread();
    void WriteRecord(const ResultRecord& record);
    void ReleaseOutput();

    const bool flush_every_record_;
    folly::MPMCQueue<std::optional<ResultRecord>> channel_;

    // Touched only by the writer thread once Start() has launched it.
    std::unique_ptr<IOutputResource> output_;
    std::thread writer_;

    mutable absl::Mutex mu_;
    State state_ ABSL_GUARDED_BY(mu_) = State::kIdle;
    int pending_accepts_ ABSL_GUARDED_BY(mu_) = 0;

    std::atomic<size_t> accepted_{0};
    std::atomic<size_t> written_{0};
    std::atomic<size_t> discarded_{0};
    std::atomic<size_t> write_failures_{0};
    std::atomic<bool> resource_available_{false};
};

} // namespace Taskfold

#endif // TASKFOLD_RESULT_SINK_H_
