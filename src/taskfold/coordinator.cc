#include "coordinator.h"

#include <future>
#include <random>
#include <stdexcept>
#include <thread>
#include <utility>

#include <glog/logging.h>

namespace Taskfold {

DelaySourceFactory MakeUniformDelayFactory(int min_ms, int max_ms) {
	uint64_t base_seed = std::random_device{}();
	return [min_ms, max_ms, base_seed](int worker_id) -> std::unique_ptr<IDelaySource> {
		return std::make_unique<UniformDelaySource>(min_ms, max_ms,
		                                            base_seed + static_cast<uint64_t>(worker_id));
	};
}

const char* CoordinatorStateName(CoordinatorState state) {
	switch (state) {
		case CoordinatorState::kInit: return "INIT";
		case CoordinatorState::kLoading: return "LOADING";
		case CoordinatorState::kRunning: return "RUNNING";
		case CoordinatorState::kDraining: return "DRAINING";
		case CoordinatorState::kClosed: return "CLOSED";
	}
	return "UNKNOWN";
}

bool RunReport::Complete() const {
	return records_written == items_loaded && records_lost == 0 && items_not_processed == 0;
}

std::vector<std::string> RunReport::Diagnostics() const {
	std::vector<std::string> diagnostics;
	if (resource_unavailable) {
		diagnostics.push_back("ResourceUnavailable: output could not be opened, " +
		                      std::to_string(records_discarded) + " records discarded");
	}
	if (write_failures > 0) {
		diagnostics.push_back("WriteFailure: " + std::to_string(write_failures) + " records failed to write");
	}
	if (timed_out) {
		diagnostics.push_back("Timeout: workers did not finish in time and were cancelled");
	} else if (cancelled) {
		diagnostics.push_back("Cancelled: run was cancelled before the queue drained");
	}
	if (items_not_processed > 0) {
		diagnostics.push_back("NotProcessed: " + std::to_string(items_not_processed) +
		                      " items were never dequeued");
	}
	for (const WorkerOutcome& outcome : worker_outcomes) {
		if (outcome.state == WorkerState::kFailed || outcome.state == WorkerState::kSinkClosed) {
			diagnostics.push_back("Worker-" + std::to_string(outcome.worker_id) + " " +
			                      WorkerStateName(outcome.state) + ": " + outcome.error);
		}
	}
	if (workers_started == 0 && workers_failed > 0) {
		diagnostics.push_back("UnexpectedWorkerFailure: no worker thread could be started");
	}
	return diagnostics;
}

void LogRunReport(const RunReport& report) {
	LOG(INFO) << "Items loaded: " << report.items_loaded;
	LOG(INFO) << "Items dequeued: " << report.items_dequeued;
	LOG(INFO) << "Records produced: " << report.records_produced;
	LOG(INFO) << "Records written: " << report.records_written;
	LOG(INFO) << "Records lost to failure: " << report.records_lost;
	LOG(INFO) << "Items not processed: " << report.items_not_processed;
	for (const std::string& line : report.Diagnostics()) {
		LOG(WARNING) << line;
	}
}

Coordinator::Coordinator(CoordinatorOptions options, OutputFactory output_factory,
                         DelaySourceFactory delay_factory)
	: options_(options),
	  output_factory_(std::move(output_factory)),
	  delay_factory_(std::move(delay_factory)),
	  sink_(options.sink_channel_capacity, options.flush_every_record) {
	if (options_.num_workers < 1) {
		throw std::invalid_argument("Coordinator: num_workers must be at least 1");
	}
	if (options_.worker_timeout.count() < 0) {
		throw std::invalid_argument("Coordinator: worker_timeout must not be negative");
	}
	if (!delay_factory_) {
		throw std::invalid_argument("Coordinator: delay factory is required");
	}
}

void Coordinator::SetState(CoordinatorState state) {
	state_.store(state, std::memory_order_release);
	VLOG(1) << "[Coordinator]: " << CoordinatorStateName(state);
}

void Coordinator::RequestCancel() {
	if (!cancel_.IsCancelled()) {
		LOG(WARNING) << "[Coordinator]: cancellation requested, " << queue_.Size() << " items still queued";
	}
	cancel_.Cancel();
}

std::unique_ptr<IOutputResource> Coordinator::AcquireOutput() {
	if (!output_factory_) {
		return nullptr;
	}
	try {
		return output_factory_();
	} catch (const std::exception& e) {
		LOG(ERROR) << "[Coordinator]: failed to create output resource: " << e.what();
		return nullptr;
	}
}

RunReport Coordinator::Run(std::vector<WorkItem> batch) {
	if (ran_.exchange(true)) {
		throw std::logic_error("Coordinator::Run may only be called once");
	}
	RunReport report;

	SetState(CoordinatorState::kLoading);
	report.items_loaded = batch.size();
	queue_.EnqueueBatch(std::move(batch));
	LOG(INFO) << "[Coordinator]: workers=" << options_.num_workers
	          << " items loaded=" << queue_.Size();

	SetState(CoordinatorState::kRunning);
	report.resource_unavailable = !sink_.Start(AcquireOutput());

	std::vector<std::unique_ptr<Worker>> workers;
	std::vector<std::thread> threads;
	std::vector<std::future<WorkerOutcome>> futures;
	for (int id = 1; id <= options_.num_workers; ++id) {
		try {
			// The worker is owned before its thread starts so it outlives the thread
			workers.push_back(std::make_unique<Worker>(id, &queue_, &sink_, delay_factory_(id), &cancel_));
			Worker* w = workers.back().get();
			std::promise<WorkerOutcome> promise;
			futures.push_back(promise.get_future());
			try {
				threads.emplace_back([w, p = std::move(promise)]() mutable {
					p.set_value(w->Run());
				});
			} catch (...) {
				futures.pop_back();
				workers.pop_back();
				throw;
			}
			++report.workers_started;
		} catch (const std::exception& e) {
			++report.workers_failed;
			LogWorkerEvent(id, WorkerEvent::kError, 0, std::string("failed to start: ") + e.what());
		}
	}

	// Phase one: graceful wait, bounded by the deadline if one is set.
	const bool bounded = options_.worker_timeout.count() > 0;
	const auto deadline = std::chrono::steady_clock::now() + options_.worker_timeout;
	for (std::future<WorkerOutcome>& future : futures) {
		if (bounded && !report.timed_out &&
		    future.wait_until(deadline) == std::future_status::timeout) {
			report.timed_out = true;
			LOG(WARNING) << "[Coordinator]: workers still running after "
			             << options_.worker_timeout.count() << " ms, cancelling";
			RequestCancel();
		}
		// Phase two: workers observe the token at their next check.
		WorkerOutcome outcome = future.get();
		report.records_lost += outcome.records_lost;
		if (outcome.state == WorkerState::kFailed || outcome.state == WorkerState::kSinkClosed) {
			++report.workers_failed;
		} else if (outcome.state == WorkerState::kCancelled) {
			++report.workers_cancelled;
		}
		report.worker_outcomes.push_back(std::move(outcome));
	}
	for (std::thread& thread : threads) {
		if (thread.joinable()) {
			thread.join();
		}
	}

	SetState(CoordinatorState::kDraining);
	sink_.Finish();

	SinkStats stats = sink_.GetStats();
	report.records_produced = stats.accepted;
	report.records_written = stats.written;
	report.records_discarded = stats.discarded;
	report.write_failures = stats.write_failures;
	report.records_lost += stats.discarded + stats.write_failures;
	report.items_dequeued = queue_.TotalDequeued();
	report.items_not_processed = queue_.Size();
	report.cancelled = cancel_.IsCancelled();

	SetState(CoordinatorState::kClosed);
	return report;
}

} // namespace Taskfold
