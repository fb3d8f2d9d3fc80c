#include "worker.h"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace Taskfold {

const char* WorkerEventName(WorkerEvent event) {
	switch (event) {
		case WorkerEvent::kStarted: return "STARTED";
		case WorkerEvent::kPicked: return "PICKED";
		case WorkerEvent::kCompleted: return "COMPLETED";
		case WorkerEvent::kFinished: return "FINISHED";
		case WorkerEvent::kError: return "ERROR";
	}
	return "UNKNOWN";
}

const char* WorkerStateName(WorkerState state) {
	switch (state) {
		case WorkerState::kCompleted: return "completed";
		case WorkerState::kCancelled: return "cancelled";
		case WorkerState::kSinkClosed: return "sink_closed";
		case WorkerState::kFailed: return "failed";
	}
	return "unknown";
}

void LogWorkerEvent(int worker_id, WorkerEvent event, int task_id, const std::string& message) {
	std::string line = "Worker-" + std::to_string(worker_id) + " " + WorkerEventName(event);
	if (task_id > 0) {
		line += " Task-" + std::to_string(task_id);
	}
	if (!message.empty()) {
		line += ": " + message;
	}

	switch (event) {
		case WorkerEvent::kError:
			LOG(ERROR) << line;
			break;
		case WorkerEvent::kPicked:
		case WorkerEvent::kCompleted:
			VLOG(1) << line;
			break;
		default:
			LOG(INFO) << line;
			break;
	}
}

Worker::Worker(int worker_id, WorkQueue* queue, ResultSink* sink,
               std::unique_ptr<IDelaySource> delay, const CancellationToken* cancel)
	: worker_id_(worker_id),
	  queue_(queue),
	  sink_(sink),
	  delay_(std::move(delay)),
	  cancel_(cancel) {
	if (queue_ == nullptr || sink_ == nullptr || delay_ == nullptr || cancel_ == nullptr) {
		throw std::invalid_argument("Worker-" + std::to_string(worker_id) + ": missing collaborator");
	}
}

WorkerOutcome Worker::Run() {
	WorkerOutcome outcome;
	outcome.worker_id = worker_id_;
	LogWorkerEvent(worker_id_, WorkerEvent::kStarted);

	// Task currently held by this worker, 0 when none
	int held_task = 0;
	try {
		while (true) {
			if (cancel_->IsCancelled()) {
				outcome.state = WorkerState::kCancelled;
				break;
			}

			std::optional<WorkItem> item = queue_->TryDequeue();
			if (!item.has_value()) {
				outcome.state = WorkerState::kCompleted;
				break;
			}
			held_task = item->id();
			++outcome.items_picked;
			LogWorkerEvent(worker_id_, WorkerEvent::kPicked, held_task);

			if (!cancel_->SleepFor(delay_->Next())) {
				++outcome.records_lost;
				outcome.state = WorkerState::kCancelled;
				LOG(WARNING) << "Worker-" << worker_id_ << " interrupted while processing Task-" << held_task;
				held_task = 0;
				break;
			}

			ResultRecord record;
			record.timestamp = std::chrono::system_clock::now();
			record.worker_id = worker_id_;
			record.task_id = item->id();
			record.payload = item->payload();

			if (!sink_->Accept(std::move(record))) {
				++outcome.records_lost;
				outcome.state = WorkerState::kSinkClosed;
				outcome.error = "result sink refused Task-" + std::to_string(held_task);
				LogWorkerEvent(worker_id_, WorkerEvent::kError, held_task, "result sink is closed");
				held_task = 0;
				break;
			}
			++outcome.records_produced;
			LogWorkerEvent(worker_id_, WorkerEvent::kCompleted, held_task);
			held_task = 0;
		}
	} catch (const std::exception& e) {
		if (held_task != 0) {
			++outcome.records_lost;
		}
		outcome.state = WorkerState::kFailed;
		outcome.error = e.what();
		LogWorkerEvent(worker_id_, WorkerEvent::kError, held_task, std::string("unexpected failure: ") + e.what());
	} catch (...) {
		if (held_task != 0) {
			++outcome.records_lost;
		}
		outcome.state = WorkerState::kFailed;
		outcome.error = "unknown exception";
		LogWorkerEvent(worker_id_, WorkerEvent::kError, held_task, "unexpected failure: unknown exception");
	}

	LogWorkerEvent(worker_id_, WorkerEvent::kFinished, 0, WorkerStateName(outcome.state));
	return outcome;
}

} // namespace Taskfold
