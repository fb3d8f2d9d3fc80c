#ifndef TASKFOLD_WORKER_H_
#define TASKFOLD_WORKER_H_

#include <cstddef>
#include <memory>
#include <string>

#include "cancellation.h"
#include "delay_source.h"
#include "result_sink.h"
#include "work_queue.h"

namespace Taskfold {

// Events written to the log for each worker. Advisory only.
enum class WorkerEvent { kStarted, kPicked, kCompleted, kFinished, kError };

const char* WorkerEventName(WorkerEvent event);

/**
 * Logs one worker event. task_id <= 0 means the event is not tied to a task.
 */
void LogWorkerEvent(int worker_id, WorkerEvent event, int task_id = 0,
                    const std::string& message = "");

enum class WorkerState {
    kCompleted,   // queue drained
    kCancelled,   // cancellation token observed
    kSinkClosed,  // ResultSink refused a record
    kFailed       // unexpected exception
};

const char* WorkerStateName(WorkerState state);

struct WorkerOutcome {
    int worker_id = 0;
    WorkerState state = WorkerState::kCompleted;
    size_t items_picked = 0;
    size_t records_produced = 0;
    // Picked but never accepted by the sink.
    size_t records_lost = 0;
    std::string error;
};

/**
 * Pulls items from the WorkQueue until it is empty, simulates processing for
 * each and hands the resulting record to the ResultSink.
 *
 * Queue and sink are not owned and must outlive Run(). The worker never holds
 * the queue lock while sleeping or while handing a record to the sink.
 */
class Worker {
public:
    Worker(int worker_id, WorkQueue* queue, ResultSink* sink,
           std::unique_ptr<IDelaySource> delay, const CancellationToken* cancel);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * Runs the loop to a terminal state. Never throws; failures are reported
     * in the returned outcome.
     */
    WorkerOutcome Run();

    int id() const { return worker_id_; }

private:
    const int worker_id_;
    WorkQueue* queue_;
    ResultSink* sink_;
    std::unique_ptr<IDelaySource> delay_;
    const CancellationToken* cancel_;
};

} // namespace Taskfold

#endif // TASKFOLD_WORKER_H_
