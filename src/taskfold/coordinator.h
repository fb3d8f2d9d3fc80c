#ifndef TASKFOLD_COORDINATOR_H_
#define TASKFOLD_COORDINATOR_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "cancellation.h"
#include "delay_source.h"
#include "output_resource.h"
#include "result_sink.h"
#include "work_item.h"
#include "work_queue.h"
#include "worker.h"

namespace Taskfold {

using OutputFactory = std::function<std::unique_ptr<IOutputResource>()>;
using DelaySourceFactory = std::function<std::unique_ptr<IDelaySource>(int worker_id)>;

// Uniform delays in [min_ms, max_ms), seeded independently per worker.
DelaySourceFactory MakeUniformDelayFactory(int min_ms, int max_ms);

struct CoordinatorOptions {
    int num_workers = 4;
    // Bound on the wait for workers before they are cancelled. Zero waits forever.
    std::chrono::milliseconds worker_timeout{20000};
    size_t sink_channel_capacity = 64;
    bool flush_every_record = false;
};

enum class CoordinatorState { kInit, kLoading, kRunning, kDraining, kClosed };

const char* CoordinatorStateName(CoordinatorState state);

/**
 * Outcome of one run, as seen after the sink has closed.
 */
struct RunReport {
    size_t items_loaded = 0;
    size_t items_dequeued = 0;
    // Still in the queue when the run closed (cancellation).
    size_t items_not_processed = 0;
    // Records accepted by the sink.
    size_t records_produced = 0;
    size_t records_written = 0;
    // Dequeued items whose record never reached the output.
    size_t records_lost = 0;
    size_t records_discarded = 0;
    size_t write_failures = 0;

    int workers_started = 0;
    int workers_failed = 0;
    int workers_cancelled = 0;

    bool resource_unavailable = false;
    bool timed_out = false;
    bool cancelled = false;

    std::vector<WorkerOutcome> worker_outcomes;

    // Every loaded item produced a written line.
    bool Complete() const;
    // One line per failure kind observed during the run.
    std::vector<std::string> Diagnostics() const;
};

void LogRunReport(const RunReport& report);

/**
 * Drives a single run through INIT -> LOADING -> RUNNING -> DRAINING -> CLOSED.
 *
 * The sink is started before any worker and finished only after every worker
 * has reached a terminal state, so the output is never closed under a
 * pending write. Run() may be called once.
 */
class Coordinator {
public:
    Coordinator(CoordinatorOptions options, OutputFactory output_factory,
                DelaySourceFactory delay_factory);

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    RunReport Run(std::vector<WorkItem> batch);

    // Thread-safe. Workers stop at their next check or delay.
    void RequestCancel();

    CoordinatorState state() const { return state_.load(std::memory_order_acquire); }
    const WorkQueue& queue() const { return queue_; }

private:
    void SetState(CoordinatorState state);
    std::unique_ptr<IOutputResource> AcquireOutput();

    const CoordinatorOptions options_;
    OutputFactory output_factory_;
    DelaySourceFactory delay_factory_;

    WorkQueue queue_;
    ResultSink sink_;
    CancellationToken cancel_;

    std::atomic<CoordinatorState> state_{CoordinatorState::kInit};
    std::atomic<bool> ran_{false};
};

} // namespace Taskfold

#endif // TASKFOLD_COORDINATOR_H_
