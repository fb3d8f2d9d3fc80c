#ifndef TASKFOLD_WORK_QUEUE_H_
#define TASKFOLD_WORK_QUEUE_H_

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "work_item.h"

namespace Taskfold {

/**
 * FIFO of WorkItem shared by every worker.
 *
 * All operations run under one absl::Mutex and none of them blocks waiting
 * for items: an empty queue is reported through an empty optional, which
 * workers treat as their normal stop signal.
 */
class WorkQueue {
public:
    WorkQueue() = default;
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void Enqueue(WorkItem item);
    void EnqueueBatch(std::vector<WorkItem> items);

    /**
     * Removes and returns the head item.
     * @return std::nullopt when no items remain
     *
     * Thread-safe. Never blocks on an empty queue and never throws on one.
     */
    std::optional<WorkItem> TryDequeue();

    // Snapshot for logging and reporting. Not consistent with a following TryDequeue().
    size_t Size() const;

    size_t TotalEnqueued() const;
    size_t TotalDequeued() const;

private:
    mutable absl::Mutex mu_;
    std::deque<WorkItem> items_ ABSL_GUARDED_BY(mu_);
    size_t total_enqueued_ ABSL_GUARDED_BY(mu_) = 0;
    size_t total_dequeued_ ABSL_GUARDED_BY(mu_) = 0;
};

} // namespace Taskfold

#endif // TASKFOLD_WORK_QUEUE_H_
