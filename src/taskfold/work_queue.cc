#include "work_queue.h"

#include <utility>

#include <glog/logging.h>

namespace Taskfold {

void WorkQueue::Enqueue(WorkItem item) {
    absl::MutexLock lock(&mu_);
    items_.push_back(std::move(item));
    ++total_enqueued_;
}

void WorkQueue::EnqueueBatch(std::vector<WorkItem> items) {
    absl::MutexLock lock(&mu_);
    for (auto& item : items) {
        items_.push_back(std::move(item));
    }
    total_enqueued_ += items.size();
    VLOG(2) << "[WorkQueue]: loaded " << items.size() << " items, depth=" << items_.size();
}

std::optional<WorkItem> WorkQueue::TryDequeue() {
    absl::MutexLock lock(&mu_);
    if (items_.empty()) {
        return std::nullopt;
    }
    std::optional<WorkItem> head(std::move(items_.front()));
    items_.pop_front();
    ++total_dequeued_;
    return head;
}

size_t WorkQueue::Size() const {
    absl::MutexLock lock(&mu_);
    return items_.size();
}

size_t WorkQueue::TotalEnqueued() const {
    absl::MutexLock lock(&mu_);
    return total_enqueued_;
}

size_t WorkQueue::TotalDequeued() const {
    absl::MutexLock lock(&mu_);
    return total_dequeued_;
}

} // namespace Taskfold
