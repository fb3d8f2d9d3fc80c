#ifndef TASKFOLD_WORK_ITEM_H_
#define TASKFOLD_WORK_ITEM_H_

#include <string>
#include <utility>
#include <vector>

namespace Taskfold {

/**
 * One unit of work. Immutable once constructed, so any worker may read it
 * without synchronization.
 */
class WorkItem {
public:
    WorkItem(int id, std::string payload)
        : id_(id), payload_(std::move(payload)) {}

    int id() const { return id_; }
    const std::string& payload() const { return payload_; }

private:
    int id_;
    std::string payload_;
};

/**
 * Builds the fixed batch for a run: ids 1..num_tasks, payload "<prefix><id>".
 */
std::vector<WorkItem> MakeBatch(int num_tasks, const std::string& payload_prefix = "data-");

} // namespace Taskfold

#endif // TASKFOLD_WORK_ITEM_H_
