#include "work_item.h"

namespace Taskfold {

std::vector<WorkItem> MakeBatch(int num_tasks, const std::string& payload_prefix) {
    std::vector<WorkItem> batch;
    if (num_tasks <= 0) {
        return batch;
    }
    batch.reserve(static_cast<size_t>(num_tasks));
    for (int id = 1; id <= num_tasks; ++id) {
        batch.emplace_back(id, payload_prefix + std::to_string(id));
    }
    return batch;
}

} // namespace Taskfold
