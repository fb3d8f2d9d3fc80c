#ifndef TASKFOLD_CANCELLATION_H_
#define TASKFOLD_CANCELLATION_H_

#include <chrono>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace Taskfold {

/**
 * One-way cancellation flag shared by the coordinator and its workers.
 * SleepFor() lets a worker wait out its processing delay while still
 * waking up as soon as Cancel() is called.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void Cancel();
    bool IsCancelled() const;

    /**
     * Waits for the given duration or until cancelled.
     * @return true if the full duration elapsed, false if cancelled
     */
    bool SleepFor(std::chrono::milliseconds duration) const;

private:
    mutable absl::Mutex mu_;
    bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Taskfold

#endif // TASKFOLD_CANCELLATION_H_
