#include "cancellation.h"

#include "absl/time/time.h"

namespace Taskfold {

void CancellationToken::Cancel() {
    absl::MutexLock lock(&mu_);
    cancelled_ = true;
}

bool CancellationToken::IsCancelled() const {
    absl::MutexLock lock(&mu_);
    return cancelled_;
}

bool CancellationToken::SleepFor(std::chrono::milliseconds duration) const {
    absl::MutexLock lock(&mu_);
    if (duration.count() <= 0) {
        return !cancelled_;
    }
    // AwaitWithTimeout returns true when the condition became true, i.e. cancelled.
    return !mu_.AwaitWithTimeout(absl::Condition(&cancelled_), absl::FromChrono(duration));
}

} // namespace Taskfold
