#ifndef TASKFOLD_DELAY_SOURCE_H_
#define TASKFOLD_DELAY_SOURCE_H_

#include <chrono>
#include <cstdint>
#include <random>

namespace Taskfold {

/**
 * Produces the simulated processing time for one work item.
 * Implementations must be bounded and must not block.
 */
class IDelaySource {
public:
    virtual ~IDelaySource() = default;
    virtual std::chrono::milliseconds Next() = 0;
};

// Uniform in [min_ms, max_ms). One instance per worker; not thread-safe.
class UniformDelaySource : public IDelaySource {
public:
    UniformDelaySource(int min_ms, int max_ms, uint64_t seed);
    std::chrono::milliseconds Next() override;

private:
    std::mt19937_64 rng_;
    std::uniform_int_distribution<int> dist_;
};

class FixedDelaySource : public IDelaySource {
public:
    explicit FixedDelaySource(std::chrono::milliseconds delay) : delay_(delay) {}
    std::chrono::milliseconds Next() override { return delay_; }

private:
    std::chrono::milliseconds delay_;
};

} // namespace Taskfold

#endif // TASKFOLD_DELAY_SOURCE_H_
