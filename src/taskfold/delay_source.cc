#include "delay_source.h"

#include <stdexcept>
#include <string>

namespace Taskfold {

UniformDelaySource::UniformDelaySource(int min_ms, int max_ms, uint64_t seed)
    : rng_(seed) {
    if (min_ms < 0 || max_ms <= min_ms) {
        throw std::invalid_argument("UniformDelaySource: invalid range [" +
                                    std::to_string(min_ms) + ", " + std::to_string(max_ms) + ")");
    }
    dist_ = std::uniform_int_distribution<int>(min_ms, max_ms - 1);
}

std::chrono::milliseconds UniformDelaySource::Next() {
    return std::chrono::milliseconds(dist_(rng_));
}

} // namespace Taskfold
