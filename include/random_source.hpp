#pragma once
#include <cstdint>

namespace blockview {

// Process-wide uniform random source backed by libsodium's generator, which
// is safe to call from any thread.
class RandomSource {
public:
    static RandomSource& instance();
    // Uniform in [0, upper_bound); upper_bound must be non-zero.
    uint32_t uniform(uint32_t upper_bound);
private:
    RandomSource();
};

} // namespace blockview
