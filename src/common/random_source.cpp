
#include "random_source.hpp"
#include <sodium.h>
#include <stdexcept>

namespace blockview {

RandomSource::RandomSource() {
  if (sodium_init() < 0)
    throw std::runtime_error("libsodium initialization failed");
}

RandomSource &RandomSource::instance() {
  static RandomSource inst;
  return inst;
}

uint32_t RandomSource::uniform(uint32_t upper_bound) {
  if (upper_bound == 0)
    throw std::invalid_argument("uniform: upper_bound must be non-zero");
  return randombytes_uniform(upper_bound);
}

} // namespace blockview
