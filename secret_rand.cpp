// Draws the secret number with a generator that is consistent across
// operating systems, so a given seed always picks the same secret.

#include <limits>
#include <random>
#include <stdexcept>
#include <string>

#include "secret_rand.hpp"

namespace SecretRand {

// xorshift never leaves 0, so 0 can't be a seed.
generator::generator(uint64_t seed) : state(seed ? seed : 1) {}

uint64_t generator::next() {
  state ^= state << 13;
  state ^= state >> 7;
  state ^= state << 17;
  return state;
}

int generator::between(int min, int max) {
  if (min > max) {
    throw std::invalid_argument("empty range [" + std::to_string(min) + ", " +
                                std::to_string(max) + "]");
  }
  // At most 2^32.
  const uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(max) - min) + 1;
  // next() - 1 takes each of the 2^64 - 1 values in [0, top) exactly once per
  // period.  Values at or above limit would favor the low residues.
  const uint64_t top = std::numeric_limits<uint64_t>::max();
  const uint64_t limit = top - top % span;
  uint64_t draw;
  do {
    draw = next() - 1;
  } while (draw >= limit);
  return static_cast<int>(static_cast<int64_t>(min) + static_cast<int64_t>(draw % span));
}

uint64_t random_seed() {
  std::random_device device;
  const uint64_t high = device();
  return (high << 32) | device();
}

} // namespace SecretRand
