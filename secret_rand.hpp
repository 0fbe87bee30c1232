// Draws the secret number with a generator that is consistent across
// operating systems, so a given seed always picks the same secret.

#pragma once

#include <cstdint>

namespace SecretRand {

// xorshift64.  The full 64 bit state comes out of every draw, so a single
// draw covers any span of int.
class generator {
 public:
  explicit generator(uint64_t seed);
  uint64_t next();
  // Uniform in [min, max], both inclusive.  Throws std::invalid_argument if
  // min > max.
  int between(int min, int max);
 private:
  uint64_t state;
};

// A seed that differs from run to run.  Throws std::system_error if the
// platform has no entropy source.
uint64_t random_seed();

} // namespace SecretRand
