// SPDX-License-Identifier: MIT

#pragma once
#include <random>
#include <cstdint>

namespace qth {
// Source of measurement randomness; one per quantum system.
class Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> dist;
public:
  explicit Rng(uint64_t seed) : gen(seed), dist(0.0, 1.0) {}
  double uniform() { return dist(gen); }
  // Raw 64-bit draw, used to derive seeds for independent runs.
  uint64_t next_seed() { return gen(); }
  void reseed(uint64_t seed) { gen.seed(seed); dist.reset(); }
};
}
