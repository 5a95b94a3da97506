#pragma once

#include "Defines.hpp"

#include <random>

namespace prism {

// Uniform real generator. Every sampling routine takes one by reference so
// renders can be replayed from a seed.
class Random {
public:
  Random() : generator(std::random_device{}()) {}
  explicit Random(u64 seed) { this->seed(seed); }

  // Returns a random real in [0,1).
  real uniform() { return distribution(generator); }

  // Returns a random real in [min,max).
  real uniform(real min, real max) { return min + (max - min) * uniform(); }

  void seed(u64 value) {
    std::seed_seq sequence{u32(value), u32(value >> 32)};
    generator.seed(sequence);
    distribution.reset();
  }

  // Process-wide instance, seeded from std::random_device.
  static Random &global();

private:
  std::mt19937 generator;
  std::uniform_real_distribution<real> distribution{0.f, 1.f};
};

} // namespace prism
