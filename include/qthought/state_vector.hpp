// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "random.hpp"
#include "operation.hpp"
#include <vector>

namespace qth {

// Amplitudes over n bits, bit 0 = LSB of the basis index. Bit lists passed
// to the methods below are read LSB first: bits[j] holds bit j of the value.
class StateVector {
  std::size_t n_;
  vec_c64 amp_;
  std::size_t applied_ = 0;
  void normalize_();

public:
  explicit StateVector(std::size_t n);
  std::size_t num_qubits() const { return n_; }
  std::size_t dimension() const { return amp_.size(); }
  const vec_c64& amplitudes() const { return amp_; }

  // Replaces all amplitudes; the vector is renormalized. Returns false if it
  // has the wrong size or zero norm (state left untouched).
  bool set_amplitudes(const vec_c64& amps, double tol = kDefaultTolerance);
  void reset();

  // Applies `op` to `targets`, acting as identity wherever any control bit is 0.
  void apply(const Operation& op, const std::vector<std::size_t>& targets,
             const std::vector<std::size_t>& controls = {});

  double norm() const;
  double probability_of_basis(std::size_t basis_index) const;
  double probability(const std::vector<std::size_t>& bits, Value value) const;
  // Marginal distribution of the value held on `bits` (size 2^bits.size()).
  std::vector<double> distribution(const std::vector<std::size_t>& bits) const;

  // Zeroes every amplitude where `bits` does not hold `value`. Returns the
  // probability mass that was kept; renormalizes unless it is below tol^2.
  double project(const std::vector<std::size_t>& bits, Value value, double tol = kDefaultTolerance);

  // Samples a value of `bits` by the Born rule and collapses onto it.
  Value measure(const std::vector<std::size_t>& bits, Rng& rng, double tol = kDefaultTolerance);
};

// Value held on `bits` in basis state `index`.
inline Value extract_bits(std::size_t index, const std::vector<std::size_t>& bits) {
  Value v = 0;
  for (std::size_t j = 0; j < bits.size(); ++j) v |= Value((index >> bits[j]) & 1) << j;
  return v;
}

} // namespace qth
