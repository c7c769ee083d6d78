// SPDX-License-Identifier: MIT

#include "qthought/state_vector.hpp"
#include "qthought/errors.hpp"
#include <algorithm>
#include <cmath>
#ifdef QTH_OPENMP
#include <omp.h>
#endif

namespace qth {

static constexpr std::size_t kMaxQubits = 30;

StateVector::StateVector(std::size_t n) : n_(n) {
  if (n > kMaxQubits)
    throw DimensionError("State of " + std::to_string(n) + " qubits exceeds the supported " + std::to_string(kMaxQubits));
  amp_.assign(std::size_t(1) << n, c64{0.0, 0.0});
  amp_[0] = {1.0, 0.0};
}

void StateVector::normalize_() {
  double norm2 = 0.0, c=0.0; for (auto& a : amp_) { double y = std::norm(a) - c; double t = norm2 + y; c = (t - norm2) - y; norm2 = t; }
  double inv = 1.0 / std::sqrt(norm2);
  for (auto& a : amp_) a *= inv;
}

bool StateVector::set_amplitudes(const vec_c64& amps, double tol) {
  if (amps.size() != amp_.size()) return false;
  double norm2 = 0.0;
  for (auto& a : amps) norm2 += std::norm(a);
  if (std::sqrt(norm2) < tol) return false;
  amp_ = amps;
  normalize_();
  return true;
}

void StateVector::reset() {
  std::fill(amp_.begin(), amp_.end(), c64{0.0, 0.0});
  amp_[0] = {1.0, 0.0};
  applied_ = 0;
}

static std::size_t mask_of(const std::vector<std::size_t>& bits, std::size_t n, std::size_t& seen) {
  std::size_t m = 0;
  for (auto b : bits) {
    if (b >= n) throw DimensionError("Bit " + std::to_string(b) + " out of range for " + std::to_string(n) + " qubits");
    std::size_t bm = std::size_t(1) << b;
    if (seen & bm) throw DimensionError("Bit " + std::to_string(b) + " used twice in one operation");
    seen |= bm;
    m |= bm;
  }
  return m;
}

void StateVector::apply(const Operation& op, const std::vector<std::size_t>& targets,
                        const std::vector<std::size_t>& controls) {
  if (targets.size() != op.arity())
    throw DimensionError("Operation '" + op.name() + "' expects " + std::to_string(op.arity()) +
                         " target bits, got " + std::to_string(targets.size()));
  std::size_t seen = 0;
  const std::size_t tm = mask_of(targets, n_, seen);
  const std::size_t cm = mask_of(controls, n_, seen);
  const std::size_t N = amp_.size();
  const std::size_t d = op.dimension();

  // offs[k]: basis offset that writes local index k onto the target bits
  std::vector<std::size_t> offs(op.kind() == Operation::Kind::Matrix ? d : 0, 0);
  for (std::size_t k = 0; k < offs.size(); ++k)
    for (std::size_t j = 0; j < targets.size(); ++j)
      if ((k >> j) & 1) offs[k] |= std::size_t(1) << targets[j];

  if (op.kind() == Operation::Kind::Matrix) {
    const auto& M = op.matrix();
#ifdef QTH_OPENMP
#pragma omp parallel
#endif
    {
      vec_c64 in(d), out(d);
#ifdef QTH_OPENMP
#pragma omp for schedule(static)
#endif
      for (std::size_t i = 0; i < N; ++i) {
        if ((i & tm) != 0 || (i & cm) != cm) continue;
        for (std::size_t k = 0; k < d; ++k) in[k] = amp_[i | offs[k]];
        for (std::size_t r = 0; r < d; ++r) {
          c64 acc{0.0, 0.0};
          for (std::size_t k = 0; k < d; ++k) acc += M[r*d + k] * in[k];
          out[r] = acc;
        }
        for (std::size_t k = 0; k < d; ++k) amp_[i | offs[k]] = out[k];
      }
    }
    if ((++applied_ & 255) == 0) normalize_();
  } else {
    vec_c64 next(N, c64{0.0, 0.0});
#ifdef QTH_OPENMP
#pragma omp parallel for schedule(static)
#endif
    for (std::size_t i = 0; i < N; ++i) {
      if ((i & cm) != cm) { next[i] = amp_[i]; continue; }
      Value local = extract_bits(i, targets);
      Value image = op.map(local);
      std::size_t j = i & ~tm;
      for (std::size_t t = 0; t < targets.size(); ++t)
        if ((image >> t) & 1) j |= std::size_t(1) << targets[t];
      next[j] = amp_[i];
    }
    amp_.swap(next);
  }
}

double StateVector::norm() const {
  double norm2 = 0.0;
  for (auto& a : amp_) norm2 += std::norm(a);
  return std::sqrt(norm2);
}

double StateVector::probability_of_basis(std::size_t basis_index) const {
  return std::norm(amp_.at(basis_index));
}

double StateVector::probability(const std::vector<std::size_t>& bits, Value value) const {
  double p = 0.0;
  for (std::size_t i = 0; i < amp_.size(); ++i)
    if (extract_bits(i, bits) == value) p += std::norm(amp_[i]);
  return p;
}

std::vector<double> StateVector::distribution(const std::vector<std::size_t>& bits) const {
  std::vector<double> p(std::size_t(1) << bits.size(), 0.0);
  for (std::size_t i = 0; i < amp_.size(); ++i) p[extract_bits(i, bits)] += std::norm(amp_[i]);
  return p;
}

double StateVector::project(const std::vector<std::size_t>& bits, Value value, double tol) {
  double kept = 0.0;
  for (std::size_t i = 0; i < amp_.size(); ++i) {
    if (extract_bits(i, bits) == value) kept += std::norm(amp_[i]);
    else amp_[i] = {0.0, 0.0};
  }
  if (std::sqrt(kept) >= tol) normalize_();
  return kept;
}

Value StateVector::measure(const std::vector<std::size_t>& bits, Rng& rng, double tol) {
  auto p = distribution(bits);
  // Cumulative distribution; fall back to the last supported value on round-off
  double r = rng.uniform();
  double acc = 0.0;
  Value idx = 0;
  for (std::size_t v = 0; v < p.size(); ++v) {
    if (std::sqrt(p[v]) < tol) continue;
    idx = v;
    acc += p[v];
    if (r <= acc) break;
  }
  project(bits, idx, tol);
  return idx;
}

} // namespace qth
