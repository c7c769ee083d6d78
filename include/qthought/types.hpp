// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <cstdint>

namespace qth {
#ifdef QTH_FP32
  using c64 = std::complex<float>;
#else
  using c64 = std::complex<double>;
#endif
  using vec_c64 = std::vector<c64>;

  // Classical value of a register (bit pattern, first bit = LSB).
  using Value = std::uint64_t;

  inline constexpr double kDefaultTolerance = 1e-9;
}
