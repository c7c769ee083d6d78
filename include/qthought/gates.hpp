// SPDX-License-Identifier: MIT

#pragma once
#include "operation.hpp"
#include <cmath>

namespace qth::gates {

inline Operation one_qubit(const char* name, c64 u00, c64 u01, c64 u10, c64 u11) {
  return Operation::from_matrix(1, {u00, u01, u10, u11}, name);
}

inline Operation X() { return one_qubit("X", {0,0}, {1,0}, {1,0}, {0,0}); }
inline Operation Y() { return one_qubit("Y", {0,0}, {0,-1}, {0,1}, {0,0}); }
inline Operation Z() { return one_qubit("Z", {1,0}, {0,0}, {0,0}, {-1,0}); }
inline Operation S() { return one_qubit("S", {1,0}, {0,0}, {0,0}, {0,1}); } // diag(1, i)

inline Operation H() {
  double s = 1.0/std::sqrt(2.0);
  return one_qubit("H", {s,0}, {s,0}, {s,0}, {-s,0});
}

inline Operation RX(double theta) {
  double c = std::cos(theta/2.0);
  double s = std::sin(theta/2.0);
  return one_qubit("RX", {c,0}, {0,-s}, {0,-s}, {c,0});
}
inline Operation RY(double theta) {
  double c = std::cos(theta/2.0);
  double s = std::sin(theta/2.0);
  return one_qubit("RY", {c,0}, {-s,0}, {s,0}, {c,0});
}
inline Operation RZ(double theta) {
  // diag(e^{-iθ/2}, e^{iθ/2})
  double half = theta/2.0;
  return one_qubit("RZ", {std::cos(-half), std::sin(-half)}, {0,0}, {0,0}, {std::cos(half), std::sin(half)});
}

// (a, b) -> (a, b + a mod 2^b_width). Target order: a first (low bits), then b.
Operation modular_add(std::size_t a_width, std::size_t b_width);

} // namespace qth::gates
