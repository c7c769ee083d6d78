// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace qth {

// A unitary acting on `arity` target bits. Either a dense 2^k x 2^k matrix
// (row-major, target bit j is bit j of the local index) or a classical
// reversible map on local indices.
class Operation {
public:
  enum class Kind { Matrix, Permutation };
  using IndexMap = std::function<Value(Value)>;

  static Operation from_matrix(std::size_t arity, std::vector<c64> matrix, std::string name = "U");
  // `table[i]` is the image of local index i; must be a bijection.
  static Operation from_table(std::size_t arity, const std::vector<Value>& table, std::string name = "P");
  // `forward` and `inverse` must be mutually inverse bijections on [0, 2^arity).
  static Operation from_map(std::size_t arity, IndexMap forward, IndexMap inverse, std::string name = "P");

  Kind kind() const { return kind_; }
  std::size_t arity() const { return arity_; }
  std::size_t dimension() const { return std::size_t(1) << arity_; }
  const std::string& name() const { return name_; }

  const std::vector<c64>& matrix() const { return matrix_; }
  Value map(Value local) const { return forward_(local); }

  Operation adjoint() const;

private:
  Operation() = default;
  Kind kind_ = Kind::Matrix;
  std::size_t arity_ = 0;
  std::string name_;
  std::vector<c64> matrix_;
  IndexMap forward_;
  IndexMap inverse_;
};

} // namespace qth
