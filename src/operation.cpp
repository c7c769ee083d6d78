// SPDX-License-Identifier: MIT

#include "qthought/operation.hpp"
#include "qthought/gates.hpp"
#include "qthought/errors.hpp"
#include <cmath>
#include <memory>

namespace qth {

static constexpr std::size_t kMaxArity = 30;

Operation Operation::from_matrix(std::size_t arity, std::vector<c64> matrix, std::string name) {
  if (arity == 0 || arity > 12)
    throw DimensionError("Matrix operation '" + name + "' must act on 1..12 bits, got " + std::to_string(arity));
  const std::size_t d = std::size_t(1) << arity;
  if (matrix.size() != d*d)
    throw DimensionError("Matrix operation '" + name + "' on " + std::to_string(arity) + " bits needs " +
                         std::to_string(d*d) + " entries, got " + std::to_string(matrix.size()));
  Operation op;
  op.kind_ = Kind::Matrix;
  op.arity_ = arity;
  op.name_ = std::move(name);
  op.matrix_ = std::move(matrix);
  return op;
}

Operation Operation::from_table(std::size_t arity, const std::vector<Value>& table, std::string name) {
  if (arity == 0 || arity > 20)
    throw DimensionError("Table operation '" + name + "' must act on 1..20 bits");
  const std::size_t d = std::size_t(1) << arity;
  if (table.size() != d)
    throw DimensionError("Table operation '" + name + "' needs " + std::to_string(d) + " entries");
  auto fwd = std::make_shared<std::vector<Value>>(table);
  auto inv = std::make_shared<std::vector<Value>>(d, d);
  for (std::size_t i = 0; i < d; ++i) {
    Value j = table[i];
    if (j >= d || (*inv)[j] != d)
      throw MalformedError("Table operation '" + name + "' is not a permutation");
    (*inv)[j] = i;
  }
  return from_map(arity, [fwd](Value x){ return (*fwd)[x]; }, [inv](Value x){ return (*inv)[x]; }, std::move(name));
}

Operation Operation::from_map(std::size_t arity, IndexMap forward, IndexMap inverse, std::string name) {
  if (arity == 0 || arity > kMaxArity)
    throw DimensionError("Permutation '" + name + "' must act on 1.." + std::to_string(kMaxArity) + " bits");
  if (!forward || !inverse)
    throw MalformedError("Permutation '" + name + "' needs both directions");
  Operation op;
  op.kind_ = Kind::Permutation;
  op.arity_ = arity;
  op.name_ = std::move(name);
  op.forward_ = std::move(forward);
  op.inverse_ = std::move(inverse);
  return op;
}

Operation Operation::adjoint() const {
  Operation op;
  op.kind_ = kind_;
  op.arity_ = arity_;
  op.name_ = name_.size() > 1 && name_.back() == '+' ? name_.substr(0, name_.size()-1) : name_ + "+";
  if (kind_ == Kind::Matrix) {
    const std::size_t d = dimension();
    op.matrix_.resize(d*d);
    for (std::size_t i=0;i<d;i++)
      for (std::size_t j=0;j<d;j++)
        op.matrix_[j*d+i] = std::conj(matrix_[i*d+j]);
  } else {
    op.forward_ = inverse_;
    op.inverse_ = forward_;
  }
  return op;
}

namespace gates {

Operation modular_add(std::size_t a_width, std::size_t b_width) {
  if (a_width == 0 || b_width == 0)
    throw DimensionError("modular_add needs non-empty registers");
  const Value amask = (Value(1) << a_width) - 1;
  const Value bmask = (Value(1) << b_width) - 1;
  auto add = [=](Value x) {
    Value a = x & amask, b = (x >> a_width) & bmask;
    return a | (((b + a) & bmask) << a_width);
  };
  auto sub = [=](Value x) {
    Value a = x & amask, b = (x >> a_width) & bmask;
    return a | (((b - a) & bmask) << a_width);
  };
  return Operation::from_map(a_width + b_width, add, sub, "ADD");
}

} // namespace gates

} // namespace qth
