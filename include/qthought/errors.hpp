// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qth {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Same name declared under two incompatible register kinds.
struct ConflictError : Error { using Error::Error; };

// Unknown or badly formed register kind, bad step domain, bad inference query.
struct MalformedError : Error { using Error::Error; };

// Register name unknown or widths do not match an operation's arity.
struct DimensionError : Error { using Error::Error; };

// A protocol was run on a system that lacks some of its registers.
struct UnsatisfiedRequirementsError : Error { using Error::Error; };

// Readout of a register that is still in superposition.
struct NotCollapsedError : Error { using Error::Error; };

// A consistency merge emptied a key that had predictions before the merge.
struct ContradictionError : Error {
  std::vector<Value> keys;
  ContradictionError(const std::string& what, std::vector<Value> k) : Error(what), keys(std::move(k)) {}
};

} // namespace qth
