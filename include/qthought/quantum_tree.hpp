// SPDX-License-Identifier: MIT

#pragma once
#include "protocol.hpp"
#include "quantum_system.hpp"
#include <set>
#include <string>
#include <vector>

namespace qth {

// The reachable branches of a system under measurement. Running a protocol on
// a tree follows every outcome of each measurement instead of sampling one.
class QuantumTree {
public:
  explicit QuantumTree(QuantumSystem root);

  // Splits every branch along the values `reg` can be found in.
  void branch_out(const std::string& reg);
  void run(const Protocol& protocol, const RunOptions& opts);

  // Union over branches of the values `reg` can be found in.
  std::set<Value> possible_outcomes(const std::string& reg) const;

  std::size_t size() const { return branches_.size(); }
  const QuantumSystem& operator[](std::size_t i) const { return branches_.at(i); }
  const std::vector<QuantumSystem>& branches() const { return branches_; }

  std::string to_string() const;

private:
  std::vector<QuantumSystem> branches_;
};

} // namespace qth
