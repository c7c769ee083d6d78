// SPDX-License-Identifier: MIT

#include "qthought/quantum_tree.hpp"
#include <iostream>
#include <sstream>

namespace qth {

QuantumTree::QuantumTree(QuantumSystem root) {
  branches_.push_back(std::move(root));
}

void QuantumTree::branch_out(const std::string& reg) {
  std::vector<QuantumSystem> next;
  for (const auto& branch : branches_) {
    for (Value v : branch.possible_values(reg)) {
      QuantumSystem child = branch.project_to(reg, v);
      if (child.reachable()) next.push_back(std::move(child));
    }
  }
  branches_ = std::move(next);
}

void QuantumTree::run(const Protocol& protocol, const RunOptions& opts) {
  if (branches_.empty()) return;
  protocol.check(branches_.front());
  for (const auto& step : protocol.steps()) {
    if (step.time() < opts.t_start || step.time() > opts.t_end) continue;
    for (const auto& action : step.actions()) {
      if (action.kind == ActionKind::Measure) {
        branch_out(action.targets[0]);
        continue;
      }
      for (auto& branch : branches_) execute(action, branch, opts.registry);
    }
    if (!opts.silent) {
      std::cout << "=== " << step.to_string() << "\n" << to_string();
    }
  }
}

std::set<Value> QuantumTree::possible_outcomes(const std::string& reg) const {
  std::set<Value> out;
  for (const auto& branch : branches_)
    for (Value v : branch.possible_values(reg)) out.insert(v);
  return out;
}

std::string QuantumTree::to_string() const {
  std::ostringstream out;
  for (std::size_t i = 0; i < branches_.size(); ++i) {
    out << "---- Branch " << i << " (p=" << branches_[i].weight() << ") ----\n";
    out << branches_[i].wavefunction_string() << "\n";
  }
  return out.str();
}

} // namespace qth
