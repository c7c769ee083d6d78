// SPDX-License-Identifier: MIT

#include "qthought/protocol.hpp"
#include "qthought/errors.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace qth {

void ActionRegistry::add(const std::string& id, std::shared_ptr<const CustomAction> action) {
  if (!action) throw MalformedError("Custom action '" + id + "' is null");
  actions_[id] = std::move(action);
}

const CustomAction& ActionRegistry::at(const std::string& id) const {
  auto it = actions_.find(id);
  if (it == actions_.end()) throw MalformedError("No custom action registered as '" + id + "'");
  return *it->second;
}

Action Action::unitary(Operation op, std::vector<std::string> targets, std::vector<std::string> controls) {
  Action a;
  a.kind = ActionKind::ApplyUnitary;
  a.op = std::move(op);
  a.targets = std::move(targets);
  a.controls = std::move(controls);
  return a;
}

Action Action::observe(const std::string& memory, const std::string& source, bool reverse) {
  Action a;
  a.kind = ActionKind::Observe;
  a.targets = {memory, source};
  a.reverse = reverse;
  return a;
}

Action Action::make_inference(const std::string& agent, bool reverse) {
  Action a;
  a.kind = ActionKind::MakeInference;
  a.targets = {agent};
  a.reverse = reverse;
  return a;
}

Action Action::prepare_inference(const std::string& agent) {
  Action a;
  a.kind = ActionKind::PrepareInference;
  a.targets = {agent};
  return a;
}

Action Action::measure(const std::string& reg) {
  Action a;
  a.kind = ActionKind::Measure;
  a.targets = {reg};
  return a;
}

Action Action::custom(const std::string& id, std::vector<std::string> touches) {
  Action a;
  a.kind = ActionKind::Custom;
  a.custom_id = id;
  a.targets = std::move(touches);
  return a;
}

std::string Action::describe() const {
  auto join = [](const std::vector<std::string>& v) {
    std::string s;
    for (std::size_t i = 0; i < v.size(); ++i) s += (i ? "," : "") + v[i];
    return s;
  };
  const char* rev = reverse ? " (reversed)" : "";
  switch (kind) {
    case ActionKind::ApplyUnitary:
      return op->name() + " on " + join(targets) + (controls.empty() ? "" : " controlled by " + join(controls));
    case ActionKind::Observe: return targets[0] + " observes " + targets[1] + rev;
    case ActionKind::MakeInference: return targets[0] + " makes an inference" + rev;
    case ActionKind::PrepareInference: return targets[0] + " loads its inference table";
    case ActionKind::Measure: return "measure " + targets[0];
    case ActionKind::Custom: return "custom '" + custom_id + "'";
  }
  return "?";
}

void execute(const Action& action, QuantumSystem& system, const ActionRegistry* registry) {
  switch (action.kind) {
    case ActionKind::ApplyUnitary:
      system.apply(*action.op, action.targets, action.controls);
      break;
    case ActionKind::Observe:
      system.observe(action.targets[0], action.targets[1], action.reverse);
      break;
    case ActionKind::MakeInference:
      system.make_inference(action.targets[0], action.reverse);
      break;
    case ActionKind::PrepareInference:
      system.prep_inference(action.targets[0]);
      break;
    case ActionKind::Measure:
      system.measure(action.targets[0]);
      break;
    case ActionKind::Custom:
      if (!registry) throw MalformedError("Custom action '" + action.custom_id + "' needs an action registry");
      registry->at(action.custom_id).apply(system);
      break;
  }
}

Step::Step(Requirements domain, std::string descr, int time, std::vector<Action> actions)
  : domain_(std::move(domain)), descr_(std::move(descr)), time_(time), actions_(std::move(actions)) {
  auto outside = [&](const std::string& what) {
    return MalformedError("Step '" + descr_ + "' uses " + what + " outside its domain");
  };
  for (auto& a : actions_) {
    if (a.kind == ActionKind::ApplyUnitary && !a.op)
      throw MalformedError("Step '" + descr_ + "' has a unitary action without an operation");
    if (a.kind == ActionKind::Observe && a.targets.size() != 2)
      throw MalformedError("Step '" + descr_ + "' has an observe action without memory and source");
    if (a.kind == ActionKind::MakeInference || a.kind == ActionKind::PrepareInference) {
      auto k = domain_.kind_of(a.targets.at(0));
      if (!k || k->type != KindType::Agent) throw outside("agent '" + a.targets[0] + "'");
      continue;
    }
    for (auto& r : a.targets) if (!domain_.provides(r)) throw outside("register '" + r + "'");
    for (auto& r : a.controls) if (!domain_.provides(r)) throw outside("register '" + r + "'");
  }
}

bool Step::measures() const {
  return std::any_of(actions_.begin(), actions_.end(), [](const Action& a){ return a.kind == ActionKind::Measure; });
}

Protocol::Protocol(std::initializer_list<Step> steps) {
  for (auto& s : steps) add_step(s);
}

void Protocol::add_step(const Step& step) {
  Requirements merged = merge(reqs_, step.domain());
  auto pos = std::upper_bound(steps_.begin(), steps_.end(), step.time(),
                              [](int t, const Step& s){ return t < s.time(); });
  steps_.insert(pos, step);
  reqs_ = std::move(merged);
}

std::vector<int> Protocol::times() const {
  std::vector<int> t;
  for (auto& s : steps_) t.push_back(s.time());
  return t;
}

bool Protocol::has_time(int t) const {
  return std::any_of(steps_.begin(), steps_.end(), [t](const Step& s){ return s.time() == t; });
}

void Protocol::check(const QuantumSystem& system) const {
  if (!reqs_.satisfied_by(system.requirements()))
    throw UnsatisfiedRequirementsError("Quantum system does not provide the protocol's registers.\n" + reqs_.to_string());
}

void Protocol::run(QuantumSystem& system, const RunOptions& opts) const {
  check(system);
  for (std::size_t i = 0; i < steps_.size(); ++i) {
    const Step& step = steps_[i];
    if (step.time() < opts.t_start || step.time() > opts.t_end) continue;
    for (auto& a : step.actions()) execute(a, system, opts.registry);
    if (!opts.silent) {
      std::cout << i << " " << step.description() << " t:" << step.time() << "\n";
      std::cout << "State:\n" << system.wavefunction_string() << "\n";
    }
  }
}

void Protocol::run(QuantumSystem& system, bool silent) const {
  RunOptions opts;
  opts.silent = silent;
  run(system, opts);
}

std::string Protocol::to_string() const {
  std::ostringstream out;
  for (std::size_t i = 0; i < steps_.size(); ++i)
    out << "Step " << i << ": " << steps_[i].to_string() << "\n";
  out << "\n" << reqs_.to_string();
  return out.str();
}

Protocol concat(const Protocol& a, const Protocol& b) {
  Protocol p = a;
  for (auto& s : b.steps()) p.add_step(s);
  return p;
}

Protocol concat(const Protocol& a, const Step& s) {
  Protocol p = a;
  p.add_step(s);
  return p;
}

} // namespace qth
