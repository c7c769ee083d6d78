// SPDX-License-Identifier: MIT

#pragma once
#include "operation.hpp"
#include "quantum_system.hpp"
#include "requirements.hpp"
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace qth {

enum class ActionKind { ApplyUnitary, Observe, MakeInference, PrepareInference, Measure, Custom };

// User-defined step behaviour, looked up by id in an ActionRegistry at run time.
class CustomAction {
public:
  virtual ~CustomAction() = default;
  virtual void apply(QuantumSystem& system) const = 0;
};

class ActionRegistry {
public:
  void add(const std::string& id, std::shared_ptr<const CustomAction> action);
  bool contains(const std::string& id) const { return actions_.count(id) != 0; }
  // Throws MalformedError for unknown ids.
  const CustomAction& at(const std::string& id) const;
private:
  std::map<std::string, std::shared_ptr<const CustomAction>> actions_;
};

// One primitive operation of a protocol step.
struct Action {
  ActionKind kind = ActionKind::Custom;
  std::optional<Operation> op;        // ApplyUnitary
  std::vector<std::string> targets;   // registers acted on; agent name for inference actions
  std::vector<std::string> controls;  // ApplyUnitary
  bool reverse = false;               // Observe, MakeInference
  std::string custom_id;              // Custom

  static Action unitary(Operation op, std::vector<std::string> targets, std::vector<std::string> controls = {});
  static Action observe(const std::string& memory, const std::string& source, bool reverse = false);
  static Action make_inference(const std::string& agent, bool reverse = false);
  static Action prepare_inference(const std::string& agent);
  static Action measure(const std::string& reg);
  // `touches` lists the registers the custom action works on.
  static Action custom(const std::string& id, std::vector<std::string> touches = {});

  std::string describe() const;
};

void execute(const Action& action, QuantumSystem& system, const ActionRegistry* registry = nullptr);

// Immutable protocol step. Construction fails with MalformedError if an
// action references a register outside `domain`.
class Step {
public:
  Step(Requirements domain, std::string descr, int time, std::vector<Action> actions);
  Step(Requirements domain, std::string descr, int time, Action action)
    : Step(std::move(domain), std::move(descr), time, std::vector<Action>{std::move(action)}) {}

  const Requirements& domain() const { return domain_; }
  const std::string& description() const { return descr_; }
  int time() const { return time_; }
  const std::vector<Action>& actions() const { return actions_; }
  bool measures() const;

  std::string to_string() const { return descr_ + "(t:" + std::to_string(time_) + ")"; }

private:
  Requirements domain_;
  std::string descr_;
  int time_;
  std::vector<Action> actions_;
};

struct RunOptions {
  bool silent = true;
  int t_start = std::numeric_limits<int>::min();
  int t_end = std::numeric_limits<int>::max();
  const ActionRegistry* registry = nullptr;
};

// Steps ordered by (time, declaration order) plus the union of their domains.
class Protocol {
public:
  Protocol() = default;
  Protocol(std::initializer_list<Step> steps);

  // Inserts after every step with time <= step.time(). Propagates ConflictError.
  void add_step(const Step& step);

  std::size_t size() const { return steps_.size(); }
  const std::vector<Step>& steps() const { return steps_; }
  const Requirements& requirements() const { return reqs_; }
  std::vector<int> times() const;
  bool has_time(int t) const;

  // Throws UnsatisfiedRequirementsError if `system` lacks a required register.
  void check(const QuantumSystem& system) const;
  // Executes every step with t_start <= time <= t_end, in order.
  void run(QuantumSystem& system, const RunOptions& opts) const;
  void run(QuantumSystem& system, bool silent = true) const;

  std::string to_string() const;

private:
  std::vector<Step> steps_;
  Requirements reqs_;
};

Protocol concat(const Protocol& a, const Protocol& b);
Protocol concat(const Protocol& a, const Step& s);

} // namespace qth
