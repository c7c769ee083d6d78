// SPDX-License-Identifier: MIT

#include "qthought/experiments.hpp"
#include "qthought/consistency.hpp"
#include "qthought/gates.hpp"
#include "qthought/quantum_tree.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace qth {

Protocol bell_protocol() {
  return Protocol{
    Step(Requirements{{"Qubit", {"s"}}}, "Prepare qubit s by applying H", 0,
         Action::unitary(gates::H(), {"s"})),
    Step(Requirements{{"Qubit", {"s"}}, {"AgentMemory(1)", {"Alice"}}}, "Alice observes s", 1,
         Action::observe("Alice_memory", "s")),
    Step(Requirements{{"Qubit", {"s"}}, {"AgentMemory(1)", {"Bob"}}}, "Bob observes s", 2,
         Action::observe("Bob_memory", "s")),
  };
}

Operation fr_init_r() {
  const double a = std::sqrt(1.0/3.0), b = std::sqrt(2.0/3.0);
  return Operation::from_matrix(1, {{a,0}, {-b,0}, {b,0}, {a,0}}, "init_R");
}

Protocol frauchiger_renner_protocol() {
  const Requirements r{{"Qubit", {"r"}}};
  const Requirements s{{"Qubit", {"s"}}};
  auto memory = [](const char* name) { return Requirements{{"AgentMemory(1)", {name}}}; };
  auto agent = [](const char* name) { return Requirements{{"Agent(1,1)", {name}}}; };

  return Protocol{
    Step(r, "Initialize R", 1, Action::unitary(fr_init_r(), {"r"})),
    Step(merge(memory("Alice"), r), "ALICE observes R", 2, Action::observe("Alice_memory", "r")),
    Step(agent("Alice"), "ALICE makes an inference", 3, Action::make_inference("Alice")),
    Step(merge(s, memory("Alice")), "Apply H to S controlled on ALICE_MEMORY", 4,
         Action::unitary(gates::H(), {"s"}, {"Alice_memory"})),
    Step(merge(s, memory("Bob")), "BOB measures S", 5, Action::observe("Bob_memory", "s")),
    Step(agent("Bob"), "BOB makes an inference", 6, Action::make_inference("Bob")),
    Step(merge(agent("Alice"), r), "Reverse ALICE reasoning", 7,
         {Action::make_inference("Alice", true), Action::observe("Alice_memory", "r", true)}),
    Step(r, "Perform Hadamard on R", 8, Action::unitary(gates::H(), {"r"})),
    Step(merge(r, memory("Ursula")), "URSULA measures ALICEs lab (i.e. r)", 9,
         Action::observe("Ursula_memory", "r")),
    Step(agent("Ursula"), "URSULA makes an inference", 10, Action::make_inference("Ursula")),
    Step(agent("Ursula"), "URSULA announces her prediction", 11, Action::measure("Ursula_prediction")),
    Step(merge(agent("Bob"), s), "Reverse BOBs inference procedure", 12,
         {Action::make_inference("Bob", true), Action::observe("Bob_memory", "s", true)}),
    Step(s, "Apply Hadamard on S", 13, Action::unitary(gates::H(), {"s"})),
    Step(s, "WIGNER checks if BOB+S is in ok state (s: 1)", 14, Action::measure("s")),
  };
}

FrTables derive_fr_tables(const Protocol& protocol, std::shared_ptr<const Interpretation> interp,
                          const InferenceOptions& opts) {
  InferenceTable alice = forward_inference(protocol, interp, "Alice_memory", 2, "s", 14, opts);
  InferenceTable bob = backward_inference(protocol, interp, "Bob_memory", 5, "Alice_memory", 2, opts);
  InferenceTable ursula = backward_inference(protocol, interp, "Ursula_memory", 9, "Bob_memory", 5, opts);
  InferenceTable bob_consistent = consistency(bob, alice);
  InferenceTable ursula_consistent = consistency(ursula, bob_consistent);
  return {alice, bob, ursula, bob_consistent, ursula_consistent};
}

static bool fr_contradiction(Value ursula_prediction, Value wigner) {
  return ursula_prediction == 0 && wigner == 1;
}

FrResult run_frauchiger_renner(std::size_t trials, uint64_t seed, std::shared_ptr<const Interpretation> interp,
                               const FrTables& tables, bool silent) {
  const Protocol protocol = frauchiger_renner_protocol();
  QuantumSystem system(protocol.requirements(), std::move(interp), seed, silent);
  system.set_inference_table("Alice", tables.alice, kFrNoPrediction);
  system.set_inference_table("Bob", tables.bob_consistent, kFrNoPrediction);
  system.set_inference_table("Ursula", tables.ursula_consistent, kFrNoPrediction);
  for (const char* name : {"Alice", "Bob", "Ursula"}) system.prep_inference(name);

  FrResult result;
  result.trials = trials;

  {
    QuantumTree tree(system);
    RunOptions all;
    tree.run(protocol, all);
    for (const auto& branch : tree.branches())
      if (fr_contradiction(branch.readout("Ursula_prediction"), branch.readout("s")))
        result.exact_probability += branch.weight();
  }

  // Everything before the first measurement is deterministic and shared by all trials
  int first_measure = std::numeric_limits<int>::max();
  for (const auto& step : protocol.steps())
    if (step.measures()) first_measure = std::min(first_measure, step.time());
  RunOptions prefix;
  prefix.silent = silent;
  prefix.t_end = first_measure - 1;
  protocol.run(system, prefix);

  RunOptions suffix;
  suffix.silent = silent;
  suffix.t_start = first_measure;
  Rng seeds(seed);
  for (std::size_t i = 0; i < trials; ++i) {
    QuantumSystem trial = system;
    trial.reseed(seeds.next_seed());
    protocol.run(trial, suffix);
    if (fr_contradiction(trial.outcome("Ursula_prediction"), trial.outcome("s"))) ++result.contradictions;
  }
  result.frequency = trials ? double(result.contradictions) / double(trials) : 0.0;
  if (!silent)
    std::cout << "Contradictions: " << result.contradictions << "/" << trials << " (exact "
              << result.exact_probability << ")\n";
  return result;
}

} // namespace qth
