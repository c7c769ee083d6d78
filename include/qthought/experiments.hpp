// SPDX-License-Identifier: MIT

#pragma once
#include "inference.hpp"
#include "interpretation.hpp"
#include "protocol.hpp"
#include <cstddef>
#include <memory>

namespace qth {

// s is put in superposition (t=0), Alice observes s (t=1), Bob observes s (t=2).
Protocol bell_protocol();

// Operation preparing r as sqrt(1/3)|0> + sqrt(2/3)|1>.
Operation fr_init_r();

// Frauchiger-Renner thought experiment: Alice measures r (value 1 = tails),
// prepares s accordingly, Bob measures s; Ursula and Wigner then measure the
// labs of Alice and Bob in the ok/fail basis (1 = ok). Every agent is
// Agent(1,1). Ursula announces her prediction at t=11, Wigner's outcome is s at t=14.
Protocol frauchiger_renner_protocol();

struct FrTables {
  InferenceTable alice;               // Alice_memory:t2 -> s:t14
  InferenceTable bob;                 // Bob_memory:t5 -> Alice_memory:t2
  InferenceTable ursula;              // Ursula_memory:t9 -> Bob_memory:t5
  InferenceTable bob_consistent;      // Bob_memory:t5 -> s:t14
  InferenceTable ursula_consistent;   // Ursula_memory:t9 -> s:t14
};

FrTables derive_fr_tables(const Protocol& protocol, std::shared_ptr<const Interpretation> interp,
                          const InferenceOptions& opts = {});

// Value of a prediction register meaning "no certain prediction"; a certain
// prediction is the predicted value of s (0 = fail).
inline constexpr Value kFrNoPrediction = 1;

struct FrResult {
  std::size_t trials = 0;
  std::size_t contradictions = 0;   // Ursula predicted fail and Wigner found ok
  double frequency = 0.0;
  double exact_probability = 0.0;   // same event, summed over all branches
};

// Loads the merged tables into the three agents, then runs the protocol
// `trials` times with measurement seeds derived from `seed`.
FrResult run_frauchiger_renner(std::size_t trials, uint64_t seed, std::shared_ptr<const Interpretation> interp,
                               const FrTables& tables, bool silent = true);

} // namespace qth
