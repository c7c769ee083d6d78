// SPDX-License-Identifier: MIT

#pragma once
#include "agent.hpp"
#include "interpretation.hpp"
#include "requirements.hpp"
#include "state_vector.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace qth {

// Contiguous run of bits inside the system state, first bit least significant.
struct Register {
  std::string name;
  RegisterKind kind;
  std::size_t offset = 0;
  std::size_t width = 0;
  std::string parent;  // enclosing agent register, empty for top-level registers
};

// The shared state of a protocol run: every register required by the
// protocol, the agents built on them and the amplitudes over all their bits.
class QuantumSystem {
public:
  QuantumSystem(const Requirements& reqs, std::shared_ptr<const Interpretation> interp,
                uint64_t seed = 12345, bool silent = true);

  std::size_t num_qubits() const { return sv_.num_qubits(); }
  const Requirements& requirements() const { return reqs_; }
  const Interpretation& interpretation() const { return *interp_; }
  std::shared_ptr<const Interpretation> interpretation_ptr() const { return interp_; }
  double tolerance() const { return tol_; }
  void set_tolerance(double tol) { tol_ = tol; }
  bool silent() const { return silent_; }
  void set_silent(bool silent) { silent_ = silent; }
  void reseed(uint64_t seed) { rng_.reseed(seed); }

  // Registers in storage order; agent sub-registers follow their agent.
  const std::vector<Register>& registers() const { return regs_; }
  bool has_register(const std::string& name) const { return index_.count(name) != 0; }
  // Throws DimensionError for unknown names.
  const Register& reg(const std::string& name) const;
  std::vector<std::size_t> bits(const std::string& name) const;

  const StateVector& state() const { return sv_; }
  // Throws DimensionError if the amplitudes do not match the system size or have zero norm.
  void set_amplitudes(const vec_c64& amps);
  // All-zero state; agents keep their tables but must be prepared again.
  void reset();

  // Targets are concatenated in the given order, first register in the low bits.
  void apply(const Operation& op, const std::vector<std::string>& targets,
             const std::vector<std::string>& controls = {});

  // Born-rule sample of `name`; collapses the state and records the outcome.
  Value measure(const std::string& name);
  // Branch of this system in which `name` holds `value`. The branch is
  // unreachable when that subspace carries no amplitude.
  QuantumSystem project_to(const std::string& name, Value value) const;
  bool reachable() const { return reachable_; }
  // Product of the probabilities of all projections leading to this branch.
  double weight() const { return weight_; }

  // Throws NotCollapsedError unless `name` holds a single definite value.
  Value readout(const std::string& name) const;
  std::string readout_bits(const std::string& name) const;
  double probability(const std::string& name, Value value) const;
  // Values of `name` with non-negligible amplitude, ascending.
  std::vector<Value> possible_values(const std::string& name) const;

  bool has_agent(const std::string& name) const { return agent_index_.count(name) != 0; }
  Agent& agent(const std::string& name);
  const Agent& agent(const std::string& name) const;
  const std::vector<Agent>& agents() const { return agents_; }

  // Records `source` in `memory` (or undoes a previous observation).
  void observe(const std::string& memory, const std::string& source, bool reverse = false);
  void set_inference_table(const std::string& agent, const InferenceTable& table, Value no_prediction = 0);
  // Loads the agent's inference table into its inference system.
  void prep_inference(const std::string& agent);
  void make_inference(const std::string& agent, bool reverse = false);

  const std::vector<std::pair<std::string, Value>>& outcomes() const { return outcomes_; }
  // Last recorded outcome of `name`; throws NotCollapsedError if it was never measured.
  Value outcome(const std::string& name) const;

  std::string wavefunction_string() const;
  std::string to_string() const;

private:
  Requirements reqs_;
  std::shared_ptr<const Interpretation> interp_;
  std::vector<Register> regs_;
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<Agent> agents_;
  std::unordered_map<std::string, std::size_t> agent_index_;
  StateVector sv_;
  Rng rng_;
  double tol_;
  bool silent_;
  bool reachable_ = true;
  double weight_ = 1.0;
  std::vector<std::pair<std::string, Value>> outcomes_;

  std::vector<std::size_t> bits_of_(const std::vector<std::string>& names) const;
};

inline QuantumSystem allocate(const Requirements& reqs, std::shared_ptr<const Interpretation> interp,
                              uint64_t seed = 12345, bool silent = true) {
  return QuantumSystem(reqs, std::move(interp), seed, silent);
}

} // namespace qth
