// SPDX-License-Identifier: MIT

#pragma once
#include "operation.hpp"
#include "requirements.hpp"
#include <memory>
#include <string>

namespace qth {

class Agent;

// How observations and agent reasoning are physically realized. Passed
// explicitly to allocation and inference; several may coexist in a process.
class Interpretation {
public:
  virtual ~Interpretation() = default;

  virtual std::string name() const = 0;
  virtual bool supports(KindType kind) const = 0;

  // Copies the value of a `source_width`-bit register into a memory register.
  // Targets: source first (low bits), then memory.
  virtual Operation observe_unitary(std::size_t memory_width, std::size_t source_width) const = 0;
  Operation observe_adjoint(std::size_t memory_width, std::size_t source_width) const {
    return observe_unitary(memory_width, source_width).adjoint();
  }

  // Writes the slot of the agent's inference system selected by its memory
  // into its prediction register. Targets: memory, prediction, inference.
  virtual Operation inference_unitary(const Agent& agent) const = 0;

  double tolerance() const { return tolerance_; }
  void set_tolerance(double tol) { tolerance_ = tol; }

protected:
  explicit Interpretation(double tolerance = kDefaultTolerance) : tolerance_(tolerance) {}

private:
  double tolerance_;
};

// Observation by modular addition of the observed value into the memory;
// inference by modular addition of the selected table slot into the prediction.
class CopenhagenInterpretation : public Interpretation {
public:
  explicit CopenhagenInterpretation(double tolerance = kDefaultTolerance) : Interpretation(tolerance) {}

  std::string name() const override { return "copenhagen"; }
  bool supports(KindType) const override { return true; }
  Operation observe_unitary(std::size_t memory_width, std::size_t source_width) const override;
  Operation inference_unitary(const Agent& agent) const override;
};

std::shared_ptr<const Interpretation> make_copenhagen(double tolerance = kDefaultTolerance);

} // namespace qth
