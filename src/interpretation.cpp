// SPDX-License-Identifier: MIT

#include "qthought/interpretation.hpp"
#include "qthought/agent.hpp"
#include "qthought/errors.hpp"
#include "qthought/gates.hpp"

namespace qth {

Operation CopenhagenInterpretation::observe_unitary(std::size_t memory_width, std::size_t source_width) const {
  if (memory_width < source_width)
    throw DimensionError("Invalid observe: observed register (" + std::to_string(source_width) +
                         " bits) is larger than the memory can hold (" + std::to_string(memory_width) + " bits)");
  return gates::modular_add(source_width, memory_width);
}

Operation CopenhagenInterpretation::inference_unitary(const Agent& agent) const {
  const std::size_t n = agent.memory_width();
  const std::size_t m = agent.prediction_width();
  const Value mem_mask = (Value(1) << n) - 1;
  const Value pred_mask = (Value(1) << m) - 1;
  auto step = [=](Value x, bool add) {
    Value mem = x & mem_mask;
    Value pred = (x >> n) & pred_mask;
    Value slot = (x >> (n + m + mem * m)) & pred_mask;
    Value next = (add ? pred + slot : pred - slot) & pred_mask;
    return (x & ~(pred_mask << n)) | (next << n);
  };
  return Operation::from_map(n + m + agent.inference_width(),
                             [step](Value x){ return step(x, true); },
                             [step](Value x){ return step(x, false); },
                             "INFER(" + agent.name() + ")");
}

std::shared_ptr<const Interpretation> make_copenhagen(double tolerance) {
  return std::make_shared<CopenhagenInterpretation>(tolerance);
}

} // namespace qth
