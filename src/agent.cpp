// SPDX-License-Identifier: MIT

#include "qthought/agent.hpp"
#include "qthought/inference_table.hpp"
#include "qthought/errors.hpp"

namespace qth {

Agent::Agent(std::string name, std::size_t memory_width, std::size_t prediction_width)
  : name_(std::move(name)), n_memory_(memory_width), n_pred_(prediction_width) {
  if (memory_width == 0 || prediction_width == 0 || memory_width < prediction_width)
    throw DimensionError("Agent '" + name_ + "' needs memory >= prediction >= 1 bits");
  predictions_.assign(std::size_t(1) << n_memory_, 0);
}

void Agent::set_inference_table(const InferenceTable& table, Value no_prediction) {
  const Value n_keys = Value(1) << n_memory_;
  const Value n_preds = Value(1) << n_pred_;
  if (table.size() > n_keys)
    throw DimensionError("Inference table with " + std::to_string(table.size()) + " entries does not fit the " +
                         std::to_string(n_memory_) + "-bit memory of " + name_);
  if (no_prediction >= n_preds)
    throw DimensionError("No-prediction value " + std::to_string(no_prediction) + " does not fit the prediction register of " + name_);
  std::vector<Value> preds(n_keys, no_prediction);
  for (auto& [key, values] : table.entries()) {
    if (key >= n_keys)
      throw DimensionError("Inference table key " + std::to_string(key) + " exceeds the memory of " + name_);
    if (values.size() != 1) continue;
    Value v = *values.begin();
    if (v >= n_preds)
      throw DimensionError("Inference value " + std::to_string(v) + " is higher than the prediction register of " +
                           name_ + " can store");
    preds[key] = v;
  }
  predictions_ = std::move(preds);
  no_prediction_ = no_prediction;
}

Value Agent::table_bits() const {
  Value bits = 0;
  for (std::size_t i = 0; i < predictions_.size(); ++i) bits |= predictions_[i] << (i * n_pred_);
  return bits;
}

} // namespace qth
