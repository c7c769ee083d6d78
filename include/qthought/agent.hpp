// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace qth {

class InferenceTable;

// An observer made of three registers: memory (n bits), prediction (m bits)
// and an inference system holding one m-bit prediction slot per memory value.
class Agent {
public:
  Agent(std::string name, std::size_t memory_width, std::size_t prediction_width);

  const std::string& name() const { return name_; }
  std::size_t memory_width() const { return n_memory_; }
  std::size_t prediction_width() const { return n_pred_; }
  std::size_t inference_width() const { return (std::size_t(1) << n_memory_) * n_pred_; }

  std::string memory_register() const { return name_ + "_memory"; }
  std::string prediction_register() const { return name_ + "_prediction"; }
  std::string inference_register() const { return name_ + "_inference"; }

  // Single predictions are stored as is; empty or ambiguous entries, and
  // memory values the table does not mention, become `no_prediction`.
  void set_inference_table(const InferenceTable& table, Value no_prediction = 0);
  // predictions()[i] is the value written to the prediction register when memory holds i.
  const std::vector<Value>& predictions() const { return predictions_; }
  Value no_prediction() const { return no_prediction_; }

  // Inference-system contents encoded as a bit pattern (slot i at bits [i*m, (i+1)*m)).
  Value table_bits() const;

  // Bit pattern currently loaded in the inference system of the state.
  Value loaded_bits() const { return loaded_; }
  bool prepared() const { return prepared_; }
  void mark_prepared(Value loaded) { loaded_ = loaded; prepared_ = true; }
  void clear_prepared() { loaded_ = 0; prepared_ = false; }

private:
  std::string name_;
  std::size_t n_memory_;
  std::size_t n_pred_;
  std::vector<Value> predictions_;
  Value no_prediction_ = 0;
  Value loaded_ = 0;
  bool prepared_ = false;
};

} // namespace qth
