// SPDX-License-Identifier: MIT

#pragma once
#include "inference_table.hpp"
#include "interpretation.hpp"
#include "protocol.hpp"
#include <memory>
#include <string>

namespace qth {

struct InferenceOptions {
  bool silent = true;
  const ActionRegistry* registry = nullptr;
  uint64_t seed = 12345;
  bool parallel = true;  // enumerate source values on OpenMP workers when available
};

// Given `source` holds v at `source_time`, which values can `target` be found
// in at `target_time` (source_time <= target_time)? Every value of the source
// register is tried on a fresh system; values whose branch carries no
// amplitude are listed in unreachable(). Measurements inside the run branch
// instead of sampling, so the table depends only on protocol and interpretation.
InferenceTable forward_inference(const Protocol& protocol, std::shared_ptr<const Interpretation> interp,
                                 const std::string& source, int source_time,
                                 const std::string& target, int target_time,
                                 const InferenceOptions& opts = {});

// Given `source` is found in v at `source_time`, which values can `target`
// have held at the earlier `target_time`? Inverts the forward table from
// target to source.
InferenceTable backward_inference(const Protocol& protocol, std::shared_ptr<const Interpretation> interp,
                                  const std::string& source, int source_time,
                                  const std::string& target, int target_time,
                                  const InferenceOptions& opts = {});

} // namespace qth
