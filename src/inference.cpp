// SPDX-License-Identifier: MIT

#include "qthought/inference.hpp"
#include "qthought/errors.hpp"
#include "qthought/quantum_tree.hpp"
#include <exception>
#include <iostream>
#include <vector>
#ifdef QTH_OPENMP
#include <omp.h>
#endif

namespace qth {

static std::size_t checked_register(const Protocol& protocol, const std::string& reg, int t) {
  if (!protocol.has_time(t))
    throw MalformedError("Time t=" + std::to_string(t) + " for '" + reg + "' does not match any protocol step");
  auto w = protocol.requirements().register_width(reg);
  if (!w) throw DimensionError("Protocol has no subsystem '" + reg + "'");
  if (*w > 20) throw DimensionError("Subsystem '" + reg + "' is too wide to enumerate");
  return *w;
}

InferenceTable forward_inference(const Protocol& protocol, std::shared_ptr<const Interpretation> interp,
                                 const std::string& source, int source_time,
                                 const std::string& target, int target_time,
                                 const InferenceOptions& opts) {
  const std::size_t width = checked_register(protocol, source, source_time);
  checked_register(protocol, target, target_time);
  if (source_time > target_time)
    throw MalformedError("Forward inference needs t_source <= t_target, got " + std::to_string(source_time) +
                         " > " + std::to_string(target_time));

  QuantumSystem root(protocol.requirements(), std::move(interp), opts.seed, true);
  RunOptions before;
  before.silent = opts.silent;
  before.t_end = source_time;
  before.registry = opts.registry;
  QuantumTree prefix(root);
  prefix.run(protocol, before);

  // Steps in (source_time, target_time]; empty when both times coincide
  const bool has_window = source_time < target_time;
  RunOptions after = before;
  after.t_start = has_window ? source_time + 1 : source_time;
  after.t_end = target_time;

  const std::int64_t n_values = std::int64_t(1) << width;
  std::vector<std::set<Value>> support(n_values);
  std::vector<char> reached(n_values, 0);
  std::exception_ptr failure;

#ifdef QTH_OPENMP
  // Each worker projects its own copy of the prefix branches
  const bool parallel = opts.parallel && opts.silent;
#pragma omp parallel for schedule(dynamic) if(parallel)
#endif
  for (std::int64_t v = 0; v < n_values; ++v) {
    try {
      if (!opts.silent) std::cout << "----- Case " << v << " -----\n";
      for (const auto& branch : prefix.branches()) {
        QuantumSystem projected = branch.project_to(source, Value(v));
        if (!projected.reachable()) continue;
        reached[v] = 1;
        QuantumTree sub(std::move(projected));
        if (has_window) sub.run(protocol, after);
        auto outs = sub.possible_outcomes(target);
        support[v].insert(outs.begin(), outs.end());
      }
      if (!reached[v] && !opts.silent)
        std::cerr << "warning: " << source << "=" << v << " has no overlap with the state at t=" << source_time << "\n";
    } catch (...) {
#ifdef QTH_OPENMP
#pragma omp critical(qth_inference_failure)
#endif
      if (!failure) failure = std::current_exception();
    }
  }
  if (failure) std::rethrow_exception(failure);

  InferenceTable table(source, source_time, target, target_time);
  for (std::int64_t v = 0; v < n_values; ++v) {
    if (reached[v]) table.set(Value(v), std::move(support[v]));
    else table.mark_unreachable(Value(v));
  }
  return table;
}

InferenceTable backward_inference(const Protocol& protocol, std::shared_ptr<const Interpretation> interp,
                                  const std::string& source, int source_time,
                                  const std::string& target, int target_time,
                                  const InferenceOptions& opts) {
  const std::size_t width = checked_register(protocol, source, source_time);
  if (target_time > source_time)
    throw MalformedError("Backward inference needs t_target <= t_source, got " + std::to_string(target_time) +
                         " > " + std::to_string(source_time));
  InferenceTable forward = forward_inference(protocol, std::move(interp), target, target_time, source, source_time, opts);

  InferenceTable::Entries backward;
  for (const auto& [in, outs] : forward.entries())
    for (Value out : outs) backward[out].insert(in);

  InferenceTable table(source, source_time, target, target_time);
  for (Value v = 0; v < (Value(1) << width); ++v) {
    auto it = backward.find(v);
    if (it != backward.end()) table.set(v, std::move(it->second));
    else table.mark_unreachable(v);
  }
  return table;
}

} // namespace qth
