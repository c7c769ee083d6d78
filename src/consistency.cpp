// SPDX-License-Identifier: MIT

#include "qthought/consistency.hpp"
#include "qthought/errors.hpp"
#include <algorithm>
#include <iterator>

namespace qth {

static std::string where(const std::string& reg, int t) {
  return reg + ":t" + std::to_string(t);
}

static void surface(const InferenceTable& merged, bool strict) {
  if (!strict || !merged.has_contradiction()) return;
  std::vector<Value> keys(merged.contradictions().begin(), merged.contradictions().end());
  std::string list;
  for (std::size_t i = 0; i < keys.size(); ++i) list += (i ? ", " : "") + std::to_string(keys[i]);
  throw ContradictionError("Contradicting inferences for " + where(merged.input(), merged.input_time()) +
                           " = {" + list + "} about " + where(merged.output(), merged.output_time()), keys);
}

static InferenceTable compose(const InferenceTable& pre, const InferenceTable& post) {
  if (pre.output() != post.input() || pre.output_time() != post.input_time())
    throw MalformedError("Output of tbl_pre (" + where(pre.output(), pre.output_time()) +
                         ") does not match input of tbl_post (" + where(post.input(), post.input_time()) + ")");

  InferenceTable merged(pre.input(), pre.input_time(), post.output(), post.output_time());
  for (auto key : pre.unreachable()) merged.mark_unreachable(key);
  for (const auto& [key, mids] : pre.entries()) {
    std::set<Value> outs;
    for (Value mid : mids) {
      if (!post.contains(mid)) continue;
      const auto& vals = post.at(mid);
      outs.insert(vals.begin(), vals.end());
    }
    if (outs.empty() && !mids.empty()) merged.mark_contradiction(key);
    else merged.set(key, std::move(outs));
  }
  for (auto key : pre.contradictions()) merged.mark_contradiction(key);
  return merged;
}

InferenceTable consistency(const InferenceTable& pre, const InferenceTable& post, bool strict) {
  InferenceTable merged = compose(pre, post);
  surface(merged, strict);
  return merged;
}

InferenceTable consistency(const InferenceTable& pre, const InferenceTable& post,
                           const InferenceTable& reference, bool strict) {
  InferenceTable merged = compose(pre, post);
  if (reference.input() != merged.input() || reference.input_time() != merged.input_time() ||
      reference.output() != merged.output() || reference.output_time() != merged.output_time())
    throw MalformedError("Reference table (" + where(reference.input(), reference.input_time()) + " -> " +
                         where(reference.output(), reference.output_time()) + ") does not relate " +
                         where(merged.input(), merged.input_time()) + " -> " +
                         where(merged.output(), merged.output_time()));
  InferenceTable result = merged;
  for (const auto& [key, outs] : merged.entries()) {
    if (!reference.contains(key) || merged.contradictions().count(key)) continue;
    const auto& ref = reference.at(key);
    std::set<Value> kept;
    std::set_intersection(outs.begin(), outs.end(), ref.begin(), ref.end(), std::inserter(kept, kept.begin()));
    if (kept.empty() && !outs.empty()) result.mark_contradiction(key);
    else result.set(key, std::move(kept));
  }
  surface(result, strict);
  return result;
}

InferenceTable consistency_chain(const std::vector<InferenceTable>& tables, bool strict) {
  if (tables.empty()) throw MalformedError("consistency_chain needs at least one table");
  InferenceTable acc = tables.front();
  for (std::size_t i = 1; i < tables.size(); ++i) acc = compose(acc, tables[i]);
  surface(acc, strict);
  return acc;
}

} // namespace qth
