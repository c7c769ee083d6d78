// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <map>
#include <set>
#include <string>

namespace qth {

// Maps each value of an input register at an input time to the values an
// output register at an output time can be found in on that branch.
class InferenceTable {
public:
  using Entries = std::map<Value, std::set<Value>>;

  InferenceTable(std::string input, int input_time, std::string output, int output_time, Entries tbl = {});

  // v -> {v} for every value of a register of `width` bits.
  static InferenceTable identity(const std::string& reg, int time, std::size_t width);

  const std::string& input() const { return input_; }
  int input_time() const { return input_time_; }
  const std::string& output() const { return output_; }
  int output_time() const { return output_time_; }

  const Entries& entries() const { return tbl_; }
  bool contains(Value key) const { return tbl_.count(key) != 0; }
  // Throws MalformedError for keys the table has no entry for.
  const std::set<Value>& at(Value key) const;
  void set(Value key, std::set<Value> values);
  std::size_t size() const { return tbl_.size(); }

  // Input values whose branch has zero amplitude; never present in entries().
  const std::set<Value>& unreachable() const { return unreachable_; }
  void mark_unreachable(Value key);

  // Keys emptied by a consistency merge; present in entries() with an empty set.
  const std::set<Value>& contradictions() const { return contradictions_; }
  void mark_contradiction(Value key);
  bool has_contradiction() const { return !contradictions_.empty(); }

  std::string to_string() const;

  bool operator==(const InferenceTable& o) const;
  bool operator!=(const InferenceTable& o) const { return !(*this == o); }

private:
  std::string input_;
  int input_time_;
  std::string output_;
  int output_time_;
  Entries tbl_;
  std::set<Value> unreachable_;
  std::set<Value> contradictions_;
};

} // namespace qth
