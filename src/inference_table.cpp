// SPDX-License-Identifier: MIT

#include "qthought/inference_table.hpp"
#include "qthought/errors.hpp"
#include <sstream>

namespace qth {

InferenceTable::InferenceTable(std::string input, int input_time, std::string output, int output_time, Entries tbl)
  : input_(std::move(input)), input_time_(input_time), output_(std::move(output)), output_time_(output_time),
    tbl_(std::move(tbl)) {}

InferenceTable InferenceTable::identity(const std::string& reg, int time, std::size_t width) {
  if (width == 0 || width > 20) throw DimensionError("identity table needs a width in 1..20");
  InferenceTable t(reg, time, reg, time);
  for (Value v = 0; v < (Value(1) << width); ++v) t.tbl_[v] = {v};
  return t;
}

const std::set<Value>& InferenceTable::at(Value key) const {
  auto it = tbl_.find(key);
  if (it == tbl_.end())
    throw MalformedError("Inference table (" + input_ + ":t" + std::to_string(input_time_) + ") has no entry " + std::to_string(key));
  return it->second;
}

void InferenceTable::set(Value key, std::set<Value> values) {
  unreachable_.erase(key);
  tbl_[key] = std::move(values);
}

void InferenceTable::mark_unreachable(Value key) {
  tbl_.erase(key);
  unreachable_.insert(key);
}

void InferenceTable::mark_contradiction(Value key) {
  tbl_[key].clear();
  contradictions_.insert(key);
}

std::string InferenceTable::to_string() const {
  std::ostringstream out;
  std::string head = "In:(" + input_ + ":t" + std::to_string(input_time_) + ")";
  head += std::string(head.size() < 22 ? 22 - head.size() : 1, ' ');
  head += "|  Out: (" + output_ + ":t" + std::to_string(output_time_) + ")";
  out << head << "\n" << std::string(head.size() + 7, '-');
  for (auto& [key, vals] : tbl_) {
    std::string k = "    " + std::to_string(key);
    out << "\n" << k << std::string(k.size() < 15 ? 15 - k.size() : 1, ' ') << "|    [";
    std::size_t i = 0;
    for (auto v : vals) out << (i++ ? ", " : "") << v;
    out << "]";
    if (contradictions_.count(key)) out << "  (contradiction)";
  }
  for (auto key : unreachable_) out << "\n    " << key << "  unreachable";
  return out.str();
}

bool InferenceTable::operator==(const InferenceTable& o) const {
  return input_ == o.input_ && input_time_ == o.input_time_ && output_ == o.output_ &&
         output_time_ == o.output_time_ && tbl_ == o.tbl_ && unreachable_ == o.unreachable_ &&
         contradictions_ == o.contradictions_;
}

} // namespace qth
