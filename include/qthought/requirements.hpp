// SPDX-License-Identifier: MIT

#pragma once
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qth {

class Interpretation;

enum class KindType { Qubit, Qureg, AgentMemory, Agent };

// Register kind as written in a requirement: Qubit, Qureg(n), AgentMemory(n), Agent(n,m).
struct RegisterKind {
  KindType type = KindType::Qubit;
  std::size_t memory = 1;      // width of Qureg / AgentMemory / agent memory
  std::size_t prediction = 0;  // agent prediction width

  static RegisterKind parse(const std::string& text);
  static RegisterKind qubit() { return {KindType::Qubit, 1, 0}; }
  static RegisterKind qureg(std::size_t n) { return {KindType::Qureg, n, 0}; }
  static RegisterKind agent_memory(std::size_t n) { return {KindType::AgentMemory, n, 0}; }
  static RegisterKind agent(std::size_t n, std::size_t m) { return {KindType::Agent, n, m}; }

  std::string str() const;
  // Total number of bits allocated for one name of this kind.
  std::size_t width() const;
  // Names of the registers one name of this kind provides.
  std::vector<std::string> register_names(const std::string& name) const;

  bool operator==(const RegisterKind& o) const { return type == o.type && memory == o.memory && prediction == o.prediction; }
  bool operator!=(const RegisterKind& o) const { return !(*this == o); }
};

// Register kinds mapped to the names required of each kind. Kinds and names
// keep first-insertion order, which is the allocation order of the state.
class Requirements {
public:
  struct Entry {
    RegisterKind kind;
    std::vector<std::string> names;
  };

  Requirements() = default;
  // {{"Qubit", {"s"}}, {"AgentMemory(1)", {"Alice", "Bob"}}}
  Requirements(std::initializer_list<std::pair<std::string, std::vector<std::string>>> reqs);

  void add(const RegisterKind& kind, const std::string& name);
  void add(const std::string& kind, const std::vector<std::string>& names);
  void merge_in(const Requirements& other);

  bool empty() const { return entries_.empty(); }
  const std::vector<Entry>& entries() const { return entries_; }
  std::optional<RegisterKind> kind_of(const std::string& name) const;

  // True if a system allocated from these requirements has `register_name`.
  bool provides(const std::string& register_name) const;
  // Width of a register a system allocated from these requirements would have.
  std::optional<std::size_t> register_width(const std::string& register_name) const;
  // True if every name required here is present in `available` with a kind that covers it.
  bool satisfied_by(const Requirements& available) const;

  std::string to_string() const;

  // Set equality: kind/name pairs only, ordering ignored.
  bool operator==(const Requirements& o) const;
  bool operator!=(const Requirements& o) const { return !(*this == o); }

private:
  std::vector<Entry> entries_;
  void remove_(const std::string& name);
};

// Union of both ledgers. Throws ConflictError if a name is required under two
// incompatible kinds. An Agent(n,m) absorbs an AgentMemory(n) of the same name.
Requirements merge(const Requirements& a, const Requirements& b);

// Throws MalformedError if `interp` does not know one of the kinds.
void validate(const Requirements& reqs, const Interpretation& interp);

} // namespace qth
