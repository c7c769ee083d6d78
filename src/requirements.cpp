// SPDX-License-Identifier: MIT

#include "qthought/requirements.hpp"
#include "qthought/errors.hpp"
#include "qthought/interpretation.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace qth {

static bool parse_size_t(const std::string& s, std::size_t& out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char ch){ return std::isdigit(ch); })) return false;
  try {
    std::size_t pos=0;
    unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size()) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch(const std::out_of_range&) { return false; }
}

RegisterKind RegisterKind::parse(const std::string& text) {
  auto bad = [&](const std::string& why) {
    return MalformedError("Invalid register kind '" + text + "': " + why +
                          " (allowed: Qubit, Qureg(n), AgentMemory(n), Agent(n,m))");
  };
  auto open = text.find('(');
  std::string prefix = text.substr(0, open);
  std::vector<std::size_t> args;
  if (open != std::string::npos) {
    if (text.back() != ')') throw bad("missing ')'");
    std::string body = text.substr(open + 1, text.size() - open - 2);
    std::stringstream ss(body);
    std::string item;
    while (std::getline(ss, item, ',')) {
      item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char ch){ return std::isspace(ch); }), item.end());
      std::size_t v;
      if (!parse_size_t(item, v) || v == 0) throw bad("invalid size '" + item + "'");
      args.push_back(v);
    }
  }
  if (prefix == "Qubit") {
    if (!args.empty() || open != std::string::npos) throw bad("Qubit takes no size");
    return qubit();
  }
  if (prefix == "Qureg" || prefix == "AgentMemory") {
    if (args.size() != 1) throw bad("expected one size");
    return prefix == "Qureg" ? qureg(args[0]) : agent_memory(args[0]);
  }
  if (prefix == "Agent") {
    if (args.size() != 2) throw bad("expected memory and prediction sizes");
    if (args[0] < args[1]) throw bad("an agent cannot make more different predictions than it has memory states");
    return agent(args[0], args[1]);
  }
  throw bad("unknown kind");
}

std::string RegisterKind::str() const {
  switch (type) {
    case KindType::Qubit: return "Qubit";
    case KindType::Qureg: return "Qureg(" + std::to_string(memory) + ")";
    case KindType::AgentMemory: return "AgentMemory(" + std::to_string(memory) + ")";
    case KindType::Agent: return "Agent(" + std::to_string(memory) + "," + std::to_string(prediction) + ")";
  }
  return "?";
}

std::size_t RegisterKind::width() const {
  switch (type) {
    case KindType::Qubit: return 1;
    case KindType::Qureg:
    case KindType::AgentMemory: return memory;
    case KindType::Agent: return memory + prediction + (std::size_t(1) << memory) * prediction;
  }
  return 0;
}

std::vector<std::string> RegisterKind::register_names(const std::string& name) const {
  switch (type) {
    case KindType::Qubit:
    case KindType::Qureg: return {name};
    case KindType::AgentMemory: return {name + "_memory"};
    case KindType::Agent: return {name, name + "_memory", name + "_prediction", name + "_inference"};
  }
  return {};
}

// Agent(n,m) covers AgentMemory(n); otherwise kinds must be equal.
static bool covers(const RegisterKind& big, const RegisterKind& small) {
  if (big == small) return true;
  return big.type == KindType::Agent && small.type == KindType::AgentMemory && big.memory == small.memory;
}

Requirements::Requirements(std::initializer_list<std::pair<std::string, std::vector<std::string>>> reqs) {
  for (auto& [kind, names] : reqs) add(kind, names);
}

void Requirements::add(const std::string& kind, const std::vector<std::string>& names) {
  auto k = RegisterKind::parse(kind);
  for (auto& n : names) add(k, n);
}

void Requirements::remove_(const std::string& name) {
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    auto pos = std::find(it->names.begin(), it->names.end(), name);
    if (pos == it->names.end()) continue;
    it->names.erase(pos);
    if (it->names.empty()) entries_.erase(it);
    return;
  }
}

void Requirements::add(const RegisterKind& kind, const std::string& name) {
  if (name.empty()) throw MalformedError("Register name must not be empty");
  const auto existing = kind_of(name);
  if (existing) {
    if (covers(*existing, kind)) return;
    if (!covers(kind, *existing))
      throw ConflictError("'" + name + "' is required both as " + existing->str() + " and as " + kind.str());
  }
  // Derived register names must not shadow registers of other names
  for (auto& rn : kind.register_names(name))
    for (auto& e : entries_)
      for (auto& other : e.names) {
        if (other == name) continue;
        for (auto& orn : e.kind.register_names(other))
          if (orn == rn)
            throw ConflictError("Register '" + rn + "' of " + kind.str() + " " + name +
                                " collides with " + e.kind.str() + " " + other);
      }
  if (existing) remove_(name);
  for (auto& e : entries_) {
    if (e.kind == kind) { e.names.push_back(name); return; }
  }
  entries_.push_back({kind, {name}});
}

void Requirements::merge_in(const Requirements& other) {
  for (auto& e : other.entries_)
    for (auto& n : e.names) add(e.kind, n);
}

std::optional<RegisterKind> Requirements::kind_of(const std::string& name) const {
  for (auto& e : entries_)
    if (std::find(e.names.begin(), e.names.end(), name) != e.names.end()) return e.kind;
  return std::nullopt;
}

bool Requirements::provides(const std::string& register_name) const {
  for (auto& e : entries_)
    for (auto& n : e.names) {
      auto regs = e.kind.register_names(n);
      if (std::find(regs.begin(), regs.end(), register_name) != regs.end()) return true;
    }
  return false;
}

std::optional<std::size_t> Requirements::register_width(const std::string& register_name) const {
  for (auto& e : entries_)
    for (auto& n : e.names) {
      if (e.kind.type != KindType::Agent) {
        if (e.kind.register_names(n).front() == register_name) return e.kind.width();
        continue;
      }
      const std::size_t mem = e.kind.memory, pred = e.kind.prediction;
      if (register_name == n) return e.kind.width();
      if (register_name == n + "_memory") return mem;
      if (register_name == n + "_prediction") return pred;
      if (register_name == n + "_inference") return (std::size_t(1) << mem) * pred;
    }
  return std::nullopt;
}

bool Requirements::satisfied_by(const Requirements& available) const {
  for (auto& e : entries_)
    for (auto& n : e.names) {
      auto have = available.kind_of(n);
      if (!have || !covers(*have, e.kind)) return false;
    }
  return true;
}

std::string Requirements::to_string() const {
  std::ostringstream out;
  out << "Requirements: \n" << std::string(30, '-') << "\n";
  for (auto& e : entries_) {
    std::string k = e.kind.str();
    out << k << std::string(k.size() < 18 ? 18 - k.size() : 1, ' ') << "[";
    for (std::size_t i = 0; i < e.names.size(); ++i) out << (i ? ", " : "") << "'" << e.names[i] << "'";
    out << "]\n";
  }
  return out.str();
}

bool Requirements::operator==(const Requirements& o) const {
  auto pairs = [](const Requirements& r) {
    std::set<std::pair<std::string, std::string>> s;
    for (auto& e : r.entries_) for (auto& n : e.names) s.insert({e.kind.str(), n});
    return s;
  };
  return pairs(*this) == pairs(o);
}

Requirements merge(const Requirements& a, const Requirements& b) {
  Requirements r = a;
  r.merge_in(b);
  return r;
}

void validate(const Requirements& reqs, const Interpretation& interp) {
  for (auto& e : reqs.entries())
    if (!interp.supports(e.kind.type))
      throw MalformedError("Interpretation '" + interp.name() + "' does not support register kind " + e.kind.str());
}

} // namespace qth
