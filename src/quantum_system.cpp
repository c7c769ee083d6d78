// SPDX-License-Identifier: MIT

#include "qthought/quantum_system.hpp"
#include "qthought/errors.hpp"
#include "qthought/inference_table.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace qth {

static std::size_t checked_width(const Requirements& reqs, const Interpretation* interp) {
  if (!interp) throw MalformedError("A quantum system needs an interpretation");
  validate(reqs, *interp);
  std::size_t n = 0;
  for (auto& e : reqs.entries()) {
    if (e.kind.type == KindType::Agent && e.kind.memory > 5)
      throw DimensionError("Agent memory of " + std::to_string(e.kind.memory) + " bits is too large to simulate");
    n += e.kind.width() * e.names.size();
  }
  return n;
}

QuantumSystem::QuantumSystem(const Requirements& reqs, std::shared_ptr<const Interpretation> interp,
                             uint64_t seed, bool silent)
  : reqs_(reqs), interp_(std::move(interp)), sv_(checked_width(reqs, interp_.get())), rng_(seed),
    tol_(interp_->tolerance()), silent_(silent) {
  std::size_t offset = 0;
  auto push = [&](Register r) {
    index_[r.name] = regs_.size();
    regs_.push_back(std::move(r));
  };
  for (auto& e : reqs.entries()) {
    for (auto& name : e.names) {
      const auto& k = e.kind;
      switch (k.type) {
        case KindType::Qubit:
        case KindType::Qureg:
          push({name, k, offset, k.width(), ""});
          break;
        case KindType::AgentMemory:
          push({name + "_memory", k, offset, k.memory, ""});
          break;
        case KindType::Agent: {
          agent_index_[name] = agents_.size();
          agents_.emplace_back(name, k.memory, k.prediction);
          const Agent& a = agents_.back();
          push({name, k, offset, k.width(), ""});
          push({a.memory_register(), k, offset, k.memory, name});
          push({a.prediction_register(), k, offset + k.memory, k.prediction, name});
          push({a.inference_register(), k, offset + k.memory + k.prediction, a.inference_width(), name});
          break;
        }
      }
      if (!silent_) std::cout << "Require " << k.str() << " " << name << "\n";
      offset += k.width();
    }
  }
}

const Register& QuantumSystem::reg(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) throw DimensionError("Your quantum system has no subsystem '" + name + "'");
  return regs_[it->second];
}

std::vector<std::size_t> QuantumSystem::bits(const std::string& name) const {
  const Register& r = reg(name);
  std::vector<std::size_t> b(r.width);
  for (std::size_t j = 0; j < r.width; ++j) b[j] = r.offset + j;
  return b;
}

std::vector<std::size_t> QuantumSystem::bits_of_(const std::vector<std::string>& names) const {
  std::vector<std::size_t> out;
  for (auto& n : names) {
    auto b = bits(n);
    out.insert(out.end(), b.begin(), b.end());
  }
  return out;
}

void QuantumSystem::set_amplitudes(const vec_c64& amps) {
  if (!sv_.set_amplitudes(amps, tol_))
    throw DimensionError("Invalid wavefunction: expected " + std::to_string(sv_.dimension()) +
                         " amplitudes with non-zero norm, got " + std::to_string(amps.size()));
  reachable_ = true;
  // the inference registers now hold whatever the new amplitudes say
  for (auto& a : agents_) a.clear_prepared();
  if (!silent_) std::cout << "Wavefunction set to custom state.\n";
}

void QuantumSystem::reset() {
  sv_.reset();
  reachable_ = true;
  weight_ = 1.0;
  outcomes_.clear();
  for (auto& a : agents_) a.clear_prepared();
}

void QuantumSystem::apply(const Operation& op, const std::vector<std::string>& targets,
                          const std::vector<std::string>& controls) {
  auto t = bits_of_(targets);
  if (t.size() != op.arity())
    throw DimensionError("Operation '" + op.name() + "' acts on " + std::to_string(op.arity()) +
                         " bits but its targets have " + std::to_string(t.size()));
  sv_.apply(op, t, bits_of_(controls));
}

Value QuantumSystem::measure(const std::string& name) {
  Value v = sv_.measure(bits(name), rng_, tol_);
  outcomes_.emplace_back(name, v);
  if (!silent_) std::cout << "Measured " << name << ": " << readout_bits(name) << "\n";
  return v;
}

QuantumSystem QuantumSystem::project_to(const std::string& name, Value value) const {
  const Register& r = reg(name);
  if (r.width < 64 && value >= (Value(1) << r.width))
    throw DimensionError("Value " + std::to_string(value) + " does not fit register '" + name + "'");
  QuantumSystem branch = *this;
  double kept = branch.sv_.project(bits(name), value, tol_);
  branch.weight_ *= kept;
  if (std::sqrt(kept) < tol_) branch.reachable_ = false;
  return branch;
}

Value QuantumSystem::readout(const std::string& name) const {
  auto vals = possible_values(name);
  if (vals.size() != 1)
    throw NotCollapsedError("Subsystem '" + name + "' is not in a definite state (" + std::to_string(vals.size()) +
                            " possible values). Measure it first");
  return vals.front();
}

std::string QuantumSystem::readout_bits(const std::string& name) const {
  Value v = readout(name);
  const Register& r = reg(name);
  std::string s(r.width, '0');
  for (std::size_t j = 0; j < r.width; ++j) if ((v >> j) & 1) s[r.width - 1 - j] = '1';
  return s;
}

double QuantumSystem::probability(const std::string& name, Value value) const {
  return sv_.probability(bits(name), value);
}

std::vector<Value> QuantumSystem::possible_values(const std::string& name) const {
  auto p = sv_.distribution(bits(name));
  std::vector<Value> out;
  for (std::size_t v = 0; v < p.size(); ++v)
    if (std::sqrt(p[v]) > tol_) out.push_back(v);
  return out;
}

Agent& QuantumSystem::agent(const std::string& name) {
  auto it = agent_index_.find(name);
  if (it == agent_index_.end()) throw DimensionError("Your quantum system has no agent '" + name + "'");
  return agents_[it->second];
}

const Agent& QuantumSystem::agent(const std::string& name) const {
  auto it = agent_index_.find(name);
  if (it == agent_index_.end()) throw DimensionError("Your quantum system has no agent '" + name + "'");
  return agents_[it->second];
}

void QuantumSystem::observe(const std::string& memory, const std::string& source, bool reverse) {
  const std::size_t mw = reg(memory).width, sw = reg(source).width;
  Operation op = reverse ? interp_->observe_adjoint(mw, sw) : interp_->observe_unitary(mw, sw);
  apply(op, {source, memory});
}

void QuantumSystem::set_inference_table(const std::string& name, const InferenceTable& table, Value no_prediction) {
  agent(name).set_inference_table(table, no_prediction);
}

void QuantumSystem::prep_inference(const std::string& name) {
  Agent& a = agent(name);
  const Value target = a.table_bits();
  const Value flip = a.loaded_bits() ^ target;
  if (flip != 0) {
    auto x = [flip](Value v){ return v ^ flip; };
    apply(Operation::from_map(a.inference_width(), x, x, "LOAD(" + name + ")"), {a.inference_register()});
  }
  a.mark_prepared(target);
}

void QuantumSystem::make_inference(const std::string& name, bool reverse) {
  const Agent& a = agent(name);
  if (!a.prepared() && !silent_)
    std::cerr << "warning: make_inference called on " << name << " without preparing an inference table\n";
  Operation op = interp_->inference_unitary(a);
  apply(reverse ? op.adjoint() : op, {a.memory_register(), a.prediction_register(), a.inference_register()});
}

Value QuantumSystem::outcome(const std::string& name) const {
  for (auto it = outcomes_.rbegin(); it != outcomes_.rend(); ++it)
    if (it->first == name) return it->second;
  throw NotCollapsedError("Subsystem '" + name + "' has not been measured");
}

static std::string cround(c64 a) {
  auto r2 = [](double x){ double v = std::round(x * 100.0) / 100.0; return v == 0.0 ? 0.0 : v; };
  double re = r2(a.real()), im = r2(a.imag());
  std::ostringstream out;
  if (im == 0.0) out << re;
  else if (re == 0.0) out << im << "i";
  else out << "(" << re << (im < 0 ? "-" : "+") << std::fabs(im) << "i)";
  return out.str();
}

std::string QuantumSystem::wavefunction_string() const {
  std::ostringstream out;
  const auto& amp = sv_.amplitudes();
  bool first = true;
  for (std::size_t i = 0; i < amp.size(); ++i) {
    if (std::abs(amp[i]) <= tol_) continue;
    out << (first ? "" : " + ") << cround(amp[i]) << "|";
    first = false;
    bool sep = false;
    // Print order: last register first, most significant bit first
    for (auto it = regs_.rbegin(); it != regs_.rend(); ++it) {
      if (!it->parent.empty()) continue;
      out << (sep ? " " : "");
      sep = true;
      for (std::size_t j = it->width; j-- > 0;) out << ((i >> (it->offset + j)) & 1);
    }
    out << ">";
  }
  return out.str();
}

std::string QuantumSystem::to_string() const {
  std::ostringstream out;
  out << "QuantumSystem object: \n";
  out << std::left << std::setw(14) << "Nqubits:" << num_qubits() << " \n";
  out << std::setw(14) << "Print order:";
  for (auto it = regs_.rbegin(); it != regs_.rend(); ++it)
    if (it->parent.empty()) out << it->name << " ";
  out << "\nWavefunction: \n" << wavefunction_string();
  return out.str();
}

} // namespace qth
