// SPDX-License-Identifier: MIT

#include "qthought/experiments.hpp"
#include "qthought/quantum_tree.hpp"
#include <cmath>
#include <iostream>

using namespace qth;

static int tests_failed = 0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)

using Entries = InferenceTable::Entries;

int main(){
  auto interp = make_copenhagen();
  const Protocol p = frauchiger_renner_protocol();
  CHECK(p.size() == 14);
  {
    QuantumSystem sys(p.requirements(), interp);
    CHECK(sys.num_qubits() == 14);
    CHECK(sys.has_agent("Alice") && sys.has_agent("Bob") && sys.has_agent("Ursula"));
  }
  {
    // r starts in sqrt(1/3)|0> + sqrt(2/3)|1>
    QuantumSystem sys(Requirements{{"Qubit", {"r"}}}, interp);
    sys.apply(fr_init_r(), {"r"});
    EXPECT_NEAR(sys.probability("r", 1), 2.0/3.0, 1e-12);
  }

  const FrTables t = derive_fr_tables(p, interp);
  CHECK((t.alice.entries() == Entries{{0, {0, 1}}, {1, {0}}}));
  CHECK((t.bob.entries() == Entries{{0, {0, 1}}, {1, {1}}}));
  CHECK((t.ursula.entries() == Entries{{0, {0, 1}}, {1, {1}}}));
  CHECK((t.bob_consistent.entries() == Entries{{0, {0, 1}}, {1, {0}}}));
  CHECK((t.ursula_consistent.entries() == Entries{{0, {0, 1}}, {1, {0}}}));
  CHECK(t.ursula_consistent.input() == "Ursula_memory" && t.ursula_consistent.input_time() == 9);
  CHECK(t.ursula_consistent.output() == "s" && t.ursula_consistent.output_time() == 14);
  CHECK(!t.bob_consistent.has_contradiction() && !t.ursula_consistent.has_contradiction());

  {
    InferenceOptions serial;
    serial.parallel = false;
    serial.seed = 7;
    CHECK(derive_fr_tables(p, interp, serial).ursula_consistent == t.ursula_consistent);
  }
  {
    // Ursula sees ok, predicts Wigner sees fail; Wigner sees ok in 1/12 of the runs
    auto r = run_frauchiger_renner(10000, 2024, interp, t);
    CHECK(r.trials == 10000);
    EXPECT_NEAR(r.exact_probability, 1.0/12.0, 1e-9);
    EXPECT_NEAR(r.frequency, 1.0/12.0, 0.01);
    auto again = run_frauchiger_renner(500, 2024, interp, t);
    auto same = run_frauchiger_renner(500, 2024, interp, t);
    CHECK(again.contradictions == same.contradictions);
  }
  {
    // Ursula's announcement and Wigner's result over every branch
    QuantumSystem sys(p.requirements(), interp);
    sys.set_inference_table("Alice", t.alice, kFrNoPrediction);
    sys.set_inference_table("Bob", t.bob_consistent, kFrNoPrediction);
    sys.set_inference_table("Ursula", t.ursula_consistent, kFrNoPrediction);
    for (const char* name : {"Alice", "Bob", "Ursula"}) sys.prep_inference(name);
    QuantumTree tree(sys);
    tree.run(p, RunOptions{});
    double total = 0.0, fail_announced = 0.0;
    for (const auto& b : tree.branches()) {
      total += b.weight();
      if (b.readout("Ursula_prediction") == 0) fail_announced += b.weight();
    }
    EXPECT_NEAR(total, 1.0, 1e-9);
    EXPECT_NEAR(fail_announced, 1.0/6.0, 1e-9);
    CHECK(tree.possible_outcomes("s") == std::set<Value>({0, 1}));
  }
  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
