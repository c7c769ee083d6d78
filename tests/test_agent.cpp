// SPDX-License-Identifier: MIT

#include "qthought/agent.hpp"
#include "qthought/errors.hpp"
#include "qthought/gates.hpp"
#include "qthought/inference_table.hpp"
#include "qthought/quantum_system.hpp"
#include <cmath>
#include <iostream>

using namespace qth;

static int tests_failed = 0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_THROW(E, ...) do{ bool thrown=false; try { __VA_ARGS__; } catch (const E&) { thrown=true; } if (!thrown) { std::cerr << "EXPECT_THROW failed at " << __LINE__ << ": " #E "\n"; ++tests_failed; } }while(0)

int main(){
  auto interp = make_copenhagen();
  const Requirements reqs{{"Qubit", {"s"}}, {"Agent(1,1)", {"Alice"}}};
  {
    QuantumSystem sys(reqs, interp);
    CHECK(sys.num_qubits() == 1 + 4);
    CHECK(sys.reg("Alice_inference").width == 2);
    CHECK(sys.reg("Alice_prediction").offset == 2);
    CHECK(sys.has_agent("Alice") && !sys.has_agent("Bob"));
    EXPECT_THROW(DimensionError, sys.agent("Bob"));
    EXPECT_THROW(DimensionError, sys.reg("Bob_memory"));

    sys.apply(gates::H(), {"s"});
    const vec_c64 before = sys.state().amplitudes();
    sys.observe("Alice_memory", "s");
    EXPECT_NEAR(sys.probability("Alice_memory", 1), 0.5, 1e-9);
    EXPECT_THROW(NotCollapsedError, sys.readout("s"));
    EXPECT_THROW(NotCollapsedError, sys.outcome("s"));
    QuantumSystem one = sys.project_to("s", 1);
    CHECK(one.readout("Alice_memory") == 1);
    EXPECT_NEAR(one.weight(), 0.5, 1e-9);
    sys.observe("Alice_memory", "s", true);
    CHECK(sys.readout("Alice_memory") == 0);
    for (std::size_t i=0;i<before.size();++i) EXPECT_NEAR(std::abs(sys.state().amplitudes()[i] - before[i]), 0.0, 1e-12);
    CHECK(sys.readout_bits("Alice") == "0000");
    CHECK(sys.wavefunction_string() == "0.71|0000 0> + 0.71|0000 1>");
  }
  {
    Agent a("Alice", 1, 1);
    InferenceTable t("Alice_memory", 1, "s", 2, {{0, {1}}, {1, {0, 1}}});
    a.set_inference_table(t, 0);
    CHECK((a.predictions() == std::vector<Value>{1, 0}));
    CHECK(a.table_bits() == 1);
    a.set_inference_table(InferenceTable("Alice_memory", 1, "s", 2, {{1, {1}}}), 0);
    CHECK(a.table_bits() == 2);
    EXPECT_THROW(DimensionError, a.set_inference_table(InferenceTable("Alice_memory", 1, "s", 2, {{2, {0}}})));
    EXPECT_THROW(DimensionError, a.set_inference_table(InferenceTable("Alice_memory", 1, "s", 2, {{0, {2}}})));
    EXPECT_THROW(DimensionError, a.set_inference_table(t, 2));
    EXPECT_THROW(DimensionError, Agent("Bob", 1, 2));
    EXPECT_THROW(DimensionError, Agent("Bob", 0, 0));
  }
  {
    // Alice predicts the opposite of what she saw
    QuantumSystem sys(reqs, interp);
    sys.set_inference_table("Alice", InferenceTable("Alice_memory", 1, "s", 2, {{0, {1}}, {1, {0}}}));
    sys.prep_inference("Alice");
    sys.prep_inference("Alice");
    CHECK(sys.agent("Alice").prepared());
    CHECK(sys.readout("Alice_inference") == 1);

    sys.apply(gates::H(), {"s"});
    sys.observe("Alice_memory", "s");
    sys.make_inference("Alice");
    for (Value v : {Value(0), Value(1)}) {
      QuantumSystem branch = sys.project_to("Alice_memory", v);
      CHECK(branch.readout("Alice_prediction") == 1 - v);
    }
    sys.make_inference("Alice", true);
    CHECK(sys.readout("Alice_prediction") == 0);
    Value m = sys.measure("s");
    CHECK(sys.outcome("s") == m);
    CHECK(sys.readout("Alice_memory") == m);

    // a new table is loaded on top of the old one
    sys.set_inference_table("Alice", InferenceTable("Alice_memory", 1, "s", 2, {{0, {0}}, {1, {1}}}));
    sys.prep_inference("Alice");
    CHECK(sys.readout("Alice_inference") == 2);
    sys.reset();
    CHECK(!sys.agent("Alice").prepared());
    CHECK(sys.readout("Alice_inference") == 0);
    CHECK(sys.outcomes().empty());
  }
  {
    // a custom wavefunction replaces the loaded table, so it must be loaded again
    QuantumSystem sys(reqs, interp);
    sys.set_inference_table("Alice", InferenceTable("Alice_memory", 1, "s", 2, {{0, {1}}, {1, {1}}}));
    sys.prep_inference("Alice");
    CHECK(sys.readout("Alice_inference") == 3);
    vec_c64 ground(32);
    ground[0] = c64(1.0, 0.0);
    sys.set_amplitudes(ground);
    CHECK(!sys.agent("Alice").prepared());
    CHECK(sys.readout("Alice_inference") == 0);
    sys.prep_inference("Alice");
    CHECK(sys.readout("Alice_inference") == 3);
    sys.make_inference("Alice");
    CHECK(sys.readout("Alice_prediction") == 1);
  }
  {
    QuantumSystem sys(reqs, interp);
    EXPECT_THROW(DimensionError, sys.set_amplitudes(vec_c64(4)));
    vec_c64 amps(32);
    amps[1] = c64(1.0, 0.0);
    sys.set_amplitudes(amps);
    CHECK(sys.readout("s") == 1);
    EXPECT_THROW(DimensionError, sys.project_to("s", 2));
    QuantumSystem none = sys.project_to("s", 0);
    CHECK(!none.reachable());
    EXPECT_THROW(DimensionError, QuantumSystem(Requirements{{"Agent(6,1)", {"Big"}}}, interp));
  }
  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
