// SPDX-License-Identifier: MIT

#include "qthought/errors.hpp"
#include "qthought/experiments.hpp"
#include "qthought/gates.hpp"
#include "qthought/inference.hpp"
#include <iostream>
#include <limits>

using namespace qth;

static int tests_failed = 0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_THROW(E, ...) do{ bool thrown=false; try { __VA_ARGS__; } catch (const E&) { thrown=true; } if (!thrown) { std::cerr << "EXPECT_THROW failed at " << __LINE__ << ": " #E "\n"; ++tests_failed; } }while(0)

using Entries = InferenceTable::Entries;

int main(){
  auto interp = make_copenhagen();
  const Protocol bell = bell_protocol();
  {
    auto t = forward_inference(bell, interp, "Alice_memory", 1, "Bob_memory", 2);
    CHECK((t.entries() == Entries{{0, {0}}, {1, {1}}}));
    CHECK(t.input() == "Alice_memory" && t.input_time() == 1);
    CHECK(t.output() == "Bob_memory" && t.output_time() == 2);
    CHECK(t.unreachable().empty());

    // independent of the seed and of the worker layout
    InferenceOptions other;
    other.seed = 99;
    other.parallel = false;
    CHECK(forward_inference(bell, interp, "Alice_memory", 1, "Bob_memory", 2, other) == t);

    auto b = backward_inference(bell, interp, "Bob_memory", 2, "Alice_memory", 1);
    CHECK((b.entries() == Entries{{0, {0}}, {1, {1}}}));
    CHECK(b.input() == "Bob_memory" && b.output() == "Alice_memory");

    // same time: the register is read at the end of that step
    auto same = forward_inference(bell, interp, "s", 1, "Alice_memory", 1);
    CHECK((same.entries() == Entries{{0, {0}}, {1, {1}}}));
  }
  {
    const Requirements s{{"Qubit", {"s"}}};
    const Requirements as = merge(s, Requirements{{"AgentMemory(1)", {"Alice"}}});
    Protocol p{Step(s, "X", 0, Action::unitary(gates::X(), {"s"})),
               Step(as, "Alice observes s", 1, Action::observe("Alice_memory", "s"))};
    auto t = forward_inference(p, interp, "Alice_memory", 1, "s", 1);
    CHECK((t.entries() == Entries{{1, {1}}}));
    CHECK(t.unreachable() == std::set<Value>{0});
    CHECK(!t.contains(0));
    EXPECT_THROW(MalformedError, t.at(0));
    auto b = backward_inference(p, interp, "s", 1, "Alice_memory", 1);
    CHECK((b.entries() == Entries{{1, {1}}}));
    CHECK(b.unreachable() == std::set<Value>{0});
  }
  {
    // measurements inside the window branch instead of sampling
    const Requirements s{{"Qubit", {"s"}}};
    const Requirements as = merge(s, Requirements{{"AgentMemory(1)", {"Alice"}}});
    Protocol p{Step(s, "H", 0, Action::unitary(gates::H(), {"s"})),
               Step(s, "measure", 1, Action::measure("s")),
               Step(s, "H again", 2, Action::unitary(gates::H(), {"s"})),
               Step(s, "measure again", 3, Action::measure("s")),
               Step(as, "Alice observes s", 4, Action::observe("Alice_memory", "s"))};
    for (uint64_t seed : {1u, 2u, 3u}) {
      InferenceOptions o;
      o.seed = seed;
      auto t = forward_inference(p, interp, "s", 1, "Alice_memory", 4, o);
      CHECK((t.entries() == Entries{{0, {0, 1}}, {1, {0, 1}}}));
    }
    auto direct = forward_inference(p, interp, "s", 3, "Alice_memory", 4);
    CHECK((direct.entries() == Entries{{0, {0}}, {1, {1}}}));
  }
  {
    // the last representable time is a valid step time
    const int last = std::numeric_limits<int>::max();
    const Requirements s{{"Qubit", {"s"}}};
    Protocol p{Step(s, "H", 0, Action::unitary(gates::H(), {"s"})),
               Step(merge(s, Requirements{{"AgentMemory(1)", {"Alice"}}}), "Alice observes s", last,
                    Action::observe("Alice_memory", "s"))};
    auto t = forward_inference(p, interp, "Alice_memory", last, "s", last);
    CHECK((t.entries() == Entries{{0, {0}}, {1, {1}}}));
    auto b = backward_inference(p, interp, "s", last, "s", 0);
    CHECK((b.entries() == Entries{{0, {0}}, {1, {1}}}));
  }
  {
    EXPECT_THROW(MalformedError, forward_inference(bell, interp, "Alice_memory", 7, "Bob_memory", 2));
    EXPECT_THROW(MalformedError, forward_inference(bell, interp, "Alice_memory", 2, "Bob_memory", 1));
    EXPECT_THROW(MalformedError, backward_inference(bell, interp, "Bob_memory", 1, "Alice_memory", 2));
    EXPECT_THROW(DimensionError, forward_inference(bell, interp, "Carol_memory", 1, "Bob_memory", 2));
    EXPECT_THROW(DimensionError, forward_inference(bell, interp, "Alice_memory", 1, "Carol_memory", 2));
    Protocol wide{Step(Requirements{{"Qureg(21)", {"w"}}}, "nothing", 0, std::vector<Action>{})};
    EXPECT_THROW(DimensionError, forward_inference(wide, interp, "w", 0, "w", 0));
  }
  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
