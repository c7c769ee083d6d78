// SPDX-License-Identifier: MIT

#include "qthought/consistency.hpp"
#include "qthought/errors.hpp"
#include <iostream>

using namespace qth;

static int tests_failed = 0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_THROW(E, ...) do{ bool thrown=false; try { __VA_ARGS__; } catch (const E&) { thrown=true; } if (!thrown) { std::cerr << "EXPECT_THROW failed at " << __LINE__ << ": " #E "\n"; ++tests_failed; } }while(0)

using Entries = InferenceTable::Entries;

int main(){
  const InferenceTable ab("a", 1, "b", 2, {{0, {0, 1}}, {1, {1}}});
  const InferenceTable bc("b", 2, "c", 3, {{0, {2}}, {1, {3}}});
  const InferenceTable cd("c", 3, "d", 4, {{2, {0}}, {3, {0, 1}}});
  {
    auto ac = consistency(ab, bc);
    CHECK((ac.entries() == Entries{{0, {2, 3}}, {1, {3}}}));
    CHECK(ac.input() == "a" && ac.input_time() == 1);
    CHECK(ac.output() == "c" && ac.output_time() == 3);
    CHECK(!ac.has_contradiction());

    // identity on either side changes nothing
    CHECK(consistency(InferenceTable::identity("a", 1, 1), ab) == ab);
    CHECK(consistency(ab, InferenceTable::identity("b", 2, 1)) == ab);

    auto left = consistency(consistency(ab, bc), cd);
    auto right = consistency(ab, consistency(bc, cd));
    CHECK(left == right);
    CHECK(consistency_chain({ab, bc, cd}) == left);
    CHECK(consistency_chain({ab}) == ab);
    EXPECT_THROW(MalformedError, consistency_chain({}));
  }
  {
    // wrong register or wrong time
    EXPECT_THROW(MalformedError, consistency(ab, cd));
    const InferenceTable late("b", 5, "c", 6, {{0, {0}}});
    EXPECT_THROW(MalformedError, consistency(ab, late));
  }
  {
    // 1 -> {1} but post has nothing for 1
    const InferenceTable partial("b", 2, "c", 3, {{0, {0}}});
    auto t = consistency(ab, partial);
    CHECK(t.has_contradiction());
    CHECK(t.contradictions() == std::set<Value>{1});
    CHECK(t.contains(1) && t.at(1).empty());
    CHECK(t.at(0) == std::set<Value>{0});
    CHECK(t.to_string().find("(contradiction)") != std::string::npos);
    bool thrown = false;
    try {
      consistency(ab, partial, true);
    } catch (const ContradictionError& e) {
      thrown = true;
      CHECK(e.keys == std::vector<Value>{1});
    }
    CHECK(thrown);
    // a contradiction survives further merges
    const InferenceTable cc("c", 3, "c", 3, {{0, {0}}});
    CHECK(consistency(t, cc).contradictions() == std::set<Value>{1});
  }
  {
    // empty predictions stay empty without being a contradiction
    const InferenceTable sparse("a", 1, "b", 2, {{0, {}}, {1, {0}}});
    auto t = consistency(sparse, bc);
    CHECK(!t.has_contradiction());
    CHECK((t.entries() == Entries{{0, {}}, {1, {2}}}));
  }
  {
    InferenceTable ab_gap("a", 1, "b", 2, {{1, {1}}});
    ab_gap.mark_unreachable(0);
    auto t = consistency(ab_gap, bc);
    CHECK(t.unreachable() == std::set<Value>{0});
    CHECK((t.entries() == Entries{{1, {3}}}));
  }
  {
    const InferenceTable ref("a", 1, "c", 3, {{0, {3}}});
    auto t = consistency(ab, bc, ref);
    CHECK((t.entries() == Entries{{0, {3}}, {1, {3}}}));
    const InferenceTable clash("a", 1, "c", 3, {{1, {2}}});
    auto c = consistency(ab, bc, clash);
    CHECK(c.contradictions() == std::set<Value>{1});
    EXPECT_THROW(ContradictionError, consistency(ab, bc, clash, true));
    const InferenceTable other("a", 1, "d", 4, {});
    EXPECT_THROW(MalformedError, consistency(ab, bc, other));
  }
  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
