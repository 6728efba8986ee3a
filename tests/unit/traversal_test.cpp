#include "internal/coverage/traversal.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "snapshot_fixtures.hpp"

namespace {

using stpa::coverage::AtCell;
using stpa::coverage::InstanceCounts;
using stpa::coverage::Position;
using stpa::coverage::Terminal;
using stpa::coverage::TraversalPlan;
using stpa::model::CellKey;

TraversalPlan TwoControllerPlan() {
  TraversalPlan plan;
  plan.controllers    = {{"c1", 0, {"a1", "a2"}}, {"c2", 1, {"b1"}}};
  plan.analysis_types = {"t1", "t2"};
  return plan;
}

std::vector<std::string> WalkForward(const TraversalPlan& plan, const InstanceCounts& counts) {
  std::vector<std::string> cells;
  for (Position p = stpa::coverage::FirstPosition(plan); std::holds_alternative<AtCell>(p);
       p = stpa::coverage::NextPosition(plan, p, counts)) {
    cells.push_back(stpa::coverage::KeyAt(plan, std::get<AtCell>(p)).ToString());
  }
  return cells;
}

std::vector<std::string> WalkBackward(const TraversalPlan& plan, const InstanceCounts& counts) {
  std::vector<std::string> cells;
  Position p = stpa::coverage::PreviousPosition(plan, Terminal{}, counts);
  while (std::holds_alternative<AtCell>(p)) {
    cells.push_back(stpa::coverage::KeyAt(plan, std::get<AtCell>(p)).ToString());
    const auto previous = stpa::coverage::PreviousPosition(plan, p, counts);
    if (previous == p)
      break;
    p = previous;
  }
  return cells;
}

void TestForwardOrder() {
  const auto cells = WalkForward(TwoControllerPlan(), {});

  const std::vector<std::string> expected = {"c1/a1/t1#0", "c1/a1/t2#0", "c1/a2/t1#0",
                                             "c1/a2/t2#0", "c2/b1/t1#0", "c2/b1/t2#0"};
  assert(cells == expected);
  assert(TwoControllerPlan().CellCount() == 6);
}

void TestExtraInstancesAreVisitedInPlace() {
  InstanceCounts counts;
  counts[CellKey{"c1", "a1", "t1", 0}] = 3;

  const auto cells = WalkForward(TwoControllerPlan(), counts);
  assert(cells.size() == 8);
  assert(cells[0] == "c1/a1/t1#0");
  assert(cells[1] == "c1/a1/t1#1");
  assert(cells[2] == "c1/a1/t1#2");
  assert(cells[3] == "c1/a1/t2#0");
}

void TestRetreatIsInverseOfAdvance() {
  InstanceCounts counts;
  counts[CellKey{"c1", "a2", "t2", 0}] = 2;
  counts[CellKey{"c2", "b1", "t2", 0}] = 2;

  const auto plan     = TwoControllerPlan();
  auto       backward = WalkBackward(plan, counts);
  std::reverse(backward.begin(), backward.end());
  assert(backward == WalkForward(plan, counts));
}

void TestRetreatAtFirstCellIsNoOp() {
  const auto     plan  = TwoControllerPlan();
  const Position first = stpa::coverage::FirstPosition(plan);
  assert(stpa::coverage::PreviousPosition(plan, first, {}) == first);
}

void TestTerminalIsAbsorbing() {
  const auto     plan = TwoControllerPlan();
  const Position end  = Terminal{};
  assert(std::holds_alternative<Terminal>(stpa::coverage::NextPosition(plan, end, {})));

  const auto last = stpa::coverage::PreviousPosition(plan, end, {});
  assert(stpa::coverage::KeyAt(plan, std::get<AtCell>(last)).ToString() == "c2/b1/t2#0");
}

void TestEmptyPlan() {
  TraversalPlan plan;
  plan.analysis_types = {"t1"};
  assert(plan.CellCount() == 0);
  assert(std::holds_alternative<Terminal>(stpa::coverage::FirstPosition(plan)));
  assert(std::holds_alternative<Terminal>(stpa::coverage::PreviousPosition(plan, Terminal{}, {})));
}

void TestLocate() {
  const auto plan = TwoControllerPlan();
  const auto cell = stpa::coverage::Locate(plan, CellKey{"c1", "a2", "t2", 4});
  assert(cell && cell->controller_index == 0 && cell->action_index == 1 && cell->type_index == 1);
  assert(cell->instance == 0);

  assert(!stpa::coverage::Locate(plan, CellKey{"c1", "b1", "t1", 0}));
  assert(!stpa::coverage::Locate(plan, CellKey{"c1", "a1", "t9", 0}));
  assert(plan.Contains("c2", "b1", "t1"));
  assert(!plan.Contains("c3", "b1", "t1"));
}

void TestBuildPlanFollowsHierarchy() {
  stpa::model::Snapshot snapshot;
  using stpa::model::ControllerType;
  snapshot.controllers = {stpa::testing::MakeController("boss", ControllerType::kHuman),
                          stpa::testing::MakeController("idle", ControllerType::kHuman),
                          stpa::testing::MakeController("worker", ControllerType::kSoftware)};
  snapshot.control_paths = {stpa::testing::MakePath("boss", "worker"), stpa::testing::MakePath("boss", "idle")};
  snapshot.control_actions = {stpa::testing::MakeAction("order", "boss"), stpa::testing::MakeAction("run", "worker"),
                              stpa::testing::MakeAction("halt", "worker"),
                              stpa::testing::MakeAction("nap", "idle", false)};

  const auto hierarchy = stpa::hierarchy::HierarchyBuilder::Build(snapshot);
  const stpa::model::SnapshotIndex index(snapshot);
  const auto plan = stpa::coverage::BuildPlan(hierarchy, index, {"t1"});

  assert(plan.controllers.size() == 2);
  assert(plan.controllers[0].controller_id == "worker");
  assert((plan.controllers[0].action_ids == std::vector<std::string>{"halt", "run"}));
  assert(plan.controllers[0].level == 0);
  assert(plan.controllers[1].controller_id == "boss");
  assert(plan.controllers[1].level == 1);
  assert(plan.CellCount() == 3);
}

} // namespace

int main() {
  TestForwardOrder();
  TestExtraInstancesAreVisitedInPlace();
  TestRetreatIsInverseOfAdvance();
  TestRetreatAtFirstCellIsNoOp();
  TestTerminalIsAbsorbing();
  TestEmptyPlan();
  TestLocate();
  TestBuildPlanFollowsHierarchy();

  std::cout << "stpa_coverage_unit_traversal: pass\n";
  return 0;
}
