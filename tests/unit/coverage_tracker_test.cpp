#include "internal/coverage/coverage_tracker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

using stpa::coverage::CoverageTracker;
using stpa::coverage::TraversalPlan;
using stpa::events::CoverageEvent;
using stpa::events::RecordingEventSink;
using stpa::hierarchy::Movement;
using stpa::model::CellKey;
using stpa::model::CellState;

TraversalPlan Plan() {
  TraversalPlan plan;
  plan.controllers    = {{"c1", 0, {"a1", "a2"}}, {"c2", 1, {"b1"}}};
  plan.analysis_types = {"t1", "t2"};
  return plan;
}

void TestAdvanceWalksToTerminal() {
  CoverageTracker tracker(Plan());
  assert(tracker.CurrentCell() == (CellKey{"c1", "a1", "t1", 0}));
  assert(tracker.CurrentMovement() == Movement::kInitial);

  std::size_t visited = 1;
  while (tracker.Advance()) {
    ++visited;
    if (tracker.CurrentCell()->controller_id == "c2")
      assert(tracker.CurrentMovement() == Movement::kUpward);
  }

  assert(visited == 6);
  assert(tracker.AtTerminal());
  assert(!tracker.CurrentCell().has_value());
  assert(!tracker.Advance().has_value());

  const auto last = tracker.Retreat();
  assert(last == (CellKey{"c2", "b1", "t2", 0}));
}

void TestRetreatAtFirstCellStays() {
  CoverageTracker tracker(Plan());
  assert(tracker.Retreat() == (CellKey{"c1", "a1", "t1", 0}));

  tracker.Advance();
  tracker.Advance();
  tracker.Advance();
  tracker.Advance();
  assert(tracker.CurrentCell()->controller_id == "c2");
  tracker.Retreat();
  assert(tracker.CurrentCell() == (CellKey{"c1", "a2", "t2", 0}));
  assert(tracker.CurrentMovement() == Movement::kDownward);
}

void TestCompletionRatioIsMonotone() {
  CoverageTracker tracker(Plan());
  assert(tracker.CompletionRatio() == 0.0);

  double previous = 0.0;
  bool   skip     = false;
  for (auto cell = tracker.CurrentCell(); cell; cell = tracker.Advance()) {
    assert(tracker.CompletionRatio() < 1.0);
    const bool applied = skip ? tracker.MarkSkipped(*cell) : tracker.MarkCompleted(*cell);
    assert(applied);
    skip = !skip;

    const double ratio = tracker.CompletionRatio();
    assert(ratio > previous);
    previous = ratio;
  }

  assert(tracker.CompletionRatio() == 1.0);
  const auto stats = tracker.Stats();
  assert(stats.total_cells == 6);
  assert(stats.completed_cells == 3);
  assert(stats.skipped_cells == 3);
}

void TestAddInstanceKeepsCompletedOriginal() {
  auto sink = std::make_shared<RecordingEventSink>();
  CoverageTracker tracker(Plan(), sink, "session-1");

  const CellKey original{"c1", "a1", "t1", 0};
  assert(tracker.MarkCompleted(original));
  const double ratio = tracker.CompletionRatio();

  const auto created = tracker.AddInstance(original);
  assert(created == (CellKey{"c1", "a1", "t1", 1}));
  assert(tracker.StateOf(original) == CellState::kCompleted);
  assert(tracker.StateOf(*created) == CellState::kUnvisited);
  assert(tracker.CurrentCell() == created);
  assert(tracker.CompletionRatio() == ratio);
  assert(tracker.Stats().bonus_instances == 1);

  const auto second = tracker.AddInstance(original);
  assert(second && second->instance_index == 2);

  // Positioned on instance 2; advancing leaves the group.
  assert(tracker.Advance() == (CellKey{"c1", "a1", "t2", 0}));
  assert(tracker.Retreat() == second);
  assert(tracker.Retreat() == created);

  const auto events = sink->Drain();
  assert(events.size() == 1);
  const auto& event = std::get<CoverageEvent>(events.front());
  assert(event.session_id == "session-1");
  assert(event.cell == original);
  assert(event.state == CellState::kCompleted);
}

void TestOutOfScopeMarksAreIgnored() {
  auto sink = std::make_shared<RecordingEventSink>();
  CoverageTracker tracker(Plan(), sink);

  assert(!tracker.MarkCompleted(CellKey{"c9", "a1", "t1", 0}));
  assert(!tracker.MarkCompleted(CellKey{"c1", "b1", "t1", 0}));
  assert(!tracker.MarkSkipped(CellKey{"c1", "a1", "t9", 0}));
  assert(!tracker.MarkCompleted(CellKey{"c1", "a1", "t1", 1}));
  assert(!tracker.AddInstance(CellKey{"c9", "a1", "t1", 0}).has_value());

  assert(sink->Pending() == 0);
  assert(tracker.CompletionRatio() == 0.0);
  assert(tracker.StateOf(CellKey{"c1", "a1", "t1", 1}) == CellState::kUnvisited);
}

void TestRemarkingOverwritesState() {
  auto sink = std::make_shared<RecordingEventSink>();
  CoverageTracker tracker(Plan(), sink);
  const CellKey key{"c2", "b1", "t1", 0};

  assert(tracker.MarkCompleted(key));
  assert(tracker.MarkCompleted(key));
  assert(tracker.MarkSkipped(key));
  assert(tracker.StateOf(key) == CellState::kSkipped);
  assert(sink->Pending() == 2);
}

void TestRebaseKeepsStateAndPosition() {
  CoverageTracker tracker(Plan());
  const CellKey dropped{"c1", "a2", "t1", 0};
  assert(tracker.MarkCompleted(dropped));
  tracker.Advance();
  const auto position = tracker.CurrentCell();

  auto smaller                      = Plan();
  smaller.controllers[0].action_ids = {"a1"};
  tracker.Rebase(smaller);

  assert(tracker.Stats().total_cells == 4);
  assert(tracker.Stats().completed_cells == 0);
  assert(tracker.CurrentCell() == position);
  assert(!tracker.MarkSkipped(dropped));

  tracker.Rebase(Plan());
  assert(tracker.StateOf(dropped) == CellState::kCompleted);
  assert(tracker.Stats().completed_cells == 1);
}

void TestRebaseResetsLostPosition() {
  CoverageTracker tracker(Plan());
  tracker.Advance();
  tracker.Advance();
  assert(tracker.CurrentCell()->control_action_id == "a2");

  auto smaller                      = Plan();
  smaller.controllers[0].action_ids = {"a1"};
  tracker.Rebase(smaller);
  assert(tracker.CurrentCell() == (CellKey{"c1", "a1", "t1", 0}));
  assert(tracker.CurrentMovement() == Movement::kInitial);
}

void TestEmptyPlanIsComplete() {
  CoverageTracker tracker(TraversalPlan{});
  assert(!tracker.CurrentCell().has_value());
  assert(tracker.AtTerminal());
  assert(tracker.CompletionRatio() == 1.0);
  assert(!tracker.Advance().has_value());
  assert(!tracker.Retreat().has_value());
}

} // namespace

int main() {
  TestAdvanceWalksToTerminal();
  TestRetreatAtFirstCellStays();
  TestCompletionRatioIsMonotone();
  TestAddInstanceKeepsCompletedOriginal();
  TestOutOfScopeMarksAreIgnored();
  TestRemarkingOverwritesState();
  TestRebaseKeepsStateAndPosition();
  TestRebaseResetsLostPosition();
  TestEmptyPlanIsComplete();

  std::cout << "stpa_coverage_unit_coverage_tracker: pass\n";
  return 0;
}
