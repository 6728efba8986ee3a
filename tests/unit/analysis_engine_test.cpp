#include "internal/engine/analysis_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "snapshot_fixtures.hpp"

namespace {

using stpa::combination::GenerationStatus;
using stpa::engine::AnalysisEngine;
using stpa::engine::AnalysisOptions;
using stpa::model::ControllerType;

AnalysisOptions PairsOnly() {
  AnalysisOptions options;
  options.generator.max_combination_size = 2;
  return options;
}

void TestUnchangedSnapshotIsMemoized() {
  AnalysisEngine engine(PairsOnly());
  const auto snapshot = stpa::testing::ThreeControllers();

  const auto first  = engine.Analyze(snapshot);
  const auto second = engine.Analyze(snapshot);
  assert(first == second);
  assert(engine.computations() == 1);

  // Same content, different order: same hash.
  auto reordered = snapshot;
  std::swap(reordered.controllers[0], reordered.controllers[1]);
  assert(engine.Analyze(reordered) == first);
  assert(engine.computations() == 1);
}

void TestChangedSnapshotIsRecomputed() {
  AnalysisEngine engine(PairsOnly());
  auto       snapshot = stpa::testing::ThreeControllers();
  const auto before   = engine.Analyze(snapshot);

  snapshot.findings.push_back(stpa::testing::MakeFinding("f1", "ctl-a", "act-ctl-a"));
  const auto after = engine.Analyze(snapshot);

  assert(engine.computations() == 2);
  assert(before->snapshot_hash != after->snapshot_hash);
  assert(after->ranked.front().risk_score == 20);
  assert(after->ranked.front().controller_ids.front() == "ctl-a");
}

void TestStatistics() {
  auto snapshot                   = stpa::testing::ThreeControllers();
  snapshot.controllers[0].type    = ControllerType::kOrganization;
  snapshot.controllers[1].type    = ControllerType::kTeam;
  snapshot.controllers[1].roles   = {"x", "y"};
  snapshot.controllers[2].team_id = "ctl-b";

  AnalysisEngine engine(PairsOnly());
  const auto  result = engine.Analyze(snapshot);
  const auto& stats  = result->statistics;

  assert(result->status == GenerationStatus::kOk);
  assert(result->scoring_policy_version == "2024.1");
  assert(stats.total == 6);
  assert(stats.co_occurrence == 3);
  assert(stats.temporal_ordering == 3);
  assert(stats.same_team == 2);
  assert(stats.cross_controller == 4);

  // a+b = 10+5+15+20+8 = 58; a+c = 10+5+20 = 35; b+c = 10+5+15+8 = 38.
  assert(stats.high_risk == 0);
  assert(stats.mean_score > 43.6 && stats.mean_score < 43.7);
  assert(result->ranked.front().risk_score == 58);
}

void TestInsufficientControllers() {
  stpa::model::Snapshot snapshot;
  snapshot.controllers     = {stpa::testing::MakeController("solo", ControllerType::kHuman)};
  snapshot.control_actions = {stpa::testing::MakeAction("a1", "solo"), stpa::testing::MakeAction("a2", "solo")};

  AnalysisEngine engine;
  const auto result = engine.Analyze(snapshot);
  assert(result->status == GenerationStatus::kInsufficientControllers);
  assert(result->ranked.empty());
  assert(result->statistics.total == 0);
  assert(result->statistics.mean_score == 0.0);
}

void TestOversizedCombinationLeavesRankingEmpty() {
  auto snapshot                            = stpa::testing::ThreeControllers();
  snapshot.control_actions.back().in_scope = false;

  AnalysisEngine engine;
  const auto result = engine.Analyze(snapshot);
  assert(result->status == GenerationStatus::kInvalidConfiguration);
  assert(result->error.find("max_combination_size") != std::string::npos);
  assert(result->ranked.empty());
  assert(result->statistics.total == 0);

  snapshot.control_actions.back().in_scope = true;
  const auto restored                      = engine.Analyze(snapshot);
  assert(restored->status == GenerationStatus::kOk);
  assert(restored->error.empty());
  assert(!restored->ranked.empty());
}

void TestHighRiskThreshold() {
  std::vector<stpa::model::CandidateCombination> candidates(3);
  candidates[0].risk_score = 70;
  candidates[1].risk_score = 69;
  candidates[2].risk_score = 100;
  assert(stpa::engine::ComputeStatistics(candidates).high_risk == 2);
}

} // namespace

int main() {
  TestUnchangedSnapshotIsMemoized();
  TestChangedSnapshotIsRecomputed();
  TestStatistics();
  TestInsufficientControllers();
  TestOversizedCombinationLeavesRankingEmpty();
  TestHighRiskThreshold();

  std::cout << "stpa_coverage_unit_analysis_engine: pass\n";
  return 0;
}
