#include "internal/combination/combination_generator.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "snapshot_fixtures.hpp"

namespace {

using stpa::combination::CombinationGenerator;
using stpa::combination::GenerationStatus;
using stpa::combination::GeneratorOptions;
using stpa::model::AbstractionLevel;
using stpa::model::CombinationType;
using stpa::model::ControllerType;
using stpa::testing::MakeAction;
using stpa::testing::MakeController;

GeneratorOptions CoOccurrenceOnly(std::uint32_t max_size) {
  GeneratorOptions options;
  options.max_combination_size           = max_size;
  options.include_temporal_ordering_type = false;
  return options;
}

void TestPairsOfThreeControllers() {
  const auto result = CombinationGenerator(CoOccurrenceOnly(2)).Generate(stpa::testing::ThreeControllers());

  assert(result.status == GenerationStatus::kOk);
  assert(result.candidates.size() == 3);
  for (const auto& candidate : result.candidates) {
    assert(candidate.controller_ids.size() == 2);
    assert(candidate.members.size() == 2);
    assert(candidate.type == CombinationType::kCoOccurrence);
  }

  const std::vector<std::string> first = {"ctl-a", "ctl-b"};
  const std::vector<std::string> last  = {"ctl-b", "ctl-c"};
  assert(result.candidates.front().controller_ids == first);
  assert(result.candidates.back().controller_ids == last);
}

void TestTripleIsAddedAtSizeThree() {
  const auto result = CombinationGenerator(CoOccurrenceOnly(3)).Generate(stpa::testing::ThreeControllers());

  assert(result.candidates.size() == 4);
  assert(result.candidates.back().controller_ids.size() == 3);
}

void TestBothTypesPerSubset() {
  GeneratorOptions options;
  options.max_combination_size = 2;
  const auto result            = CombinationGenerator(options).Generate(stpa::testing::ThreeControllers());

  assert(result.candidates.size() == 6);
  for (std::size_t i = 0; i < result.candidates.size(); i += 2) {
    const auto& co       = result.candidates[i];
    const auto& temporal = result.candidates[i + 1];
    assert(co.type == CombinationType::kCoOccurrence);
    assert(temporal.type == CombinationType::kTemporalOrdering);
    assert(co.control_action_ids == temporal.control_action_ids);
  }
}

void TestSingleControllerSubsetsAreDropped() {
  stpa::model::Snapshot snapshot;
  snapshot.controllers     = {MakeController("a", ControllerType::kHuman), MakeController("b", ControllerType::kSoftware)};
  snapshot.control_actions = {MakeAction("a1", "a"), MakeAction("a2", "a"), MakeAction("b1", "b")};

  const auto result = CombinationGenerator(CoOccurrenceOnly(2)).Generate(snapshot);

  assert(result.candidates.size() == 2);
  for (const auto& candidate : result.candidates) {
    assert(candidate.controller_ids.size() >= 2);
  }
}

void TestOutOfScopeActionsAreIgnored() {
  auto snapshot = stpa::testing::ThreeControllers();
  snapshot.control_actions.push_back(MakeAction("act-extra", "ctl-a", false));

  const auto result = CombinationGenerator(CoOccurrenceOnly(2)).Generate(snapshot);
  assert(result.candidates.size() == 3);
}

void TestInsufficientControllersIsAStatus() {
  stpa::model::Snapshot snapshot;
  snapshot.controllers     = {MakeController("a", ControllerType::kHuman), MakeController("b", ControllerType::kSoftware)};
  snapshot.control_actions = {MakeAction("a1", "a"), MakeAction("a2", "a"), MakeAction("b1", "b", false)};

  // Size 3 exceeds the controller count too; the status wins.
  const auto result = CombinationGenerator(CoOccurrenceOnly(3)).Generate(snapshot);
  assert(result.status == GenerationStatus::kInsufficientControllers);
  assert(result.candidates.empty());
}

void TestInvalidSizesThrow() {
  for (const std::uint32_t size : {0u, 1u, 4u}) {
    bool threw = false;
    try {
      (void)CombinationGenerator(CoOccurrenceOnly(size)).Generate(stpa::testing::ThreeControllers());
    } catch (const stpa::util::InvalidConfigurationError&) {
      threw = true;
    }
    assert(threw && "max_combination_size outside [2, controllers] must be rejected.");
  }
}

stpa::model::Snapshot TeamSnapshot() {
  stpa::model::Snapshot snapshot;
  snapshot.controllers = {
      MakeController("crew", ControllerType::kTeam, "", {"pilot", "copilot"}),
      MakeController("pilot", ControllerType::kHuman, "crew"),
      MakeController("copilot", ControllerType::kHuman, "crew"),
      MakeController("atc", ControllerType::kHuman),
  };
  snapshot.control_actions = {MakeAction("brief", "crew"), MakeAction("climb", "pilot"),
                              MakeAction("flaps", "copilot"), MakeAction("clear", "atc")};
  return snapshot;
}

void TestAbstractionFollowsTeamMembership() {
  const auto result = CombinationGenerator(CoOccurrenceOnly(2)).Generate(TeamSnapshot());
  assert(result.candidates.size() == 6);

  std::set<std::vector<std::string>> same_team;
  for (const auto& candidate : result.candidates) {
    if (candidate.abstraction == AbstractionLevel::kSameTeam)
      same_team.insert(candidate.controller_ids);
  }

  const std::set<std::vector<std::string>> expected = {
      {"copilot", "crew"}, {"copilot", "pilot"}, {"crew", "pilot"}};
  assert(same_team == expected);
}

void TestAbstractionFlagsFilter() {
  auto options                          = CoOccurrenceOnly(3);
  options.include_same_team_abstraction = false;
  auto result                           = CombinationGenerator(options).Generate(TeamSnapshot());
  for (const auto& candidate : result.candidates) {
    assert(candidate.abstraction == AbstractionLevel::kCrossController);
  }

  options.include_same_team_abstraction        = true;
  options.include_cross_controller_abstraction = false;
  result                                       = CombinationGenerator(options).Generate(TeamSnapshot());
  // Three pairs plus the crew/pilot/copilot triple.
  assert(result.candidates.size() == 4);
  for (const auto& candidate : result.candidates) {
    assert(candidate.abstraction == AbstractionLevel::kSameTeam);
  }
}

void TestForEachStreamsSameSequence() {
  GeneratorOptions options;
  CombinationGenerator generator(options);
  const auto collected = generator.Generate(TeamSnapshot());

  std::vector<std::string> streamed;
  const auto status = generator.ForEach(TeamSnapshot(), [&](stpa::model::CandidateCombination&& candidate) {
    streamed.push_back(candidate.Signature());
  });

  assert(status == GenerationStatus::kOk);
  assert(streamed.size() == collected.candidates.size());
  for (std::size_t i = 0; i < streamed.size(); ++i) {
    assert(streamed[i] == collected.candidates[i].Signature());
  }
}

} // namespace

int main() {
  TestPairsOfThreeControllers();
  TestTripleIsAddedAtSizeThree();
  TestBothTypesPerSubset();
  TestSingleControllerSubsetsAreDropped();
  TestOutOfScopeActionsAreIgnored();
  TestInsufficientControllersIsAStatus();
  TestInvalidSizesThrow();
  TestAbstractionFollowsTeamMembership();
  TestAbstractionFlagsFilter();
  TestForEachStreamsSameSequence();

  std::cout << "stpa_coverage_unit_combination_generator: pass\n";
  return 0;
}
