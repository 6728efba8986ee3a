#include "internal/scoring/prioritizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/combination/combination_generator.hpp"
#include "internal/scoring/risk_scorer.hpp"
#include "snapshot_fixtures.hpp"

namespace {

using stpa::model::AbstractionLevel;
using stpa::model::CandidateCombination;
using stpa::model::CombinationType;
using stpa::scoring::Prioritizer;

CandidateCombination Scored(std::vector<std::string> controllers, std::uint32_t score,
                            CombinationType type = CombinationType::kCoOccurrence) {
  CandidateCombination candidate;
  candidate.controller_ids     = std::move(controllers);
  candidate.control_action_ids = {"x"};
  candidate.type               = type;
  candidate.risk_score         = score;
  return candidate;
}

void TestHighestScoreFirst() {
  const auto ranked = Prioritizer().Rank({Scored({"a", "b"}, 10), Scored({"a", "c"}, 40), Scored({"b", "c"}, 25)});

  assert(ranked.size() == 3);
  assert(ranked[0].risk_score == 40);
  assert(ranked[1].risk_score == 25);
  assert(ranked[2].risk_score == 10);
}

void TestTiesUseCanonicalOrder() {
  const auto ranked = Prioritizer().Rank({
      Scored({"b", "c"}, 20, CombinationType::kTemporalOrdering),
      Scored({"a", "c"}, 20),
      Scored({"b", "c"}, 20),
      Scored({"a", "b"}, 20),
  });

  assert((ranked[0].controller_ids == std::vector<std::string>{"a", "b"}));
  assert((ranked[1].controller_ids == std::vector<std::string>{"a", "c"}));
  assert((ranked[2].controller_ids == std::vector<std::string>{"b", "c"}));
  assert(ranked[2].type == CombinationType::kCoOccurrence);
  assert(ranked[3].type == CombinationType::kTemporalOrdering);
}

void TestMinimumScoreFilters() {
  const auto ranked = Prioritizer(20).Rank({Scored({"a", "b"}, 10), Scored({"a", "c"}, 40), Scored({"b", "c"}, 20)});

  assert(ranked.size() == 2);
  for (const auto& candidate : ranked) {
    assert(candidate.risk_score >= 20);
  }
}

std::vector<std::string> RankedSignatures(const stpa::model::Snapshot& snapshot) {
  auto candidates = stpa::combination::CombinationGenerator().Generate(snapshot).candidates;
  const stpa::model::SnapshotIndex index(snapshot);
  stpa::scoring::RiskScorer().Apply(candidates, index);

  std::vector<std::string> out;
  for (const auto& candidate : Prioritizer().Rank(std::move(candidates))) {
    out.push_back(std::to_string(candidate.risk_score) + " " + candidate.Signature() + " " +
                  std::string(stpa::model::ToString(candidate.abstraction)) + " " + candidate.rationale);
  }
  return out;
}

void TestPipelineIsDeterministic() {
  auto snapshot                   = stpa::testing::ThreeControllers();
  snapshot.controllers[0].type    = stpa::model::ControllerType::kTeam;
  snapshot.controllers[0].roles   = {"one", "two"};
  snapshot.controllers[1].team_id = "ctl-a";

  const auto first  = RankedSignatures(snapshot);
  const auto second = RankedSignatures(snapshot);
  assert(first == second);

  auto shuffled = snapshot;
  std::swap(shuffled.controllers[0], shuffled.controllers[2]);
  std::swap(shuffled.control_actions[0], shuffled.control_actions[1]);
  assert(RankedSignatures(shuffled) == first);
}

} // namespace

int main() {
  TestHighestScoreFirst();
  TestTiesUseCanonicalOrder();
  TestMinimumScoreFilters();
  TestPipelineIsDeterministic();

  std::cout << "stpa_coverage_unit_prioritizer: pass\n";
  return 0;
}
