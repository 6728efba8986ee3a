#include "internal/scoring/risk_scorer.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace stpa::scoring {

namespace {

void AddReason(std::string& rationale, const std::string& reason) {
  if (!rationale.empty())
    rationale += "; ";
  rationale += reason;
}

} // namespace

RiskScorer::RiskScorer(ScoringPolicy policy) : policy_(std::move(policy)) {
}

RiskAssessment RiskScorer::Score(const model::CandidateCombination& candidate, const model::SnapshotIndex& index) const {
  std::set<model::ControllerType> types;

  bool          has_team         = false;
  bool          has_organization = false;
  std::uint64_t multi_role_teams = 0;

  for (const auto& id : candidate.controller_ids) {
    const auto* controller = index.FindController(id);
    if (!controller)
      continue;

    types.insert(controller->type);
    if (controller->type == model::ControllerType::kTeam) {
      has_team = true;
      if (controller->roles.size() >= 2)
        ++multi_role_teams;
    }
    if (controller->type == model::ControllerType::kOrganization)
      has_organization = true;
  }

  std::uint64_t flagged = 0;
  for (const auto& action_id : candidate.control_action_ids) {
    if (index.FindingCount(action_id) > 0)
      ++flagged;
  }

  std::uint64_t total = 0;
  RiskAssessment assessment;

  const auto controllers = candidate.controller_ids.size();
  if (controllers > 1) {
    total += (controllers - 1) * policy_.per_extra_controller;
    AddReason(assessment.rationale, "multiple controllers (" + std::to_string(controllers) + ") involved");
  }
  if (types.size() > 1) {
    total += (types.size() - 1) * policy_.per_extra_controller_type;
    AddReason(assessment.rationale, "mixed controller types (" + std::to_string(types.size()) + ")");
  }
  if (has_team) {
    total += policy_.team_present;
    AddReason(assessment.rationale, "team coordination required");
  }
  if (has_organization) {
    total += policy_.organization_present;
    AddReason(assessment.rationale, "organizational authority involved");
  }
  if (flagged > 0) {
    total += flagged * policy_.per_flagged_action;
    AddReason(assessment.rationale, std::to_string(flagged) + " action(s) already flagged");
  }
  if (multi_role_teams > 0) {
    total += multi_role_teams * policy_.per_multi_role_team;
    AddReason(assessment.rationale, std::to_string(multi_role_teams) + " team(s) with multiple roles");
  }

  const std::uint32_t ceiling = std::min(policy_.ceiling, kMaxRiskScore);
  if (total > ceiling) {
    total = ceiling;
    AddReason(assessment.rationale, "score capped at " + std::to_string(ceiling));
  }
  if (assessment.rationale.empty())
    assessment.rationale = "no risk rules fired";

  assessment.value = static_cast<std::uint32_t>(total);
  return assessment;
}

void RiskScorer::Apply(std::vector<model::CandidateCombination>& candidates, const model::SnapshotIndex& index) const {
  for (auto& candidate : candidates) {
    auto assessment      = Score(candidate, index);
    candidate.risk_score = assessment.value;
    candidate.rationale  = std::move(assessment.rationale);
  }
}

} // namespace stpa::scoring
