#include "internal/combination/combination_generator.hpp"

#include <algorithm>
#include <set>
#include <string>

#include "internal/combination/index_combination.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stpa::combination {

using stpa::observability::IntField;
using stpa::observability::StringField;

namespace {

bool IsTeam(const model::Controller* controller) {
  return controller != nullptr && controller->type == model::ControllerType::kTeam;
}

// True when one Team controller covers every controller of the subset,
// either as the team itself or as one of its members.
bool WithinOneTeam(const std::vector<std::string>& controller_ids, const model::SnapshotIndex& index) {
  const auto* first = index.FindController(controller_ids.front());
  std::vector<std::string> teams;
  if (IsTeam(first))
    teams.push_back(first->id);
  if (!first->team_id.empty() && IsTeam(index.FindController(first->team_id)))
    teams.push_back(first->team_id);

  for (const auto& team : teams) {
    const bool covered = std::all_of(controller_ids.begin(), controller_ids.end(), [&](const std::string& id) {
      return id == team || index.FindController(id)->team_id == team;
    });
    if (covered)
      return true;
  }
  return false;
}

} // namespace

CombinationGenerator::CombinationGenerator(GeneratorOptions options) : options_(options) {
}

GenerationStatus CombinationGenerator::ForEach(const model::Snapshot& snapshot, const Visitor& visit) const {
  const model::SnapshotIndex index(snapshot);
  const auto& actions          = index.InScopeActions();
  const auto  controller_count = index.InScopeControllers().size();

  if (controller_count < 2) {
    STPA_LOG_WARN("Combination generation needs at least two in-scope controllers",
                  {IntField("in_scope_controllers", static_cast<std::int64_t>(controller_count))});
    return GenerationStatus::kInsufficientControllers;
  }

  if (options_.max_combination_size < 2 || options_.max_combination_size > controller_count) {
    throw util::InvalidConfigurationError("max_combination_size must be between 2 and " + std::to_string(controller_count) +
                                          " (in-scope controllers), got " + std::to_string(options_.max_combination_size));
  }

  std::vector<model::CombinationType> types;
  if (options_.include_co_occurrence_type)
    types.push_back(model::CombinationType::kCoOccurrence);
  if (options_.include_temporal_ordering_type)
    types.push_back(model::CombinationType::kTemporalOrdering);

  std::vector<std::size_t> subset;
  for (std::size_t size = 2; size <= options_.max_combination_size; ++size) {
    IndexCombination cursor(actions.size(), size);

    while (cursor.Next(&subset)) {
      model::CandidateCombination base;
      std::set<std::string> controllers;
      for (const auto i : subset) {
        const auto* action = actions[i];
        base.members.push_back({action->controller_id, action->id});
        base.control_action_ids.push_back(action->id);
        controllers.insert(action->controller_id);
      }

      if (controllers.size() < 2)
        continue;

      base.controller_ids.assign(controllers.begin(), controllers.end());
      std::sort(base.control_action_ids.begin(), base.control_action_ids.end());

      base.abstraction = WithinOneTeam(base.controller_ids, index) ? model::AbstractionLevel::kSameTeam
                                                                   : model::AbstractionLevel::kCrossController;
      if (base.abstraction == model::AbstractionLevel::kSameTeam && !options_.include_same_team_abstraction)
        continue;
      if (base.abstraction == model::AbstractionLevel::kCrossController && !options_.include_cross_controller_abstraction)
        continue;

      for (std::size_t t = 0; t < types.size(); ++t) {
        auto candidate = t + 1 < types.size() ? base : std::move(base);
        candidate.type = types[t];
        visit(std::move(candidate));
      }
    }
  }

  return GenerationStatus::kOk;
}

GenerationResult CombinationGenerator::Generate(const model::Snapshot& snapshot) const {
  GenerationResult result;
  result.status = ForEach(snapshot, [&](model::CandidateCombination&& candidate) {
    result.candidates.push_back(std::move(candidate));
  });

  STPA_LOG_DEBUG("Combinations enumerated",
                 {StringField("status", ToString(result.status)),
                  IntField("candidates", static_cast<std::int64_t>(result.candidates.size()))});
  return result;
}

} // namespace stpa::combination
