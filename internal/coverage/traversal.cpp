#include "internal/coverage/traversal.hpp"

#include <algorithm>
#include <utility>

namespace stpa::coverage {

std::size_t TraversalPlan::CellCount() const {
  std::size_t actions = 0;
  for (const auto& controller : controllers)
    actions += controller.action_ids.size();
  return actions * analysis_types.size();
}

bool TraversalPlan::Contains(const std::string& controller_id, const std::string& action_id,
                             const std::string& analysis_type) const {
  model::CellKey key{controller_id, action_id, analysis_type, 0};
  return Locate(*this, key).has_value();
}

TraversalPlan BuildPlan(const hierarchy::Hierarchy& hierarchy, const model::SnapshotIndex& index,
                        std::vector<std::string> analysis_types) {
  TraversalPlan plan;
  plan.analysis_types = std::move(analysis_types);

  std::optional<std::string> current;
  while (auto step = hierarchy.NextController(current)) {
    PlannedController planned;
    planned.controller_id = step->controller_id;
    planned.level         = hierarchy.LevelOf(step->controller_id).value_or(0);
    for (const auto* action : index.InScopeActionsOf(step->controller_id))
      planned.action_ids.push_back(action->id);

    if (!planned.action_ids.empty())
      plan.controllers.push_back(std::move(planned));
    current = step->controller_id;
  }
  return plan;
}

std::uint32_t InstanceCount(const InstanceCounts& counts, const model::CellKey& key) {
  auto it = counts.find(key.WithInstance(0));
  return it == counts.end() ? 1 : it->second;
}

Position FirstPosition(const TraversalPlan& plan) {
  if (plan.CellCount() == 0)
    return Terminal{};
  return AtCell{};
}

namespace {

AtCell LastInstance(const TraversalPlan& plan, AtCell cell, const InstanceCounts& counts) {
  cell.instance = InstanceCount(counts, KeyAt(plan, cell)) - 1;
  return cell;
}

AtCell LastCellOf(const TraversalPlan& plan, std::size_t controller_index, const InstanceCounts& counts) {
  AtCell cell;
  cell.controller_index = controller_index;
  cell.action_index     = plan.controllers[controller_index].action_ids.size() - 1;
  cell.type_index       = plan.analysis_types.size() - 1;
  return LastInstance(plan, cell, counts);
}

} // namespace

Position NextPosition(const TraversalPlan& plan, const Position& position, const InstanceCounts& counts) {
  const auto* at = std::get_if<AtCell>(&position);
  if (!at)
    return Terminal{};

  AtCell next = *at;
  if (next.instance + 1 < InstanceCount(counts, KeyAt(plan, next))) {
    ++next.instance;
    return next;
  }

  next.instance = 0;
  if (next.type_index + 1 < plan.analysis_types.size()) {
    ++next.type_index;
    return next;
  }

  next.type_index = 0;
  if (next.action_index + 1 < plan.controllers[next.controller_index].action_ids.size()) {
    ++next.action_index;
    return next;
  }

  next.action_index = 0;
  if (next.controller_index + 1 < plan.controllers.size()) {
    ++next.controller_index;
    return next;
  }

  return Terminal{};
}

Position PreviousPosition(const TraversalPlan& plan, const Position& position, const InstanceCounts& counts) {
  const auto* at = std::get_if<AtCell>(&position);
  if (!at) {
    if (plan.CellCount() == 0)
      return Terminal{};
    return LastCellOf(plan, plan.controllers.size() - 1, counts);
  }

  AtCell previous = *at;
  if (previous.instance > 0) {
    --previous.instance;
    return previous;
  }

  if (previous.type_index > 0) {
    --previous.type_index;
    return LastInstance(plan, previous, counts);
  }

  if (previous.action_index > 0) {
    --previous.action_index;
    previous.type_index = plan.analysis_types.size() - 1;
    return LastInstance(plan, previous, counts);
  }

  if (previous.controller_index > 0)
    return LastCellOf(plan, previous.controller_index - 1, counts);

  return previous;
}

model::CellKey KeyAt(const TraversalPlan& plan, const AtCell& cell) {
  const auto& controller = plan.controllers[cell.controller_index];
  return model::CellKey{controller.controller_id, controller.action_ids[cell.action_index],
                        plan.analysis_types[cell.type_index], cell.instance};
}

std::optional<AtCell> Locate(const TraversalPlan& plan, const model::CellKey& key) {
  const auto type = std::find(plan.analysis_types.begin(), plan.analysis_types.end(), key.analysis_type);
  if (type == plan.analysis_types.end())
    return std::nullopt;

  for (std::size_t c = 0; c < plan.controllers.size(); ++c) {
    const auto& controller = plan.controllers[c];
    if (controller.controller_id != key.controller_id)
      continue;

    const auto& actions = controller.action_ids;
    const auto  action  = std::find(actions.begin(), actions.end(), key.control_action_id);
    if (action == actions.end())
      return std::nullopt;

    AtCell cell;
    cell.controller_index = c;
    cell.action_index     = static_cast<std::size_t>(action - actions.begin());
    cell.type_index       = static_cast<std::size_t>(type - plan.analysis_types.begin());
    return cell;
  }
  return std::nullopt;
}

} // namespace stpa::coverage
