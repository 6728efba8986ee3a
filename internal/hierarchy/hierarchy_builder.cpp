#include "internal/hierarchy/hierarchy_builder.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <set>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace stpa::hierarchy {

using stpa::observability::IntField;
using stpa::observability::StringField;

// ------------------------------------------------------------
// Hierarchy queries
// ------------------------------------------------------------

std::optional<std::uint32_t> Hierarchy::LevelOf(const std::string& controller_id) const {
  auto it = level_of_.find(controller_id);
  if (it == level_of_.end())
    return std::nullopt;
  return it->second;
}

std::optional<ControllerStep> Hierarchy::NextController(const std::optional<std::string>& current) const {
  if (!current) {
    if (visiting_order_.empty())
      return std::nullopt;
    return ControllerStep{visiting_order_.front(), Movement::kInitial};
  }

  auto it = visiting_index_.find(*current);
  if (it == visiting_index_.end() || it->second + 1 >= visiting_order_.size())
    return std::nullopt;

  const auto& next     = visiting_order_[it->second + 1];
  const auto  movement = level_of_.at(next) == level_of_.at(*current) ? Movement::kLateral : Movement::kUpward;
  return ControllerStep{next, movement};
}

std::optional<ControllerStep> Hierarchy::PreviousController(const std::string& current) const {
  auto it = visiting_index_.find(current);
  if (it == visiting_index_.end() || it->second == 0)
    return std::nullopt;

  const auto& previous = visiting_order_[it->second - 1];
  const auto  movement = level_of_.at(previous) == level_of_.at(current) ? Movement::kLateral : Movement::kDownward;
  return ControllerStep{previous, movement};
}

// ------------------------------------------------------------
// Build
// ------------------------------------------------------------

namespace {

struct ControllerGraph {
  // controller -> controllers it governs
  std::map<std::string, std::set<std::string>> children;
  // controller -> controllers governing it
  std::map<std::string, std::set<std::string>> parents;
};

ControllerGraph BuildGraph(const model::Snapshot& snapshot, const model::SnapshotIndex& index) {
  ControllerGraph graph;
  for (const auto& controller : snapshot.controllers) {
    graph.children[controller.id];
    graph.parents[controller.id];
  }

  for (const auto& path : snapshot.control_paths) {
    if (index.FindController(path.source_controller_id) == nullptr) {
      STPA_LOG_WARN("Control path from unknown controller ignored",
                    {StringField("path_id", path.id), StringField("source_controller_id", path.source_controller_id)});
      continue;
    }

    // Targets that are not controllers are controlled components.
    if (index.FindController(path.target_id) == nullptr)
      continue;

    graph.children[path.source_controller_id].insert(path.target_id);
    graph.parents[path.target_id].insert(path.source_controller_id);
  }

  return graph;
}

// Kahn's algorithm from the leaves upward. Every controller is released
// once all controllers it governs have a level.
std::map<std::string, std::uint32_t> AssignLevels(const ControllerGraph& graph) {
  std::map<std::string, std::size_t> remaining;
  std::map<std::string, std::uint32_t> levels;
  std::queue<std::string> ready;

  for (const auto& [id, children] : graph.children) {
    remaining[id] = children.size();
    levels[id]    = 0;
    if (children.empty())
      ready.push(id);
  }

  std::size_t processed = 0;
  while (!ready.empty()) {
    const auto node = ready.front();
    ready.pop();
    ++processed;

    for (const auto& parent : graph.parents.at(node)) {
      levels[parent] = std::max(levels[parent], levels[node] + 1);
      if (--remaining[parent] == 0)
        ready.push(parent);
    }
  }

  if (processed < graph.children.size()) {
    std::vector<std::string> blocked;
    for (const auto& [id, count] : remaining) {
      if (count > 0)
        blocked.push_back(id);
    }

    std::string message = "control structure contains a cycle among:";
    for (const auto& id : blocked) {
      message += ' ';
      message += id;
    }
    throw util::GraphCycleError(message, std::move(blocked));
  }

  return levels;
}

// A non-finite position would break the strict weak ordering of the sort.
bool IsPlaced(const model::Controller& controller) {
  return controller.layout_x.has_value() && std::isfinite(*controller.layout_x);
}

// First-reach preorder from the roots, roots and children in id order.
std::map<std::string, std::size_t> GraphPositions(const ControllerGraph& graph) {
  std::map<std::string, std::size_t> positions;
  std::vector<std::string> stack;

  for (const auto& [id, parents] : graph.parents) {
    if (!parents.empty())
      continue;

    stack.push_back(id);
    while (!stack.empty()) {
      const auto node = stack.back();
      stack.pop_back();
      if (!positions.emplace(node, positions.size()).second)
        continue;

      const auto& children = graph.children.at(node);
      for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if (positions.count(*it) == 0)
          stack.push_back(*it);
      }
    }
  }

  return positions;
}

} // namespace

Hierarchy HierarchyBuilder::Build(const model::Snapshot& snapshot) {
  const model::SnapshotIndex index(snapshot);
  const auto graph = BuildGraph(snapshot, index);

  Hierarchy hierarchy;
  hierarchy.level_of_  = AssignLevels(graph);
  const auto positions = GraphPositions(graph);

  std::uint32_t max_level = 0;
  for (const auto& [id, level] : hierarchy.level_of_)
    max_level = std::max(max_level, level);

  if (!hierarchy.level_of_.empty())
    hierarchy.levels_.resize(max_level + 1);

  for (const auto& [id, level] : hierarchy.level_of_)
    hierarchy.levels_[level].push_back(id);

  for (auto& lateral : hierarchy.levels_) {
    std::sort(lateral.begin(), lateral.end(), [&](const std::string& a, const std::string& b) {
      const auto*  ca         = index.FindController(a);
      const auto*  cb         = index.FindController(b);
      const bool   a_unplaced = !IsPlaced(*ca);
      const bool   b_unplaced = !IsPlaced(*cb);
      const double ax         = a_unplaced ? 0.0 : *ca->layout_x;
      const double bx         = b_unplaced ? 0.0 : *cb->layout_x;
      return std::tie(a_unplaced, ax, positions.at(a), a) < std::tie(b_unplaced, bx, positions.at(b), b);
    });

    for (const auto& id : lateral) {
      if (index.InScopeControllers().count(id) == 0)
        continue;
      hierarchy.visiting_index_[id] = hierarchy.visiting_order_.size();
      hierarchy.visiting_order_.push_back(id);
    }
  }

  STPA_LOG_DEBUG("Control structure levelled",
                 {IntField("controllers", static_cast<std::int64_t>(hierarchy.level_of_.size())),
                  IntField("levels", static_cast<std::int64_t>(hierarchy.levels_.size())),
                  IntField("visiting", static_cast<std::int64_t>(hierarchy.visiting_order_.size()))});

  return hierarchy;
}

} // namespace stpa::hierarchy
