#include "internal/coverage/coverage_tracker.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace stpa::coverage {

using stpa::observability::DoubleField;
using stpa::observability::IntField;
using stpa::observability::StringField;

CoverageTracker::CoverageTracker(TraversalPlan plan, std::shared_ptr<events::EventSink> sink, std::string session_id)
    : plan_(std::move(plan)), sink_(std::move(sink)), session_id_(std::move(session_id)), position_(FirstPosition(plan_)) {
}

std::optional<model::CellKey> CoverageTracker::CurrentCell() const {
  const auto* at = std::get_if<AtCell>(&position_);
  if (!at)
    return std::nullopt;
  return KeyAt(plan_, *at);
}

bool CoverageTracker::AtTerminal() const {
  return std::holds_alternative<Terminal>(position_);
}

void CoverageTracker::Move(const Position& next) {
  const auto* from = std::get_if<AtCell>(&position_);
  const auto* to   = std::get_if<AtCell>(&next);

  if (from && to && from->controller_index != to->controller_index) {
    const auto& a = plan_.controllers[from->controller_index];
    const auto& b = plan_.controllers[to->controller_index];
    if (a.level == b.level)
      movement_ = hierarchy::Movement::kLateral;
    else
      movement_ = b.level > a.level ? hierarchy::Movement::kUpward : hierarchy::Movement::kDownward;
  }
  position_ = next;
}

std::optional<model::CellKey> CoverageTracker::Advance() {
  Move(NextPosition(plan_, position_, instances_));
  return CurrentCell();
}

std::optional<model::CellKey> CoverageTracker::Retreat() {
  Move(PreviousPosition(plan_, position_, instances_));
  return CurrentCell();
}

bool CoverageTracker::Exists(const model::CellKey& key) const {
  if (!plan_.Contains(key.controller_id, key.control_action_id, key.analysis_type))
    return false;
  return key.instance_index < InstanceCount(instances_, key);
}

bool CoverageTracker::MarkCompleted(const model::CellKey& key) {
  return Mark(key, model::CellState::kCompleted);
}

bool CoverageTracker::MarkSkipped(const model::CellKey& key) {
  return Mark(key, model::CellState::kSkipped);
}

bool CoverageTracker::Mark(const model::CellKey& key, model::CellState state) {
  if (!Exists(key)) {
    STPA_LOG_WARN("Ignoring mark of a cell outside coverage scope",
                  {StringField("session_id", session_id_), StringField("cell", key.ToString()),
                   StringField("state", model::ToString(state))});
    return false;
  }

  auto& current = states_[key];
  if (!model::CanTransition(current, state))
    return false;
  if (current == state)
    return true;
  current = state;

  if (sink_)
    sink_->Publish(events::CoverageEvent{session_id_, key, state, util::Now()});
  return true;
}

std::optional<model::CellKey> CoverageTracker::AddInstance(const model::CellKey& key) {
  if (!plan_.Contains(key.controller_id, key.control_action_id, key.analysis_type)) {
    STPA_LOG_WARN("Ignoring instance request for a cell outside coverage scope",
                  {StringField("session_id", session_id_), StringField("cell", key.ToString())});
    return std::nullopt;
  }

  const auto group   = key.WithInstance(0);
  const auto count   = InstanceCount(instances_, group);
  instances_[group]  = count + 1;
  auto       created = key.WithInstance(count);

  if (auto* at = std::get_if<AtCell>(&position_); at && KeyAt(plan_, *at).SameGroup(created))
    at->instance = count;

  STPA_LOG_DEBUG("Instance added", {StringField("session_id", session_id_), StringField("cell", created.ToString())});
  return created;
}

model::CellState CoverageTracker::StateOf(const model::CellKey& key) const {
  auto it = states_.find(key);
  return it == states_.end() ? model::CellState::kUnvisited : it->second;
}

CoverageStats CoverageTracker::Stats() const {
  CoverageStats stats;
  stats.total_cells = plan_.CellCount();

  for (const auto& controller : plan_.controllers) {
    for (const auto& action_id : controller.action_ids) {
      for (const auto& type : plan_.analysis_types) {
        const model::CellKey key{controller.controller_id, action_id, type, 0};
        switch (StateOf(key)) {
          case model::CellState::kCompleted:
            ++stats.completed_cells;
            break;
          case model::CellState::kSkipped:
            ++stats.skipped_cells;
            break;
          case model::CellState::kUnvisited:
            break;
        }
        stats.bonus_instances += InstanceCount(instances_, key) - 1;
      }
    }
  }
  return stats;
}

double CoverageTracker::CompletionRatio() const {
  const auto stats = Stats();
  if (stats.total_cells == 0)
    return 1.0;
  return static_cast<double>(stats.completed_cells + stats.skipped_cells) / static_cast<double>(stats.total_cells);
}

void CoverageTracker::Rebase(TraversalPlan plan) {
  const auto current  = CurrentCell();
  const bool finished = AtTerminal() && plan_.CellCount() > 0;
  plan_               = std::move(plan);

  // A finished walk stays finished; new cells are reached by retreating.
  if (!finished) {
    if (current && Exists(*current)) {
      auto cell     = *Locate(plan_, *current);
      cell.instance = current->instance_index;
      position_     = cell;
    } else {
      position_ = FirstPosition(plan_);
      movement_ = hierarchy::Movement::kInitial;
    }
  }

  STPA_LOG_INFO("Coverage scope rebased",
                {StringField("session_id", session_id_), IntField("cells", static_cast<std::int64_t>(plan_.CellCount())),
                 DoubleField("completion_ratio", CompletionRatio())});
}

} // namespace stpa::coverage
