#include "internal/model/snapshot.hpp"

#include <algorithm>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/hash.hpp"

namespace stpa::model {

using stpa::observability::StringField;

SnapshotIndex::SnapshotIndex(const Snapshot& snapshot) {
  for (const auto& controller : snapshot.controllers) {
    if (!controllers_.emplace(controller.id, &controller).second) {
      STPA_LOG_WARN("Duplicate controller id ignored", {StringField("controller_id", controller.id)});
    }
  }

  for (const auto& action : snapshot.control_actions) {
    if (controllers_.find(action.controller_id) == controllers_.end()) {
      STPA_LOG_WARN("Control action references unknown controller",
                    {StringField("control_action_id", action.id), StringField("controller_id", action.controller_id)});
      continue;
    }
    if (!actions_.emplace(action.id, &action).second) {
      STPA_LOG_WARN("Duplicate control action id ignored", {StringField("control_action_id", action.id)});
      continue;
    }
    if (action.in_scope) {
      in_scope_actions_.push_back(&action);
      in_scope_controllers_.insert(action.controller_id);
    }
  }

  std::sort(in_scope_actions_.begin(), in_scope_actions_.end(), [](const ControlAction* a, const ControlAction* b) {
    return std::tie(a->controller_id, a->id) < std::tie(b->controller_id, b->id);
  });

  for (const auto& finding : snapshot.findings) {
    ++findings_by_action_[finding.control_action_id];
  }
}

const Controller* SnapshotIndex::FindController(const std::string& id) const {
  auto it = controllers_.find(id);
  return it == controllers_.end() ? nullptr : it->second;
}

const ControlAction* SnapshotIndex::FindAction(const std::string& id) const {
  auto it = actions_.find(id);
  return it == actions_.end() ? nullptr : it->second;
}

std::vector<const ControlAction*> SnapshotIndex::InScopeActionsOf(const std::string& controller_id) const {
  std::vector<const ControlAction*> result;
  for (const auto* action : in_scope_actions_) {
    if (action->controller_id == controller_id) {
      result.push_back(action);
    }
  }
  return result;
}

bool SnapshotIndex::IsInScope(const std::string& controller_id, const std::string& action_id) const {
  const auto* action = FindAction(action_id);
  return action != nullptr && action->in_scope && action->controller_id == controller_id;
}

std::size_t SnapshotIndex::FindingCount(const std::string& action_id) const {
  auto it = findings_by_action_.find(action_id);
  return it == findings_by_action_.end() ? 0 : it->second;
}

// ------------------------------------------------------------
// Content hash
// ------------------------------------------------------------

namespace {

template <typename T, typename Encode>
void HashSorted(util::Fnv1a& hash, const std::vector<T>& items, Encode encode) {
  std::vector<std::string> records;
  records.reserve(items.size());
  for (const auto& item : items) {
    util::Fnv1a record;
    encode(record, item);
    records.push_back(util::HexDigest(record.Digest()));
  }
  std::sort(records.begin(), records.end());

  hash.UpdateInt(records.size());
  for (const auto& record : records) {
    hash.Update(record);
  }
}

} // namespace

std::uint64_t ContentHash(const Snapshot& snapshot) {
  util::Fnv1a hash;

  HashSorted(hash, snapshot.controllers, [](util::Fnv1a& h, const Controller& c) {
    h.UpdateField(c.id);
    h.UpdateField(c.name);
    h.UpdateInt(static_cast<std::uint64_t>(c.type));
    h.UpdateInt(c.roles.size());
    for (const auto& role : c.roles) {
      h.UpdateField(role);
    }
    h.UpdateField(c.team_id);
    h.UpdateInt(c.layout_x.has_value() ? 1 : 0);
    if (c.layout_x) {
      h.UpdateField(std::to_string(*c.layout_x));
    }
  });

  HashSorted(hash, snapshot.control_paths, [](util::Fnv1a& h, const ControlPath& p) {
    h.UpdateField(p.source_controller_id);
    h.UpdateField(p.target_id);
  });

  HashSorted(hash, snapshot.control_actions, [](util::Fnv1a& h, const ControlAction& a) {
    h.UpdateField(a.id);
    h.UpdateField(a.controller_id);
    h.UpdateField(a.verb);
    h.UpdateField(a.object);
    h.UpdateInt(a.in_scope ? 1 : 0);
  });

  HashSorted(hash, snapshot.findings, [](util::Fnv1a& h, const Finding& f) {
    h.UpdateField(f.id);
    h.UpdateField(f.controller_id);
    h.UpdateField(f.control_action_id);
    h.UpdateField(f.analysis_type);
  });

  return hash.Digest();
}

} // namespace stpa::model
