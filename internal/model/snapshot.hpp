#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/model/controller.hpp"

namespace stpa::model {

/*
  Read-only view of the external data store at one point in time.
*/
struct Snapshot {
  std::vector<Controller> controllers;
  std::vector<ControlPath> control_paths;
  std::vector<ControlAction> control_actions;
  std::vector<Finding> findings;
};

/*
  Lookup tables over a Snapshot. Holds pointers into it, so the snapshot
  must outlive the index.
*/
class SnapshotIndex {
 public:
  explicit SnapshotIndex(const Snapshot& snapshot);

  const Controller* FindController(const std::string& id) const;
  const ControlAction* FindAction(const std::string& id) const;

  // In-scope actions of known controllers, sorted by (controller id, id).
  const std::vector<const ControlAction*>& InScopeActions() const {
    return in_scope_actions_;
  }

  // In-scope actions of one controller, sorted by id.
  std::vector<const ControlAction*> InScopeActionsOf(const std::string& controller_id) const;

  // Controllers owning at least one in-scope action.
  const std::set<std::string>& InScopeControllers() const {
    return in_scope_controllers_;
  }

  bool IsInScope(const std::string& controller_id, const std::string& action_id) const;

  std::size_t FindingCount(const std::string& action_id) const;

 private:
  std::map<std::string, const Controller*> controllers_;
  std::map<std::string, const ControlAction*> actions_;
  std::vector<const ControlAction*> in_scope_actions_;
  std::set<std::string> in_scope_controllers_;
  std::map<std::string, std::size_t> findings_by_action_;
};

// 64-bit FNV-1a over a canonical encoding of the snapshot. Independent of
// the order entities appear in.
std::uint64_t ContentHash(const Snapshot& snapshot);

} // namespace stpa::model
