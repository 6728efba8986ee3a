#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/snapshot.hpp"

namespace stpa::testing {

inline model::Controller MakeController(const std::string& id, model::ControllerType type,
                                        const std::string& team_id = {}, std::vector<std::string> roles = {},
                                        std::optional<double> layout_x = std::nullopt) {
  model::Controller controller;
  controller.id       = id;
  controller.name     = id;
  controller.type     = type;
  controller.team_id  = team_id;
  controller.roles    = std::move(roles);
  controller.layout_x = layout_x;
  return controller;
}

inline model::ControlAction MakeAction(const std::string& id, const std::string& controller_id, bool in_scope = true) {
  return model::ControlAction{id, controller_id, "issue", id, in_scope};
}

inline model::ControlPath MakePath(const std::string& source, const std::string& target) {
  return model::ControlPath{source + "->" + target, source, target};
}

inline model::Finding MakeFinding(const std::string& id, const std::string& controller_id, const std::string& action_id) {
  return model::Finding{id, controller_id, action_id, "not-provided"};
}

// Three software controllers with one in-scope action each.
inline model::Snapshot ThreeControllers() {
  model::Snapshot snapshot;
  for (const auto* id : {"ctl-a", "ctl-b", "ctl-c"}) {
    snapshot.controllers.push_back(MakeController(id, model::ControllerType::kSoftware));
    snapshot.control_actions.push_back(MakeAction(std::string("act-") + id, id));
  }
  return snapshot;
}

} // namespace stpa::testing
