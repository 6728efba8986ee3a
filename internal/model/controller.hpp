#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stpa::model {

enum class ControllerType : std::uint8_t {
  kUnspecified = 0,
  kHuman = 1,
  kSoftware = 2,
  kTeam = 3,
  kOrganization = 4,
  kHybrid = 5,
};

constexpr std::string_view ToString(ControllerType type) {
  switch (type) {
    case ControllerType::kHuman:
      return "human";
    case ControllerType::kSoftware:
      return "software";
    case ControllerType::kTeam:
      return "team";
    case ControllerType::kOrganization:
      return "organization";
    case ControllerType::kHybrid:
      return "hybrid";
    case ControllerType::kUnspecified:
    default:
      return "unspecified";
  }
}

struct Controller {
  std::string id;
  std::string name;
  ControllerType type = ControllerType::kUnspecified;

  // Only meaningful for kTeam.
  std::vector<std::string> roles;

  // Team controller this controller is a member of. Empty when standalone.
  std::string team_id;

  std::optional<double> layout_x;
};

// Edge of the control structure. target_id names either a controller or a
// controlled component.
struct ControlPath {
  std::string id;
  std::string source_controller_id;
  std::string target_id;
};

struct ControlAction {
  std::string id;
  std::string controller_id;
  std::string verb;
  std::string object;
  bool in_scope = true;
};

struct Finding {
  std::string id;
  std::string controller_id;
  std::string control_action_id;
  std::string analysis_type;
};

} // namespace stpa::model
