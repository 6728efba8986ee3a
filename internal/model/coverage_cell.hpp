#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace stpa::model {

enum class CellState : std::uint8_t {
  kUnvisited = 0,
  kCompleted = 1,
  kSkipped = 2,
};

constexpr std::string_view ToString(CellState state) {
  switch (state) {
    case CellState::kCompleted:
      return "completed";
    case CellState::kSkipped:
      return "skipped";
    case CellState::kUnvisited:
    default:
      return "unvisited";
  }
}

constexpr bool IsVisited(CellState state) {
  return state == CellState::kCompleted || state == CellState::kSkipped;
}

// Re-marking overwrites between the two visited states; nothing returns a
// cell to kUnvisited.
constexpr bool CanTransition(CellState from, CellState to) {
  if (from == to) {
    return true;
  }
  return to != CellState::kUnvisited;
}

struct CellKey {
  std::string controller_id;
  std::string control_action_id;
  std::string analysis_type;
  std::uint32_t instance_index = 0;

  // Same (controller, action, type) group, any instance.
  bool SameGroup(const CellKey& other) const {
    return controller_id == other.controller_id && control_action_id == other.control_action_id &&
           analysis_type == other.analysis_type;
  }

  CellKey WithInstance(std::uint32_t instance) const {
    CellKey key        = *this;
    key.instance_index = instance;
    return key;
  }

  std::string ToString() const {
    return controller_id + "/" + control_action_id + "/" + analysis_type + "#" + std::to_string(instance_index);
  }
};

inline bool operator<(const CellKey& a, const CellKey& b) {
  return std::tie(a.controller_id, a.control_action_id, a.analysis_type, a.instance_index) <
         std::tie(b.controller_id, b.control_action_id, b.analysis_type, b.instance_index);
}

inline bool operator==(const CellKey& a, const CellKey& b) {
  return a.SameGroup(b) && a.instance_index == b.instance_index;
}

inline bool operator!=(const CellKey& a, const CellKey& b) {
  return !(a == b);
}

// The seven unsafe-control-action questions asked for every action.
inline const std::vector<std::string>& DefaultAnalysisTypes() {
  static const std::vector<std::string> kTypes = {
      "not-provided", "provided-unsafe", "too-early", "too-late", "wrong-order", "too-long", "too-short",
  };
  return kTypes;
}

} // namespace stpa::model
