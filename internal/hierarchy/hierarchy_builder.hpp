#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/snapshot.hpp"

namespace stpa::hierarchy {

// How the visiting sequence moved between two controllers.
enum class Movement : std::uint8_t {
  kInitial = 0,
  kLateral = 1,
  kUpward = 2,
  kDownward = 3,
};

constexpr std::string_view ToString(Movement movement) {
  switch (movement) {
    case Movement::kLateral:
      return "lateral";
    case Movement::kUpward:
      return "upward";
    case Movement::kDownward:
      return "downward";
    case Movement::kInitial:
    default:
      return "initial";
  }
}

struct ControllerStep {
  std::string controller_id;
  Movement movement = Movement::kInitial;
};

/*
  Levelled view of the control structure.

  Level 0 holds controllers that govern no other controller; a controller
  sits one level above the highest controller it governs. Inside a level
  controllers keep a stable left-to-right order.

  The visiting order is bottom-up, left-to-right, restricted to controllers
  that own at least one in-scope control action.
*/
class Hierarchy {
 public:
  std::optional<std::uint32_t> LevelOf(const std::string& controller_id) const;

  // levels[i] is the lateral sequence of level i; covers every controller.
  const std::vector<std::vector<std::string>>& Levels() const {
    return levels_;
  }

  const std::vector<std::string>& VisitingOrder() const {
    return visiting_order_;
  }

  bool Contains(const std::string& controller_id) const {
    return visiting_index_.count(controller_id) > 0;
  }

  // nullopt current starts the sequence. Returns nullopt past the last
  // controller or for a controller not in the visiting order.
  std::optional<ControllerStep> NextController(const std::optional<std::string>& current) const;

  std::optional<ControllerStep> PreviousController(const std::string& current) const;

 private:
  friend class HierarchyBuilder;

  std::map<std::string, std::uint32_t> level_of_;
  std::vector<std::vector<std::string>> levels_;
  std::vector<std::string> visiting_order_;
  std::map<std::string, std::size_t> visiting_index_;
};

class HierarchyBuilder {
 public:
  // Throws util::GraphCycleError when controllers govern each other in a
  // cycle.
  static Hierarchy Build(const model::Snapshot& snapshot);
};

} // namespace stpa::hierarchy
