#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stpa::model {

enum class AbstractionLevel : std::uint8_t {
  kSameTeam = 1,
  kCrossController = 2,
};

enum class CombinationType : std::uint8_t {
  kCoOccurrence = 1,
  kTemporalOrdering = 2,
};

constexpr std::string_view ToString(AbstractionLevel level) {
  switch (level) {
    case AbstractionLevel::kSameTeam:
      return "same-team";
    case AbstractionLevel::kCrossController:
    default:
      return "cross-controller";
  }
}

constexpr std::string_view ToString(CombinationType type) {
  switch (type) {
    case CombinationType::kCoOccurrence:
      return "co-occurrence";
    case CombinationType::kTemporalOrdering:
    default:
      return "temporal-ordering";
  }
}

// Reviewer verdict on a ranked candidate.
enum class Decision : std::uint8_t {
  kPending = 0,
  kAccepted = 1,
  kRejected = 2,
};

constexpr std::string_view ToString(Decision decision) {
  switch (decision) {
    case Decision::kAccepted:
      return "accepted";
    case Decision::kRejected:
      return "rejected";
    case Decision::kPending:
    default:
      return "pending";
  }
}

struct CombinationMember {
  std::string controller_id;
  std::string control_action_id;
};

/*
  One candidate unsafe combination. A computed value: two candidates with
  the same members, abstraction and type are the same candidate.

  members are ordered by (controller id, action id). controller_ids and
  control_action_ids are sorted and de-duplicated.
*/
struct CandidateCombination {
  std::vector<CombinationMember> members;
  std::vector<std::string> controller_ids;
  std::vector<std::string> control_action_ids;

  AbstractionLevel abstraction = AbstractionLevel::kCrossController;
  CombinationType  type        = CombinationType::kCoOccurrence;

  std::uint32_t risk_score = 0;
  std::string rationale;

  // "<type>|<controller ids>|<action ids>", ids joined by ','. A '\\', ','
  // or '|' inside an id is escaped with '\\'.
  std::string Signature() const;
};

// Joins ids with separator. Backslash, the separator and '|' inside an id
// are escaped with a backslash so that distinct lists never join equal.
std::string JoinIds(const std::vector<std::string>& ids, char separator);

// Total order used for ranking ties: controllers, then actions, then type,
// then abstraction.
bool CanonicalLess(const CandidateCombination& a, const CandidateCombination& b);

} // namespace stpa::model
