#pragma once

#include <cstdint>
#include <string>

namespace stpa::scoring {

// Upper bound of every risk score, whatever the policy's ceiling.
constexpr std::uint32_t kMaxRiskScore = 100;

/*
  Weights of the risk heuristics. Versioned so that a ranking can be traced
  back to the weights that produced it.
*/
struct ScoringPolicy {
  std::string version = "2024.1";

  std::uint32_t per_extra_controller      = 10;
  std::uint32_t per_extra_controller_type = 5;
  std::uint32_t team_present              = 15;
  std::uint32_t organization_present      = 20;
  std::uint32_t per_flagged_action        = 10;
  std::uint32_t per_multi_role_team       = 8;

  // Clamp applied to the summed weights; at most kMaxRiskScore.
  std::uint32_t ceiling = kMaxRiskScore;
};

} // namespace stpa::scoring
