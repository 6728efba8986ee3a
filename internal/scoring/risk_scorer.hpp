#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/candidate.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/scoring/scoring_policy.hpp"

namespace stpa::scoring {

struct RiskAssessment {
  std::uint32_t value = 0;
  std::string rationale;
};

/*
  Heuristic risk estimate of a candidate combination, in [0, ceiling].

  Rules are additive and evaluated in a fixed order; the rationale lists
  the rules that fired in that same order. Controllers the index does not
  know contribute nothing.
*/
class RiskScorer {
 public:
  explicit RiskScorer(ScoringPolicy policy = {});

  RiskAssessment Score(const model::CandidateCombination& candidate, const model::SnapshotIndex& index) const;

  // Writes risk_score and rationale of every candidate.
  void Apply(std::vector<model::CandidateCombination>& candidates, const model::SnapshotIndex& index) const;

  const ScoringPolicy& policy() const {
    return policy_;
  }

 private:
  ScoringPolicy policy_;
};

} // namespace stpa::scoring
