#include "internal/scoring/prioritizer.hpp"

#include <algorithm>

namespace stpa::scoring {

std::vector<model::CandidateCombination> Prioritizer::Rank(std::vector<model::CandidateCombination> candidates) const {
  std::sort(candidates.begin(), candidates.end(),
            [](const model::CandidateCombination& a, const model::CandidateCombination& b) {
              if (a.risk_score != b.risk_score)
                return a.risk_score > b.risk_score;
              return model::CanonicalLess(a, b);
            });

  if (min_risk_score_ > 0) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [this](const model::CandidateCombination& c) {
                                      return c.risk_score < min_risk_score_;
                                    }),
                     candidates.end());
  }
  return candidates;
}

} // namespace stpa::scoring
