#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/candidate.hpp"

namespace stpa::scoring {

/*
  Orders scored candidates: risk descending, ties broken by the canonical
  order of model::CanonicalLess. The result is a pure function of the
  input set.
*/
class Prioritizer {
 public:
  explicit Prioritizer(std::uint32_t min_risk_score = 0) : min_risk_score_(min_risk_score) {
  }

  std::vector<model::CandidateCombination> Rank(std::vector<model::CandidateCombination> candidates) const;

 private:
  std::uint32_t min_risk_score_;
};

} // namespace stpa::scoring
