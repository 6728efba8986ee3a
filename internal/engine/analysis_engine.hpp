#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/combination/combination_generator.hpp"
#include "internal/model/candidate.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/scoring/scoring_policy.hpp"

namespace stpa::engine {

// Candidates at or above this score count as high risk.
constexpr std::uint32_t kHighRiskScore = 70;

struct AnalysisOptions {
  combination::GeneratorOptions generator;
  scoring::ScoringPolicy scoring;
  std::uint32_t min_risk_score = 0;
};

struct RankingStatistics {
  std::size_t total             = 0;
  std::size_t co_occurrence     = 0;
  std::size_t temporal_ordering = 0;
  std::size_t same_team         = 0;
  std::size_t cross_controller  = 0;
  std::size_t high_risk         = 0;
  double      mean_score        = 0.0;
};

RankingStatistics ComputeStatistics(const std::vector<model::CandidateCombination>& candidates);

struct AnalysisResult {
  std::uint64_t                 snapshot_hash = 0;
  combination::GenerationStatus status        = combination::GenerationStatus::kOk;
  std::string scoring_policy_version;
  // Set with GenerationStatus::kInvalidConfiguration.
  std::string error;
  std::vector<model::CandidateCombination> ranked;
  RankingStatistics statistics;
};

/*
  AnalysisEngine

  generate -> score -> rank over one snapshot. The last result is memoized
  by content hash of snapshot and options, so re-analysing an unchanged
  snapshot costs one hash.

  Options that do not fit the snapshot's scope (a combination size above
  the in-scope controller count) yield an empty ranking with status
  kInvalidConfiguration instead of an exception; the coverage walk does
  not depend on the ranking.

  Not thread-safe; each review session owns its engine.
*/
class AnalysisEngine {
 public:
  explicit AnalysisEngine(AnalysisOptions options = {});

  std::shared_ptr<const AnalysisResult> Analyze(const model::Snapshot& snapshot);

  const AnalysisOptions& options() const {
    return options_;
  }

  // Number of full recomputations so far.
  std::size_t computations() const {
    return computations_;
  }

 private:
  AnalysisOptions options_;
  std::uint64_t options_hash_;

  std::shared_ptr<const AnalysisResult> cached_;
  std::uint64_t cached_key_   = 0;
  std::size_t   computations_ = 0;
};

} // namespace stpa::engine
