#include "internal/engine/analysis_engine.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/scoring/prioritizer.hpp"
#include "internal/scoring/risk_scorer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace stpa::engine {

using stpa::observability::DoubleField;
using stpa::observability::IntField;
using stpa::observability::StringField;

namespace {

std::uint64_t HashOptions(const AnalysisOptions& options) {
  util::Fnv1a hash;
  const auto& g = options.generator;
  hash.UpdateInt(g.max_combination_size);
  hash.UpdateInt(g.include_same_team_abstraction);
  hash.UpdateInt(g.include_cross_controller_abstraction);
  hash.UpdateInt(g.include_co_occurrence_type);
  hash.UpdateInt(g.include_temporal_ordering_type);

  const auto& s = options.scoring;
  hash.UpdateField(s.version);
  for (const auto weight : {s.per_extra_controller, s.per_extra_controller_type, s.team_present, s.organization_present,
                            s.per_flagged_action, s.per_multi_role_team, s.ceiling})
    hash.UpdateInt(weight);

  hash.UpdateInt(options.min_risk_score);
  return hash.Digest();
}

} // namespace

RankingStatistics ComputeStatistics(const std::vector<model::CandidateCombination>& candidates) {
  RankingStatistics stats;
  std::uint64_t sum = 0;

  for (const auto& c : candidates) {
    ++stats.total;
    sum += c.risk_score;
    if (c.type == model::CombinationType::kCoOccurrence)
      ++stats.co_occurrence;
    else
      ++stats.temporal_ordering;
    if (c.abstraction == model::AbstractionLevel::kSameTeam)
      ++stats.same_team;
    else
      ++stats.cross_controller;
    if (c.risk_score >= kHighRiskScore)
      ++stats.high_risk;
  }

  if (stats.total > 0)
    stats.mean_score = static_cast<double>(sum) / static_cast<double>(stats.total);
  return stats;
}

AnalysisEngine::AnalysisEngine(AnalysisOptions options)
    : options_(std::move(options)), options_hash_(HashOptions(options_)) {
}

std::shared_ptr<const AnalysisResult> AnalysisEngine::Analyze(const model::Snapshot& snapshot) {
  const auto snapshot_hash = model::ContentHash(snapshot);

  util::Fnv1a key;
  key.UpdateInt(snapshot_hash);
  key.UpdateInt(options_hash_);
  if (cached_ && cached_key_ == key.Digest())
    return cached_;

  auto result                    = std::make_shared<AnalysisResult>();
  result->snapshot_hash          = snapshot_hash;
  result->scoring_policy_version = options_.scoring.version;

  combination::CombinationGenerator generator(options_.generator);
  try {
    auto generated = generator.Generate(snapshot);
    result->status = generated.status;

    const model::SnapshotIndex index(snapshot);
    scoring::RiskScorer(options_.scoring).Apply(generated.candidates, index);
    result->ranked = scoring::Prioritizer(options_.min_risk_score).Rank(std::move(generated.candidates));
  } catch (const util::InvalidConfigurationError& e) {
    result->status = combination::GenerationStatus::kInvalidConfiguration;
    result->error  = e.what();
    STPA_LOG_WARN("Ranking skipped", {StringField("snapshot_hash", util::HexDigest(snapshot_hash)),
                                       StringField("error", result->error)});
  }
  result->statistics = ComputeStatistics(result->ranked);

  ++computations_;
  cached_     = result;
  cached_key_ = key.Digest();

  STPA_LOG_INFO("Candidates ranked",
                {StringField("snapshot_hash", util::HexDigest(snapshot_hash)),
                 StringField("status", combination::ToString(result->status)),
                 IntField("candidates", static_cast<std::int64_t>(result->statistics.total)),
                 IntField("high_risk", static_cast<std::int64_t>(result->statistics.high_risk)),
                 DoubleField("mean_score", result->statistics.mean_score)});
  return cached_;
}

} // namespace stpa::engine
