#include "internal/session/review_session.hpp"

#include <utility>

#include "internal/coverage/traversal.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hash.hpp"

namespace stpa::session {

using stpa::observability::IntField;
using stpa::observability::StringField;

ReviewSession::ReviewSession(std::string id, model::Snapshot snapshot, engine::AnalysisOptions options,
                             std::vector<std::string> analysis_types)
    : id_(std::move(id)),
      snapshot_(std::move(snapshot)),
      analysis_types_(std::move(analysis_types)),
      engine_(std::move(options)),
      hierarchy_(hierarchy::HierarchyBuilder::Build(snapshot_)),
      sink_(std::make_shared<events::RecordingEventSink>()) {
  analysis_ = engine_.Analyze(snapshot_);

  const model::SnapshotIndex index(snapshot_);
  tracker_ = std::make_unique<coverage::CoverageTracker>(coverage::BuildPlan(hierarchy_, index, analysis_types_), sink_, id_);
  review_  = std::make_unique<review::CandidateReview>(analysis_->ranked, sink_, id_);

  STPA_LOG_INFO("Review session opened",
                {StringField("session_id", id_), StringField("snapshot_hash", util::HexDigest(analysis_->snapshot_hash)),
                 IntField("controllers", static_cast<std::int64_t>(hierarchy_.VisitingOrder().size())),
                 IntField("cells", static_cast<std::int64_t>(tracker_->Stats().total_cells)),
                 IntField("candidates", static_cast<std::int64_t>(analysis_->ranked.size()))});
}

void ReviewSession::UpdateSnapshot(model::Snapshot snapshot) {
  // Build first so a cyclic update leaves the session untouched.
  auto hierarchy = hierarchy::HierarchyBuilder::Build(snapshot);
  auto analysis  = engine_.Analyze(snapshot);

  snapshot_  = std::move(snapshot);
  hierarchy_ = std::move(hierarchy);

  const model::SnapshotIndex index(snapshot_);
  tracker_->Rebase(coverage::BuildPlan(hierarchy_, index, analysis_types_));

  if (analysis != analysis_) {
    analysis_ = std::move(analysis);
    review_->Replace(analysis_->ranked);
  }
}

} // namespace stpa::session
