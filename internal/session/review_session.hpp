#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/coverage/coverage_tracker.hpp"
#include "internal/engine/analysis_engine.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/hierarchy/hierarchy_builder.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/review/candidate_review.hpp"

namespace stpa::session {

/*
  ReviewSession

  One reviewer's working state over a snapshot: the levelled hierarchy,
  the ranked candidates with their verdicts, the coverage walk and the
  events not yet drained.

  Construction throws util::GraphCycleError when the control structure
  is cyclic. Callers serialize access through mutex().
*/
class ReviewSession {
 public:
  ReviewSession(std::string id, model::Snapshot snapshot, engine::AnalysisOptions options,
                std::vector<std::string> analysis_types);

  const std::string& id() const {
    return id_;
  }

  std::mutex& mutex() {
    return mutex_;
  }

  const model::Snapshot& snapshot() const {
    return snapshot_;
  }

  const hierarchy::Hierarchy& hierarchy() const {
    return hierarchy_;
  }

  const engine::AnalysisResult& analysis() const {
    return *analysis_;
  }

  coverage::CoverageTracker& tracker() {
    return *tracker_;
  }

  review::CandidateReview& review() {
    return *review_;
  }

  events::RecordingEventSink& events() {
    return *sink_;
  }

  // Re-reads the data store view. Recorded coverage and verdicts carry
  // over to whatever is still in scope.
  void UpdateSnapshot(model::Snapshot snapshot);

 private:
  std::string id_;
  model::Snapshot snapshot_;
  std::vector<std::string> analysis_types_;

  engine::AnalysisEngine engine_;
  hierarchy::Hierarchy hierarchy_;
  std::shared_ptr<const engine::AnalysisResult> analysis_;

  std::shared_ptr<events::RecordingEventSink> sink_;
  std::unique_ptr<coverage::CoverageTracker> tracker_;
  std::unique_ptr<review::CandidateReview> review_;

  std::mutex mutex_;
};

} // namespace stpa::session
