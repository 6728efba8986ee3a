#include "internal/review/candidate_review.hpp"

#include <map>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stpa::review {

using stpa::observability::IntField;
using stpa::observability::StringField;

CandidateReview::CandidateReview(std::vector<model::CandidateCombination> ranked,
                                 std::shared_ptr<events::EventSink> sink, std::string session_id)
    : ranked_(std::move(ranked)),
      decisions_(ranked_.size(), model::Decision::kPending),
      sink_(std::move(sink)),
      session_id_(std::move(session_id)) {
}

std::optional<std::size_t> CandidateReview::CurrentIndex() const {
  if (ranked_.empty())
    return std::nullopt;
  return cursor_;
}

const model::CandidateCombination* CandidateReview::Current() const {
  return ranked_.empty() ? nullptr : &ranked_[cursor_];
}

const model::CandidateCombination* CandidateReview::Next() {
  if (cursor_ + 1 < ranked_.size())
    ++cursor_;
  return Current();
}

const model::CandidateCombination* CandidateReview::Previous() {
  if (cursor_ > 0)
    --cursor_;
  return Current();
}

void CandidateReview::CheckIndex(std::size_t index) const {
  if (ranked_.empty())
    throw util::InvalidState("no candidates to review");
  if (index >= ranked_.size())
    throw util::NotFound("candidate index " + std::to_string(index) + " out of range (" +
                         std::to_string(ranked_.size()) + " candidates)");
}

events::DecisionEvent CandidateReview::Accept(std::size_t index) {
  return Decide(index, model::Decision::kAccepted);
}

events::DecisionEvent CandidateReview::Reject(std::size_t index) {
  return Decide(index, model::Decision::kRejected);
}

events::DecisionEvent CandidateReview::Decide(std::size_t index, model::Decision decision) {
  CheckIndex(index);
  decisions_[index] = decision;
  cursor_           = index;

  events::DecisionEvent event{session_id_, ranked_[index].Signature(), decision, util::Now()};
  STPA_LOG_DEBUG("Candidate decision recorded",
                 {StringField("session_id", session_id_), IntField("index", static_cast<std::int64_t>(index)),
                  StringField("decision", model::ToString(decision))});
  if (sink_)
    sink_->Publish(event);
  return event;
}

model::Decision CandidateReview::DecisionOf(std::size_t index) const {
  CheckIndex(index);
  return decisions_[index];
}

const model::CandidateCombination& CandidateReview::At(std::size_t index) const {
  CheckIndex(index);
  return ranked_[index];
}

DecisionSummary CandidateReview::Summary() const {
  DecisionSummary summary;
  for (const auto decision : decisions_) {
    switch (decision) {
      case model::Decision::kAccepted:
        ++summary.accepted;
        break;
      case model::Decision::kRejected:
        ++summary.rejected;
        break;
      case model::Decision::kPending:
        ++summary.pending;
        break;
    }
  }
  return summary;
}

void CandidateReview::Replace(std::vector<model::CandidateCombination> ranked) {
  std::map<std::string, model::Decision> previous;
  for (std::size_t i = 0; i < ranked_.size(); ++i) {
    if (decisions_[i] != model::Decision::kPending)
      previous.emplace(ranked_[i].Signature(), decisions_[i]);
  }

  ranked_ = std::move(ranked);
  decisions_.assign(ranked_.size(), model::Decision::kPending);
  for (std::size_t i = 0; i < ranked_.size(); ++i) {
    auto it = previous.find(ranked_[i].Signature());
    if (it != previous.end())
      decisions_[i] = it->second;
  }
  cursor_ = 0;
}

} // namespace stpa::review
