#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/events/event_sink.hpp"
#include "internal/model/candidate.hpp"

namespace stpa::review {

struct DecisionSummary {
  std::size_t accepted = 0;
  std::size_t rejected = 0;
  std::size_t pending  = 0;
};

/*
  CandidateReview

  Cursor over a ranked candidate list with one verdict per candidate.
  Accepting a rejected candidate (or the reverse) replaces the verdict.
*/
class CandidateReview {
 public:
  CandidateReview(std::vector<model::CandidateCombination> ranked, std::shared_ptr<events::EventSink> sink = nullptr,
                  std::string session_id = {});

  std::size_t size() const {
    return ranked_.size();
  }

  std::optional<std::size_t> CurrentIndex() const;
  const model::CandidateCombination* Current() const;

  // Moves the cursor; stays on the first/last candidate at either end.
  const model::CandidateCombination* Next();
  const model::CandidateCombination* Previous();

  // Return the event handed to the sink. Throw util::NotFound for an index
  // outside the list.
  events::DecisionEvent Accept(std::size_t index);
  events::DecisionEvent Reject(std::size_t index);
  model::Decision DecisionOf(std::size_t index) const;
  const model::CandidateCombination& At(std::size_t index) const;

  DecisionSummary Summary() const;

  // New ranking for a changed snapshot. Verdicts follow candidates by
  // signature; the cursor restarts at the top.
  void Replace(std::vector<model::CandidateCombination> ranked);

 private:
  events::DecisionEvent Decide(std::size_t index, model::Decision decision);
  void CheckIndex(std::size_t index) const;

  std::vector<model::CandidateCombination> ranked_;
  std::vector<model::Decision> decisions_;
  std::size_t cursor_ = 0;

  std::shared_ptr<events::EventSink> sink_;
  std::string session_id_;
};

} // namespace stpa::review
