#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/candidate.hpp"
#include "internal/model/coverage_cell.hpp"
#include "internal/util/time.hpp"

namespace stpa::events {

// A coverage cell changed state.
struct CoverageEvent {
  std::string session_id;
  model::CellKey cell;
  model::CellState state = model::CellState::kUnvisited;
  util::TimePoint recorded_at;
};

// A reviewer accepted or rejected a ranked candidate.
struct DecisionEvent {
  std::string session_id;
  std::string signature;
  model::Decision decision = model::Decision::kPending;
  util::TimePoint recorded_at;
};

using ReviewEvent = std::variant<CoverageEvent, DecisionEvent>;

/*
  Write-back channel of a review session. Implementations must not throw
  into the caller.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const CoverageEvent& event) = 0;
  virtual void Publish(const DecisionEvent& event) = 0;
};

/*
  Buffers events in publication order until drained.
*/
class RecordingEventSink : public EventSink {
 public:
  void Publish(const CoverageEvent& event) override;
  void Publish(const DecisionEvent& event) override;

  std::vector<ReviewEvent> Drain();
  std::size_t Pending() const;

 private:
  mutable std::mutex mutex_;
  std::vector<ReviewEvent> events_;
};

class LoggingEventSink : public EventSink {
 public:
  void Publish(const CoverageEvent& event) override;
  void Publish(const DecisionEvent& event) override;
};

} // namespace stpa::events
