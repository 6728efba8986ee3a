#include "internal/events/event_sink.hpp"


#include "internal/observability/logging.hpp"

namespace stpa::events {

using stpa::observability::IntField;
using stpa::observability::StringField;

void RecordingEventSink::Publish(const CoverageEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.emplace_back(event);
}

void RecordingEventSink::Publish(const DecisionEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.emplace_back(event);
}

std::vector<ReviewEvent> RecordingEventSink::Drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ReviewEvent> out;
  out.swap(events_);
  return out;
}

std::size_t RecordingEventSink::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void LoggingEventSink::Publish(const CoverageEvent& event) {
  STPA_LOG_DEBUG("Coverage cell marked",
                {StringField("session_id", event.session_id), StringField("controller_id", event.cell.controller_id),
                 StringField("control_action_id", event.cell.control_action_id),
                 StringField("analysis_type", event.cell.analysis_type),
                 IntField("instance", event.cell.instance_index), StringField("state", model::ToString(event.state))});
}

void LoggingEventSink::Publish(const DecisionEvent& event) {
  STPA_LOG_DEBUG("Candidate decided", {StringField("session_id", event.session_id), StringField("signature", event.signature),
                                      StringField("decision", model::ToString(event.decision))});
}

} // namespace stpa::events
