#include "internal/session/session_registry.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace stpa::session {

using stpa::observability::StringField;

SessionRegistry::SessionRegistry(engine::AnalysisOptions options, std::vector<std::string> analysis_types)
    : options_(std::move(options)), analysis_types_(std::move(analysis_types)) {
}

std::shared_ptr<ReviewSession> SessionRegistry::Open(model::Snapshot snapshot) {
  // Analysis runs outside the lock.
  auto session = std::make_shared<ReviewSession>(util::GenerateSessionId(), std::move(snapshot), options_, analysis_types_);

  std::lock_guard lock(mutex_);
  sessions_.emplace(session->id(), session);
  return session;
}

std::shared_ptr<ReviewSession> SessionRegistry::Get(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end())
    throw util::NotFound("review session not found: " + session_id);
  return it->second;
}

void SessionRegistry::Close(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  if (sessions_.erase(session_id) == 0)
    throw util::NotFound("review session not found: " + session_id);

  STPA_LOG_INFO("Review session closed", {StringField("session_id", session_id)});
}

std::size_t SessionRegistry::size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

} // namespace stpa::session
