#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/engine/analysis_engine.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/session/review_session.hpp"

namespace stpa::session {

/*
  Open review sessions by id. The map is the only shared state; sessions
  are independent of each other.
*/
class SessionRegistry {
 public:
  SessionRegistry(engine::AnalysisOptions options, std::vector<std::string> analysis_types);

  std::shared_ptr<ReviewSession> Open(model::Snapshot snapshot);

  // Throw util::NotFound for an unknown id.
  std::shared_ptr<ReviewSession> Get(const std::string& session_id) const;
  void Close(const std::string& session_id);

  std::size_t size() const;

 private:
  engine::AnalysisOptions options_;
  std::vector<std::string> analysis_types_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<ReviewSession>> sessions_;
};

} // namespace stpa::session
