#pragma once

#include "service_context.hpp"
#include "stpa/coverage/v1.hpp"

namespace stpa::service {

/*
  Proto-facing review operations. Exceptions from the core propagate
  unchanged; the transport layer maps them to status codes.
*/
class CoverageService {
 public:
  explicit CoverageService(ServiceContext ctx);

  stpa::coverage::v1::OpenSessionResponse OpenSession(const stpa::coverage::v1::OpenSessionRequest& req);
  stpa::coverage::v1::UpdateSnapshotResponse UpdateSnapshot(const stpa::coverage::v1::UpdateSnapshotRequest& req);
  stpa::coverage::v1::CloseSessionResponse CloseSession(const stpa::coverage::v1::CloseSessionRequest& req);

  stpa::coverage::v1::RankCandidatesResponse RankCandidates(const stpa::coverage::v1::RankCandidatesRequest& req);
  stpa::coverage::v1::DecideCandidateResponse DecideCandidate(const stpa::coverage::v1::DecideCandidateRequest& req);

  stpa::coverage::v1::CellResponse GetCurrentCell(const stpa::coverage::v1::GetCurrentCellRequest& req);
  stpa::coverage::v1::CellResponse Advance(const stpa::coverage::v1::AdvanceRequest& req);
  stpa::coverage::v1::CellResponse Retreat(const stpa::coverage::v1::RetreatRequest& req);
  stpa::coverage::v1::MarkCellResponse MarkCell(const stpa::coverage::v1::MarkCellRequest& req);
  stpa::coverage::v1::AddInstanceResponse AddInstance(const stpa::coverage::v1::AddInstanceRequest& req);
  stpa::coverage::v1::GetProgressResponse GetProgress(const stpa::coverage::v1::GetProgressRequest& req);

  stpa::coverage::v1::DrainEventsResponse DrainEvents(const stpa::coverage::v1::DrainEventsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace stpa::service
