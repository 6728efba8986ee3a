#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/coverage_service.hpp"
#include "stpa/coverage/v1/coverage_service.grpc.pb.h"

namespace stpa::grpc {

class CoverageServer final : public stpa::coverage::v1::CoverageService::Service {
 public:
  explicit CoverageServer(std::shared_ptr<stpa::service::CoverageService> svc);

  ::grpc::Status OpenSession(::grpc::ServerContext*, const stpa::coverage::v1::OpenSessionRequest*,
                 stpa::coverage::v1::OpenSessionResponse*) override;
  ::grpc::Status UpdateSnapshot(::grpc::ServerContext*, const stpa::coverage::v1::UpdateSnapshotRequest*,
                 stpa::coverage::v1::UpdateSnapshotResponse*) override;
  ::grpc::Status CloseSession(::grpc::ServerContext*, const stpa::coverage::v1::CloseSessionRequest*,
                 stpa::coverage::v1::CloseSessionResponse*) override;
  ::grpc::Status RankCandidates(::grpc::ServerContext*, const stpa::coverage::v1::RankCandidatesRequest*,
                 stpa::coverage::v1::RankCandidatesResponse*) override;
  ::grpc::Status DecideCandidate(::grpc::ServerContext*, const stpa::coverage::v1::DecideCandidateRequest*,
                 stpa::coverage::v1::DecideCandidateResponse*) override;
  ::grpc::Status GetCurrentCell(::grpc::ServerContext*, const stpa::coverage::v1::GetCurrentCellRequest*,
                 stpa::coverage::v1::CellResponse*) override;
  ::grpc::Status Advance(::grpc::ServerContext*, const stpa::coverage::v1::AdvanceRequest*,
                 stpa::coverage::v1::CellResponse*) override;
  ::grpc::Status Retreat(::grpc::ServerContext*, const stpa::coverage::v1::RetreatRequest*,
                 stpa::coverage::v1::CellResponse*) override;
  ::grpc::Status MarkCell(::grpc::ServerContext*, const stpa::coverage::v1::MarkCellRequest*,
                 stpa::coverage::v1::MarkCellResponse*) override;
  ::grpc::Status AddInstance(::grpc::ServerContext*, const stpa::coverage::v1::AddInstanceRequest*,
                 stpa::coverage::v1::AddInstanceResponse*) override;
  ::grpc::Status GetProgress(::grpc::ServerContext*, const stpa::coverage::v1::GetProgressRequest*,
                 stpa::coverage::v1::GetProgressResponse*) override;
  ::grpc::Status DrainEvents(::grpc::ServerContext*, const stpa::coverage::v1::DrainEventsRequest*,
                 stpa::coverage::v1::DrainEventsResponse*) override;

 private:
  std::shared_ptr<stpa::service::CoverageService> service_;
};

} // namespace stpa::grpc
