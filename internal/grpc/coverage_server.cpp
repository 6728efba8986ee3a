#include "coverage_server.hpp"

#include <utility>

#include "grpc_error.hpp"

namespace stpa::grpc {

using namespace stpa::coverage::v1;

CoverageServer::CoverageServer(std::shared_ptr<stpa::service::CoverageService> svc) : service_(std::move(svc)) {
}

::grpc::Status CoverageServer::OpenSession(::grpc::ServerContext*, const OpenSessionRequest* req, OpenSessionResponse* resp) {
  try {
    *resp = service_->OpenSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::UpdateSnapshot(::grpc::ServerContext*, const UpdateSnapshotRequest* req, UpdateSnapshotResponse* resp) {
  try {
    *resp = service_->UpdateSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::CloseSession(::grpc::ServerContext*, const CloseSessionRequest* req, CloseSessionResponse* resp) {
  try {
    *resp = service_->CloseSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::RankCandidates(::grpc::ServerContext*, const RankCandidatesRequest* req, RankCandidatesResponse* resp) {
  try {
    *resp = service_->RankCandidates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::DecideCandidate(::grpc::ServerContext*, const DecideCandidateRequest* req, DecideCandidateResponse* resp) {
  try {
    *resp = service_->DecideCandidate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::GetCurrentCell(::grpc::ServerContext*, const GetCurrentCellRequest* req, CellResponse* resp) {
  try {
    *resp = service_->GetCurrentCell(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::Advance(::grpc::ServerContext*, const AdvanceRequest* req, CellResponse* resp) {
  try {
    *resp = service_->Advance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::Retreat(::grpc::ServerContext*, const RetreatRequest* req, CellResponse* resp) {
  try {
    *resp = service_->Retreat(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::MarkCell(::grpc::ServerContext*, const MarkCellRequest* req, MarkCellResponse* resp) {
  try {
    *resp = service_->MarkCell(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::AddInstance(::grpc::ServerContext*, const AddInstanceRequest* req, AddInstanceResponse* resp) {
  try {
    *resp = service_->AddInstance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::GetProgress(::grpc::ServerContext*, const GetProgressRequest* req, GetProgressResponse* resp) {
  try {
    *resp = service_->GetProgress(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CoverageServer::DrainEvents(::grpc::ServerContext*, const DrainEventsRequest* req, DrainEventsResponse* resp) {
  try {
    *resp = service_->DrainEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace stpa::grpc
