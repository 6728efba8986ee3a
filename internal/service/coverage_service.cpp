#include "coverage_service.hpp"

#include <exception>
#include <mutex>
#include <utility>
#include <variant>

#include "internal/coverage/coverage_tracker.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/report_writer.hpp"
#include "internal/session/session_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace stpa::service {

using namespace stpa::coverage::v1;
using stpa::observability::StringField;

namespace {

// Logs the failing route and rethrows.
template <typename Fn>
auto Handle(const char* route, const std::string& session_id, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    STPA_LOG_ERROR("RPC failed",
                   {StringField("route", route), StringField("session_id", session_id), StringField("error", ex.what())});
    throw;
  }
}

Movement ToProto(hierarchy::Movement movement) {
  switch (movement) {
    case hierarchy::Movement::kLateral:
      return MOVEMENT_LATERAL;
    case hierarchy::Movement::kUpward:
      return MOVEMENT_UPWARD;
    case hierarchy::Movement::kDownward:
      return MOVEMENT_DOWNWARD;
    case hierarchy::Movement::kInitial:
    default:
      return MOVEMENT_INITIAL;
  }
}

Progress ToProgress(const coverage::CoverageTracker& tracker) {
  const auto stats = tracker.Stats();
  Progress progress;
  progress.set_total_cells(static_cast<std::uint32_t>(stats.total_cells));
  progress.set_completed_cells(static_cast<std::uint32_t>(stats.completed_cells));
  progress.set_skipped_cells(static_cast<std::uint32_t>(stats.skipped_cells));
  progress.set_bonus_instances(static_cast<std::uint32_t>(stats.bonus_instances));
  progress.set_completion_ratio(tracker.CompletionRatio());
  return progress;
}

CellResponse ToCellResponse(const coverage::CoverageTracker& tracker) {
  CellResponse resp;
  if (const auto cell = tracker.CurrentCell())
    *resp.mutable_cell() = model::ToProto(*cell);
  resp.set_terminal(tracker.AtTerminal());
  resp.set_movement(ToProto(tracker.CurrentMovement()));
  return resp;
}

DecisionEvent ToProto(const events::DecisionEvent& decision) {
  DecisionEvent out;
  out.set_session_id(decision.session_id);
  out.set_signature(decision.signature);
  out.set_decision(model::ToProto(decision.decision));
  *out.mutable_recorded_at() = util::ToProto(decision.recorded_at);
  return out;
}

ReviewEvent ToProto(const events::ReviewEvent& event) {
  ReviewEvent out;
  if (const auto* coverage = std::get_if<events::CoverageEvent>(&event)) {
    auto* e = out.mutable_coverage();
    e->set_session_id(coverage->session_id);
    *e->mutable_cell() = model::ToProto(coverage->cell);
    e->set_state(model::ToProto(coverage->state));
    *e->mutable_recorded_at() = util::ToProto(coverage->recorded_at);
  } else {
    *out.mutable_decision() = ToProto(std::get<events::DecisionEvent>(event));
  }
  return out;
}

} // namespace

CoverageService::CoverageService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

OpenSessionResponse CoverageService::OpenSession(const OpenSessionRequest& req) {
  return Handle("CoverageService.OpenSession", "", [&] {
    auto session = ctx_.sessions->Open(model::FromProto(req.snapshot()));
    std::lock_guard lock(session->mutex());

    OpenSessionResponse resp;
    resp.set_session_id(session->id());
    if (const auto cell = session->tracker().CurrentCell())
      *resp.mutable_current() = model::ToProto(*cell);
    resp.set_terminal(session->tracker().AtTerminal());
    *resp.mutable_progress() = ToProgress(session->tracker());
    resp.set_snapshot_hash(util::HexDigest(session->analysis().snapshot_hash));
    return resp;
  });
}

UpdateSnapshotResponse CoverageService::UpdateSnapshot(const UpdateSnapshotRequest& req) {
  return Handle("CoverageService.UpdateSnapshot", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());
    session->UpdateSnapshot(model::FromProto(req.snapshot()));

    UpdateSnapshotResponse resp;
    if (const auto cell = session->tracker().CurrentCell())
      *resp.mutable_current() = model::ToProto(*cell);
    resp.set_terminal(session->tracker().AtTerminal());
    *resp.mutable_progress() = ToProgress(session->tracker());
    resp.set_snapshot_hash(util::HexDigest(session->analysis().snapshot_hash));
    return resp;
  });
}

CloseSessionResponse CoverageService::CloseSession(const CloseSessionRequest& req) {
  return Handle("CoverageService.CloseSession", req.session_id(), [&] {
    ctx_.sessions->Close(req.session_id());
    return CloseSessionResponse{};
  });
}

RankCandidatesResponse CoverageService::RankCandidates(const RankCandidatesRequest& req) {
  return Handle("CoverageService.RankCandidates", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());

    RankCandidatesResponse resp;
    *resp.mutable_report() = report::BuildReport(session->analysis());
    return resp;
  });
}

DecideCandidateResponse CoverageService::DecideCandidate(const DecideCandidateRequest& req) {
  return Handle("CoverageService.DecideCandidate", req.session_id(), [&] {
    const auto decision = model::FromProto(req.decision());
    if (decision == model::Decision::kPending)
      throw util::InvalidArgument("decision must be ACCEPTED or REJECTED");

    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());

    auto&      review = session->review();
    const auto event  = decision == model::Decision::kAccepted ? review.Accept(req.index()) : review.Reject(req.index());

    DecideCandidateResponse resp;
    *resp.mutable_event() = ToProto(event);
    return resp;
  });
}

CellResponse CoverageService::GetCurrentCell(const GetCurrentCellRequest& req) {
  return Handle("CoverageService.GetCurrentCell", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());
    return ToCellResponse(session->tracker());
  });
}

CellResponse CoverageService::Advance(const AdvanceRequest& req) {
  return Handle("CoverageService.Advance", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());
    session->tracker().Advance();
    return ToCellResponse(session->tracker());
  });
}

CellResponse CoverageService::Retreat(const RetreatRequest& req) {
  return Handle("CoverageService.Retreat", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());
    session->tracker().Retreat();
    return ToCellResponse(session->tracker());
  });
}

MarkCellResponse CoverageService::MarkCell(const MarkCellRequest& req) {
  return Handle("CoverageService.MarkCell", req.session_id(), [&] {
    const auto state = model::FromProto(req.state());
    if (state == model::CellState::kUnvisited)
      throw util::InvalidArgument("cells can only be marked COMPLETED or SKIPPED");

    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());

    auto&      tracker = session->tracker();
    const auto key     = model::FromProto(req.cell());

    MarkCellResponse resp;
    resp.set_applied(state == model::CellState::kCompleted ? tracker.MarkCompleted(key) : tracker.MarkSkipped(key));
    *resp.mutable_progress() = ToProgress(tracker);
    return resp;
  });
}

AddInstanceResponse CoverageService::AddInstance(const AddInstanceRequest& req) {
  return Handle("CoverageService.AddInstance", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());

    const auto key     = model::FromProto(req.cell());
    const auto created = session->tracker().AddInstance(key);
    if (!created)
      throw util::NotFound("cell not in coverage scope: " + key.ToString());

    AddInstanceResponse resp;
    *resp.mutable_cell() = model::ToProto(*created);
    return resp;
  });
}

GetProgressResponse CoverageService::GetProgress(const GetProgressRequest& req) {
  return Handle("CoverageService.GetProgress", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());
    std::lock_guard lock(session->mutex());

    GetProgressResponse resp;
    *resp.mutable_progress() = ToProgress(session->tracker());
    return resp;
  });
}

DrainEventsResponse CoverageService::DrainEvents(const DrainEventsRequest& req) {
  return Handle("CoverageService.DrainEvents", req.session_id(), [&] {
    auto session = ctx_.sessions->Get(req.session_id());

    DrainEventsResponse resp;
    for (const auto& event : session->events().Drain())
      *resp.add_events() = ToProto(event);
    return resp;
  });
}

} // namespace stpa::service
