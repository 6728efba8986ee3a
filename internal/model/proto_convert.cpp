#include "internal/model/proto_convert.hpp"

#include <cmath>
#include <utility>

namespace stpa::model {

namespace {

ControllerType FromProto(v1::ControllerType type) {
  switch (type) {
    case v1::CONTROLLER_TYPE_HUMAN:
      return ControllerType::kHuman;
    case v1::CONTROLLER_TYPE_SOFTWARE:
      return ControllerType::kSoftware;
    case v1::CONTROLLER_TYPE_TEAM:
      return ControllerType::kTeam;
    case v1::CONTROLLER_TYPE_ORGANIZATION:
      return ControllerType::kOrganization;
    case v1::CONTROLLER_TYPE_HYBRID:
      return ControllerType::kHybrid;
    default:
      return ControllerType::kUnspecified;
  }
}

v1::AbstractionLevel ToProto(AbstractionLevel level) {
  return level == AbstractionLevel::kSameTeam ? v1::ABSTRACTION_LEVEL_SAME_TEAM : v1::ABSTRACTION_LEVEL_CROSS_CONTROLLER;
}

v1::CombinationType ToProto(CombinationType type) {
  return type == CombinationType::kCoOccurrence ? v1::COMBINATION_TYPE_CO_OCCURRENCE
                                                : v1::COMBINATION_TYPE_TEMPORAL_ORDERING;
}

} // namespace

Snapshot FromProto(const v1::Snapshot& proto) {
  Snapshot snapshot;

  for (const auto& c : proto.controllers()) {
    Controller controller;
    controller.id   = c.id();
    controller.name = c.name();
    controller.type = FromProto(c.type());
    controller.roles.assign(c.roles().begin(), c.roles().end());
    controller.team_id = c.team_id();
    // NaN and infinities count as unplaced.
    if (c.has_layout_x() && std::isfinite(c.layout_x()))
      controller.layout_x = c.layout_x();
    snapshot.controllers.push_back(std::move(controller));
  }

  for (const auto& p : proto.control_paths())
    snapshot.control_paths.push_back(ControlPath{p.id(), p.source_controller_id(), p.target_id()});

  for (const auto& a : proto.control_actions()) {
    snapshot.control_actions.push_back(
        ControlAction{a.id(), a.controller_id(), a.verb(), a.object(), a.has_in_scope() ? a.in_scope() : true});
  }

  for (const auto& f : proto.findings())
    snapshot.findings.push_back(Finding{f.id(), f.controller_id(), f.control_action_id(), f.analysis_type()});

  return snapshot;
}

CellKey FromProto(const v1::CellKey& proto) {
  return CellKey{proto.controller_id(), proto.control_action_id(), proto.analysis_type(), proto.instance_index()};
}

v1::CellKey ToProto(const CellKey& key) {
  v1::CellKey out;
  out.set_controller_id(key.controller_id);
  out.set_control_action_id(key.control_action_id);
  out.set_analysis_type(key.analysis_type);
  out.set_instance_index(key.instance_index);
  return out;
}

CellState FromProto(v1::CellState state) {
  switch (state) {
    case v1::CELL_STATE_COMPLETED:
      return CellState::kCompleted;
    case v1::CELL_STATE_SKIPPED:
      return CellState::kSkipped;
    default:
      return CellState::kUnvisited;
  }
}

v1::CellState ToProto(CellState state) {
  switch (state) {
    case CellState::kCompleted:
      return v1::CELL_STATE_COMPLETED;
    case CellState::kSkipped:
      return v1::CELL_STATE_SKIPPED;
    case CellState::kUnvisited:
    default:
      return v1::CELL_STATE_UNVISITED;
  }
}

Decision FromProto(v1::Decision decision) {
  switch (decision) {
    case v1::DECISION_ACCEPTED:
      return Decision::kAccepted;
    case v1::DECISION_REJECTED:
      return Decision::kRejected;
    default:
      return Decision::kPending;
  }
}

v1::Decision ToProto(Decision decision) {
  switch (decision) {
    case Decision::kAccepted:
      return v1::DECISION_ACCEPTED;
    case Decision::kRejected:
      return v1::DECISION_REJECTED;
    case Decision::kPending:
    default:
      return v1::DECISION_PENDING;
  }
}

v1::CandidateCombination ToProto(const CandidateCombination& candidate, std::uint32_t rank) {
  v1::CandidateCombination out;
  out.set_rank(rank);
  out.set_signature(candidate.Signature());
  for (const auto& id : candidate.controller_ids)
    out.add_controller_ids(id);
  for (const auto& id : candidate.control_action_ids)
    out.add_control_action_ids(id);
  out.set_abstraction(ToProto(candidate.abstraction));
  out.set_type(ToProto(candidate.type));
  out.set_risk_score(candidate.risk_score);
  out.set_rationale(candidate.rationale);
  for (const auto& member : candidate.members) {
    auto* m = out.add_members();
    m->set_controller_id(member.controller_id);
    m->set_control_action_id(member.control_action_id);
  }
  return out;
}

} // namespace stpa::model
