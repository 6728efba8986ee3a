#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/hierarchy/hierarchy_builder.hpp"
#include "internal/model/coverage_cell.hpp"
#include "internal/model/snapshot.hpp"

namespace stpa::coverage {

struct PlannedController {
  std::string controller_id;
  std::uint32_t level = 0;
  std::vector<std::string> action_ids;
};

/*
  The guided walk: controllers in hierarchy visiting order, each with its
  in-scope actions sorted by id, crossed with the ordered analysis types.
*/
struct TraversalPlan {
  std::vector<PlannedController> controllers;
  std::vector<std::string> analysis_types;

  // Instance-0 cells.
  std::size_t CellCount() const;

  bool Contains(const std::string& controller_id, const std::string& action_id, const std::string& analysis_type) const;
};

TraversalPlan BuildPlan(const hierarchy::Hierarchy& hierarchy, const model::SnapshotIndex& index,
                        std::vector<std::string> analysis_types);

// ------------------------------------------------------------
// Position state machine
// ------------------------------------------------------------

struct AtCell {
  std::size_t   controller_index = 0;
  std::size_t   action_index     = 0;
  std::size_t   type_index       = 0;
  std::uint32_t instance         = 0;
};

inline bool operator==(const AtCell& a, const AtCell& b) {
  return a.controller_index == b.controller_index && a.action_index == b.action_index &&
         a.type_index == b.type_index && a.instance == b.instance;
}

struct Terminal {};

inline bool operator==(const Terminal&, const Terminal&) {
  return true;
}

using Position = std::variant<AtCell, Terminal>;

// Number of existing instances per (controller, action, type) group, keyed
// by the instance-0 key. Groups not listed have exactly one instance.
using InstanceCounts = std::map<model::CellKey, std::uint32_t>;

std::uint32_t InstanceCount(const InstanceCounts& counts, const model::CellKey& key);

// First cell, or Terminal for an empty plan.
Position FirstPosition(const TraversalPlan& plan);

// Next existing instance, next type, next action, next controller, then
// Terminal. Terminal is absorbing.
Position NextPosition(const TraversalPlan& plan, const Position& position, const InstanceCounts& counts);

// Inverse of NextPosition. The first cell maps to itself; Terminal maps to
// the last existing cell.
Position PreviousPosition(const TraversalPlan& plan, const Position& position, const InstanceCounts& counts);

model::CellKey KeyAt(const TraversalPlan& plan, const AtCell& cell);

// Position of an instance-0 group in the plan, ignoring key.instance_index.
std::optional<AtCell> Locate(const TraversalPlan& plan, const model::CellKey& key);

} // namespace stpa::coverage
