#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/coverage/traversal.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/hierarchy/hierarchy_builder.hpp"
#include "internal/model/coverage_cell.hpp"

namespace stpa::coverage {

struct CoverageStats {
  std::size_t total_cells     = 0;
  std::size_t completed_cells = 0;
  std::size_t skipped_cells   = 0;
  // Instances beyond the first, over cells still in scope.
  std::size_t bonus_instances = 0;
};

/*
  CoverageTracker

  Records which (controller, action, analysis type, instance) cells a
  reviewer has completed or skipped and where the guided walk currently
  stands.

  Cells outside the plan are never stored; operations on them log a
  warning and report failure. States survive Rebase, so a cell that
  leaves scope and returns keeps its state.
*/
class CoverageTracker {
 public:
  explicit CoverageTracker(TraversalPlan plan, std::shared_ptr<events::EventSink> sink = nullptr,
                           std::string session_id = {});

  // nullopt at Terminal or on an empty plan.
  std::optional<model::CellKey> CurrentCell() const;

  hierarchy::Movement CurrentMovement() const {
    return movement_;
  }

  bool AtTerminal() const;

  std::optional<model::CellKey> Advance();
  std::optional<model::CellKey> Retreat();

  bool MarkCompleted(const model::CellKey& key);
  bool MarkSkipped(const model::CellKey& key);

  // Creates the next instance of key's group. nullopt when the group is
  // out of scope.
  std::optional<model::CellKey> AddInstance(const model::CellKey& key);

  model::CellState StateOf(const model::CellKey& key) const;

  double CompletionRatio() const;
  CoverageStats Stats() const;

  void Rebase(TraversalPlan plan);

  const TraversalPlan& plan() const {
    return plan_;
  }

 private:
  bool Mark(const model::CellKey& key, model::CellState state);
  bool Exists(const model::CellKey& key) const;
  void Move(const Position& next);

  TraversalPlan plan_;
  std::shared_ptr<events::EventSink> sink_;
  std::string session_id_;

  std::map<model::CellKey, model::CellState> states_;
  InstanceCounts instances_;

  Position position_;
  hierarchy::Movement movement_ = hierarchy::Movement::kInitial;
};

} // namespace stpa::coverage
