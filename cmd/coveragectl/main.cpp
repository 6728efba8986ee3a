#include <exception>
#include <iostream>
#include <memory>
#include <utility>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/coverage/coverage_tracker.hpp"
#include "internal/coverage/traversal.hpp"
#include "internal/engine/analysis_engine.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/hierarchy/hierarchy_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/report_writer.hpp"
#include "internal/util/errors.hpp"

using stpa::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage:\n"
            << "  coveragectl rank <config.yaml> <snapshot.yaml> [json|csv]\n"
            << "  coveragectl hierarchy <snapshot.yaml>\n"
            << "  coveragectl walk <config.yaml> <snapshot.yaml>\n";
}

static int Rank(const RuntimeConfig& config, const std::string& snapshot_path, stpa::report::ExportFormat format) {
  const auto snapshot = stpa::config::ConfigLoader::LoadSnapshotFromYaml(snapshot_path);

  stpa::engine::AnalysisEngine engine(stpa::config::ToAnalysisOptions(config));
  const auto result = engine.Analyze(snapshot);
  if (result->status == stpa::combination::GenerationStatus::kInvalidConfiguration)
    throw stpa::util::InvalidConfigurationError(result->error);

  std::cout << stpa::report::Export(*result, format);
  if (format == stpa::report::ExportFormat::kJson)
    std::cout << "\n";

  const auto& stats = result->statistics;
  std::cerr << "candidates=" << stats.total << " co_occurrence=" << stats.co_occurrence
            << " temporal_ordering=" << stats.temporal_ordering << " same_team=" << stats.same_team
            << " cross_controller=" << stats.cross_controller << " high_risk=" << stats.high_risk
            << " mean_score=" << stats.mean_score << "\n";
  return 0;
}

static int Hierarchy(const std::string& snapshot_path) {
  const auto snapshot  = stpa::config::ConfigLoader::LoadSnapshotFromYaml(snapshot_path);
  const auto hierarchy = stpa::hierarchy::HierarchyBuilder::Build(snapshot);

  const auto& levels = hierarchy.Levels();
  for (std::size_t level = 0; level < levels.size(); ++level) {
    std::cout << "level " << level << ":";
    for (const auto& id : levels[level]) std::cout << " " << id;
    std::cout << "\n";
  }

  std::cout << "visiting order:";
  for (const auto& id : hierarchy.VisitingOrder()) std::cout << " " << id;
  std::cout << "\n";
  return 0;
}

// Prints every cell of the guided walk and marks it completed.
static int Walk(const RuntimeConfig& config, const std::string& snapshot_path) {
  const auto snapshot  = stpa::config::ConfigLoader::LoadSnapshotFromYaml(snapshot_path);
  const auto hierarchy = stpa::hierarchy::HierarchyBuilder::Build(snapshot);
  const stpa::model::SnapshotIndex index(snapshot);

  auto plan = stpa::coverage::BuildPlan(hierarchy, index, stpa::config::ToAnalysisTypes(config.analysis()));
  stpa::coverage::CoverageTracker tracker(std::move(plan), std::make_shared<stpa::events::LoggingEventSink>(), "coveragectl");

  std::string controller;
  for (auto cell = tracker.CurrentCell(); cell; cell = tracker.Advance()) {
    if (cell->controller_id != controller) {
      controller = cell->controller_id;
      std::cout << controller << " (" << stpa::hierarchy::ToString(tracker.CurrentMovement()) << ")\n";
    }
    std::cout << "  " << cell->ToString() << "\n";
    tracker.MarkCompleted(*cell);
  }

  const auto stats = tracker.Stats();
  std::cout << "cells=" << stats.total_cells << " completion_ratio=" << tracker.CompletionRatio() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[1];

  try {
    if (cmd == "hierarchy" && argc == 3) {
      stpa::observability::InitializeLogging(RuntimeConfig{}, stpa::observability::LogTarget::kStderr);
      return Hierarchy(argv[2]);
    }

    if ((cmd == "rank" && (argc == 4 || argc == 5)) || (cmd == "walk" && argc == 4)) {
      const auto config = stpa::config::ConfigLoader::LoadFromYaml(argv[2]);
      stpa::observability::InitializeLogging(config, stpa::observability::LogTarget::kStderr);

      if (cmd == "walk")
        return Walk(config, argv[3]);

      const auto format = stpa::report::ParseExportFormat(argc == 5 ? argv[4] : "json");
      if (!format) {
        std::cerr << "unknown format: " << argv[4] << " (expected json or csv)\n";
        return 1;
      }
      return Rank(config, argv[3], *format);
    }
  } catch (const stpa::util::GraphCycleError& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
