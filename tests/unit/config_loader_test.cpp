#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "stpa_coverage_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
logging:
  level: debug
analysis:
  max_combination_size: 2
  include_same_team_abstraction: false
  include_temporal_ordering_type: false
  analysis_types: [not-provided, too-late]
  min_risk_score: 15
scoring:
  version: "2025.2"
  team_present: 30
  ceiling: 90
)");

  auto config = stpa::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.logging().level() == "debug");

  const auto options = stpa::config::ToAnalysisOptions(config);
  assert(options.generator.max_combination_size == 2);
  assert(!options.generator.include_same_team_abstraction);
  assert(options.generator.include_cross_controller_abstraction);
  assert(options.generator.include_co_occurrence_type);
  assert(!options.generator.include_temporal_ordering_type);
  assert(options.min_risk_score == 15);

  assert(options.scoring.version == "2025.2");
  assert(options.scoring.team_present == 30);
  assert(options.scoring.ceiling == 90);
  assert(options.scoring.per_extra_controller == 10);

  const auto types = stpa::config::ToAnalysisTypes(config.analysis());
  assert((types == std::vector<std::string>{"not-provided", "too-late"}));
}

void TestEmptyConfigUsesDefaults() {
  const auto config  = stpa::config::ConfigLoader::ParseYaml("");
  const auto options = stpa::config::ToAnalysisOptions(config);

  assert(options.generator.max_combination_size == 3);
  assert(options.generator.include_temporal_ordering_type);
  assert(options.scoring.version == "2024.1");
  assert(stpa::config::ToAnalysisTypes(config.analysis()).size() == 7);
}

void TestQuotedScalarsStayStrings() {
  const auto config = stpa::config::ConfigLoader::ParseYaml(R"(scoring:
  version: "2024"
)");
  assert(config.scoring().version() == "2024");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)stpa::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInvalidValuesAreRejected() {
  const auto expect_invalid = [](const std::string& yaml) {
    bool threw = false;
    try {
      const auto config = stpa::config::ConfigLoader::ParseYaml(yaml);
      (void)stpa::config::ToAnalysisOptions(config);
      (void)stpa::config::ToAnalysisTypes(config.analysis());
    } catch (const stpa::util::InvalidConfigurationError&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid("analysis:\n  max_combination_size: 1\n");
  expect_invalid("analysis:\n  analysis_types: [too-late, too-late]\n");
  expect_invalid("analysis:\n  analysis_types: [\"\"]\n");
  expect_invalid("scoring:\n  ceiling: 0\n");
  expect_invalid("scoring:\n  ceiling: 500\n");

  const auto full_range = stpa::config::ConfigLoader::ParseYaml("scoring:\n  ceiling: 100\n");
  assert(stpa::config::ToScoringPolicy(full_range.scoring()).ceiling == 100);
}

void TestSnapshotIsLoaded() {
  const auto yaml_path = WriteYaml("snapshot",
                                   R"(controllers:
  - id: crew
    name: Flight crew
    type: CONTROLLER_TYPE_TEAM
    roles: [pilot, copilot]
  - id: fms
    type: CONTROLLER_TYPE_SOFTWARE
    team_id: crew
    layout_x: 12.5
  - id: "42"
    type: CONTROLLER_TYPE_HUMAN
control_paths:
  - id: p1
    source_controller_id: crew
    target_id: fms
control_actions:
  - id: climb
    controller_id: crew
  - id: descend
    controller_id: fms
    in_scope: false
findings:
  - id: f1
    controller_id: crew
    control_action_id: climb
    analysis_type: too-late
)");

  const auto snapshot = stpa::config::ConfigLoader::LoadSnapshotFromYaml(yaml_path.string());
  assert(snapshot.controllers.size() == 3);
  assert(snapshot.controllers[0].type == stpa::model::ControllerType::kTeam);
  assert(snapshot.controllers[0].roles.size() == 2);
  assert(!snapshot.controllers[0].layout_x.has_value());
  assert(snapshot.controllers[1].team_id == "crew");
  assert(snapshot.controllers[1].layout_x == 12.5);
  assert(snapshot.controllers[2].id == "42");

  assert(snapshot.control_paths.size() == 1);
  assert(snapshot.control_actions[0].in_scope);
  assert(!snapshot.control_actions[1].in_scope);
  assert(snapshot.findings.front().analysis_type == "too-late");
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestEmptyConfigUsesDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestSnapshotIsLoaded();

  std::cout << "stpa_coverage_unit_config_loader: pass\n";
  return 0;
}
