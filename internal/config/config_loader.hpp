#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/combination/combination_generator.hpp"
#include "internal/engine/analysis_engine.hpp"
#include "internal/model/snapshot.hpp"
#include "internal/scoring/scoring_policy.hpp"
#include "stpa/coverage/v1/types.pb.h"

namespace stpa::config {

/*
  Loads RuntimeConfig and snapshots from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names and
  enum names follow the .proto definitions and unknown fields are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static stpa::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static stpa::runtime::config::RuntimeConfig ParseYaml(const std::string& text);

  static model::Snapshot LoadSnapshotFromYaml(const std::string& path);
  static stpa::coverage::v1::Snapshot ParseSnapshotYaml(const std::string& text);
};

// ------------------------------------------------------------
// Translation into core options. All throw
// util::InvalidConfigurationError on values no snapshot could accept.
// ------------------------------------------------------------

combination::GeneratorOptions ToGeneratorOptions(const stpa::runtime::config::AnalysisConfig& analysis);

scoring::ScoringPolicy ToScoringPolicy(const stpa::runtime::config::ScoringConfig& scoring);

std::vector<std::string> ToAnalysisTypes(const stpa::runtime::config::AnalysisConfig& analysis);

engine::AnalysisOptions ToAnalysisOptions(const stpa::runtime::config::RuntimeConfig& config);

} // namespace stpa::config
