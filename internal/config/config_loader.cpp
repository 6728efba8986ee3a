#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <exception>
#include <set>
#include <string>

#include "internal/model/coverage_cell.hpp"
#include "internal/model/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace stpa::config {

using stpa::runtime::config::AnalysisConfig;
using stpa::runtime::config::RuntimeConfig;
using stpa::runtime::config::ScoringConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::InvalidConfigurationError("Unsupported YAML node");
  }
}

static void YamlToMessage(const YAML::Node& yaml, google::protobuf::Message* message) {
  // an empty document configures nothing
  if (!yaml || yaml.IsNull())
    return;

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::InvalidConfigurationError("Invalid " + message->GetDescriptor()->name() + ": " +
                                          std::string(status.message()));
  }
}

static YAML::Node LoadYamlFile(const std::string& path) {
  try {
    return YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfigurationError("Failed to load YAML file " + path + ": " + std::string(e.what()));
  }
}

static YAML::Node LoadYamlText(const std::string& text) {
  try {
    return YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidConfigurationError("Failed to parse YAML: " + std::string(e.what()));
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  RuntimeConfig config;
  YamlToMessage(LoadYamlFile(path), &config);
  return config;
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& text) {
  RuntimeConfig config;
  YamlToMessage(LoadYamlText(text), &config);
  return config;
}

model::Snapshot ConfigLoader::LoadSnapshotFromYaml(const std::string& path) {
  stpa::coverage::v1::Snapshot snapshot;
  YamlToMessage(LoadYamlFile(path), &snapshot);
  return model::FromProto(snapshot);
}

stpa::coverage::v1::Snapshot ConfigLoader::ParseSnapshotYaml(const std::string& text) {
  stpa::coverage::v1::Snapshot snapshot;
  YamlToMessage(LoadYamlText(text), &snapshot);
  return snapshot;
}

// ------------------------------------------------------------
// Translation
// ------------------------------------------------------------

combination::GeneratorOptions ToGeneratorOptions(const AnalysisConfig& analysis) {
  combination::GeneratorOptions options;
  if (analysis.has_max_combination_size())
    options.max_combination_size = analysis.max_combination_size();
  if (analysis.has_include_same_team_abstraction())
    options.include_same_team_abstraction = analysis.include_same_team_abstraction();
  if (analysis.has_include_cross_controller_abstraction())
    options.include_cross_controller_abstraction = analysis.include_cross_controller_abstraction();
  if (analysis.has_include_co_occurrence_type())
    options.include_co_occurrence_type = analysis.include_co_occurrence_type();
  if (analysis.has_include_temporal_ordering_type())
    options.include_temporal_ordering_type = analysis.include_temporal_ordering_type();

  if (options.max_combination_size < 2) {
    throw util::InvalidConfigurationError("analysis.max_combination_size must be at least 2, got " +
                                          std::to_string(options.max_combination_size));
  }
  return options;
}

scoring::ScoringPolicy ToScoringPolicy(const ScoringConfig& scoring) {
  scoring::ScoringPolicy policy;
  if (!scoring.version().empty())
    policy.version = scoring.version();
  if (scoring.has_per_extra_controller())
    policy.per_extra_controller = scoring.per_extra_controller();
  if (scoring.has_per_extra_controller_type())
    policy.per_extra_controller_type = scoring.per_extra_controller_type();
  if (scoring.has_team_present())
    policy.team_present = scoring.team_present();
  if (scoring.has_organization_present())
    policy.organization_present = scoring.organization_present();
  if (scoring.has_per_flagged_action())
    policy.per_flagged_action = scoring.per_flagged_action();
  if (scoring.has_per_multi_role_team())
    policy.per_multi_role_team = scoring.per_multi_role_team();
  if (scoring.has_ceiling())
    policy.ceiling = scoring.ceiling();

  if (policy.ceiling == 0 || policy.ceiling > scoring::kMaxRiskScore)
    throw util::InvalidConfigurationError("scoring.ceiling must be between 1 and " +
                                          std::to_string(scoring::kMaxRiskScore) + ", got " +
                                          std::to_string(policy.ceiling));
  return policy;
}

std::vector<std::string> ToAnalysisTypes(const AnalysisConfig& analysis) {
  if (analysis.analysis_types().empty())
    return model::DefaultAnalysisTypes();

  std::vector<std::string> types;
  std::set<std::string> seen;
  for (const auto& type : analysis.analysis_types()) {
    if (type.empty())
      throw util::InvalidConfigurationError("analysis.analysis_types contains an empty entry");
    if (!seen.insert(type).second)
      throw util::InvalidConfigurationError("analysis.analysis_types lists '" + type + "' twice");
    types.push_back(type);
  }
  return types;
}

engine::AnalysisOptions ToAnalysisOptions(const RuntimeConfig& config) {
  engine::AnalysisOptions options;
  options.generator      = ToGeneratorOptions(config.analysis());
  options.scoring        = ToScoringPolicy(config.scoring());
  options.min_risk_score = config.analysis().min_risk_score();
  return options;
}

} // namespace stpa::config
