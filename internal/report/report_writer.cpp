#include "internal/report/report_writer.hpp"

#include <google/protobuf/util/json_util.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/model/proto_convert.hpp"
#include "internal/util/hash.hpp"

namespace stpa::report {

namespace v1 = stpa::coverage::v1;

namespace {

std::string CsvField(const std::string& value) {
  if (value.find_first_of(",\"\n\r") == std::string::npos)
    return value;

  std::string quoted = "\"";
  for (const char c : value) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

template <typename Repeated>
std::string JoinIds(const Repeated& ids) {
  return model::JoinIds(std::vector<std::string>(ids.begin(), ids.end()), ';');
}

std::string_view AbstractionName(v1::AbstractionLevel level) {
  return level == v1::ABSTRACTION_LEVEL_SAME_TEAM ? model::ToString(model::AbstractionLevel::kSameTeam)
                                                  : model::ToString(model::AbstractionLevel::kCrossController);
}

std::string_view TypeName(v1::CombinationType type) {
  return type == v1::COMBINATION_TYPE_CO_OCCURRENCE ? model::ToString(model::CombinationType::kCoOccurrence)
                                                    : model::ToString(model::CombinationType::kTemporalOrdering);
}

} // namespace

std::optional<ExportFormat> ParseExportFormat(std::string_view name) {
  if (name == "json")
    return ExportFormat::kJson;
  if (name == "csv")
    return ExportFormat::kCsv;
  return std::nullopt;
}

v1::CandidateReport BuildReport(const engine::AnalysisResult& result) {
  v1::CandidateReport report;
  report.set_scoring_policy_version(result.scoring_policy_version);
  report.set_snapshot_hash(util::HexDigest(result.snapshot_hash));
  report.set_insufficient_controllers(result.status == combination::GenerationStatus::kInsufficientControllers);
  report.set_configuration_error(result.error);

  auto*       stats = report.mutable_statistics();
  const auto& s     = result.statistics;
  stats->set_total(static_cast<std::uint32_t>(s.total));
  stats->set_co_occurrence_count(static_cast<std::uint32_t>(s.co_occurrence));
  stats->set_temporal_ordering_count(static_cast<std::uint32_t>(s.temporal_ordering));
  stats->set_same_team_count(static_cast<std::uint32_t>(s.same_team));
  stats->set_cross_controller_count(static_cast<std::uint32_t>(s.cross_controller));
  stats->set_high_risk_count(static_cast<std::uint32_t>(s.high_risk));
  stats->set_mean_score(s.mean_score);

  std::uint32_t rank = 1;
  for (const auto& candidate : result.ranked)
    *report.add_candidates() = model::ToProto(candidate, rank++);
  return report;
}

std::string ToJson(const v1::CandidateReport& report) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok())
    throw std::runtime_error("Failed to serialize report to JSON: " + std::string(status.message()));
  return json;
}

std::string ToCsv(const v1::CandidateReport& report) {
  std::ostringstream out;
  out << "rank,signature,controllers,actions,abstraction,type,score,rationale\n";

  for (const auto& c : report.candidates()) {
    out << c.rank() << ',' << CsvField(c.signature()) << ',' << CsvField(JoinIds(c.controller_ids())) << ','
        << CsvField(JoinIds(c.control_action_ids())) << ',' << AbstractionName(c.abstraction()) << ','
        << TypeName(c.type()) << ',' << c.risk_score() << ',' << CsvField(c.rationale()) << '\n';
  }
  return out.str();
}

std::string Export(const engine::AnalysisResult& result, ExportFormat format) {
  const auto report = BuildReport(result);
  return format == ExportFormat::kJson ? ToJson(report) : ToCsv(report);
}

} // namespace stpa::report
