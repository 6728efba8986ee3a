#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/engine/analysis_engine.hpp"
#include "stpa/coverage/v1/candidate.pb.h"

namespace stpa::report {

enum class ExportFormat {
  kJson,
  kCsv,
};

std::optional<ExportFormat> ParseExportFormat(std::string_view name);

stpa::coverage::v1::CandidateReport BuildReport(const engine::AnalysisResult& result);

// Field names as in the .proto, primitives always printed.
std::string ToJson(const stpa::coverage::v1::CandidateReport& report);

// Header rank,signature,controllers,actions,abstraction,type,score,rationale.
// Multi-valued columns are joined by ';'.
std::string ToCsv(const stpa::coverage::v1::CandidateReport& report);

std::string Export(const engine::AnalysisResult& result, ExportFormat format);

} // namespace stpa::report
