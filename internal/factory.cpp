#include "internal/factory.hpp"

#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

namespace stpa::factory {

using stpa::observability::IntField;
using stpa::observability::StringField;

Application Build(const stpa::runtime::config::RuntimeConfig& config) {
  auto options        = config::ToAnalysisOptions(config);
  auto analysis_types = config::ToAnalysisTypes(config.analysis());

  STPA_LOG_INFO("Analysis configured",
                {IntField("max_combination_size", options.generator.max_combination_size),
                 StringField("scoring_policy", options.scoring.version),
                 IntField("analysis_types", static_cast<std::int64_t>(analysis_types.size())),
                 IntField("min_risk_score", options.min_risk_score)});

  Application app;
  app.sessions = std::make_shared<session::SessionRegistry>(std::move(options), std::move(analysis_types));

  service::ServiceContext ctx;
  ctx.sessions         = app.sessions;
  app.coverage_service = std::make_shared<service::CoverageService>(std::move(ctx));
  return app;
}

} // namespace stpa::factory
