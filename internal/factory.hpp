#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/service/coverage_service.hpp"
#include "internal/session/session_registry.hpp"

namespace stpa::factory {

/*
  Application

  Owns the long-lived objects of the server process. Transport adapters
  are layered on top by the binary.
*/
struct Application {
  std::shared_ptr<session::SessionRegistry> sessions;
  std::shared_ptr<service::CoverageService> coverage_service;
};

/*
  Build

  Composition root: translates the runtime config into core options and
  wires the service layer. Throws util::InvalidConfigurationError.
*/
Application Build(const stpa::runtime::config::RuntimeConfig& config);

} // namespace stpa::factory
