#pragma once

#include <memory>

namespace stpa::session {
class SessionRegistry;
}

namespace stpa::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<stpa::session::SessionRegistry> sessions;
};

} // namespace stpa::service
