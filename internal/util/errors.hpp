#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stpa::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfigurationError : public std::runtime_error {
 public:
  explicit InvalidConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  The control structure is not a DAG. Carries the controllers that could
  not be levelled: members of a cycle and the controllers above them.
*/
class GraphCycleError : public std::runtime_error {
 public:
  GraphCycleError(const std::string& msg, std::vector<std::string> controller_ids)
      : std::runtime_error(msg), controller_ids_(std::move(controller_ids)) {
  }

  const std::vector<std::string>& controller_ids() const {
    return controller_ids_;
  }

 private:
  std::vector<std::string> controller_ids_;
};

} // namespace stpa::util
