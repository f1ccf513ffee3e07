#pragma once

#include <stdexcept>
#include <string>

namespace coordinator::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Subscription tier does not permit the requested quality or resources.
  Carries the highest level the tier would accept.
*/
class QuotaError : public std::runtime_error {
 public:
  QuotaError(const std::string& msg, std::string permitted_ceiling)
      : std::runtime_error(msg + " (permitted ceiling: " + permitted_ceiling + ")"), permitted_ceiling_(std::move(permitted_ceiling)) {
  }

  const std::string& PermittedCeiling() const {
    return permitted_ceiling_;
  }

 private:
  std::string permitted_ceiling_;
};

// Execution engine or autoscaling API temporarily unreachable. Retryable.
class TransientInfraError : public std::runtime_error {
 public:
  explicit TransientInfraError(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

} // namespace coordinator::util
