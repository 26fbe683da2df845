/**
 * Actuator Agent error types
 *
 * Every failure surfaced to an adapter derives from ActuatorError and knows the
 * HTTP status it should be reported with.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace actuator {

class ActuatorError : public std::runtime_error {
 public:
  explicit ActuatorError(const std::string& message)
      : std::runtime_error(message) {}

  virtual int http_status() const { return 500; }
};

/**
 * Unknown metric, logger, log range or disabled endpoint.
 */
class NotFoundError : public ActuatorError {
 public:
  using ActuatorError::ActuatorError;

  int http_status() const override { return 404; }
};

class MetricNotFound : public NotFoundError {
 public:
  explicit MetricNotFound(const std::string& name)
      : NotFoundError("metric not found: " + name), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class LoggerNotFound : public NotFoundError {
 public:
  explicit LoggerNotFound(const std::string& name)
      : NotFoundError("logger not found: " + name), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

class RangeNotSatisfiable : public NotFoundError {
 public:
  using NotFoundError::NotFoundError;

  int http_status() const override { return 416; }
};

class EndpointDisabled : public NotFoundError {
 public:
  explicit EndpointDisabled(const std::string& endpoint)
      : NotFoundError("endpoint disabled: " + endpoint) {}
};

/**
 * Malformed input: empty logger name, unknown level, bad Range header.
 */
class InvalidArgument : public ActuatorError {
 public:
  using ActuatorError::ActuatorError;

  int http_status() const override { return 400; }
};

/**
 * A health indicator could not evaluate its resource.
 */
class UnavailableError : public ActuatorError {
 public:
  using ActuatorError::ActuatorError;

  int http_status() const override { return 503; }
};

/**
 * A registration attempt failed (network error or non-2xx answer).
 * Never escapes the registration worker.
 */
class RemoteRegistrationFailure : public ActuatorError {
 public:
  RemoteRegistrationFailure(const std::string& message, long status_code)
      : ActuatorError(message), status_code_(status_code) {}

  long status_code() const { return status_code_; }

 private:
  long status_code_;
};

}  // namespace actuator
