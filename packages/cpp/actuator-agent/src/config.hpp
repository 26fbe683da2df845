/**
 * Actuator Agent configuration
 *
 * Plain configuration struct with defaults, loadable from ACTUATOR_* environment
 * variables, plus the agent's own spdlog logger.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace actuator {

/**
 * Introspection resources an adapter may expose.
 */
enum class Endpoint {
  ENV,
  INFO,
  HEALTH,
  METRICS,
  LOGGERS,
  LOGFILE,
  HTTPTRACE,
  THREADDUMP
};

inline const char* endpoint_name(Endpoint endpoint) {
  switch (endpoint) {
    case Endpoint::ENV:
      return "env";
    case Endpoint::INFO:
      return "info";
    case Endpoint::HEALTH:
      return "health";
    case Endpoint::METRICS:
      return "metrics";
    case Endpoint::LOGGERS:
      return "loggers";
    case Endpoint::LOGFILE:
      return "logfile";
    case Endpoint::HTTPTRACE:
      return "httptrace";
    case Endpoint::THREADDUMP:
      return "threaddump";
  }
  return "unknown";
}

inline const std::set<Endpoint>& all_endpoints() {
  static const std::set<Endpoint> endpoints = {
      Endpoint::ENV,     Endpoint::INFO,    Endpoint::HEALTH,
      Endpoint::METRICS, Endpoint::LOGGERS, Endpoint::LOGFILE,
      Endpoint::HTTPTRACE, Endpoint::THREADDUMP};
  return endpoints;
}

/**
 * Configuration for the actuator agent.
 */
struct AgentConfig {
  std::string app_name = "my-app";
  std::string app_description;

  /**
   * Base URL of the monitored service and of its introspection endpoints.
   * An empty management_url means app_url + "/actuator".
   */
  std::string app_url = "http://localhost:8080";
  std::string management_url;

  /**
   * Registry endpoint the instance registers with.
   * Empty disables registration entirely.
   */
  std::string registration_url;
  std::chrono::milliseconds registration_interval{10000};
  std::chrono::milliseconds http_timeout{5000};
  std::string registration_username;
  std::string registration_password;

  /**
   * Caller supplied metadata sent with every registration.
   */
  std::map<std::string, std::string> metadata;

  /**
   * Additional static entries reported by the info endpoint.
   */
  std::map<std::string, std::string> additional_app_info;

  size_t trace_capacity = 100;

  std::string disk_space_path = ".";
  std::uint64_t disk_space_threshold = 10 * 1024 * 1024;

  std::string log_pattern = "%Y-%m-%d %H:%M:%S.%e  %-5l %P -- [%t] %n: %v";

  std::set<Endpoint> disabled_endpoints;

  std::string resolved_management_url() const {
    return management_url.empty() ? app_url + "/actuator" : management_url;
  }

  /**
   * Load configuration from environment variables.
   *
   * Recognized:
   *   ACTUATOR_APP_NAME, ACTUATOR_APP_DESCRIPTION, ACTUATOR_APP_URL,
   *   ACTUATOR_MANAGEMENT_URL, ACTUATOR_REGISTRATION_URL,
   *   ACTUATOR_REGISTRATION_INTERVAL_MS, ACTUATOR_HTTP_TIMEOUT_MS,
   *   ACTUATOR_REGISTRATION_USERNAME, ACTUATOR_REGISTRATION_PASSWORD,
   *   ACTUATOR_TRACE_CAPACITY, ACTUATOR_DISK_SPACE_PATH,
   *   ACTUATOR_DISK_SPACE_THRESHOLD, ACTUATOR_LOG_PATTERN,
   *   ACTUATOR_DISABLED_ENDPOINTS (comma separated endpoint names)
   *
   * Values that fail to parse are ignored and the default is kept.
   */
  static AgentConfig from_env();
};

namespace detail {

constexpr const char* kAgentLoggerName = "actuator";

/**
 * The agent's own diagnostics logger. Registered with spdlog so it shows up in
 * (and can be tuned through) the logger registry.
 */
inline std::shared_ptr<spdlog::logger> agent_logger() {
  static std::mutex mtx;
  std::lock_guard<std::mutex> lock(mtx);
  auto logger = spdlog::get(kAgentLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kAgentLoggerName);
  }
  return logger;
}

inline void read_env_string(const char* name, std::string& target) {
  const char* value = std::getenv(name);
  if (value) {
    target = value;
  }
}

inline void read_env_millis(const char* name, std::chrono::milliseconds& target) {
  const char* value = std::getenv(name);
  if (!value) {
    return;
  }
  try {
    long ms = std::stol(value);
    if (ms > 0) {
      target = std::chrono::milliseconds(ms);
    } else {
      agent_logger()->warn("{} must be positive, got '{}'", name, value);
    }
  } catch (const std::exception& e) {
    agent_logger()->warn("Ignoring {}='{}': {}", name, value, e.what());
  }
}

template <typename Unsigned>
inline void read_env_unsigned(const char* name, Unsigned& target) {
  const char* value = std::getenv(name);
  if (!value) {
    return;
  }
  try {
    long long parsed = std::stoll(value);
    if (parsed >= 0) {
      target = static_cast<Unsigned>(parsed);
    } else {
      agent_logger()->warn("{} must not be negative, got '{}'", name, value);
    }
  } catch (const std::exception& e) {
    agent_logger()->warn("Ignoring {}='{}': {}", name, value, e.what());
  }
}

}  // namespace detail

inline AgentConfig AgentConfig::from_env() {
  AgentConfig config;

  detail::read_env_string("ACTUATOR_APP_NAME", config.app_name);
  detail::read_env_string("ACTUATOR_APP_DESCRIPTION", config.app_description);
  detail::read_env_string("ACTUATOR_APP_URL", config.app_url);
  detail::read_env_string("ACTUATOR_MANAGEMENT_URL", config.management_url);
  detail::read_env_string("ACTUATOR_REGISTRATION_URL", config.registration_url);
  detail::read_env_string("ACTUATOR_REGISTRATION_USERNAME",
                          config.registration_username);
  detail::read_env_string("ACTUATOR_REGISTRATION_PASSWORD",
                          config.registration_password);
  detail::read_env_string("ACTUATOR_DISK_SPACE_PATH", config.disk_space_path);
  detail::read_env_string("ACTUATOR_LOG_PATTERN", config.log_pattern);

  detail::read_env_millis("ACTUATOR_REGISTRATION_INTERVAL_MS",
                          config.registration_interval);
  detail::read_env_millis("ACTUATOR_HTTP_TIMEOUT_MS", config.http_timeout);

  detail::read_env_unsigned("ACTUATOR_TRACE_CAPACITY", config.trace_capacity);
  detail::read_env_unsigned("ACTUATOR_DISK_SPACE_THRESHOLD",
                            config.disk_space_threshold);

  const char* disabled = std::getenv("ACTUATOR_DISABLED_ENDPOINTS");
  if (disabled) {
    std::istringstream names(disabled);
    std::string name;
    while (std::getline(names, name, ',')) {
      bool matched = false;
      for (Endpoint endpoint : all_endpoints()) {
        if (name == endpoint_name(endpoint)) {
          config.disabled_endpoints.insert(endpoint);
          matched = true;
        }
      }
      if (!matched && !name.empty()) {
        detail::agent_logger()->warn("Unknown endpoint '{}' in ACTUATOR_DISABLED_ENDPOINTS",
                                     name);
      }
    }
  }

  return config;
}

}  // namespace actuator
