/**
 * Actuator Agent
 *
 * In-process monitoring agent: health, metrics, environment, loggers, HTTP
 * trace history, captured log text and thread state, plus periodic
 * self-registration with a remote monitoring registry.
 *
 * AgentEngine is the single object web-framework adapters call into. Build
 * one, hand a reference to the adapters, call start() once the service is
 * reachable and stop() before shutting down.
 *
 *   actuator::AgentConfig config = actuator::AgentConfig::from_env();
 *   actuator::AgentEngine engine(config);
 *   auto logger = engine.create_logger("my_service");
 *   engine.start();
 *   ...
 *   engine.stop();
 */

#pragma once

#include <unistd.h>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "http_transport.hpp"
#include "log_capture.hpp"
#include "logger_registry.hpp"
#include "metrics_registry.hpp"
#include "registration_client.hpp"
#include "ring_buffer.hpp"
#include "thread_dump.hpp"
#include "trace_recorder.hpp"

extern char** environ;

namespace actuator {

struct EndpointLink {
  std::string href;
  bool templated = false;
};

/**
 * Index of the available sub-resources, keyed by link name ("self",
 * "health", "metrics-requiredMetricName", ...).
 */
struct EndpointsData {
  std::map<std::string, EndpointLink> links;
};

struct PropertySource {
  std::string name;
  std::map<std::string, std::string> properties;
};

struct EnvironmentData {
  std::vector<std::string> active_profiles;
  std::vector<PropertySource> property_sources;
};

struct AppInfo {
  std::string name;
  std::string description;
  std::map<std::string, std::string> additional;
};

class AgentEngine {
 public:
  explicit AgentEngine(const AgentConfig& config);

  /**
   * Use the given transport for registration instead of libcurl.
   */
  AgentEngine(const AgentConfig& config, std::shared_ptr<RegistryTransport> transport);

  ~AgentEngine();

  // Non-copyable
  AgentEngine(const AgentEngine&) = delete;
  AgentEngine& operator=(const AgentEngine&) = delete;

  /**
   * Begin periodic registration (no-op without a registration URL).
   */
  void start();

  /**
   * Stop registering and deregister. Idempotent.
   */
  void stop();

  EndpointsData get_endpoints() const;
  EnvironmentData get_environment() const;
  AppInfo get_app_info() const;

  HealthReport get_health() const;

  std::set<std::string> get_metric_names() const;
  Metric get_metric_measurement(const std::string& name) const;

  LoggersSnapshot get_loggers();
  LoggerConfig get_logger(const std::string& name);
  void set_logger_level(const std::string& name, const std::optional<std::string>& level);

  LogRange get_range() const;
  LogSlice get_logfile(const std::string& range_header) const;

  void add_trace_record(TraceRecord record);
  HttpTraces get_httptrace() const;

  ThreadDump get_thread_dump() const;

  bool is_enabled(Endpoint endpoint) const {
    return config_.disabled_endpoints.count(endpoint) == 0;
  }

  /**
   * Create (or return the already registered) spdlog logger with a console
   * sink and the log capture sink, at the level the logger registry resolves.
   */
  std::shared_ptr<spdlog::logger> create_logger(const std::string& name);

  /**
   * Route an existing logger's output into the captured log as well.
   */
  std::shared_ptr<LogCaptureSink_mt> capture_logger(const std::shared_ptr<spdlog::logger>& logger);

  const AgentConfig& config() const { return config_; }
  MetricsRegistry& metrics() { return metrics_; }
  HealthAggregator& health() { return health_; }
  LoggerRegistry& loggers() { return loggers_; }
  LogCapture& log_capture() { return *log_capture_; }
  TraceRecorder& trace_recorder() { return traces_; }

  /**
   * nullptr when no registration URL is configured.
   */
  RegistrationClient* registration_client() { return registration_.get(); }

 private:
  void require(Endpoint endpoint) const;

  const AgentConfig config_;
  TraceRecorder traces_;
  std::shared_ptr<LogCapture> log_capture_;
  MetricsRegistry metrics_;
  LoggerRegistry loggers_;
  HealthAggregator health_;
  ThreadDumper thread_dumper_;
  std::unique_ptr<RegistrationClient> registration_;
};

// =========================
// Inline Implementations
// =========================

inline AgentEngine::AgentEngine(const AgentConfig& config)
    : AgentEngine(config, config.registration_url.empty()
                              ? std::shared_ptr<RegistryTransport>()
                              : std::make_shared<CurlRegistryTransport>(config)) {}

inline AgentEngine::AgentEngine(const AgentConfig& config,
                                std::shared_ptr<RegistryTransport> transport)
    : config_(config),
      traces_(config.trace_capacity),
      log_capture_(std::make_shared<LogCapture>()) {
  health_.add_indicator(std::make_shared<DiskSpaceHealthIndicator>(
      config_.disk_space_path, config_.disk_space_threshold));

  if (!config_.registration_url.empty() && transport) {
    registration_ = std::make_unique<RegistrationClient>(config_, std::move(transport));
  }
}

inline AgentEngine::~AgentEngine() { stop(); }

inline void AgentEngine::start() {
  if (registration_) {
    registration_->start();
  }
}

inline void AgentEngine::stop() {
  if (registration_) {
    registration_->stop();
  }
}

inline void AgentEngine::require(Endpoint endpoint) const {
  if (!is_enabled(endpoint)) {
    throw EndpointDisabled(endpoint_name(endpoint));
  }
}

inline EndpointsData AgentEngine::get_endpoints() const {
  const std::string base = config_.resolved_management_url();

  EndpointsData data;
  data.links["self"] = EndpointLink{base, false};
  for (Endpoint endpoint : all_endpoints()) {
    if (!is_enabled(endpoint)) {
      continue;
    }
    const std::string name = endpoint_name(endpoint);
    data.links[name] = EndpointLink{base + "/" + name, false};
    if (endpoint == Endpoint::METRICS) {
      data.links["metrics-requiredMetricName"] =
          EndpointLink{base + "/metrics/{requiredMetricName}", true};
    } else if (endpoint == Endpoint::LOGGERS) {
      data.links["loggers-name"] = EndpointLink{base + "/loggers/{name}", true};
    }
  }
  return data;
}

inline EnvironmentData AgentEngine::get_environment() const {
  require(Endpoint::ENV);

  PropertySource system_environment;
  system_environment.name = "systemEnvironment";
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string variable(*entry);
    auto equals = variable.find('=');
    if (equals == std::string::npos || equals == 0) {
      continue;
    }
    system_environment.properties[variable.substr(0, equals)] = variable.substr(equals + 1);
  }

  EnvironmentData data;
  data.property_sources.push_back(std::move(system_environment));
  return data;
}

inline AppInfo AgentEngine::get_app_info() const {
  require(Endpoint::INFO);
  return AppInfo{config_.app_name, config_.app_description, config_.additional_app_info};
}

inline HealthReport AgentEngine::get_health() const {
  require(Endpoint::HEALTH);
  return health_.get_health();
}

inline std::set<std::string> AgentEngine::get_metric_names() const {
  require(Endpoint::METRICS);
  return metrics_.get_metric_names();
}

inline Metric AgentEngine::get_metric_measurement(const std::string& name) const {
  require(Endpoint::METRICS);
  return metrics_.get_metric_measurement(name);
}

inline LoggersSnapshot AgentEngine::get_loggers() {
  require(Endpoint::LOGGERS);
  return loggers_.get_loggers();
}

inline LoggerConfig AgentEngine::get_logger(const std::string& name) {
  require(Endpoint::LOGGERS);
  return loggers_.get_logger(name);
}

inline void AgentEngine::set_logger_level(const std::string& name,
                                          const std::optional<std::string>& level) {
  require(Endpoint::LOGGERS);
  if (name.empty()) {
    throw InvalidArgument("logger name must not be empty");
  }
  loggers_.set_logger_level(name, level);
}

inline LogRange AgentEngine::get_range() const {
  require(Endpoint::LOGFILE);
  return log_capture_->get_range();
}

inline LogSlice AgentEngine::get_logfile(const std::string& range_header) const {
  require(Endpoint::LOGFILE);
  return log_capture_->get_logfile(range_header);
}

inline void AgentEngine::add_trace_record(TraceRecord record) {
  traces_.add_record(std::move(record));
}

inline HttpTraces AgentEngine::get_httptrace() const {
  require(Endpoint::HTTPTRACE);
  return traces_.get_httptrace();
}

inline ThreadDump AgentEngine::get_thread_dump() const {
  require(Endpoint::THREADDUMP);
  return thread_dumper_.get_thread_dump();
}

inline std::shared_ptr<spdlog::logger> AgentEngine::create_logger(const std::string& name) {
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }

  logger = std::make_shared<spdlog::logger>(name);
  logger->sinks().push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  logger->sinks().push_back(
      std::make_shared<LogCaptureSink_mt>(log_capture_, config_.log_pattern));
  loggers_.apply(logger);
  spdlog::register_logger(logger);
  return logger;
}

inline std::shared_ptr<LogCaptureSink_mt> AgentEngine::capture_logger(
    const std::shared_ptr<spdlog::logger>& logger) {
  return attach_log_capture(logger, log_capture_, config_.log_pattern);
}

}  // namespace actuator
