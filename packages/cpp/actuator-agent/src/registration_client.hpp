/**
 * Periodic self-registration with a remote monitoring registry.
 *
 * A dedicated worker thread registers the instance right after start() and
 * then again on every interval; the registry expires registrations that are
 * not refreshed. Failures are logged and retried on the next tick. stop()
 * wakes the worker, which deregisters (if it ever got an instance id) and
 * exits; stop() returns once the worker has been joined.
 *
 * States: IDLE -> REGISTERING -> REGISTERED -> REGISTERING ...
 *         REGISTERING -> IDLE on failure
 *         IDLE/REGISTERED -> DEREGISTERING -> STOPPED on stop
 */

#pragma once

#include <time.h>

#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <thread>

#include "config.hpp"
#include "errors.hpp"
#include "http_transport.hpp"

namespace actuator {

enum class RegistrationPhase {
  IDLE,
  REGISTERING,
  REGISTERED,
  DEREGISTERING,
  STOPPED
};

inline const char* phase_name(RegistrationPhase phase) {
  switch (phase) {
    case RegistrationPhase::IDLE:
      return "IDLE";
    case RegistrationPhase::REGISTERING:
      return "REGISTERING";
    case RegistrationPhase::REGISTERED:
      return "REGISTERED";
    case RegistrationPhase::DEREGISTERING:
      return "DEREGISTERING";
    case RegistrationPhase::STOPPED:
      return "STOPPED";
  }
  return "UNKNOWN";
}

struct RegistrationState {
  std::optional<std::string> instance_id;
  std::optional<std::chrono::system_clock::time_point> last_attempt_time;
  std::optional<std::chrono::system_clock::time_point> last_success_time;
  int consecutive_failures = 0;
};

struct RegistrationDocument {
  std::string name;
  std::string management_url;
  std::string health_url;
  std::string service_url;
  std::map<std::string, std::string> metadata;
};

namespace detail {

inline std::string escape_json(const std::string& str) {
  std::ostringstream escaped;
  for (char c : str) {
    switch (c) {
      case '"':
        escaped << "\\\"";
        break;
      case '\\':
        escaped << "\\\\";
        break;
      case '\b':
        escaped << "\\b";
        break;
      case '\f':
        escaped << "\\f";
        break;
      case '\n':
        escaped << "\\n";
        break;
      case '\r':
        escaped << "\\r";
        break;
      case '\t':
        escaped << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                  << static_cast<int>(c) << std::dec;
        } else {
          escaped << c;
        }
        break;
    }
  }
  return escaped.str();
}

/**
 * ISO-8601 UTC timestamp with microseconds, e.g. 2024-05-01T10:00:00.123456+00:00
 */
inline std::string iso8601(std::chrono::system_clock::time_point time) {
  auto since_epoch = time.time_since_epoch();
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds);

  time_t raw = static_cast<time_t>(seconds.count());
  struct tm utc {};
  gmtime_r(&raw, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6)
      << std::setfill('0') << micros.count() << "+00:00";
  return out.str();
}

}  // namespace detail

class RegistrationClient {
 public:
  RegistrationClient(const AgentConfig& config, std::shared_ptr<RegistryTransport> transport);
  ~RegistrationClient();

  // Non-copyable
  RegistrationClient(const RegistrationClient&) = delete;
  RegistrationClient& operator=(const RegistrationClient&) = delete;

  /**
   * Start the worker. Calling start() again, or after stop(), does nothing.
   */
  void start();

  /**
   * Cancel the timer, deregister if an instance id was obtained and join the
   * worker. Idempotent.
   */
  void stop();

  RegistrationPhase phase() const;
  RegistrationState registration_state() const;

  /**
   * Fixed at construction and sent with every registration.
   */
  const std::string& startup_time() const { return startup_time_; }

  RegistrationDocument document() const;

  static std::string serialize(const RegistrationDocument& document);

  /**
   * The "id" field of a registry response, if present.
   */
  static std::optional<std::string> parse_instance_id(const std::string& body);

 private:
  void run();
  void tick();
  void register_once();
  void deregister();
  void set_phase(RegistrationPhase phase);

  const AgentConfig config_;
  std::shared_ptr<RegistryTransport> transport_;
  const std::string startup_time_;

  std::thread worker_;
  std::mutex stop_mutex_;
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool should_stop_ = false;
  bool started_ = false;

  mutable std::mutex state_mutex_;
  RegistrationPhase phase_ = RegistrationPhase::IDLE;
  RegistrationState state_;
};

// =========================
// Inline Implementations
// =========================

inline RegistrationClient::RegistrationClient(const AgentConfig& config,
                                              std::shared_ptr<RegistryTransport> transport)
    : config_(config),
      transport_(std::move(transport)),
      startup_time_(detail::iso8601(std::chrono::system_clock::now())) {}

inline RegistrationClient::~RegistrationClient() { stop(); }

inline void RegistrationClient::start() {
  std::lock_guard<std::mutex> stop_lock(stop_mutex_);
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (started_ || should_stop_) {
      return;
    }
    started_ = true;
  }
  worker_ = std::thread([this]() { run(); });
}

inline void RegistrationClient::stop() {
  std::lock_guard<std::mutex> stop_lock(stop_mutex_);
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    if (should_stop_) {
      return;
    }
    should_stop_ = true;
  }
  wake_cv_.notify_one();

  // Always join, never detach: the worker touches members until it exits
  if (worker_.joinable()) {
    worker_.join();
  } else {
    set_phase(RegistrationPhase::STOPPED);
  }
}

inline void RegistrationClient::run() {
  while (true) {
    {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      if (should_stop_) {
        break;
      }
    }

    tick();

    std::unique_lock<std::mutex> lock(wake_mutex_);
    if (wake_cv_.wait_for(lock, config_.registration_interval,
                          [this] { return should_stop_; })) {
      break;
    }
  }

  deregister();
  set_phase(RegistrationPhase::STOPPED);
}

inline void RegistrationClient::tick() {
  set_phase(RegistrationPhase::REGISTERING);
  try {
    register_once();
    set_phase(RegistrationPhase::REGISTERED);
  } catch (const RemoteRegistrationFailure& e) {
    int failures = 0;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      failures = ++state_.consecutive_failures;
      phase_ = RegistrationPhase::IDLE;
    }
    detail::agent_logger()->warn("Failed registering with {} ({} consecutive failures): {}",
                                 config_.registration_url, failures, e.what());
  }
}

inline void RegistrationClient::register_once() {
  const auto now = std::chrono::system_clock::now();
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.last_attempt_time = now;
  }

  HttpResponse response =
      transport_->register_instance(config_.registration_url, serialize(document()));
  if (!response.ok) {
    throw RemoteRegistrationFailure(response.error, response.status_code);
  }

  auto instance_id = parse_instance_id(response.body);
  if (!instance_id) {
    detail::agent_logger()->warn("Registry at {} answered without an instance id",
                                 config_.registration_url);
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  if (instance_id) {
    state_.instance_id = instance_id;
  }
  state_.last_success_time = now;
  state_.consecutive_failures = 0;
  detail::agent_logger()->debug("Registered with {} as {}", config_.registration_url,
                                state_.instance_id.value_or("<unknown>"));
}

inline void RegistrationClient::deregister() {
  std::optional<std::string> instance_id;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    instance_id = state_.instance_id;
  }
  if (!instance_id) {
    return;
  }

  set_phase(RegistrationPhase::DEREGISTERING);
  std::string url = config_.registration_url;
  if (url.empty() || url.back() != '/') {
    url += '/';
  }
  url += *instance_id;

  HttpResponse response = transport_->deregister_instance(url);
  if (!response.ok) {
    detail::agent_logger()->warn("Failed deregistering {}: {}", url, response.error);
    return;
  }
  detail::agent_logger()->debug("Deregistered {}", url);
}

inline void RegistrationClient::set_phase(RegistrationPhase phase) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  phase_ = phase;
}

inline RegistrationPhase RegistrationClient::phase() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return phase_;
}

inline RegistrationState RegistrationClient::registration_state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

inline RegistrationDocument RegistrationClient::document() const {
  RegistrationDocument document;
  document.name = config_.app_name;
  document.management_url = config_.resolved_management_url();
  document.health_url = document.management_url + "/health";
  document.service_url = config_.app_url;
  document.metadata = config_.metadata;
  document.metadata["startup"] = startup_time_;
  return document;
}

inline std::string RegistrationClient::serialize(const RegistrationDocument& document) {
  std::ostringstream json;
  json << "{"
       << "\"name\":\"" << detail::escape_json(document.name) << "\","
       << "\"managementUrl\":\"" << detail::escape_json(document.management_url) << "\","
       << "\"healthUrl\":\"" << detail::escape_json(document.health_url) << "\","
       << "\"serviceUrl\":\"" << detail::escape_json(document.service_url) << "\","
       << "\"metadata\":{";
  bool first = true;
  for (const auto& [key, value] : document.metadata) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << "\"" << detail::escape_json(key) << "\":\"" << detail::escape_json(value) << "\"";
  }
  json << "}}";
  return json.str();
}

inline std::optional<std::string> RegistrationClient::parse_instance_id(
    const std::string& body) {
  static const std::regex pattern(R"delim("id"\s*:\s*"([^"]+)")delim");
  std::smatch match;
  if (std::regex_search(body, match, pattern)) {
    return match[1].str();
  }
  return std::nullopt;
}

}  // namespace actuator
