/**
 * Named logger levels on top of the spdlog registry.
 *
 * spdlog keeps a flat set of loggers; this registry layers a dot-separated
 * hierarchy over it ("a.b.c" inherits from "a.b", then "a", then ROOT) and
 * pushes the resolved level onto the live spdlog loggers. ROOT is spdlog's
 * default logger.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace actuator {

struct LoggerConfig {
  std::string name;
  std::optional<std::string> configured_level;
  std::string effective_level;
};

struct LoggersSnapshot {
  std::vector<std::string> levels;
  std::map<std::string, LoggerConfig> loggers;
};

class LoggerRegistry {
 public:
  static constexpr const char* kRootLogger = "ROOT";

  LoggerRegistry() = default;

  // Non-copyable
  LoggerRegistry(const LoggerRegistry&) = delete;
  LoggerRegistry& operator=(const LoggerRegistry&) = delete;

  /**
   * Live spdlog loggers registered since the last call pick up their
   * configured ancestor's level here, so the reported effective level is the
   * one spdlog filters with.
   */
  LoggersSnapshot get_loggers();

  /**
   * Throws LoggerNotFound if the name is neither configured nor a live
   * spdlog logger. Synchronizes live levels like get_loggers().
   */
  LoggerConfig get_logger(const std::string& name);

  /**
   * Set (or with std::nullopt clear) the configured level of a logger. The
   * level is applied right away to the spdlog logger of that name and to every
   * live descendant that inherits from it.
   *
   * Throws InvalidArgument for an empty name or an unknown level.
   */
  void set_logger_level(const std::string& name, const std::optional<std::string>& level);

  /**
   * Give a newly created logger the level its configured ancestors dictate.
   */
  void apply(const std::shared_ptr<spdlog::logger>& logger) const;

  static spdlog::level::level_enum parse_level(const std::string& level);
  static std::string level_name(spdlog::level::level_enum level);

 private:
  using LiveLoggers = std::map<std::string, std::shared_ptr<spdlog::logger>>;

  static LiveLoggers live_loggers();
  static std::string parent_of(const std::string& name);
  static bool inherits_from(const std::string& name, const std::string& ancestor);

  /**
   * Nearest configured level walking up from name, if any.
   */
  std::optional<std::string> inherited_level_locked(const std::string& name) const;
  LoggerConfig describe_locked(const std::string& name, const LiveLoggers& live) const;

  /**
   * Push the configured level onto every live logger that has one along its
   * chain.
   */
  void sync_locked(const LiveLoggers& live);

  std::map<std::string, std::string> configured_;
  // Every name ever passed to set_logger_level, configured or cleared
  std::set<std::string> known_;
  mutable std::mutex mutex_;
};

// =========================
// Inline Implementations
// =========================

inline spdlog::level::level_enum LoggerRegistry::parse_level(const std::string& level) {
  std::string upper(level);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  if (upper == "TRACE") return spdlog::level::trace;
  if (upper == "DEBUG") return spdlog::level::debug;
  if (upper == "INFO") return spdlog::level::info;
  if (upper == "WARN" || upper == "WARNING") return spdlog::level::warn;
  if (upper == "ERROR") return spdlog::level::err;
  if (upper == "FATAL" || upper == "CRITICAL") return spdlog::level::critical;
  if (upper == "OFF") return spdlog::level::off;

  throw InvalidArgument("unknown log level: " + level);
}

inline std::string LoggerRegistry::level_name(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:
      return "TRACE";
    case spdlog::level::debug:
      return "DEBUG";
    case spdlog::level::info:
      return "INFO";
    case spdlog::level::warn:
      return "WARN";
    case spdlog::level::err:
      return "ERROR";
    case spdlog::level::critical:
      return "FATAL";
    default:
      return "OFF";
  }
}

inline LoggerRegistry::LiveLoggers LoggerRegistry::live_loggers() {
  LiveLoggers live;
  spdlog::apply_all([&live](std::shared_ptr<spdlog::logger> logger) {
    const std::string& name = logger->name();
    live[name.empty() ? kRootLogger : name] = logger;
  });
  return live;
}

inline std::string LoggerRegistry::parent_of(const std::string& name) {
  auto dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    return kRootLogger;
  }
  return name.substr(0, dot);
}

inline bool LoggerRegistry::inherits_from(const std::string& name,
                                          const std::string& ancestor) {
  if (name == ancestor || ancestor == kRootLogger) {
    return true;
  }
  return name.size() > ancestor.size() && name.compare(0, ancestor.size(), ancestor) == 0 &&
         name[ancestor.size()] == '.';
}

inline std::optional<std::string> LoggerRegistry::inherited_level_locked(
    const std::string& name) const {
  std::string candidate = name;
  while (true) {
    auto it = configured_.find(candidate);
    if (it != configured_.end()) {
      return it->second;
    }
    if (candidate == kRootLogger) {
      return std::nullopt;
    }
    candidate = parent_of(candidate);
  }
}

inline LoggerConfig LoggerRegistry::describe_locked(const std::string& name,
                                                    const LiveLoggers& live) const {
  LoggerConfig config;
  config.name = name;

  auto configured = configured_.find(name);
  if (configured != configured_.end()) {
    config.configured_level = configured->second;
  }

  auto inherited = inherited_level_locked(name);
  if (inherited) {
    config.effective_level = *inherited;
    return config;
  }

  // Nothing configured along the chain: report what spdlog actually does
  auto self = live.find(name);
  if (self != live.end()) {
    config.effective_level = level_name(self->second->level());
    return config;
  }
  auto root = live.find(kRootLogger);
  config.effective_level =
      root != live.end() ? level_name(root->second->level()) : level_name(spdlog::level::info);
  return config;
}

inline void LoggerRegistry::sync_locked(const LiveLoggers& live) {
  for (const auto& entry : live) {
    auto inherited = inherited_level_locked(entry.first);
    if (!inherited) {
      continue;
    }
    auto level = parse_level(*inherited);
    if (entry.second->level() != level) {
      entry.second->set_level(level);
    }
  }
}

inline LoggersSnapshot LoggerRegistry::get_loggers() {
  LiveLoggers live = live_loggers();

  LoggersSnapshot snapshot;
  snapshot.levels = {"OFF", "FATAL", "ERROR", "WARN", "INFO", "DEBUG", "TRACE"};

  std::lock_guard<std::mutex> lock(mutex_);
  sync_locked(live);
  snapshot.loggers[kRootLogger] = describe_locked(kRootLogger, live);
  for (const auto& name : known_) {
    snapshot.loggers[name] = describe_locked(name, live);
  }
  for (const auto& entry : live) {
    snapshot.loggers[entry.first] = describe_locked(entry.first, live);
  }
  return snapshot;
}

inline LoggerConfig LoggerRegistry::get_logger(const std::string& name) {
  LiveLoggers live = live_loggers();

  std::lock_guard<std::mutex> lock(mutex_);
  sync_locked(live);
  if (name != kRootLogger && known_.count(name) == 0 && live.count(name) == 0) {
    throw LoggerNotFound(name);
  }
  return describe_locked(name, live);
}

inline void LoggerRegistry::set_logger_level(const std::string& name,
                                             const std::optional<std::string>& level) {
  if (name.empty()) {
    throw InvalidArgument("logger name must not be empty");
  }

  std::optional<spdlog::level::level_enum> parsed;
  if (level) {
    parsed = parse_level(*level);
  }

  LiveLoggers live = live_loggers();

  std::lock_guard<std::mutex> lock(mutex_);
  known_.insert(name);
  if (parsed) {
    configured_[name] = level_name(*parsed);
  } else {
    configured_.erase(name);
  }

  // Level for loggers with nothing configured along their chain
  spdlog::level::level_enum fallback = spdlog::level::info;
  auto root_level = inherited_level_locked(kRootLogger);
  auto root = live.find(kRootLogger);
  if (root_level) {
    fallback = parse_level(*root_level);
  } else if (name != kRootLogger && root != live.end()) {
    fallback = root->second->level();
  }

  for (const auto& [logger_name, logger] : live) {
    if (!inherits_from(logger_name, name)) {
      continue;
    }
    auto inherited = inherited_level_locked(logger_name);
    logger->set_level(inherited ? parse_level(*inherited) : fallback);
  }
}

inline void LoggerRegistry::apply(const std::shared_ptr<spdlog::logger>& logger) const {
  if (!logger) {
    return;
  }
  const std::string name = logger->name().empty() ? kRootLogger : logger->name();

  std::lock_guard<std::mutex> lock(mutex_);
  auto inherited = inherited_level_locked(name);
  if (inherited) {
    logger->set_level(parse_level(*inherited));
  }
}

}  // namespace actuator
