/**
 * Health indicators and their aggregation.
 *
 * Each indicator produces one named HealthReport. The aggregator runs all of
 * them and folds the results: any DOWN makes the whole report DOWN, UP
 * requires every indicator to be UP. An indicator that throws counts as DOWN.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

namespace actuator {

enum class HealthStatus {
  UP,
  DOWN,
  UNKNOWN,
  OUT_OF_SERVICE
};

inline const char* status_name(HealthStatus status) {
  switch (status) {
    case HealthStatus::UP:
      return "UP";
    case HealthStatus::DOWN:
      return "DOWN";
    case HealthStatus::OUT_OF_SERVICE:
      return "OUT_OF_SERVICE";
    default:
      return "UNKNOWN";
  }
}

using DetailValue = std::variant<std::int64_t, double, std::string>;

/**
 * details holds an indicator's own scalar values; components holds nested
 * reports in the order they were added, names unique. Adapters serialize both
 * under "details".
 */
struct HealthReport {
  HealthStatus status = HealthStatus::UNKNOWN;
  std::map<std::string, DetailValue> details;
  std::vector<std::pair<std::string, HealthReport>> components;

  /**
   * 200 for UP and UNKNOWN, 503 for DOWN and OUT_OF_SERVICE.
   */
  int http_status() const {
    return (status == HealthStatus::DOWN || status == HealthStatus::OUT_OF_SERVICE) ? 503
                                                                                     : 200;
  }

  /**
   * Add a nested report; replaces an existing component of the same name.
   */
  void set_component(const std::string& name, HealthReport report) {
    for (auto& entry : components) {
      if (entry.first == name) {
        entry.second = std::move(report);
        return;
      }
    }
    components.emplace_back(name, std::move(report));
  }

  /**
   * nullptr if there is no component of that name.
   */
  const HealthReport* component(const std::string& name) const {
    for (const auto& entry : components) {
      if (entry.first == name) {
        return &entry.second;
      }
    }
    return nullptr;
  }
};

class HealthIndicator {
 public:
  virtual ~HealthIndicator() = default;

  virtual std::string name() const = 0;

  /**
   * May throw; the aggregator turns any exception into a DOWN report.
   */
  virtual HealthReport health() const = 0;
};

struct DiskUsage {
  std::uint64_t total = 0;
  std::uint64_t free = 0;
};

using DiskUsageProbe = std::function<DiskUsage(const std::string& path)>;

/**
 * Disk usage of the filesystem holding path. Throws UnavailableError.
 */
inline DiskUsage filesystem_disk_usage(const std::string& path) {
  std::error_code ec;
  std::filesystem::space_info info = std::filesystem::space(path, ec);
  if (ec) {
    throw UnavailableError("cannot read disk usage of '" + path + "': " + ec.message());
  }
  return DiskUsage{info.capacity, info.available};
}

/**
 * DOWN when the free space on path drops below threshold bytes.
 */
class DiskSpaceHealthIndicator : public HealthIndicator {
 public:
  DiskSpaceHealthIndicator(std::string path, std::uint64_t threshold,
                           DiskUsageProbe probe = filesystem_disk_usage)
      : path_(std::move(path)), threshold_(threshold), probe_(std::move(probe)) {}

  std::string name() const override { return "diskSpace"; }

  HealthReport health() const override {
    DiskUsage usage = probe_(path_);

    HealthReport report;
    report.status = usage.free < threshold_ ? HealthStatus::DOWN : HealthStatus::UP;
    report.details["total"] = static_cast<std::int64_t>(usage.total);
    report.details["free"] = static_cast<std::int64_t>(usage.free);
    report.details["threshold"] = static_cast<std::int64_t>(threshold_);
    report.details["path"] = path_;
    return report;
  }

 private:
  std::string path_;
  std::uint64_t threshold_;
  DiskUsageProbe probe_;
};

class HealthAggregator {
 public:
  HealthAggregator() = default;

  // Non-copyable
  HealthAggregator(const HealthAggregator&) = delete;
  HealthAggregator& operator=(const HealthAggregator&) = delete;

  /**
   * Indicators are evaluated in the order they were added. Throws
   * InvalidArgument if an indicator with the same name is already registered.
   */
  void add_indicator(std::shared_ptr<HealthIndicator> indicator);

  HealthReport get_health() const;

  static HealthStatus fold(const std::vector<HealthStatus>& statuses);

 private:
  static HealthReport evaluate(const HealthIndicator& indicator);
  static void settle(HealthReport& report);

  std::vector<std::shared_ptr<HealthIndicator>> indicators_;
  mutable std::mutex mutex_;
};

// =========================
// Inline Implementations
// =========================

inline void HealthAggregator::add_indicator(std::shared_ptr<HealthIndicator> indicator) {
  if (!indicator) {
    throw InvalidArgument("health indicator must not be null");
  }
  const std::string name = indicator->name();

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& existing : indicators_) {
    if (existing->name() == name) {
      throw InvalidArgument("duplicate health indicator: " + name);
    }
  }
  indicators_.push_back(std::move(indicator));
}

inline HealthStatus HealthAggregator::fold(const std::vector<HealthStatus>& statuses) {
  bool all_up = true;
  bool out_of_service = false;
  for (HealthStatus status : statuses) {
    if (status == HealthStatus::DOWN) {
      return HealthStatus::DOWN;
    }
    if (status == HealthStatus::OUT_OF_SERVICE) {
      out_of_service = true;
    }
    if (status != HealthStatus::UP) {
      all_up = false;
    }
  }
  if (out_of_service) {
    return HealthStatus::OUT_OF_SERVICE;
  }
  return all_up ? HealthStatus::UP : HealthStatus::UNKNOWN;
}

inline void HealthAggregator::settle(HealthReport& report) {
  if (report.components.empty()) {
    return;
  }
  // A nested DOWN dominates whatever the indicator claimed for itself
  std::vector<HealthStatus> statuses{report.status};
  for (auto& entry : report.components) {
    settle(entry.second);
    statuses.push_back(entry.second.status);
  }
  report.status = fold(statuses);
}

inline HealthReport HealthAggregator::evaluate(const HealthIndicator& indicator) {
  try {
    HealthReport report = indicator.health();
    settle(report);
    return report;
  } catch (const std::exception& e) {
    detail::agent_logger()->error("Health indicator '{}' failed: {}", indicator.name(),
                                  e.what());
    HealthReport report;
    report.status = HealthStatus::DOWN;
    report.details["error"] = std::string(e.what());
    return report;
  }
}

inline HealthReport HealthAggregator::get_health() const {
  std::vector<std::shared_ptr<HealthIndicator>> indicators;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    indicators = indicators_;
  }

  HealthReport overall;
  std::vector<HealthStatus> statuses;
  for (const auto& indicator : indicators) {
    HealthReport report = evaluate(*indicator);
    statuses.push_back(report.status);
    overall.components.emplace_back(indicator->name(), std::move(report));
  }
  overall.status = fold(statuses);
  return overall;
}

}  // namespace actuator
