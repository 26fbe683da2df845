/**
 * On-demand process metrics.
 *
 * Every measurement is taken at call time; nothing is cached. Providers are
 * asked for their names on every call, so a provider may expose a name set
 * that changes while the process runs.
 */

#pragma once

#include <sys/resource.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"

namespace actuator {

enum class Statistic {
  VALUE,
  COUNT
};

inline const char* statistic_name(Statistic statistic) {
  return statistic == Statistic::COUNT ? "COUNT" : "VALUE";
}

struct Measurement {
  Statistic statistic = Statistic::VALUE;
  double value = 0.0;
};

struct Metric {
  std::string name;
  std::string description;
  std::string base_unit;
  std::vector<Measurement> measurements;
};

/**
 * A source of named metrics.
 */
class MetricProvider {
 public:
  virtual ~MetricProvider() = default;

  virtual std::set<std::string> metric_names() const = 0;

  /**
   * Measure one metric; std::nullopt if this provider does not know the name.
   */
  virtual std::optional<Metric> measure(const std::string& name) const = 0;
};

/**
 * A single metric backed by a callback.
 */
class GaugeProvider : public MetricProvider {
 public:
  GaugeProvider(std::string name, std::string base_unit, std::string description,
                std::function<double()> sample, Statistic statistic = Statistic::VALUE)
      : name_(std::move(name)),
        base_unit_(std::move(base_unit)),
        description_(std::move(description)),
        sample_(std::move(sample)),
        statistic_(statistic) {}

  std::set<std::string> metric_names() const override { return {name_}; }

  std::optional<Metric> measure(const std::string& name) const override {
    if (name != name_) {
      return std::nullopt;
    }
    return Metric{name_, description_, base_unit_, {{statistic_, sample_()}}};
  }

 private:
  std::string name_;
  std::string base_unit_;
  std::string description_;
  std::function<double()> sample_;
  Statistic statistic_;
};

/**
 * Memory, thread, file and CPU figures of the current process read from
 * /proc and getrusage(), plus a few host-wide figures.
 */
class ProcessMetricsProvider : public MetricProvider {
 public:
  ProcessMetricsProvider();

  // Non-copyable: samplers capture this
  ProcessMetricsProvider(const ProcessMetricsProvider&) = delete;
  ProcessMetricsProvider& operator=(const ProcessMetricsProvider&) = delete;

  std::set<std::string> metric_names() const override;
  std::optional<Metric> measure(const std::string& name) const override;

 private:
  struct Definition {
    std::string name;
    std::string description;
    std::string base_unit;
    Statistic statistic;
    std::function<double()> sample;
  };

  std::chrono::steady_clock::time_point started_;
  std::vector<Definition> definitions_;
};

class MetricsRegistry {
 public:
  /**
   * Starts with a ProcessMetricsProvider registered.
   */
  MetricsRegistry();

  // Non-copyable
  MetricsRegistry(const MetricsRegistry&) = delete;
  MetricsRegistry& operator=(const MetricsRegistry&) = delete;

  void add_provider(std::shared_ptr<MetricProvider> provider);

  void add_gauge(const std::string& name, const std::string& base_unit,
                 const std::string& description, std::function<double()> sample,
                 Statistic statistic = Statistic::VALUE);

  std::set<std::string> get_metric_names() const;

  /**
   * Throws MetricNotFound if no provider knows the name.
   */
  Metric get_metric_measurement(const std::string& name) const;

 private:
  std::vector<std::shared_ptr<MetricProvider>> providers() const;

  std::vector<std::shared_ptr<MetricProvider>> providers_;
  mutable std::mutex mutex_;
};

// =========================
// Inline Implementations
// =========================

namespace detail {

/**
 * Read the Nth (0-based) field of /proc/self/statm, in bytes.
 */
inline double read_statm_bytes(int field) {
  std::ifstream file("/proc/self/statm");
  if (!file.is_open()) {
    throw UnavailableError("cannot open /proc/self/statm");
  }
  unsigned long long value = 0;
  for (int i = 0; i <= field; ++i) {
    if (!(file >> value)) {
      throw UnavailableError("cannot parse /proc/self/statm");
    }
  }
  return static_cast<double>(value) * static_cast<double>(sysconf(_SC_PAGESIZE));
}

inline double read_thread_count() {
  std::ifstream file("/proc/self/status");
  if (!file.is_open()) {
    throw UnavailableError("cannot open /proc/self/status");
  }
  std::string line;
  while (std::getline(file, line)) {
    if (line.rfind("Threads:", 0) == 0) {
      std::istringstream fields(line.substr(8));
      long threads = 0;
      if (fields >> threads) {
        return static_cast<double>(threads);
      }
    }
  }
  throw UnavailableError("no Threads entry in /proc/self/status");
}

inline double count_open_files() {
  std::error_code ec;
  std::filesystem::directory_iterator it("/proc/self/fd", ec);
  if (ec) {
    throw UnavailableError("cannot list /proc/self/fd: " + ec.message());
  }
  auto count = static_cast<double>(
      std::distance(std::filesystem::begin(it), std::filesystem::end(it)));
  // The iterator's own descriptor is listed as well
  return count > 0 ? count - 1 : 0;
}

inline double read_cpu_seconds() {
  rusage usage{};
  if (getrusage(RUSAGE_SELF, &usage) != 0) {
    throw UnavailableError("getrusage failed");
  }
  auto seconds = [](const timeval& tv) {
    return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6;
  };
  return seconds(usage.ru_utime) + seconds(usage.ru_stime);
}

}  // namespace detail

inline ProcessMetricsProvider::ProcessMetricsProvider()
    : started_(std::chrono::steady_clock::now()) {
  definitions_ = {
      {"memory.rss", "Resident set size of the process", "bytes", Statistic::VALUE,
       [] { return detail::read_statm_bytes(1); }},
      {"memory.vms", "Virtual memory size of the process", "bytes", Statistic::VALUE,
       [] { return detail::read_statm_bytes(0); }},
      {"thread.count", "Live threads in the process", "", Statistic::COUNT,
       [] { return detail::read_thread_count(); }},
      {"process.uptime", "Time since the agent started", "seconds", Statistic::VALUE,
       [this] {
         return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_)
             .count();
       }},
      {"process.files.open", "Open file descriptors", "", Statistic::COUNT,
       [] { return detail::count_open_files(); }},
      {"process.cpu.time", "User plus system CPU time consumed", "seconds",
       Statistic::VALUE, [] { return detail::read_cpu_seconds(); }},
      {"system.cpu.count", "Processors available to the process", "", Statistic::COUNT,
       [] { return static_cast<double>(std::thread::hardware_concurrency()); }},
      {"system.load.average.1m", "System load average over the last minute", "",
       Statistic::VALUE,
       [] {
         double load[1] = {0.0};
         if (getloadavg(load, 1) != 1) {
           throw UnavailableError("getloadavg failed");
         }
         return load[0];
       }},
  };
}

inline std::set<std::string> ProcessMetricsProvider::metric_names() const {
  std::set<std::string> names;
  for (const auto& definition : definitions_) {
    names.insert(definition.name);
  }
  return names;
}

inline std::optional<Metric> ProcessMetricsProvider::measure(const std::string& name) const {
  for (const auto& definition : definitions_) {
    if (definition.name == name) {
      return Metric{definition.name, definition.description, definition.base_unit,
                    {{definition.statistic, definition.sample()}}};
    }
  }
  return std::nullopt;
}

inline MetricsRegistry::MetricsRegistry() {
  providers_.push_back(std::make_shared<ProcessMetricsProvider>());
}

inline void MetricsRegistry::add_provider(std::shared_ptr<MetricProvider> provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  providers_.push_back(std::move(provider));
}

inline void MetricsRegistry::add_gauge(const std::string& name, const std::string& base_unit,
                                       const std::string& description,
                                       std::function<double()> sample, Statistic statistic) {
  add_provider(std::make_shared<GaugeProvider>(name, base_unit, description,
                                               std::move(sample), statistic));
}

inline std::vector<std::shared_ptr<MetricProvider>> MetricsRegistry::providers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return providers_;
}

inline std::set<std::string> MetricsRegistry::get_metric_names() const {
  std::set<std::string> names;
  for (const auto& provider : providers()) {
    auto provided = provider->metric_names();
    names.insert(provided.begin(), provided.end());
  }
  return names;
}

inline Metric MetricsRegistry::get_metric_measurement(const std::string& name) const {
  for (const auto& provider : providers()) {
    auto metric = provider->measure(name);
    if (metric) {
      return *metric;
    }
  }
  throw MetricNotFound(name);
}

}  // namespace actuator
