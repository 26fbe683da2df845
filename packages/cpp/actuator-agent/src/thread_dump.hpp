/**
 * Snapshot of the live threads of this process, read from /proc/self/task.
 */

#pragma once

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"

namespace actuator {

struct ThreadInfo {
  std::int64_t thread_id = 0;
  std::string thread_name;
  std::string thread_state;
  std::int64_t cpu_time_ms = 0;
  // Not available without a debugger; always empty
  std::vector<std::string> stack_trace;
};

struct ThreadDump {
  std::vector<ThreadInfo> threads;
};

class ThreadDumper {
 public:
  /**
   * Throws UnavailableError if /proc/self/task cannot be listed. Threads that
   * exit while being read are skipped.
   */
  ThreadDump get_thread_dump() const;

  static std::string state_name(char kernel_state);
};

// =========================
// Inline Implementations
// =========================

inline std::string ThreadDumper::state_name(char kernel_state) {
  switch (kernel_state) {
    case 'R':
      return "RUNNABLE";
    case 'S':
    case 'D':
      return "WAITING";
    case 'T':
    case 't':
      return "BLOCKED";
    case 'Z':
    case 'X':
      return "TERMINATED";
    default:
      return "UNKNOWN";
  }
}

inline ThreadDump ThreadDumper::get_thread_dump() const {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::directory_iterator tasks("/proc/self/task", ec);
  if (ec) {
    throw UnavailableError("cannot list /proc/self/task: " + ec.message());
  }

  const long ticks_per_second = sysconf(_SC_CLK_TCK);

  ThreadDump dump;
  for (const auto& entry : tasks) {
    ThreadInfo info;
    try {
      info.thread_id = std::stoll(entry.path().filename().string());
    } catch (const std::exception&) {
      continue;
    }

    std::ifstream comm(entry.path() / "comm");
    if (!comm.is_open() || !std::getline(comm, info.thread_name)) {
      continue;
    }

    std::ifstream stat_file(entry.path() / "stat");
    std::string stat;
    if (!stat_file.is_open() || !std::getline(stat_file, stat)) {
      continue;
    }

    // "tid (comm) S f4 ... f13 utime stime ..."; comm may contain ')'
    auto close = stat.rfind(')');
    if (close == std::string::npos) {
      continue;
    }
    std::istringstream fields(stat.substr(close + 1));
    char state = '?';
    fields >> state;
    info.thread_state = state_name(state);

    std::string skipped;
    for (int i = 4; i <= 13; ++i) {
      fields >> skipped;
    }
    unsigned long long utime = 0;
    unsigned long long stime = 0;
    if (fields >> utime >> stime && ticks_per_second > 0) {
      const auto ticks = static_cast<unsigned long long>(ticks_per_second);
      info.cpu_time_ms = static_cast<std::int64_t>((utime + stime) * 1000ULL / ticks);
    }

    dump.threads.push_back(std::move(info));
  }

  std::sort(dump.threads.begin(), dump.threads.end(),
            [](const ThreadInfo& a, const ThreadInfo& b) { return a.thread_id < b.thread_id; });
  return dump;
}

}  // namespace actuator
