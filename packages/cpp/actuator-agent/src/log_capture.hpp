/**
 * In-memory log capture.
 *
 * LogCapture is an append-only byte sink holding every captured log line. It
 * answers single byte-range queries ("bytes=start-end", "bytes=start-",
 * "bytes=-suffix") for log tailing. LogCaptureSink feeds it from spdlog.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <regex>
#include <string>

#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace actuator {

/**
 * Size of the captured log, returned when no range was requested.
 * end equals total_length so adapters can echo it as the document size.
 */
struct LogRange {
  size_t start = 0;
  size_t end = 0;
  size_t total_length = 0;
};

/**
 * Bytes [start, end] of the captured log. content is empty, with
 * start == end == total length, when the caller is already at the tail.
 */
struct LogSlice {
  std::string content;
  size_t start = 0;
  size_t end = 0;
};

// =========================
// Core (spdlog-independent)
// =========================

class LogCapture {
 public:
  LogCapture() = default;

  // Non-copyable
  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  /**
   * Append one line; a '\n' terminator is added.
   */
  void append(const std::string& line);

  LogRange get_range() const;

  /**
   * Resolve a Range header against the current log and return the slice.
   *
   * Throws InvalidArgument for a malformed header and RangeNotSatisfiable when
   * the start lies beyond the log or after the requested end.
   */
  LogSlice get_logfile(const std::string& range_header) const;

  size_t length() const;

  /**
   * Drop everything captured so far.
   */
  void reset();

 private:
  std::string buffer_;
  mutable std::mutex mutex_;
};

// =========================
// spdlog Adapter
// =========================

template <typename Mutex>
class LogCaptureSink : public spdlog::sinks::base_sink<Mutex> {
 public:
  LogCaptureSink(std::shared_ptr<LogCapture> capture, const std::string& pattern)
      : capture_(std::move(capture)) {
    this->set_pattern_(pattern);
  }

  const std::shared_ptr<LogCapture>& capture() const { return capture_; }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    spdlog::memory_buf_t formatted;
    this->formatter_->format(msg, formatted);

    std::string line(formatted.data(), formatted.size());
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    capture_->append(line);
  }

  void flush_() override {}

 private:
  std::shared_ptr<LogCapture> capture_;
};

using LogCaptureSink_mt = LogCaptureSink<std::mutex>;
using LogCaptureSink_st = LogCaptureSink<spdlog::details::null_mutex>;

/**
 * Add a capture sink to an existing logger without touching its other sinks.
 */
inline std::shared_ptr<LogCaptureSink_mt> attach_log_capture(
    const std::shared_ptr<spdlog::logger>& logger,
    std::shared_ptr<LogCapture> capture,
    const std::string& pattern) {
  auto sink = std::make_shared<LogCaptureSink_mt>(std::move(capture), pattern);
  logger->sinks().push_back(sink);
  return sink;
}

// =========================
// Inline Implementations
// =========================

inline void LogCapture::append(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_.append(line);
  buffer_.push_back('\n');
}

inline LogRange LogCapture::get_range() const {
  std::lock_guard<std::mutex> lock(mutex_);
  LogRange range;
  range.start = 0;
  range.end = buffer_.size();
  range.total_length = buffer_.size();
  return range;
}

inline size_t LogCapture::length() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

inline void LogCapture::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_.clear();
}

inline LogSlice LogCapture::get_logfile(const std::string& range_header) const {
  static const std::regex pattern(R"delim(^\s*bytes\s*=\s*(\d*)\s*-\s*(\d*)\s*$)delim");

  std::smatch match;
  if (!std::regex_match(range_header, match, pattern)) {
    throw InvalidArgument("malformed range header: " + range_header);
  }
  const bool has_start = match[1].length() > 0;
  const bool has_end = match[2].length() > 0;
  if (!has_start && !has_end) {
    throw InvalidArgument("malformed range header: " + range_header);
  }

  size_t first = 0;
  size_t last = 0;
  try {
    if (has_start) {
      first = static_cast<size_t>(std::stoull(match[1].str()));
    }
    if (has_end) {
      last = static_cast<size_t>(std::stoull(match[2].str()));
    }
  } catch (const std::out_of_range&) {
    throw InvalidArgument("range value out of bounds: " + range_header);
  }

  // Length and content are read under the same lock so concurrent appends
  // cannot shift the slice.
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t total = buffer_.size();

  size_t start = 0;
  size_t end = 0;
  if (!has_start) {
    // bytes=-N: the last N bytes
    if (last == 0) {
      throw RangeNotSatisfiable("empty suffix range: " + range_header);
    }
    start = total > last ? total - last : 0;
  } else {
    start = first;
    if (has_end && last < first) {
      throw RangeNotSatisfiable("range start after end: " + range_header);
    }
  }

  if (start > total) {
    throw RangeNotSatisfiable("range start " + std::to_string(start) +
                              " beyond log length " + std::to_string(total));
  }
  if (start == total) {
    return LogSlice{std::string(), total, total};
  }

  end = total - 1;
  if (has_start && has_end && last < end) {
    end = last;
  }

  return LogSlice{buffer_.substr(start, end - start + 1), start, end};
}

}  // namespace actuator
