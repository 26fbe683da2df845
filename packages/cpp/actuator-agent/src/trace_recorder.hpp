/**
 * HTTP exchange history.
 *
 * Adapters measure each completed request/response and hand the result to
 * add_record(); get_httptrace() returns the retained history oldest-first.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "ring_buffer.hpp"

namespace actuator {

using HeaderMap = std::map<std::string, std::vector<std::string>>;

struct TraceRequest {
  std::string method;
  std::string uri;
  HeaderMap headers;
};

struct TraceResponse {
  int status_code = 0;
  HeaderMap headers;
};

/**
 * One completed HTTP exchange. principal and session are empty when the
 * adapter cannot tell.
 */
struct TraceRecord {
  std::chrono::system_clock::time_point request_time;
  std::string principal;
  std::string session;
  TraceRequest request;
  TraceResponse response;
  std::int64_t duration_ms = 0;
};

struct HttpTraces {
  std::vector<TraceRecord> traces;
};

class TraceRecorder {
 public:
  explicit TraceRecorder(size_t capacity = RingBuffer<TraceRecord>::kDefaultCapacity)
      : buffer_(capacity) {}

  void add_record(TraceRecord record) { buffer_.push(std::move(record)); }

  HttpTraces get_httptrace() const { return HttpTraces{buffer_.snapshot()}; }

  void clear() { buffer_.clear(); }

  size_t capacity() const { return buffer_.capacity(); }

 private:
  RingBuffer<TraceRecord> buffer_;
};

}  // namespace actuator
