/**
 * Unit tests for TraceRecorder.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "trace_recorder.hpp"

namespace actuator {
namespace testing {

namespace {

TraceRecord make_record(const std::string& uri, int status) {
  TraceRecord record;
  record.request_time = std::chrono::system_clock::now();
  record.request.method = "GET";
  record.request.uri = uri;
  record.request.headers["user-data"] = {"my-secret"};
  record.response.status_code = status;
  record.response.headers["content-type"] = {"text/plain"};
  record.duration_ms = 3;
  return record;
}

}  // namespace

TEST(TraceRecorder, ReturnsRecordsNewestLast) {
  TraceRecorder recorder;
  recorder.add_record(make_record("http://localhost/first", 200));
  recorder.add_record(make_record("http://localhost/second", 404));

  HttpTraces traces = recorder.get_httptrace();
  ASSERT_EQ(traces.traces.size(), 2u);
  EXPECT_EQ(traces.traces[0].request.uri, "http://localhost/first");
  EXPECT_EQ(traces.traces[1].request.uri, "http://localhost/second");
  EXPECT_EQ(traces.traces[1].response.status_code, 404);
  EXPECT_EQ(traces.traces[0].request.headers.at("user-data"),
            (std::vector<std::string>{"my-secret"}));
}

TEST(TraceRecorder, BoundedByCapacity) {
  TraceRecorder recorder(3);
  for (int i = 0; i < 10; ++i) {
    recorder.add_record(make_record("http://localhost/" + std::to_string(i), 200));
  }

  HttpTraces traces = recorder.get_httptrace();
  ASSERT_EQ(traces.traces.size(), 3u);
  EXPECT_EQ(traces.traces.front().request.uri, "http://localhost/7");
  EXPECT_EQ(traces.traces.back().request.uri, "http://localhost/9");
}

TEST(TraceRecorder, ClearDropsHistory) {
  TraceRecorder recorder;
  recorder.add_record(make_record("http://localhost/", 200));
  recorder.clear();
  EXPECT_TRUE(recorder.get_httptrace().traces.empty());
}

}  // namespace testing
}  // namespace actuator
