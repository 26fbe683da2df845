/**
 * Tests for AgentEngine, the object adapters call into.
 *
 * Tests:
 * - Delegation to every subcomponent
 * - Environment snapshot and app info
 * - Endpoint index and disabled endpoints
 * - Logger creation wired to log capture and the logger registry
 * - Registration lifecycle through start()/stop()
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "actuator_agent.hpp"

namespace actuator {
namespace testing {

class CountingTransport : public RegistryTransport {
 public:
  HttpResponse register_instance(const std::string&, const std::string&) override {
    registrations.fetch_add(1);
    HttpResponse response;
    response.ok = true;
    response.status_code = 201;
    response.body = R"({"id":"engine-1"})";
    return response;
  }

  HttpResponse deregister_instance(const std::string&) override {
    deregistrations.fetch_add(1);
    HttpResponse response;
    response.ok = true;
    response.status_code = 200;
    return response;
  }

  std::atomic<int> registrations{0};
  std::atomic<int> deregistrations{0};
};

class AgentEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.app_name = "engine-test";
    config_.app_description = "engine under test";
    config_.app_url = "http://localhost:8080";
    config_.additional_app_info["version"] = "1.2.3";
    config_.log_pattern = "%l %n: %v";
  }

  void TearDown() override {
    spdlog::drop("engine_test_logger");
    spdlog::drop("engine_test_logger.child");
  }

  AgentConfig config_;
};

TEST_F(AgentEngineTest, EnvironmentContainsProcessVariables) {
  setenv("ACTUATOR_ENGINE_TEST_VAR", "some=value", 1);
  AgentEngine engine(config_);

  EnvironmentData env = engine.get_environment();
  ASSERT_EQ(env.property_sources.size(), 1u);
  EXPECT_EQ(env.property_sources[0].name, "systemEnvironment");
  EXPECT_EQ(env.property_sources[0].properties.at("ACTUATOR_ENGINE_TEST_VAR"), "some=value");

  unsetenv("ACTUATOR_ENGINE_TEST_VAR");
}

TEST_F(AgentEngineTest, AppInfoFromConfig) {
  AgentEngine engine(config_);
  AppInfo info = engine.get_app_info();
  EXPECT_EQ(info.name, "engine-test");
  EXPECT_EQ(info.description, "engine under test");
  EXPECT_EQ(info.additional.at("version"), "1.2.3");
}

TEST_F(AgentEngineTest, HealthIncludesDiskSpace) {
  config_.disk_space_threshold = 1;
  AgentEngine engine(config_);

  HealthReport report = engine.get_health();
  EXPECT_EQ(report.status, HealthStatus::UP);
  const HealthReport* disk = report.component("diskSpace");
  ASSERT_NE(disk, nullptr);
  EXPECT_GT(std::get<std::int64_t>(disk->details.at("free")), 0);
}

TEST_F(AgentEngineTest, CustomIndicatorJoinsHealth) {
  class Down : public HealthIndicator {
   public:
    std::string name() const override { return "queue"; }
    HealthReport health() const override {
      HealthReport report;
      report.status = HealthStatus::DOWN;
      return report;
    }
  };

  config_.disk_space_threshold = 1;
  AgentEngine engine(config_);
  engine.health().add_indicator(std::make_shared<Down>());

  HealthReport report = engine.get_health();
  EXPECT_EQ(report.status, HealthStatus::DOWN);
  EXPECT_EQ(report.http_status(), 503);
}

TEST_F(AgentEngineTest, SecondDiskSpaceIndicatorRejected) {
  AgentEngine engine(config_);
  EXPECT_THROW(engine.health().add_indicator(
                   std::make_shared<DiskSpaceHealthIndicator>("/tmp", 1)),
               InvalidArgument);
}

TEST_F(AgentEngineTest, MetricsDelegate) {
  AgentEngine engine(config_);
  EXPECT_EQ(engine.get_metric_names().count("memory.rss"), 1u);
  EXPECT_EQ(engine.get_metric_measurement("thread.count").name, "thread.count");
  EXPECT_THROW(engine.get_metric_measurement("nope"), MetricNotFound);
}

TEST_F(AgentEngineTest, TracesDelegate) {
  config_.trace_capacity = 2;
  AgentEngine engine(config_);
  for (int i = 0; i < 3; ++i) {
    TraceRecord record;
    record.request.method = "GET";
    record.request.uri = "/" + std::to_string(i);
    record.response.status_code = 200;
    engine.add_trace_record(record);
  }

  HttpTraces traces = engine.get_httptrace();
  ASSERT_EQ(traces.traces.size(), 2u);
  EXPECT_EQ(traces.traces[0].request.uri, "/1");
  EXPECT_EQ(traces.traces[1].request.uri, "/2");
}

TEST_F(AgentEngineTest, CreatedLoggerFeedsLogfile) {
  AgentEngine engine(config_);
  auto logger = engine.create_logger("engine_test_logger");
  logger->error("repeat me");

  LogSlice slice = engine.get_logfile("bytes=0-");
  EXPECT_NE(slice.content.find("error engine_test_logger: repeat me\n"), std::string::npos);
  EXPECT_EQ(engine.get_range().total_length, slice.content.size());

  // Same name returns the registered logger
  EXPECT_EQ(engine.create_logger("engine_test_logger"), logger);
}

TEST_F(AgentEngineTest, LoggerLevelsControlCreatedLoggers) {
  AgentEngine engine(config_);
  engine.set_logger_level("engine_test_logger", "ERROR");

  auto parent = engine.create_logger("engine_test_logger");
  auto child = engine.create_logger("engine_test_logger.child");
  EXPECT_EQ(parent->level(), spdlog::level::err);
  EXPECT_EQ(child->level(), spdlog::level::err);

  child->warn("filtered");
  EXPECT_EQ(engine.get_range().total_length, 0u);

  engine.set_logger_level("engine_test_logger.child", "DEBUG");
  EXPECT_EQ(engine.get_logger("engine_test_logger.child").effective_level, "DEBUG");
  EXPECT_EQ(engine.get_loggers().loggers.at("engine_test_logger").configured_level.value_or(""),
            "ERROR");
}

TEST_F(AgentEngineTest, EmptyLoggerNameRejected) {
  AgentEngine engine(config_);
  try {
    engine.set_logger_level("", "DEBUG");
    FAIL() << "expected InvalidArgument";
  } catch (const InvalidArgument& e) {
    EXPECT_EQ(e.http_status(), 400);
  }
}

TEST_F(AgentEngineTest, ThreadDumpDelegates) {
  AgentEngine engine(config_);
  EXPECT_FALSE(engine.get_thread_dump().threads.empty());
}

TEST_F(AgentEngineTest, EndpointIndexListsEnabledResources) {
  config_.disabled_endpoints = {Endpoint::ENV};
  AgentEngine engine(config_);

  EndpointsData data = engine.get_endpoints();
  EXPECT_EQ(data.links.at("self").href, "http://localhost:8080/actuator");
  EXPECT_EQ(data.links.at("health").href, "http://localhost:8080/actuator/health");
  EXPECT_TRUE(data.links.at("metrics-requiredMetricName").templated);
  EXPECT_EQ(data.links.count("env"), 0u);

  EXPECT_THROW(engine.get_environment(), EndpointDisabled);
  EXPECT_NO_THROW(engine.get_health());
}

TEST_F(AgentEngineTest, NoRegistrationWithoutUrl) {
  AgentEngine engine(config_);
  EXPECT_EQ(engine.registration_client(), nullptr);
  EXPECT_NO_THROW(engine.start());
  EXPECT_NO_THROW(engine.stop());
}

TEST_F(AgentEngineTest, RegistrationLifecycle) {
  config_.registration_url = "http://localhost:8001/instances";
  config_.registration_interval = std::chrono::milliseconds(50);
  auto transport = std::make_shared<CountingTransport>();

  {
    AgentEngine engine(config_, transport);
    ASSERT_NE(engine.registration_client(), nullptr);
    engine.start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (transport->registrations.load() < 2 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_GE(transport->registrations.load(), 2);

    engine.stop();
    EXPECT_EQ(transport->deregistrations.load(), 1);
    // Destructor stops again
  }
  EXPECT_EQ(transport->deregistrations.load(), 1);
}

}  // namespace testing
}  // namespace actuator
