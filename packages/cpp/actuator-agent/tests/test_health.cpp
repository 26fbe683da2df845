/**
 * Unit tests for HealthAggregator and DiskSpaceHealthIndicator.
 *
 * Tests:
 * - DOWN dominance and UP-only-if-all-UP folding
 * - Failing indicators degrade to DOWN
 * - Disk space threshold with a mocked probe
 * - HTTP status mapping
 * - Unique indicator names, registration order kept
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

#include "health.hpp"

namespace actuator {
namespace testing {

class FixedIndicator : public HealthIndicator {
 public:
  FixedIndicator(std::string name, HealthStatus status)
      : name_(std::move(name)), status_(status) {}

  std::string name() const override { return name_; }

  HealthReport health() const override {
    HealthReport report;
    report.status = status_;
    return report;
  }

 private:
  std::string name_;
  HealthStatus status_;
};

class ThrowingIndicator : public HealthIndicator {
 public:
  std::string name() const override { return "database"; }

  HealthReport health() const override { throw UnavailableError("connection refused"); }
};

TEST(HealthAggregator, AllUpIsUp) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<FixedIndicator>("a", HealthStatus::UP));
  aggregator.add_indicator(std::make_shared<FixedIndicator>("b", HealthStatus::UP));

  HealthReport report = aggregator.get_health();
  EXPECT_EQ(report.status, HealthStatus::UP);
  EXPECT_EQ(report.http_status(), 200);
  EXPECT_EQ(report.components.size(), 2u);
}

TEST(HealthAggregator, OneDownIsDown) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<FixedIndicator>("a", HealthStatus::UP));
  aggregator.add_indicator(std::make_shared<FixedIndicator>("b", HealthStatus::DOWN));

  HealthReport report = aggregator.get_health();
  EXPECT_EQ(report.status, HealthStatus::DOWN);
  EXPECT_EQ(report.http_status(), 503);
  ASSERT_NE(report.component("a"), nullptr);
  ASSERT_NE(report.component("b"), nullptr);
  EXPECT_EQ(report.component("a")->status, HealthStatus::UP);
  EXPECT_EQ(report.component("b")->status, HealthStatus::DOWN);
}

TEST(HealthAggregator, DuplicateNameRejected) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<FixedIndicator>("db", HealthStatus::DOWN));
  EXPECT_THROW(
      aggregator.add_indicator(std::make_shared<FixedIndicator>("db", HealthStatus::UP)),
      InvalidArgument);

  // Every folded status stays visible as a component
  HealthReport report = aggregator.get_health();
  EXPECT_EQ(report.status, HealthStatus::DOWN);
  ASSERT_EQ(report.components.size(), 1u);
  EXPECT_EQ(report.components[0].first, "db");
  EXPECT_EQ(report.components[0].second.status, HealthStatus::DOWN);
}

TEST(HealthAggregator, NullIndicatorRejected) {
  HealthAggregator aggregator;
  EXPECT_THROW(aggregator.add_indicator(nullptr), InvalidArgument);
}

TEST(HealthAggregator, ComponentsKeepRegistrationOrder) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<FixedIndicator>("zookeeper", HealthStatus::UP));
  aggregator.add_indicator(std::make_shared<FixedIndicator>("archive", HealthStatus::UP));
  aggregator.add_indicator(std::make_shared<FixedIndicator>("mail", HealthStatus::UP));

  HealthReport report = aggregator.get_health();
  ASSERT_EQ(report.components.size(), 3u);
  EXPECT_EQ(report.components[0].first, "zookeeper");
  EXPECT_EQ(report.components[1].first, "archive");
  EXPECT_EQ(report.components[2].first, "mail");
  EXPECT_EQ(report.component("missing"), nullptr);
}

TEST(HealthReport, SetComponentReplacesSameName) {
  HealthReport down;
  down.status = HealthStatus::DOWN;
  HealthReport up;
  up.status = HealthStatus::UP;

  HealthReport report;
  report.set_component("node", down);
  report.set_component("node", up);
  ASSERT_EQ(report.components.size(), 1u);
  EXPECT_EQ(report.component("node")->status, HealthStatus::UP);
}

TEST(HealthAggregator, UnknownIsNotUp) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<FixedIndicator>("a", HealthStatus::UP));
  aggregator.add_indicator(std::make_shared<FixedIndicator>("b", HealthStatus::UNKNOWN));

  HealthReport report = aggregator.get_health();
  EXPECT_EQ(report.status, HealthStatus::UNKNOWN);
  EXPECT_EQ(report.http_status(), 200);
}

TEST(HealthAggregator, OutOfServiceMapsTo503) {
  HealthAggregator aggregator;
  aggregator.add_indicator(
      std::make_shared<FixedIndicator>("a", HealthStatus::OUT_OF_SERVICE));

  HealthReport report = aggregator.get_health();
  EXPECT_EQ(report.status, HealthStatus::OUT_OF_SERVICE);
  EXPECT_EQ(report.http_status(), 503);
}

TEST(HealthAggregator, NoIndicatorsIsUp) {
  HealthAggregator aggregator;
  EXPECT_EQ(aggregator.get_health().status, HealthStatus::UP);
}

TEST(HealthAggregator, FailingIndicatorReportsDownWithError) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<FixedIndicator>("a", HealthStatus::UP));
  aggregator.add_indicator(std::make_shared<ThrowingIndicator>());

  HealthReport report;
  ASSERT_NO_THROW(report = aggregator.get_health());
  EXPECT_EQ(report.status, HealthStatus::DOWN);

  ASSERT_NE(report.component("database"), nullptr);
  const HealthReport& database = *report.component("database");
  EXPECT_EQ(database.status, HealthStatus::DOWN);
  EXPECT_EQ(std::get<std::string>(database.details.at("error")), "connection refused");
}

/**
 * An indicator that claims UP but carries a DOWN sub-report.
 */
class CompositeIndicator : public HealthIndicator {
 public:
  std::string name() const override { return "cluster"; }

  HealthReport health() const override {
    HealthReport node;
    node.status = HealthStatus::DOWN;

    HealthReport report;
    report.status = HealthStatus::UP;
    report.set_component("node-1", node);
    return report;
  }
};

TEST(HealthAggregator, NestedDownDominates) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<CompositeIndicator>());

  HealthReport report = aggregator.get_health();
  ASSERT_NE(report.component("cluster"), nullptr);
  EXPECT_EQ(report.component("cluster")->status, HealthStatus::DOWN);
  EXPECT_EQ(report.status, HealthStatus::DOWN);
}

TEST(DiskSpaceHealthIndicator, BelowThresholdIsDown) {
  DiskSpaceHealthIndicator indicator("/data", 10000000, [](const std::string&) {
    return DiskUsage{100000000, 9999999};
  });

  HealthReport report = indicator.health();
  EXPECT_EQ(indicator.name(), "diskSpace");
  EXPECT_EQ(report.status, HealthStatus::DOWN);
  EXPECT_EQ(std::get<std::int64_t>(report.details.at("free")), 9999999);
  EXPECT_EQ(std::get<std::int64_t>(report.details.at("total")), 100000000);
  EXPECT_EQ(std::get<std::int64_t>(report.details.at("threshold")), 10000000);
}

TEST(DiskSpaceHealthIndicator, AboveThresholdIsUp) {
  DiskSpaceHealthIndicator indicator("/data", 10000000, [](const std::string&) {
    return DiskUsage{100000000, 50000000};
  });
  EXPECT_EQ(indicator.health().status, HealthStatus::UP);
}

TEST(DiskSpaceHealthIndicator, RealFilesystemReportsValues) {
  DiskSpaceHealthIndicator indicator(".", 1);
  HealthReport report = indicator.health();
  EXPECT_GT(std::get<std::int64_t>(report.details.at("total")), 0);
}

TEST(DiskSpaceHealthIndicator, MissingPathDegradesToDown) {
  HealthAggregator aggregator;
  aggregator.add_indicator(std::make_shared<DiskSpaceHealthIndicator>(
      "/definitely/not/a/real/path/for/actuator", 1));

  HealthReport report = aggregator.get_health();
  EXPECT_EQ(report.status, HealthStatus::DOWN);
  ASSERT_NE(report.component("diskSpace"), nullptr);
  EXPECT_EQ(report.component("diskSpace")->details.count("error"), 1u);
}

}  // namespace testing
}  // namespace actuator
