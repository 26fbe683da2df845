/**
 * Minimal C++ example application embedding the actuator agent.
 *
 * Loads configuration from ACTUATOR_* environment variables, logs through a
 * logger created by the agent (so the output is captured for the logfile
 * resource), records a fake request trace and prints what an adapter would
 * serve.
 *
 * Registration only runs when ACTUATOR_REGISTRATION_URL is set, e.g.
 *   ACTUATOR_APP_NAME=demo ACTUATOR_REGISTRATION_URL=http://localhost:8001/instances \
 *       ./minimal_cpp_app
 */

#include "actuator_agent.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <iostream>
#include <thread>

int main() {
  try {
    actuator::AgentConfig config = actuator::AgentConfig::from_env();

    std::cout << "Actuator agent example" << std::endl;
    std::cout << "Application: " << config.app_name << std::endl;
    std::cout << "Management URL: " << config.resolved_management_url() << std::endl;
    std::cout << "Registration: "
              << (config.registration_url.empty() ? "disabled" : config.registration_url)
              << std::endl;

    actuator::AgentEngine engine(config);
    engine.metrics().add_gauge("demo.requests", "requests", "Requests handled",
                               [] { return 1.0; }, actuator::Statistic::COUNT);

    auto logger = engine.create_logger("demo");
    engine.start();

    logger->info("Demo application started");
    logger->warn("Low memory warning: {} MB available", 512);

    actuator::TraceRecord record;
    record.request_time = std::chrono::system_clock::now();
    record.request.method = "GET";
    record.request.uri = "/hello";
    record.response.status_code = 200;
    record.duration_ms = 3;
    engine.add_trace_record(record);

    engine.set_logger_level("demo", std::string("DEBUG"));
    logger->debug("Debug output is now enabled");

    actuator::HealthReport health = engine.get_health();
    std::cout << "Health: " << actuator::status_name(health.status) << " (HTTP "
              << health.http_status() << ")" << std::endl;

    actuator::Metric rss = engine.get_metric_measurement("memory.rss");
    std::cout << "memory.rss: " << rss.measurements.front().value << " " << rss.base_unit
              << std::endl;

    std::cout << "Threads: " << engine.get_thread_dump().threads.size() << std::endl;
    std::cout << "Traces: " << engine.get_httptrace().traces.size() << std::endl;

    actuator::LogSlice tail = engine.get_logfile("bytes=-200");
    std::cout << "Captured log tail (" << tail.start << "-" << tail.end << "):" << std::endl
              << tail.content;

    // Let a registration cycle or two happen
    std::this_thread::sleep_for(std::chrono::seconds(2));

    engine.stop();
    std::cout << "Example completed." << std::endl;

  } catch (const actuator::ActuatorError& e) {
    std::cerr << "Error (" << e.http_status() << "): " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
