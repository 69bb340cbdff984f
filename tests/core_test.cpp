#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/MessageChannel.hpp"
#include "core/NoiseProducer.hpp"
#include "core/TaskWorker.hpp"
#include "devices/DummyTemperatureController.hpp"

#include "RecordingChannel.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace labcomm::core;
using namespace labcomm::test;
using ::testing::ElementsAre;
using json = nlohmann::json;

//---configuration-----------------------------------------------------------

TEST(config, empty_object_keeps_defaults) {
  const auto cfg = parseConfig(json::object());
  EXPECT_EQ(cfg.logLevel, "info");
  EXPECT_EQ(cfg.tc4820.maxAttempts, 3);
  EXPECT_EQ(cfg.tc4820.readTimeoutMs, 1000);
  EXPECT_EQ(cfg.tc4820.defaultBaudrate, 115200);
  EXPECT_THAT(cfg.baudrates, ElementsAre(9600, 19200, 38400, 57600, 115200));
  EXPECT_DOUBLE_EQ(cfg.sensorPollInterval, 60.0);
  EXPECT_DOUBLE_EQ(cfg.measureDuration, 1.0);
}

TEST(config, overlays_present_keys) {
  const auto cfg = parseConfig(json::parse(R"({
    "log_level": "debug",
    "tc4820": { "max_attempts": 5, "default_baudrate": 9600 },
    "sensors": { "poll_interval": 2.5 },
    "spectrometer": { "measure_duration": 0.2 }
  })"));
  EXPECT_EQ(cfg.logLevel, "debug");
  EXPECT_EQ(cfg.tc4820.maxAttempts, 5);
  EXPECT_EQ(cfg.tc4820.readTimeoutMs, 1000);
  EXPECT_EQ(cfg.tc4820.defaultBaudrate, 9600);
  EXPECT_DOUBLE_EQ(cfg.sensorPollInterval, 2.5);
  EXPECT_DOUBLE_EQ(cfg.measureDuration, 0.2);
}

TEST(config, null_poll_interval_means_poll_once) {
  const auto cfg = parseConfig(json::parse(R"({ "sensors": { "poll_interval": null } })"));
  EXPECT_TRUE(std::isnan(cfg.sensorPollInterval));
}

TEST(config, rejects_bad_values) {
  EXPECT_THROW(parseConfig(json::array()), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "log_level": "loud" })")), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "log_level": 3 })")), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "tc4820": { "max_attempts": 0 } })")),
               std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "baudrates": [] })")), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "baudrates": [14400, 115200] })")),
               std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "baudrates": [9600] })")), std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "sensors": { "poll_interval": -1 } })")),
               std::runtime_error);
  EXPECT_THROW(parseConfig(json::parse(R"({ "spectrometer": { "measure_duration": 0 } })")),
               std::runtime_error);
}

TEST(config, loads_from_file) {
  char path[] = "/tmp/labcomm_config_XXXXXX";
  const int fd = mkstemp(path);
  ASSERT_GE(fd, 0);
  ::close(fd);
  {
    std::ofstream out(path);
    out << R"({ "tc4820": { "read_timeout_ms": 250 } })";
  }

  const auto cfg = ConfigLoader(path).loadConfig();
  EXPECT_EQ(cfg.tc4820.readTimeoutMs, 250);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(ConfigLoader(path).load(), std::runtime_error);
  std::remove(path);

  EXPECT_THROW(ConfigLoader("/nonexistent/labcomm.json").load(), std::runtime_error);
}

//---logger--------------------------------------------------------------------

TEST(logger, formats_and_filters) {
  std::vector<std::string> lines;
  Logger logger([&](LogLevel, const std::string& line) { lines.push_back(line); });

  logger.debug("TC4820", "hidden");
  logger.info("TC4820", "opened");
  logger.setLevel(LogLevel::Error);
  logger.warn("TC4820", "hidden too");
  logger.error("TC4820", "gone");

  EXPECT_THAT(lines, ElementsAre("[INFO] TC4820: opened", "[ERROR] TC4820: gone"));
  EXPECT_EQ(logger.level(), LogLevel::Error);
}

TEST(logger, parses_level_names) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
  EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
  EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
  EXPECT_THROW(parseLogLevel("DEBUG"), std::invalid_argument);
}

//---message channel-----------------------------------------------------------

TEST(message_channel, fans_out_until_unsubscribed) {
  MessageChannel channel;
  int a = 0;
  int b = 0;
  const auto ta = channel.subscribe([&](const Message&) { ++a; });
  channel.subscribe([&](const Message&) { ++b; });

  channel.publish(ErrorMessage{ "device.sensors", "x" });
  channel.unsubscribe(ta);
  channel.publish(ErrorMessage{ "device.sensors", "y" });

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 2);
}

TEST(message_channel, subscriber_may_unsubscribe_itself) {
  MessageChannel channel;
  int calls = 0;
  MessageChannel::Token token = 0;
  token = channel.subscribe([&](const Message&) {
    ++calls;
    channel.unsubscribe(token);
  });

  channel.publish(CatalogMessage{});
  channel.publish(CatalogMessage{});
  EXPECT_EQ(calls, 1);
}

//---error monitor-------------------------------------------------------------

TEST(error_monitor, logs_and_publishes_every_failure_escalates_once) {
  auto channel = std::make_shared<RecordingChannel>();
  std::vector<std::string> lines;
  auto logger =
      std::make_shared<Logger>([&](LogLevel, const std::string& line) { lines.push_back(line); });
  ErrorMonitor monitor(channel, logger);

  int escalations = 0;
  monitor.registerEscalation([&](const std::string& topic, const std::string& message) {
    ++escalations;
    EXPECT_EQ(topic, "device.sensors");
    EXPECT_EQ(message, "unreachable");
  });

  monitor.notifyFailure("device.sensors", "unreachable");
  monitor.notifyFailure("device.sensors", "unreachable");

  EXPECT_EQ(escalations, 1);
  EXPECT_EQ(channel->all<ErrorMessage>().size(), 2u);
  EXPECT_THAT(lines, ElementsAre("[ERROR] device.sensors: unreachable",
                                 "[ERROR] device.sensors: unreachable"));

  monitor.reset();
  monitor.notifyFailure("device.sensors", "unreachable");
  EXPECT_EQ(escalations, 2);
}

//---task worker---------------------------------------------------------------

TEST(task_worker, runs_tasks_in_order_and_reports_exceptions) {
  std::vector<std::string> errors;
  std::vector<int> order;
  TaskWorker worker([&](const std::string& what) { errors.push_back(what); });

  EXPECT_TRUE(worker.post([&] { order.push_back(1); }));
  EXPECT_TRUE(worker.post([] { throw std::runtime_error("fetch failed"); }));
  EXPECT_TRUE(worker.post([&] { order.push_back(2); }));
  worker.waitIdle();

  EXPECT_THAT(order, ElementsAre(1, 2));
  EXPECT_THAT(errors, ElementsAre("fetch failed"));

  worker.stop();
  EXPECT_FALSE(worker.post([&] { order.push_back(3); }));
  worker.waitIdle();
  EXPECT_EQ(order.size(), 2u);
}

//---dummy temperature controller / noise -------------------------------------

TEST(noise_producer, same_seed_same_sequence) {
  NoiseProducer a({ 35.0, 0.1, 7 });
  NoiseProducer b({ 35.0, 0.1, 7 });
  for (int i = 0; i < 5; ++i)
    EXPECT_DOUBLE_EQ(a(), b());
}

TEST(dummy_temperature_controller, reports_noisy_properties) {
  auto channel = std::make_shared<RecordingChannel>();
  labcomm::devices::DummyTemperatureController tc(channel, "hot_bb");

  tc.requestProperties();
  const auto props = channel->all<PropertiesMessage>();
  ASSERT_EQ(props.size(), 1u);
  EXPECT_EQ(props[0].topic, "device.temperature_controller.hot_bb");
  EXPECT_NEAR(props[0].properties.temperature, 35.0, 1.0);
  EXPECT_NEAR(props[0].properties.power, 40, 15);
  EXPECT_EQ(props[0].properties.alarmStatus, 0);
  EXPECT_DOUBLE_EQ(props[0].properties.setPoint, 70.0);

  tc.changeSetPoint(80.5);
  EXPECT_DOUBLE_EQ(tc.setPoint(), 80.5);
  EXPECT_THROW(labcomm::devices::DummyTemperatureController(channel, "lukewarm_bb"),
               std::invalid_argument);
}

TEST(dummy_temperature_controller, power_is_truncated_noise) {
  auto channel = std::make_shared<RecordingChannel>();
  labcomm::devices::DummyTemperatureController tc(channel, "cold_bb", { 35.0, 0.1, 1 },
                                                  { 40.7, 1e-6, 1 });
  EXPECT_EQ(tc.power(), 40);

  labcomm::devices::DummyTemperatureController negative(channel, "cold_bb", { 35.0, 0.1, 1 },
                                                        { -3.7, 1e-6, 1 });
  EXPECT_EQ(negative.power(), -3);
}
