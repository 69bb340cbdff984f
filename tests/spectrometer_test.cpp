// labcomm headers
#include "core/Logger.hpp"
#include "devices/DummySpectrometer.hpp"

// labcomm fakes
#include "FakeScheduler.hpp"
#include "RecordingChannel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace labcomm::test {

  using core::SpectrometerStatus;
  using devices::DummySpectrometer;
  using devices::SpectrometerError;

  class SpectrometerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      spec = std::make_unique<DummySpectrometer>(channel, scheduler, logger, 2.5);
    }

    std::vector<SpectrometerStatus> published() const {
      std::vector<SpectrometerStatus> out;
      for (const auto& m : channel->all<core::StatusMessage>())
        out.push_back(m.status);
      return out;
    }

    /// The error code a command is refused with, 0 if it is accepted.
    int refusal(const std::string& command) {
      try {
        spec->requestCommand(command);
      } catch (const SpectrometerError& e) {
        return e.code();
      }
      return 0;
    }

    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>();
    std::shared_ptr<FakeScheduler> scheduler = std::make_shared<FakeScheduler>();
    std::shared_ptr<core::Logger> logger =
        std::make_shared<core::Logger>([](core::LogLevel, const std::string&) {});
    std::unique_ptr<DummySpectrometer> spec;
  };

  TEST_F(SpectrometerTest, connect_start_and_timed_finish) {
    spec->connect();
    EXPECT_EQ(spec->status(), SpectrometerStatus::Connected);

    spec->startMeasuring();
    EXPECT_EQ(spec->status(), SpectrometerStatus::Measuring);
    const auto timer = scheduler->onlyTimer();
    EXPECT_EQ(scheduler->timer(timer).period, std::chrono::milliseconds(2500));
    EXPECT_EQ(scheduler->timer(timer).mode, core::TimerMode::SingleShot);

    scheduler->fire(timer);

    EXPECT_EQ(spec->status(), SpectrometerStatus::Connected);
    EXPECT_EQ(scheduler->armedCount(), 0u);
    EXPECT_THAT(published(),
                ::testing::ElementsAre(SpectrometerStatus::Connected, SpectrometerStatus::Measuring,
                                       SpectrometerStatus::Connected));
  }

  TEST_F(SpectrometerTest, stop_measuring_cancels) {
    spec->connect();
    spec->startMeasuring();
    const auto timer = scheduler->onlyTimer();

    spec->stopMeasuring();

    EXPECT_EQ(spec->status(), SpectrometerStatus::Connected);
    EXPECT_FALSE(scheduler->isArmed(timer));
    EXPECT_THAT(scheduler->cancelled, ::testing::Contains(timer));
  }

  TEST_F(SpectrometerTest, stop_command_finishes_early) {
    spec->connect();
    spec->startMeasuring();
    spec->requestCommand("stop");

    EXPECT_EQ(spec->status(), SpectrometerStatus::Connected);
    EXPECT_EQ(scheduler->armedCount(), 0u);
  }

  TEST_F(SpectrometerTest, status_is_published_on_request) {
    spec->connect();
    channel->clear();
    spec->requestCommand("status");
    EXPECT_THAT(published(), ::testing::ElementsAre(SpectrometerStatus::Connected));
  }

  TEST_F(SpectrometerTest, wrong_state_commands_are_refused_with_codes) {
    EXPECT_EQ(refusal("status"), 7);
    EXPECT_EQ(refusal("start"), 7);
    EXPECT_EQ(refusal("cancel"), 2);
    EXPECT_EQ(refusal("stop"), 3);
    EXPECT_EQ(refusal("fly"), 4);

    EXPECT_EQ(refusal("connect"), 0);
    EXPECT_EQ(refusal("connect"), 1);

    EXPECT_EQ(refusal("start"), 0);
    EXPECT_EQ(refusal("start"), 7);
    EXPECT_EQ(refusal("connect"), 1);

    // a refused command publishes nothing
    EXPECT_EQ(published().size(), 2u);
  }

  TEST_F(SpectrometerTest, error_text_matches_code) {
    try {
      spec->requestCommand("cancel");
      FAIL() << "cancel accepted while idle";
    } catch (const SpectrometerError& e) {
      EXPECT_EQ(e.code(), 2);
      EXPECT_EQ(std::string(e.what()),
                "Error 2: Status is not 'Running' although required for current command");
    }
  }

  TEST_F(SpectrometerTest, close_disarms_measurement) {
    spec->connect();
    spec->startMeasuring();
    spec->close();
    EXPECT_EQ(scheduler->armedCount(), 0u);
  }

  TEST_F(SpectrometerTest, publishes_on_spectrometer_topic) {
    spec->connect();
    const auto statuses = channel->all<core::StatusMessage>();
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].topic, "device.spectrometer");
  }

  TEST(spectrometer_status, names_and_connected_range) {
    EXPECT_STREQ(core::toString(SpectrometerStatus::Finishing), "Finishing current measurement");
    EXPECT_FALSE(core::isConnected(SpectrometerStatus::Idle));
    EXPECT_FALSE(core::isConnected(SpectrometerStatus::Connecting));
    EXPECT_TRUE(core::isConnected(SpectrometerStatus::Connected));
    EXPECT_TRUE(core::isConnected(SpectrometerStatus::Cancelling));
    EXPECT_FALSE(core::isConnected(SpectrometerStatus::Undefined));
  }

  TEST(dummy_spectrometer_construction, rejects_bad_duration) {
    auto channel = std::make_shared<RecordingChannel>();
    auto scheduler = std::make_shared<FakeScheduler>();
    auto logger = std::make_shared<core::Logger>([](core::LogLevel, const std::string&) {});

    EXPECT_THROW(DummySpectrometer(channel, scheduler, logger, 0.0), std::invalid_argument);
    EXPECT_THROW(DummySpectrometer(channel, scheduler, logger, -1.0), std::invalid_argument);
    EXPECT_THROW(DummySpectrometer(channel, nullptr, logger, 1.0), std::invalid_argument);
  }

} // namespace labcomm::test
