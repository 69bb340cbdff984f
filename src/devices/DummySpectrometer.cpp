/* @file DummySpectrometer.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <cmath>
#include <stdexcept>

// labcomm headers
#include "core/Logger.hpp"
#include "devices/DummySpectrometer.hpp"

namespace labcomm::devices {

  namespace {
    constexpr const char* kComponent = "DummySpectrometer";

    // codes and wording from the OPUS manual
    struct ErrorInfo {
      int code;
      const char* text;
    };
    constexpr ErrorInfo kNotIdle{ 1, "Status is not 'Idle' although required for current command" };
    constexpr ErrorInfo kNotRunning{
      2, "Status is not 'Running' although required for current command"
    };
    constexpr ErrorInfo kNotRunningOrFinishing{
      3, "Status is not 'Running' or 'Finishing' although required for current command"
    };
    constexpr ErrorInfo kUnknownCommand{ 4, "Unknown command" };
    constexpr ErrorInfo kNotConnected{ 7, "System not connected" };

    [[noreturn]] void fail(const ErrorInfo& info) { throw SpectrometerError(info.code, info.text); }

    std::chrono::milliseconds toPeriod(double seconds) {
      if (!std::isfinite(seconds) || std::llround(seconds * 1000.0) <= 0)
        throw std::invalid_argument("[DummySpectrometer] measure duration must be positive");
      return std::chrono::milliseconds(std::llround(seconds * 1000.0));
    }
  } // namespace

  using core::SpectrometerStatus;

  DummySpectrometer::DummySpectrometer(std::shared_ptr<core::MessageChannel> channel,
                                       std::shared_ptr<core::Scheduler> scheduler,
                                       std::shared_ptr<core::Logger> logger,
                                       double measureDuration)
      : SpectrometerBase(std::move(channel)), scheduler_(std::move(scheduler)),
        logger_(std::move(logger)),
        measureDuration_(toPeriod(measureDuration)) {
    if (!scheduler_)
      throw std::invalid_argument("[DummySpectrometer] scheduler is nullptr");
    assert(logger_ && "[DummySpectrometer] logger is nullptr");
  }

  DummySpectrometer::~DummySpectrometer() { DummySpectrometer::close(); }

  void DummySpectrometer::requestCommand(const std::string& command) {
    namespace cmd = spectrometer_commands;

    if (command == cmd::Status) {
      if (state_ == SpectrometerStatus::Idle)
        fail(kNotConnected);
    } else if (command == cmd::Connect) {
      if (state_ != SpectrometerStatus::Idle)
        fail(kNotIdle);
      transition(SpectrometerStatus::Connecting);
      transition(SpectrometerStatus::Connected);
    } else if (command == cmd::Start) {
      if (state_ != SpectrometerStatus::Connected)
        fail(kNotConnected);
      transition(SpectrometerStatus::Measuring);
      measureTimer_ = scheduler_->arm(measureDuration_, core::TimerMode::SingleShot,
                                      [this] { onMeasureTimer(); });
    } else if (command == cmd::Cancel) {
      if (state_ != SpectrometerStatus::Measuring)
        fail(kNotRunning);
      cancelMeasureTimer();
      logger_->info(kComponent, "Cancelling current measurement");
      transition(SpectrometerStatus::Cancelling);
      transition(SpectrometerStatus::Connected);
    } else if (command == cmd::Stop) {
      if (state_ != SpectrometerStatus::Measuring)
        fail(kNotRunningOrFinishing);
      finishMeasurement();
    } else {
      fail(kUnknownCommand);
    }

    sendStatusMessage(state_);
  }

  void DummySpectrometer::close() { cancelMeasureTimer(); }

  void DummySpectrometer::transition(SpectrometerStatus next) {
    state_ = next;
    logger_->debug(kComponent, std::string("Current state: ") + core::toString(next));
  }

  void DummySpectrometer::finishMeasurement() {
    cancelMeasureTimer();
    transition(SpectrometerStatus::Finishing);
    transition(SpectrometerStatus::Connected);
    logger_->info(kComponent, "Measurement complete");
  }

  void DummySpectrometer::cancelMeasureTimer() {
    if (measureTimer_ == core::Scheduler::kNoTimer)
      return;
    scheduler_->cancel(measureTimer_);
    measureTimer_ = core::Scheduler::kNoTimer;
  }

  void DummySpectrometer::onMeasureTimer() {
    // single-shot: the scheduler has already dropped it
    measureTimer_ = core::Scheduler::kNoTimer;
    if (state_ != SpectrometerStatus::Measuring)
      return;

    finishMeasurement();
    sendStatusMessage(state_);
  }

} // namespace labcomm::devices
