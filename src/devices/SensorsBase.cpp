/* @file SensorsBase.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cmath>
#include <stdexcept>

// labcomm headers
#include "devices/SensorsBase.hpp"

namespace labcomm::devices {

  SensorsBase::SensorsBase(std::shared_ptr<core::MessageChannel> channel,
                           std::shared_ptr<core::Scheduler> scheduler, double pollInterval,
                           bool startPolling)
      : Device(std::move(channel), kSensorsTopic), scheduler_(std::move(scheduler)),
        pollInterval_(pollInterval) {
    if (!scheduler_)
      throw std::invalid_argument("[SensorsBase] scheduler is nullptr");
    if (!std::isnan(pollInterval_) && !(pollInterval_ > 0.0 && std::isfinite(pollInterval_)))
      throw std::invalid_argument("[SensorsBase] poll interval must be positive or NaN");

    if (startPolling)
      this->startPolling();
  }

  SensorsBase::~SensorsBase() { SensorsBase::close(); }

  void SensorsBase::startPolling() {
    if (std::isnan(pollInterval_) || timer_ != core::Scheduler::kNoTimer)
      return;

    const auto period = std::chrono::milliseconds(std::llround(pollInterval_ * 1000.0));
    timer_ = scheduler_->arm(period, core::TimerMode::Repeating, [this] { onPollTimer(); });
  }

  void SensorsBase::close() {
    if (timer_ == core::Scheduler::kNoTimer)
      return;
    scheduler_->cancel(timer_);
    timer_ = core::Scheduler::kNoTimer;
  }

  bool SensorsBase::isPolling() const {
    return timer_ != core::Scheduler::kNoTimer && scheduler_->isArmed(timer_);
  }

  void SensorsBase::sendReadingsMessage(std::vector<core::SensorReading> readings) const {
    publish(core::ReadingsMessage{ topic(), "data", std::move(readings) });
  }

  void SensorsBase::onPollTimer() {
    try {
      requestReadings();
    } catch (const std::exception& e) {
      publishError(e.what());
    }
  }

} // namespace labcomm::devices
