#pragma once
/** @file  SensorsBase.hpp
 *  @brief Base class for sensor devices that are polled on a timer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <limits>
#include <memory>
#include <vector>

#include "core/Scheduler.hpp"
#include "devices/Device.hpp"

namespace labcomm::devices {

  inline constexpr const char* kSensorsTopic = "device.sensors";
  inline constexpr const char* kSensorsDescription = "Sensor devices";

  /**
 * @class SensorsBase
 * @brief Polls `requestReadings()` every `pollInterval` seconds; concrete
 *        variants answer (now or later) with `sendReadingsMessage()`.
 *
 *  * NaN interval: no timer is ever armed; the owner triggers one-shot reads
 *    by calling `requestReadings()` itself.
 *  * The timer is armed from the constructor but only fires from the
 *    scheduler's loop, so construct on the loop thread.
 *  * Derived classes must call `close()` from their destructor.
 */
  class SensorsBase : public Device {
  public:
    static constexpr double kNoPolling = std::numeric_limits<double>::quiet_NaN();

    SensorsBase(std::shared_ptr<core::MessageChannel> channel,
                std::shared_ptr<core::Scheduler> scheduler, double pollInterval = kNoPolling,
                bool startPolling = true);
    ~SensorsBase() override;

    /// Arm the repeating timer. No-op for a NaN interval or if already armed.
    void startPolling();

    /// Ask the device for fresh readings. Must not block for long.
    virtual void requestReadings() = 0;

    /// Stop the timer. No requestReadings() from the timer after this returns.
    void close() override;

    double pollInterval() const { return pollInterval_; }
    bool isPolling() const;

  protected:
    /// Publish a ReadingsMessage tagged "data".
    void sendReadingsMessage(std::vector<core::SensorReading> readings) const;

  private:
    void onPollTimer();

    std::shared_ptr<core::Scheduler> scheduler_;
    double pollInterval_;
    core::Scheduler::Handle timer_{ core::Scheduler::kNoTimer };
  };

} // namespace labcomm::devices
