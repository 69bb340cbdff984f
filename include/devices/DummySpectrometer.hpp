#pragma once
/** @file  DummySpectrometer.hpp
 *  @brief Mock spectrometer following the OPUS state machine.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

#include "core/Scheduler.hpp"
#include "devices/SpectrometerBase.hpp"

namespace labcomm::core {
  class Logger;
}

namespace labcomm::devices {

  /**
 * @class DummySpectrometer
 * @brief Idle → Connecting → Connected → Measuring → Finishing / Cancelling →
 *        Connected, with the error codes the OPUS manual gives for commands
 *        issued in the wrong state.
 *
 *  * A measurement ends by itself after `measureDuration` seconds (single-shot
 *    scheduler timer) or by "stop".
 *  * Every successful command publishes the resulting status.
 */
  class DummySpectrometer : public SpectrometerBase {
  public:
    DummySpectrometer(std::shared_ptr<core::MessageChannel> channel,
                      std::shared_ptr<core::Scheduler> scheduler,
                      std::shared_ptr<core::Logger> logger, double measureDuration = 1.0);
    ~DummySpectrometer() override;

    void requestCommand(const std::string& command) override;
    void close() override;

    core::SpectrometerStatus status() const { return state_; }

  private:
    void transition(core::SpectrometerStatus next);
    void finishMeasurement();
    void cancelMeasureTimer();
    void onMeasureTimer();

    std::shared_ptr<core::Scheduler> scheduler_;
    std::shared_ptr<core::Logger> logger_;
    std::chrono::milliseconds measureDuration_;
    core::SpectrometerStatus state_{ core::SpectrometerStatus::Idle };
    core::Scheduler::Handle measureTimer_{ core::Scheduler::kNoTimer };
  };

} // namespace labcomm::devices
