/* @file DummyTemperatureController.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "devices/DummyTemperatureController.hpp"

namespace labcomm::devices {

  DummyTemperatureController::DummyTemperatureController(
      std::shared_ptr<core::MessageChannel> channel, const std::string& name,
      const core::NoiseParameters& temperatureParams, const core::NoiseParameters& powerParams,
      int alarmStatus, double initialSetPoint)
      : TemperatureController(std::move(channel), name), temperatureNoise_(temperatureParams),
        powerNoise_(powerParams), alarmStatus_(alarmStatus), setPoint_(initialSetPoint) {}

  // truncated toward zero, not rounded
  int DummyTemperatureController::power() { return static_cast<int>(powerNoise_()); }

} // namespace labcomm::devices
