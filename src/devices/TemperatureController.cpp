/* @file TemperatureController.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>
#include <stdexcept>

#include "devices/TemperatureController.hpp"

namespace labcomm::devices {

  namespace {
    std::string checkedTopic(const std::string& name) {
      const bool valid = std::any_of(kControllerNames.begin(), kControllerNames.end(),
                                     [&](const char* n) { return name == n; });
      if (!valid)
        throw std::invalid_argument("Invalid name given for temperature controller: " + name);
      return "device.temperature_controller." + name;
    }
  } // namespace

  TemperatureController::TemperatureController(std::shared_ptr<core::MessageChannel> channel,
                                               const std::string& name)
      : Device(std::move(channel), checkedTopic(name)), name_(name) {}

  core::TemperatureProperties TemperatureController::getProperties() {
    core::TemperatureProperties props;
    props.temperature = temperature();
    props.power = power();
    props.alarmStatus = alarmStatus();
    props.setPoint = setPoint();
    return props;
  }

  void TemperatureController::requestProperties() {
    try {
      publish(core::PropertiesMessage{ topic(), getProperties() });
    } catch (const std::exception& e) {
      publishError(e.what());
    }
  }

  void TemperatureController::changeSetPoint(double temperature) {
    try {
      setSetPoint(temperature);
    } catch (const std::exception& e) {
      publishError(e.what());
    }
  }

} // namespace labcomm::devices
