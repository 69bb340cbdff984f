#pragma once
/** @file  DummyTemperatureController.hpp
 *  @brief Hardware-free temperature controller producing seeded noise.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/NoiseProducer.hpp"
#include "devices/TemperatureController.hpp"

namespace labcomm::devices {

  class DummyTemperatureController : public TemperatureController {
  public:
    DummyTemperatureController(std::shared_ptr<core::MessageChannel> channel,
                               const std::string& name,
                               const core::NoiseParameters& temperatureParams = { 35.0, 0.1, 42 },
                               const core::NoiseParameters& powerParams = { 40.0, 2.0, 42 },
                               int alarmStatus = 0, double initialSetPoint = 70.0);

    double temperature() override { return temperatureNoise_(); }
    int power() override;
    int alarmStatus() override { return alarmStatus_; }
    double setPoint() override { return setPoint_; }
    void setSetPoint(double temperature) override { setPoint_ = temperature; }

    void close() override {}

  private:
    core::NoiseProducer temperatureNoise_;
    core::NoiseProducer powerNoise_;
    int alarmStatus_;
    double setPoint_;
  };

} // namespace labcomm::devices
