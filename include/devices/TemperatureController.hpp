#pragma once
/** @file  TemperatureController.hpp
 *  @brief Base class for black-body temperature controllers (real or dummy).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <string>

#include "devices/Device.hpp"

namespace labcomm::devices {

  /// Instance names a controller may take, and their long forms.
  inline constexpr std::array<const char*, 2> kControllerNames{ "hot_bb", "cold_bb" };
  inline constexpr std::array<const char*, 2> kControllerLongNames{ "hot black body",
                                                                    "cold black body" };

  inline constexpr const char* kTemperatureControllerDescription = "Temperature controller";

  class TemperatureController : public Device {
  public:
    /// Throws std::invalid_argument unless @p name is one of kControllerNames.
    TemperatureController(std::shared_ptr<core::MessageChannel> channel, const std::string& name);

    const std::string& name() const { return name_; }

    virtual double temperature() = 0;
    virtual int power() = 0;
    virtual int alarmStatus() = 0; ///< 0 = no error
    virtual double setPoint() = 0;
    virtual void setSetPoint(double temperature) = 0;

    core::TemperatureProperties getProperties();

    /// Publish a PropertiesMessage, or an ErrorMessage if the device fails.
    void requestProperties();

    /// setSetPoint(); failures are published as an ErrorMessage.
    void changeSetPoint(double temperature);

  private:
    std::string name_;
  };

} // namespace labcomm::devices
