#pragma once
/** @file  SpectrometerBase.hpp
 *  @brief Base class for acquisition instruments driven by named commands.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

#include "devices/Device.hpp"

namespace labcomm::devices {

  inline constexpr const char* kSpectrometerTopic = "device.spectrometer";
  inline constexpr const char* kSpectrometerDescription = "Spectrometer";

  namespace spectrometer_commands {
    inline constexpr const char* Connect = "connect";
    inline constexpr const char* Start = "start";
    inline constexpr const char* Cancel = "cancel";
    inline constexpr const char* Stop = "stop";
    inline constexpr const char* Status = "status";
  } // namespace spectrometer_commands

  /**
 * @class SpectrometerError
 * @brief Error code + text reported by the instrument. Passed to the caller
 *        as-is; never retried here.
 */
  class SpectrometerError : public std::runtime_error {
  public:
    SpectrometerError(int code, std::string text);

    int code() const noexcept { return code_; }
    const std::string& text() const noexcept { return text_; }

  private:
    int code_;
    std::string text_;
  };

  class SpectrometerBase : public Device {
  public:
    explicit SpectrometerBase(std::shared_ptr<core::MessageChannel> channel);

    void connect() { requestCommand(spectrometer_commands::Connect); }
    void startMeasuring() { requestCommand(spectrometer_commands::Start); }
    void stopMeasuring() { requestCommand(spectrometer_commands::Cancel); }

    /// Send @p command to the backend. Throws the backend's error on refusal
    /// (SpectrometerError, FTSW500Error).
    virtual void requestCommand(const std::string& command) = 0;

  protected:
    void sendStatusMessage(core::SpectrometerStatus status) const;
  };

} // namespace labcomm::devices
