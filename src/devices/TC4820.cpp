/* @file TC4820.cpp
 * @brief TC4820 request/response with bounded retry
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <cmath>
#include <stdexcept>

// labcomm headers
#include "core/Logger.hpp"
#include "devices/TC4820.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/Command.hpp"
#include "protocols/FrameCodec.hpp"

namespace labcomm::devices {

  namespace {
    constexpr const char* kComponent = "TC4820";
  }

  TC4820::TC4820(std::shared_ptr<core::MessageChannel> channel, const std::string& name,
                 std::unique_ptr<io::SerialChannel> serial, std::shared_ptr<core::Logger> logger,
                 int maxAttempts, std::chrono::milliseconds readTimeout)
      : TemperatureController(std::move(channel), name), serial_(std::move(serial)),
        logger_(std::move(logger)), maxAttempts_(maxAttempts), readTimeout_(readTimeout) {
    if (maxAttempts_ < 1)
      throw std::invalid_argument("max_attempts must be at least 1");
    if (!serial_)
      throw std::invalid_argument("[TC4820] serial channel is nullptr");
    assert(logger_ && "[TC4820] logger is nullptr");
  }

  TC4820::~TC4820() { close(); }

  void TC4820::write(const std::string& commandHex) {
    if (!serial_->write(protocols::Command{ commandHex }.toWire()))
      throw io::SerialError("[TC4820] failed to write to serial device");
  }

  int TC4820::read() {
    auto frame =
        serial_->readUntil(protocols::kReadTerminator, protocols::kFrameSize, readTimeout_);
    if (!frame)
      throw io::SerialError("[TC4820] no response from serial device");

    return protocols::decodeFrame(*frame);
  }

  int TC4820::requestInt(const std::string& command) {
    for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
      // leftovers of a noisy or late reply must not be read as this answer
      serial_->discardInput();
      write(command);
      try {
        return read();
      } catch (const protocols::MalformedFrame& e) {
        logger_->warn(kComponent, std::string("Malformed message: ") + e.what() + "; retrying");
      }
    }

    throw io::SerialError("Maximum number of attempts (=" + std::to_string(maxAttempts_) +
                          ") exceeded");
  }

  double TC4820::requestDecimal(const std::string& command) {
    return protocols::toDecimal(requestInt(command));
  }

  double TC4820::temperature() { return requestDecimal(protocols::commands::Temperature.code); }

  int TC4820::power() { return requestInt(protocols::commands::Power.code); }

  int TC4820::alarmStatus() { return requestInt(protocols::commands::AlarmStatus.code); }

  double TC4820::setPoint() { return requestDecimal(protocols::commands::SetPoint.code); }

  void TC4820::setSetPoint(double temperature) {
    if (!std::isfinite(temperature))
      throw std::out_of_range("Temperature provided is out of range");

    // std::nearbyint rounds half to even under the default rounding mode
    const double scaled = std::nearbyint(temperature * 10.0);
    if (scaled < 0.0 || scaled > 0xFFFF)
      throw std::out_of_range("Temperature provided is out of range");

    const int val = static_cast<int>(scaled);
    const int echoed = requestInt(protocols::commands::setPoint(val).code);
    if (echoed != val) {
      logger_->warn(kComponent,
                    "The set point returned by the device differs from the one requested (" +
                        std::to_string(echoed) + " != " + std::to_string(val) + ")");
    }
  }

  double TC4820::powerPercent() { return power() * 100.0 / kMaxPower; }

  void TC4820::close() {
    if (serial_)
      serial_->close();
  }

} // namespace labcomm::devices
