/* @file SpectrometerBase.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "devices/SpectrometerBase.hpp"

namespace labcomm::devices {

  SpectrometerError::SpectrometerError(int code, std::string text)
      : std::runtime_error("Error " + std::to_string(code) + ": " + text), code_(code),
        text_(std::move(text)) {}

  SpectrometerBase::SpectrometerBase(std::shared_ptr<core::MessageChannel> channel)
      : Device(std::move(channel), kSpectrometerTopic) {}

  void SpectrometerBase::sendStatusMessage(core::SpectrometerStatus status) const {
    publish(core::StatusMessage{ topic(), status });
  }

} // namespace labcomm::devices
