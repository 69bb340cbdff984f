/* @file Device.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <cassert>

#include "core/MessageChannel.hpp"
#include "devices/Device.hpp"

namespace labcomm::devices {

  Device::Device(std::shared_ptr<core::MessageChannel> channel, std::string topic)
      : channel_(std::move(channel)), topic_(std::move(topic)) {
    assert(channel_ && "[Device] message channel is nullptr");
  }

  void Device::publish(const core::Message& msg) const { channel_->publish(msg); }

  void Device::publishError(const std::string& message) const {
    channel_->publish(core::ErrorMessage{ topic_, message });
  }

} // namespace labcomm::devices
