#pragma once
/** @file  Device.hpp
 *  @brief Abstract base class for every driver.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

#include "core/Messages.hpp"

namespace labcomm::core {
  class MessageChannel;
}

namespace labcomm::devices {

  /**
 * @class Device
 * @brief Common polymorphic interface that every concrete driver
 *        (TC4820, EM27 sensors, spectrometers) implements.
 *
 *  * Owns its transport/timer; releases them in `close()`.
 *  * Reports to the outside world only through the message channel it was
 *    given at construction, under its topic.
 *  * Not thread-safe: callers serialize calls on one instance.
 */
  class Device {
  public:
    Device(std::shared_ptr<core::MessageChannel> channel, std::string topic);
    virtual ~Device() = default;

    /// Release the transport / timer. Safe to call more than once.
    virtual void close() = 0;

    const std::string& topic() const { return topic_; }

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

  protected:
    void publish(const core::Message& msg) const;
    void publishError(const std::string& message) const;

    std::shared_ptr<core::MessageChannel> channel_;

  private:
    std::string topic_;
  };

} // namespace labcomm::devices
