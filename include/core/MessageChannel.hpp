#pragma once
/** @file  MessageChannel.hpp
 *  @brief Typed fan-out channel from devices to whoever is listening.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

#include "core/Messages.hpp"

namespace labcomm::core {

  /**
 * @class MessageChannel
 * @brief Devices `publish()`, the presentation layer `subscribe()`s.
 *
 * * Thread-safe; subscribers run on the publishing thread, outside the lock,
 *   so a subscriber may (un)subscribe or publish again.
 * * Passed explicitly to every device at construction.
 */
  class MessageChannel {
  public:
    using Subscriber = std::function<void(const Message&)>;
    using Token = std::size_t;

    MessageChannel() = default;
    virtual ~MessageChannel() = default;

    Token subscribe(Subscriber fn);
    void unsubscribe(Token token);

    virtual void publish(const Message& msg) const;

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

  private:
    mutable std::mutex mtx_;
    std::map<Token, Subscriber> subscribers_;
    Token next_{ 1 };
  };

} // namespace labcomm::core
