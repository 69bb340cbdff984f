#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace labcomm::core {

  class Logger;
  class MessageChannel;

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; every failure is logged and
 *        published as an ErrorMessage, and the registered escalation callback
 *        runs exactly once per unique (topic, message).
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate escalations so a failing poll doesn't spam the owner.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor(std::shared_ptr<MessageChannel> channel, std::shared_ptr<Logger> logger);
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the application layer.
    void registerEscalation(std::function<void(const std::string& topic, const std::string& message)> cb);

    /// Called by subsystems on fault.
    virtual void notifyFailure(const std::string& topic, const std::string& message);

    /// Forget seen failures so they escalate again.
    void reset();

  private:
    bool markSeen(const std::string& key);

    std::shared_ptr<MessageChannel> channel_;
    std::shared_ptr<Logger> logger_;
    std::function<void(const std::string&, const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace labcomm::core
