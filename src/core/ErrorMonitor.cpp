/* @file ErrorMonitor.cpp
 * @brief log + publish + escalate-once
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>

// labcomm headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/MessageChannel.hpp"

namespace labcomm {
  namespace core {

    ErrorMonitor::ErrorMonitor(std::shared_ptr<MessageChannel> channel,
                               std::shared_ptr<Logger> logger)
        : channel_(std::move(channel)), logger_(std::move(logger)) {
      assert(channel_ && "[ErrorMonitor] message channel is nullptr");
      assert(logger_ && "[ErrorMonitor] logger is nullptr");
    }

    void ErrorMonitor::registerEscalation(
        std::function<void(const std::string&, const std::string&)> cb) {
      std::lock_guard lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& topic, const std::string& message) {
      logger_->error(topic, message);
      channel_->publish(ErrorMessage{ topic, message });

      std::function<void(const std::string&, const std::string&)> escalate;
      {
        std::lock_guard lock(mtx_);
        if (!markSeen(topic + '\n' + message))
          return;
        escalate = escalation_;
      }
      if (escalate)
        escalate(topic, message);
    }

    void ErrorMonitor::reset() {
      std::lock_guard lock(mtx_);
      seen_.clear();
    }

    bool ErrorMonitor::markSeen(const std::string& key) {
      if (std::find(seen_.begin(), seen_.end(), key) != seen_.end())
        return false;
      seen_.push_back(key);
      return true;
    }

  } // namespace core
} // namespace labcomm
