#pragma once
/** @file  FTSW500.hpp
 *  @brief ABB spectrometer driven through the FTSW500 program's line protocol over TCP.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/Scheduler.hpp"
#include "devices/SpectrometerBase.hpp"

namespace labcomm::core {
  class Logger;
}

namespace labcomm::io {
  class TcpChannel;
}

namespace labcomm::devices {

  /** NAK from FTSW500, a reply that does not parse, or a dead connection. */
  class FTSW500Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// "ACK" -> "", "ACK&arg" -> "arg". Throws FTSW500Error with the message
  /// of a "NAK&msg", or for anything else.
  std::string parseFtswResponse(const std::string& response);

  /**
 * @class FTSW500
 * @brief Sends one `\n`-terminated action per request and reads one
 *        `\n`-terminated ACK/NAK line back.
 *
 *  * The generic command names map to FTSW500 button actions (`actionFor`);
 *    unknown names go through unchanged.
 *  * Status is polled with a single-shot timer that is re-armed after every
 *    update. Only changes are published. A failed poll is published as an
 *    error and stops the polling.
 *  * After each command, dialog messages FTSW500 shows are logged and closed.
 */
  class FTSW500 : public SpectrometerBase {
  public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{ 1000 };
    static constexpr std::chrono::milliseconds kDefaultTimeout{ 5000 };
    static constexpr std::size_t kMaxResponse = 1024;

    /// @p transport must be connected. Queries the initial status, so this
    /// throws FTSW500Error if FTSW500 does not answer.
    FTSW500(std::shared_ptr<core::MessageChannel> channel,
            std::shared_ptr<core::Scheduler> scheduler, std::unique_ptr<io::TcpChannel> transport,
            std::shared_ptr<core::Logger> logger,
            std::chrono::milliseconds pollInterval = kDefaultPollInterval,
            std::chrono::milliseconds timeout = kDefaultTimeout);
    ~FTSW500() override;

    /// Throws FTSW500Error if the action is refused or the link fails.
    void requestCommand(const std::string& command) override;
    void close() override;

    core::SpectrometerStatus status() const { return status_; }

    static std::string actionFor(const std::string& command);

  private:
    std::string makeRequest(const std::string& action);
    std::optional<core::SpectrometerStatus> queryStatus();
    void updateStatus();
    void armStatusTimer();
    void onStatusTimer();
    void logDialog(const char* isOpenQuery, const char* lastMessageQuery,
                   const char* closeAction);

    std::shared_ptr<core::Scheduler> scheduler_;
    std::unique_ptr<io::TcpChannel> transport_;
    std::shared_ptr<core::Logger> logger_;
    std::chrono::milliseconds pollInterval_;
    std::chrono::milliseconds timeout_;
    core::SpectrometerStatus status_{ core::SpectrometerStatus::Undefined };
    core::Scheduler::Handle statusTimer_{ core::Scheduler::kNoTimer };
  };

} // namespace labcomm::devices
