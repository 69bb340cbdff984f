/* @file FTSW500.cpp
 * @brief FTSW500 ACK/NAK line protocol, action names and status polling
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <map>
#include <stdexcept>

// labcomm headers
#include "core/Logger.hpp"
#include "devices/FTSW500.hpp"
#include "io/TcpChannel.hpp"

namespace labcomm::devices {

  namespace {
    constexpr const char* kComponent = "FTSW500";
    constexpr const char* kStateQuery = "getFTSW500State";

    const std::map<std::string, std::string> kActions{
      { spectrometer_commands::Connect, "clickConnectButton" },
      { spectrometer_commands::Start, "clickStartAcquisitionButton" },
      { spectrometer_commands::Cancel, "clickStopAcquisitionButton" },
      { spectrometer_commands::Stop, "clickStopAcquisitionButton" },
    };
  } // namespace

  using core::SpectrometerStatus;

  std::string parseFtswResponse(const std::string& response) {
    const auto amp = response.find('&');
    const std::string tag = response.substr(0, amp);
    const std::string args = amp == std::string::npos ? std::string() : response.substr(amp + 1);

    if (tag == "ACK")
      return args;
    if (tag == "NAK")
      throw FTSW500Error(args);
    throw FTSW500Error("Unexpected response: " + response);
  }

  FTSW500::FTSW500(std::shared_ptr<core::MessageChannel> channel,
                   std::shared_ptr<core::Scheduler> scheduler,
                   std::unique_ptr<io::TcpChannel> transport, std::shared_ptr<core::Logger> logger,
                   std::chrono::milliseconds pollInterval, std::chrono::milliseconds timeout)
      : SpectrometerBase(std::move(channel)), scheduler_(std::move(scheduler)),
        transport_(std::move(transport)), logger_(std::move(logger)), pollInterval_(pollInterval),
        timeout_(timeout) {
    if (!scheduler_)
      throw std::invalid_argument("[FTSW500] scheduler is nullptr");
    if (!transport_)
      throw std::invalid_argument("[FTSW500] transport is nullptr");
    if (pollInterval_.count() <= 0)
      throw std::invalid_argument("[FTSW500] polling interval must be positive");
    assert(logger_ && "[FTSW500] logger is nullptr");

    updateStatus();
  }

  FTSW500::~FTSW500() { FTSW500::close(); }

  std::string FTSW500::actionFor(const std::string& command) {
    const auto it = kActions.find(command);
    return it == kActions.end() ? command : it->second;
  }

  void FTSW500::requestCommand(const std::string& command) {
    if (command == spectrometer_commands::Status) {
      updateStatus();
      sendStatusMessage(status_);
      return;
    }

    makeRequest(actionFor(command));

    // the command may have changed the state; don't wait for the next poll
    updateStatus();

    logDialog("isNonModalMessageDisplayed", "getLastNonModalMessageDisplayed",
              "closeNonModalDialogMessage");
    logDialog("isModalMessageDisplayed", "getLastModalMessageDisplayed",
              "closeModalDialogMessage");
  }

  void FTSW500::close() {
    if (statusTimer_ != core::Scheduler::kNoTimer) {
      scheduler_->cancel(statusTimer_);
      statusTimer_ = core::Scheduler::kNoTimer;
    }

    if (transport_ && transport_->isOpen()) {
      try {
        logDialog("isNonModalMessageDisplayed", "getLastNonModalMessageDisplayed",
                  "closeNonModalDialogMessage");
      } catch (const FTSW500Error& e) {
        logger_->warn(kComponent, std::string("could not read dialog on close: ") + e.what());
      }
      transport_->close();
    }
  }

  std::string FTSW500::makeRequest(const std::string& action) {
    transport_->discardInput();
    if (!transport_->write(action + "\n"))
      throw FTSW500Error("Failed to send " + action);

    const auto response = transport_->readUntil('\n', kMaxResponse, timeout_);
    if (!response) {
      if (!transport_->isOpen())
        throw FTSW500Error("Connection terminated unexpectedly");
      throw FTSW500Error("No response to " + action);
    }
    if (!response->ends_with('\n'))
      throw FTSW500Error("Response not terminated with newline");

    return parseFtswResponse(response->substr(0, response->size() - 1));
  }

  // -------------------------------------------------------------------
  // FTSW500::queryStatus
  // 0 disconnected, 1 connecting, 2 acquiring, 3 acquiring + saving;
  // -1 is a short-lived intermediate state, reported as nullopt.
  // -------------------------------------------------------------------
  std::optional<SpectrometerStatus> FTSW500::queryStatus() {
    const std::string value = makeRequest(kStateQuery);

    int state = 0;
    try {
      std::size_t used = 0;
      state = std::stoi(value, &used);
      if (used != value.size())
        throw std::invalid_argument(value);
    } catch (const std::logic_error&) {
      throw FTSW500Error("Invalid value received for status: " + value);
    }

    if (state == -1)
      return std::nullopt;
    if (state < 0 || state > 3)
      throw FTSW500Error("Invalid value received for status: " + value);
    return static_cast<SpectrometerStatus>(state);
  }

  void FTSW500::updateStatus() {
    const auto next = queryStatus();
    if (next && *next != status_) {
      status_ = *next;
      logger_->debug(kComponent, std::string("Current state: ") + core::toString(status_));
      sendStatusMessage(status_);
    }
    armStatusTimer();
  }

  void FTSW500::armStatusTimer() {
    if (statusTimer_ != core::Scheduler::kNoTimer)
      scheduler_->cancel(statusTimer_);
    statusTimer_ = scheduler_->arm(pollInterval_, core::TimerMode::SingleShot,
                                   [this] { onStatusTimer(); });
  }

  void FTSW500::onStatusTimer() {
    // single-shot: the scheduler has already dropped it
    statusTimer_ = core::Scheduler::kNoTimer;
    try {
      updateStatus();
    } catch (const FTSW500Error& e) {
      logger_->error(kComponent, e.what());
      publishError(e.what());
    }
  }

  void FTSW500::logDialog(const char* isOpenQuery, const char* lastMessageQuery,
                          const char* closeAction) {
    if (makeRequest(isOpenQuery) != "true")
      return;
    logger_->info(kComponent, "FTSW500: " + makeRequest(lastMessageQuery));
    makeRequest(closeAction);
  }

} // namespace labcomm::devices
