#pragma once
/** @file  TC4820.hpp
 *  @brief Driver for TC4820 temperature controllers (checksummed serial protocol).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>

#include "devices/TemperatureController.hpp"

namespace labcomm::core {
  class Logger;
}
namespace labcomm::io {
  class SerialChannel;
}

namespace labcomm::devices {

  /**
 * @class TC4820
 * @brief Write-then-read exchanges with bounded retry over one serial channel.
 *
 *  Two kinds of failure come out of here:
 *  * protocols::MalformedFrame: a corrupted reply; `requestInt()` absorbs
 *    these by sending the command again, up to `maxAttempts()` times.
 *  * io::SerialError: the port failed, the device said nothing, or the
 *    attempts ran out. Not recoverable here.
 *
 *  Every attempt starts by discarding pending input, so the tail of a noisy
 *  or late reply is never decoded as the answer to the next command.
 *
 *  Callers must serialize calls; one request in flight per instance.
 */
  class TC4820 : public TemperatureController {
  public:
    static constexpr int kDefaultMaxAttempts = 3;
    static constexpr int kMaxPower = 511; ///< raw power reading at 100 %
    static constexpr std::chrono::milliseconds kDefaultReadTimeout{ 1000 };

    /// Throws std::invalid_argument if @p maxAttempts < 1 or @p serial is null.
    TC4820(std::shared_ptr<core::MessageChannel> channel, const std::string& name,
           std::unique_ptr<io::SerialChannel> serial, std::shared_ptr<core::Logger> logger,
           int maxAttempts = kDefaultMaxAttempts,
           std::chrono::milliseconds readTimeout = kDefaultReadTimeout);
    ~TC4820() override;

    //---wire level-------------------------------------------------------
    /// Frame @p commandHex with a `\r` terminator and send it.
    void write(const std::string& commandHex);
    /// Read one `^`-terminated frame and decode it.
    int read();
    int requestInt(const std::string& command);
    double requestDecimal(const std::string& command);

    //---properties-------------------------------------------------------
    double temperature() override;
    int power() override;
    int alarmStatus() override;
    double setPoint() override;

    /**
     * Round to tenths and send. Throws std::out_of_range (nothing sent) if the
     * value does not fit in 0..0xFFFF tenths. A differing echo is only logged.
     */
    void setSetPoint(double temperature) override;

    /// Power as a percentage of kMaxPower.
    double powerPercent();

    void close() override;

    int maxAttempts() const { return maxAttempts_; }

  private:
    std::unique_ptr<io::SerialChannel> serial_;
    std::shared_ptr<core::Logger> logger_;
    int maxAttempts_;
    std::chrono::milliseconds readTimeout_;
  };

} // namespace labcomm::devices
