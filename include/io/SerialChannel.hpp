#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART byte I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>
#include <vector>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

#include "io/StreamChannel.hpp"

namespace labcomm {
  namespace io {

    /**
 * @class SerialError
 * @brief Fatal transport failure: the port is gone, the device is silent, or a
 *        request ran out of attempts. Not recovered locally.
 */
    class SerialError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Raw 8N1 byte stream; framing is the caller's business.
 *  * Reads and buffering come from StreamChannel.
 */
    class SerialChannel : public StreamChannel {

    public:
      SerialChannel() : StreamChannel("SerialChannel") {}

      virtual bool open(const std::string& dev, speed_t baud);

      /// tcflush(TCIFLUSH) plus the local buffer.
      void discardInput() override;
    };

    /// Map a numeric baud rate (e.g. 115200) to its termios constant.
    /// Throws std::invalid_argument for rates termios does not know.
    speed_t toSpeed(int baudrate);

    /// USB serial ports currently present (/dev/ttyUSB*, /dev/ttyACM*), sorted.
    std::vector<std::string> listSerialPorts();

  } // namespace io
} // namespace labcomm
