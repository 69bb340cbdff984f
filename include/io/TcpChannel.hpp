#pragma once
/** @file  TcpChannel.hpp
 *  @brief Client TCP socket with the same buffered read/write API as the serial port.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include "io/StreamChannel.hpp"

namespace labcomm {
  namespace io {

    /**
 * @class TcpChannel
 * @brief RAII wrapper around one connected IPv4 stream socket.
 *
 *  * `connect()` takes a dotted-quad address; no name resolution.
 *  * Writes never raise SIGPIPE; a vanished peer shows up as a failed write
 *    or a std::nullopt read.
 */
    class TcpChannel : public StreamChannel {
    public:
      TcpChannel() : StreamChannel("TcpChannel") {}

      /// Returns false (and logs) if the address is invalid, the peer refuses,
      /// or @p timeout passes first.
      virtual bool connect(const std::string& host, std::uint16_t port,
                           std::chrono::milliseconds timeout);

    protected:
      ssize_t writeSome(const char* data, std::size_t len) override;
    };

  } // namespace io
} // namespace labcomm
