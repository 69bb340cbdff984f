#pragma once
/** @file  StreamChannel.hpp
 *  @brief Buffered, poll-driven byte I/O over one non-blocking file descriptor.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

// Linux header
#include <sys/types.h> // ssize_t

namespace labcomm {
  namespace io {

    /**
 * @class StreamChannel
 * @brief Owns a non-blocking fd; subclasses decide how it gets opened
 *        (tty device, TCP socket).
 *
 *  * Bytes received past a terminator stay buffered for the next read.
 *  * *Non-copyable*; a move leaves the source closed.
 */
    class StreamChannel {

    public:
      virtual ~StreamChannel(); // close the fd at destruction

      //---public API-------------------------------------------
      virtual bool write(const std::string& bytes); // returns false on EIO

      /**
       * Read until @p terminator (inclusive) or until @p maxBytes have arrived.
       *
       * @returns the bytes read, possibly short if the timeout hits after some
       *          data arrived; std::nullopt if nothing arrived, on disconnect,
       *          or on error.
       */
      virtual std::optional<std::string> readUntil(char terminator, std::size_t maxBytes,
                                                   std::chrono::milliseconds timeout);

      /// Drop everything received but not yet read, buffered or still queued
      /// in the kernel.
      virtual void discardInput();

      virtual void close();
      virtual bool isOpen() const { return fd_ >= 0; }

      //---non-copyable-----------------------------------------
      StreamChannel(const StreamChannel&) = delete;
      StreamChannel& operator=(const StreamChannel&) = delete;

      //---mv and mv assign-------------------------------------
      StreamChannel(StreamChannel&& other) noexcept;
      StreamChannel& operator=(StreamChannel&& other) noexcept;

    protected:
      /// @param component  prefix for the error lines written to std::cerr
      explicit StreamChannel(const char* component) : component_(component) {}

      /// Take ownership of an open fd, closing the previous one.
      void adopt(int fd);
      void logErrno(const char* call) const;

      /// One write(2)-like call; sockets override it to avoid SIGPIPE.
      virtual ssize_t writeSome(const char* data, std::size_t len);

      int fd_{ -1 }; ///< POSIX fd (-1==closed)

    private:
      std::optional<std::string> takeFrame(char terminator, std::size_t maxBytes);
      void release() noexcept;

      const char* component_;
      std::string rx_buffer_{}; ///< bytes read but not yet handed out
    };

  } // namespace io
} // namespace labcomm
