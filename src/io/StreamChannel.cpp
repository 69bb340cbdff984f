/* @file StreamChannel.cpp
 * @brief fd ownership, write loop and buffered terminator reads shared by the serial and TCP channels
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// labcomm headers
#include "io/StreamChannel.hpp"

using namespace labcomm::io;

StreamChannel::~StreamChannel() { release(); }

StreamChannel::StreamChannel(StreamChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), component_(other.component_),
      rx_buffer_(std::move(other.rx_buffer_)) {
  other.rx_buffer_.clear();
}

StreamChannel& StreamChannel::operator=(StreamChannel&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = std::exchange(other.fd_, -1);
    component_ = other.component_;
    rx_buffer_ = std::move(other.rx_buffer_);
    other.rx_buffer_.clear();
  }
  return *this;
}

void StreamChannel::adopt(int fd) {
  release();
  fd_ = fd;
}

void StreamChannel::logErrno(const char* call) const {
  const int err = errno; // the stream may clobber it
  std::cerr << "[" << component_ << "] " << call << " failed: " << strerror(err) << " (" << err
            << ")\n";
}

ssize_t StreamChannel::writeSome(const char* data, std::size_t len) {
  return ::write(fd_, data, len);
}

bool StreamChannel::write(const std::string& bytes) {

  if (fd_ < 0) {
    return false;
  }

  std::size_t total = 0;
  while (total < bytes.size()) {
    ssize_t written = writeSome(bytes.data() + total, bytes.size() - total);
    if (written > 0) {
      total += written;
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      ::poll(&pfd, 1, 10);
      continue;
    } else {
      logErrno("write");
      return false;
    }
  }

  return true;
}

// -------------------------------------------------------------------
// StreamChannel::takeFrame
// Pops bytes up to and including the terminator, or maxBytes if no
// terminator shows up first. Leaves the rest in rx_buffer_.
// -------------------------------------------------------------------
std::optional<std::string> StreamChannel::takeFrame(char terminator, std::size_t maxBytes) {
  const auto limit = std::min(rx_buffer_.size(), maxBytes);
  const auto pos = rx_buffer_.find(terminator);

  std::size_t len = 0;
  if (pos != std::string::npos && pos < limit) {
    len = pos + 1;
  } else if (rx_buffer_.size() >= maxBytes) {
    len = maxBytes;
  } else {
    return std::nullopt;
  }

  std::string frame = rx_buffer_.substr(0, len);
  rx_buffer_.erase(0, len);
  return frame;
}

std::optional<std::string> StreamChannel::readUntil(char terminator, std::size_t maxBytes,
                                                    std::chrono::milliseconds timeout) {
  if (fd_ < 0 || maxBytes == 0)
    return std::nullopt;

  if (auto frame = takeFrame(terminator, maxBytes))
    return frame;

  char temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (std::chrono::steady_clock::now() < deadline) {

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());

    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      logErrno("poll");
      return std::nullopt;
    }
    if (rc == 0)
      break;

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.append(temp, n);
      } else if (n == 0) { // EOF / peer gone
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      } else {
        logErrno("read");
        return std::nullopt;
      }

      if (auto frame = takeFrame(terminator, maxBytes))
        return frame;
    } else if (pfd.revents & (POLLHUP | POLLERR)) {
      close();
      return std::nullopt;
    }
  }

  // timeout: hand back a short read so the caller can see it was truncated
  if (rx_buffer_.empty())
    return std::nullopt;
  std::string partial;
  partial.swap(rx_buffer_);
  return partial;
}

void StreamChannel::discardInput() {
  rx_buffer_.clear();
  if (fd_ < 0)
    return;

  // fd is non-blocking: read until the kernel queue is empty
  char temp[256];
  for (;;) {
    const ssize_t n = ::read(fd_, temp, sizeof(temp));
    if (n > 0)
      continue;
    if (n == -1 && errno == EINTR)
      continue;
    if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK)
      logErrno("read");
    break; // empty, EOF (seen by the next read) or error
  }
}

void StreamChannel::close() { release(); }

void StreamChannel::release() noexcept {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
}
