/* @file TcpChannel.cpp
 * @brief non-blocking connect with timeout; reads and buffering live in StreamChannel
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <iostream>

// Linux headers
#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

// labcomm headers
#include "io/TcpChannel.hpp"

using namespace labcomm::io;

bool TcpChannel::connect(const std::string& host, std::uint16_t port,
                         std::chrono::milliseconds timeout) {
  close();

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    std::cerr << "[TcpChannel] invalid IPv4 address: " << host << "\n";
    return false;
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    logErrno("socket");
    return false;
  }
  adopt(fd);

  if (::connect(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0)
    return true;
  if (errno != EINPROGRESS) {
    logErrno("connect");
    close();
    return false;
  }

  // wait for the handshake, then ask the socket how it went
  pollfd pfd{ fd_, POLLOUT, 0 };
  int rc;
  do {
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (rc == -1 && errno == EINTR);

  if (rc == 0) {
    std::cerr << "[TcpChannel] connect to " << host << ":" << port << " timed out\n";
    close();
    return false;
  }
  if (rc < 0) {
    logErrno("poll");
    close();
    return false;
  }

  int soError = 0;
  socklen_t len = sizeof(soError);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soError, &len) != 0) {
    logErrno("getsockopt");
    close();
    return false;
  }
  if (soError != 0) {
    errno = soError;
    logErrno("connect");
    close();
    return false;
  }
  return true;
}

ssize_t TcpChannel::writeSome(const char* data, std::size_t len) {
  return ::send(fd_, data, len, MSG_NOSIGNAL);
}
