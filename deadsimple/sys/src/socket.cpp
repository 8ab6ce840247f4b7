#include "deadsimple/socket.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "deadsimple/base-fd.hpp"
#include "deadsimple/connection.hpp"
#include "deadsimple/errno-throw.hpp"
#include "deadsimple/log.hpp"
#include "deadsimple/socket-ops.hpp"

namespace deadsimple {

namespace {

sockaddr_in Resolve(std::string_view address, uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* result = nullptr;
  const std::string host(address);
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (rc != 0 || result == nullptr) {
    throw std::invalid_argument(std::format("Unable to resolve address '{}': {}", address, ::gai_strerror(rc)));
  }

  sockaddr_in addr{};
  std::memcpy(&addr, result->ai_addr, sizeof(addr));
  ::freeaddrinfo(result);

  addr.sin_port = htons(port);
  return addr;
}

}  // namespace

Socket::Socket(int protocol) : _baseFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, protocol)) {
  if (_baseFd.fd() == kInvalidHandle) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view address, bool reusePort, uint16_t& port) {
  const sockaddr_in addr = Resolve(address, port);

  if (!SetReuseOptions(fd(), reusePort)) {
    throw_errno("setsockopt reuse options failed on fd # {}", fd());
  }
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed for {}:{}", address, port);
  }
  if (::listen(fd(), SOMAXCONN) != 0) {
    throw_errno("listen failed for {}:{}", address, port);
  }
  if (port == 0) {
    port = LocalPort(fd());
    if (port == 0) {
      throw_errno("getsockname failed on fd # {}", fd());
    }
  }
}

void Socket::connect(std::string_view address, uint16_t port) {
  const sockaddr_in addr = Resolve(address, port);
  if (::connect(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("connect failed for {}:{}", address, port);
  }
}

Connection Socket::accept(std::chrono::milliseconds timeout) const {
  pollfd pfd{fd(), POLLIN, 0};
  const int nbReady = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (nbReady == -1) {
    if (errno == EINTR) {
      return {};
    }
    throw_errno("poll failed on listening fd # {}", fd());
  }
  if (nbReady == 0) {
    return {};
  }

  BaseFd clientFd(::accept4(fd(), nullptr, nullptr, SOCK_CLOEXEC));
  if (!clientFd) {
    // Transient failures (aborted handshakes, fd exhaustion) must not stop the accept loop
    log::warn("accept failed on fd # {}: {}", fd(), std::strerror(errno));
    return {};
  }
  return Connection(std::move(clientFd));
}

}  // namespace deadsimple
