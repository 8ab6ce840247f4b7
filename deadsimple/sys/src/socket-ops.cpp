#include "deadsimple/socket-ops.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <format>
#include <string>

namespace deadsimple {

int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

int64_t SafeRecv(NativeHandle fd, void* data, std::size_t len) noexcept {
  while (true) {
    const auto nbRead = ::recv(fd, data, len, 0);
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(nbRead);
  }
}

bool SetReuseOptions(NativeHandle fd, bool reusePort) noexcept {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    return false;
  }
  return !reusePort || ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) == 0;
}

std::string PeerAddressString(NativeHandle fd) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return {};
  }
  char ipBuf[INET6_ADDRSTRLEN]{};
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
    ::inet_ntop(AF_INET, &in->sin_addr, ipBuf, sizeof(ipBuf));
    return std::format("{}:{}", ipBuf, ntohs(in->sin_port));
  }
  if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, ipBuf, sizeof(ipBuf));
    return std::format("[{}]:{}", ipBuf, ntohs(in6->sin6_port));
  }
  return {};
}

uint16_t LocalPort(NativeHandle fd) noexcept {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

}  // namespace deadsimple
