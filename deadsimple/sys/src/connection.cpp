#include "deadsimple/connection.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <utility>

#include "deadsimple/base-fd.hpp"
#include "deadsimple/log.hpp"
#include "deadsimple/socket-ops.hpp"

namespace deadsimple {

Connection::Connection(BaseFd baseFd) : _baseFd(std::move(baseFd)), _peer(PeerAddressString(_baseFd.fd())) {}

int64_t Connection::recvSome(char* data, std::size_t len) const noexcept { return SafeRecv(fd(), data, len); }

bool Connection::sendAll(std::string_view data) const noexcept {
  while (!data.empty()) {
    const auto sent = SafeSend(fd(), data);
    if (sent == -1) {
      if (errno == EINTR) {
        continue;
      }
      log::debug("send on fd # {} ({}) failed: {}", fd(), _peer, std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

void Connection::close() noexcept {
  if (_baseFd) {
    if (!ShutdownWrite(_baseFd.fd())) {
      // the peer may already be gone
      log::debug("shutdown on fd # {} ({}) failed: {}", fd(), _peer, std::strerror(errno));
    }
    _baseFd.close();
  }
}

}  // namespace deadsimple
