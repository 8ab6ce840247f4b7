#include "deadsimple/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "deadsimple/log.hpp"

namespace deadsimple {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

bool BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return true;
  }
  const NativeHandle fd = std::exchange(_fd, kClosedFd);
  // On Linux the descriptor is released even when close is interrupted: it must not be closed again, as the number
  // may already be reused by another connection thread.
  if (::close(fd) != 0 && errno != EINTR) {
    log::error("close fd # {} failed: {}", fd, std::strerror(errno));
    return false;
  }
  log::debug("fd # {} closed", fd);
  return true;
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace deadsimple
