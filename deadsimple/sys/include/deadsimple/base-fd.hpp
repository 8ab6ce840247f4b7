#pragma once

#include "deadsimple/platform.hpp"

namespace deadsimple {

// Exclusive owner of a file descriptor (listening socket, accepted connection), closed on destruction.
// Ownership moves with the object, so a descriptor handed to a connection thread is closed exactly once.
class BaseFd {
 public:
  static constexpr NativeHandle kClosedFd = kInvalidHandle;

  explicit BaseFd(NativeHandle fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  // Returns true if the underlying fd is valid (not closed).
  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  [[nodiscard]] NativeHandle release() noexcept;

  // Close the descriptor now. It is never closed twice, even if close fails or is interrupted.
  // Returns false if the system reported an error (logged), true otherwise, including when already closed.
  bool close() noexcept;

 private:
  NativeHandle _fd;
};

}  // namespace deadsimple
