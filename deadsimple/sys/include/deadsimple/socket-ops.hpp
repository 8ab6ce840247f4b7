#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "deadsimple/platform.hpp"

namespace deadsimple {

// Thin wrappers centralising socket system calls so that higher-level modules (http, main)
// never include platform networking headers directly.

// Send data on a connected socket without raising SIGPIPE if the peer is gone.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(NativeHandle fd, std::string_view data) noexcept {
  return SafeSend(fd, data.data(), data.size());
}

// Receive at most len bytes, retrying on EINTR.
// Returns the number of bytes read (0 on orderly shutdown), or -1 on error (errno is set).
int64_t SafeRecv(NativeHandle fd, void* data, std::size_t len) noexcept;

// Enable SO_REUSEADDR (and SO_REUSEPORT if reusePort is true) on a listening socket.
// Returns true on success.
bool SetReuseOptions(NativeHandle fd, bool reusePort) noexcept;

// Return the remote peer address of fd as "ip:port", or an empty string if it cannot be determined.
std::string PeerAddressString(NativeHandle fd);

// Return the local port bound to fd, or 0 on failure.
uint16_t LocalPort(NativeHandle fd) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(NativeHandle fd) noexcept;

}  // namespace deadsimple
