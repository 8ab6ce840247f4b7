#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "deadsimple/base-fd.hpp"
#include "deadsimple/connection.hpp"
#include "deadsimple/platform.hpp"

namespace deadsimple {

// Simple RAII class wrapping a blocking IPv4 stream socket.
class Socket {
 public:
  Socket() noexcept = default;

  // Construct a new IPv4 stream socket.
  // Throws std::system_error on failure.
  explicit Socket(int protocol);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to address:port and start listening. If port is 0, an ephemeral port is chosen and written back
  // into the argument.
  // Throws std::invalid_argument if address cannot be resolved, std::system_error on socket failures.
  void bindAndListen(std::string_view address, bool reusePort, uint16_t& port);

  // Connect to address:port (blocking).
  // Throws std::invalid_argument if address cannot be resolved, std::system_error on failure.
  void connect(std::string_view address, uint16_t port);

  // Wait at most timeout for a pending connection and accept it.
  // Returns an empty Connection if none arrived in time or if accept failed transiently.
  // Throws std::system_error on unrecoverable poll failures.
  [[nodiscard]] Connection accept(std::chrono::milliseconds timeout) const;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace deadsimple
