#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "deadsimple/base-fd.hpp"
#include "deadsimple/platform.hpp"

namespace deadsimple {

// An accepted, blocking TCP connection. Exclusively owned by the thread serving it and closed on destruction.
class Connection {
 public:
  Connection() noexcept = default;

  explicit Connection(BaseFd baseFd);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Peer address as "ip:port", empty if unknown.
  [[nodiscard]] std::string_view peer() const noexcept { return _peer; }

  // Read at most len bytes into data. Blocks until some data is available.
  // Returns the number of bytes read, 0 if the peer closed its side, -1 on error.
  [[nodiscard]] int64_t recvSome(char* data, std::size_t len) const noexcept;

  // Write all of data, looping over partial writes.
  // Returns false if the connection broke before everything was written.
  [[nodiscard]] bool sendAll(std::string_view data) const noexcept;

  // Signal end of response to the peer, then close.
  void close() noexcept;

 private:
  BaseFd _baseFd;
  std::string _peer;
};

}  // namespace deadsimple
