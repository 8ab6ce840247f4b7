#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace deadsimple {

struct WebServiceConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // Host name or IPv4 address to bind.
  std::string bindAddress{"127.0.0.1"};

  // TCP port to bind. 0 lets the OS pick an ephemeral free port, retrievable after binding via WebService::port().
  uint16_t port{8000};

  // If true, enables SO_REUSEPORT so that several processes can bind the same port. Disabled by default.
  bool reusePort{false};

  // ============================
  // Request reading
  // ============================
  // Size of the chunks read from a connection. A read returning less than this is taken as the end of the request,
  // so a request whose size is an exact multiple of it waits for the client to send more or close its side.
  std::size_t readChunkBytes{2048};

  // ===========================================
  // Accept loop responsiveness
  // ===========================================
  // Maximum duration the accept loop blocks waiting for a new connection before checking for stop requests
  // (stop() call or SIGINT/SIGTERM when SignalHandler is enabled).
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Build a config from a "host:port" string, e.g. "127.0.0.1:8000".
  // Throws std::invalid_argument if the port part is missing or invalid.
  static WebServiceConfig FromAddress(std::string_view address);

  WebServiceConfig& withBindAddress(std::string_view address);

  WebServiceConfig& withPort(uint16_t port);

  WebServiceConfig& withReusePort(bool on = true);

  WebServiceConfig& withReadChunkBytes(std::size_t readChunkBytes);

  WebServiceConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  // Throws std::invalid_argument if the configuration is unusable.
  void validate() const;

  // "http://host:port" for the configured address.
  [[nodiscard]] std::string url() const;

  bool operator==(const WebServiceConfig&) const noexcept = default;
};

}  // namespace deadsimple
