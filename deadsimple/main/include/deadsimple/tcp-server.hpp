#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "deadsimple/dispatcher.hpp"
#include "deadsimple/router.hpp"
#include "deadsimple/socket.hpp"
#include "deadsimple/web-service-config.hpp"

namespace deadsimple {

// Accept loop handing each connection to the dispatcher on its own detached thread.
//
// Threading model:
//  - run() blocks the calling thread and never waits for connections being served.
//  - Each accepted connection is read, dispatched and answered on a dedicated thread. There is no limit on the
//    number of connections in flight.
//  - Connection threads co-own the dispatcher, so they may outlive the TcpServer.
//  - Routes must be registered before run() is called.
class TcpServer {
 public:
  // Throws std::invalid_argument if config is invalid.
  explicit TcpServer(WebServiceConfig config);

  TcpServer(const TcpServer&) = delete;
  TcpServer(TcpServer&&) = delete;
  TcpServer& operator=(const TcpServer&) = delete;
  TcpServer& operator=(TcpServer&&) = delete;

  ~TcpServer() = default;

  [[nodiscard]] Router& router() noexcept { return _dispatcher->router(); }

  [[nodiscard]] const WebServiceConfig& config() const noexcept { return _config; }

  // Bind and listen on the configured address if not done yet, and return the effective port.
  // Throws std::system_error or std::invalid_argument if the address cannot be bound.
  uint16_t bind();

  // Port the server is bound to, 0 if not bound yet and an ephemeral port was requested.
  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  // Bind if needed, optionally open the server URL in a browser (best effort), then accept connections until
  // stop() is called or a termination signal is received (see SignalHandler). The listening socket is closed on
  // return, connections in flight keep being served.
  void run(bool autoOpen);

  // Request run() to return. Observed within one poll interval. Safe to call from any thread.
  // A stopped server cannot be run again.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

 private:
  WebServiceConfig _config;
  std::shared_ptr<Dispatcher> _dispatcher;
  Socket _listener;
  std::atomic<bool> _stopRequested{false};
};

}  // namespace deadsimple
