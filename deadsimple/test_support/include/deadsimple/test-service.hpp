#pragma once

#include <chrono>
#include <cstdint>
#include <thread>
#include <utility>

#include "deadsimple/web-service-config.hpp"
#include "deadsimple/web-service.hpp"

namespace deadsimple::test {

// Lightweight RAII harness running a WebService<T> on a background thread.
//  * binds immediately to an ephemeral loopback port
//  * routes must be registered through service() before start()
//  * stops and joins on destruction
//
// Usage pattern:
//   TestService<int> ts(0);
//   ts.service().registerRoute("/x", http::Method::GET, handler);
//   ts.start();
//   auto raw = sendAndCollect(ts.port(), buildRequest("GET", "/x"));
template <class T>
class TestService {
 public:
  explicit TestService(T initialState, WebServiceConfig config = DefaultConfig())
      : _service(std::move(config), std::move(initialState)) {
    _service.bind();
  }

  TestService(const TestService&) = delete;
  TestService(TestService&&) = delete;
  TestService& operator=(const TestService&) = delete;
  TestService& operator=(TestService&&) = delete;

  ~TestService() { stop(); }

  [[nodiscard]] WebService<T>& service() noexcept { return _service; }

  [[nodiscard]] uint16_t port() const noexcept { return _service.port(); }

  // Start accepting connections. The listening socket is already bound, so clients may connect right away.
  void start() {
    _thread = std::jthread([this] { _service.listen(false); });
  }

  // Cooperative stop; safe to call multiple times.
  void stop() {
    _service.stop();
    if (_thread.joinable()) {
      _thread.join();
    }
  }

  static WebServiceConfig DefaultConfig() {
    WebServiceConfig config;
    config.withPort(0).withPollInterval(std::chrono::milliseconds{5});
    return config;
  }

 private:
  WebService<T> _service;
  std::jthread _thread;
};

}  // namespace deadsimple::test
