#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include "deadsimple/http-method.hpp"
#include "deadsimple/request-context.hpp"
#include "deadsimple/request.hpp"
#include "deadsimple/response.hpp"
#include "deadsimple/router.hpp"
#include "deadsimple/shared-state.hpp"
#include "deadsimple/tcp-server.hpp"
#include "deadsimple/web-service-config.hpp"

namespace deadsimple {

// Embeddable web service whose handlers all share one value of type T.
//
// Usage:
//   WebService<std::vector<Message>>("127.0.0.1:8000", {})
//       .registerRoute("/chat", http::Method::POST, Chat)
//       .registerRoute("/history", http::Method::GET, History)
//       .registerRoute("404", http::Method::GET, [](const auto&) { return Response::Html("404 :("); })
//       .listen(false);
//
// Handlers run concurrently, one thread per connection. The shared value is only reachable through
// Request<T>::sharedState, which serializes its users.
template <class T>
class WebService {
 public:
  using Handler = std::function<Response(const Request<T>&)>;

  // Service bound to a "host:port" address.
  // Throws std::invalid_argument if address is invalid.
  WebService(std::string_view address, T initialState)
      : WebService(WebServiceConfig::FromAddress(address), std::move(initialState)) {}

  // Throws std::invalid_argument if config is invalid.
  WebService(WebServiceConfig config, T initialState)
      : _sharedState(std::make_shared<SharedState<T>>(std::move(initialState))), _server(std::move(config)) {}

  // Register handler for requests of method whose path matches pattern. Patterns of a method are tried in
  // registration order. See Router for the pattern syntax.
  WebService& registerRoute(std::string_view pattern, http::Method method, Handler handler) {
    _server.router().setPath(
        method, pattern, [sharedState = _sharedState, handler = std::move(handler)](RequestContext& ctx) {
          return handler(Request<T>{sharedState, std::move(ctx.params), std::move(ctx.args), std::move(ctx.body),
                                    ctx.connection});
        });
    return *this;
  }

  // Bind now and return the effective port. Optional, listen() binds if needed.
  uint16_t bind() { return _server.bind(); }

  // Bind, optionally open the service URL in the desktop browser (failure ignored), and serve connections until
  // stop() is called or a termination signal is received.
  void listen(bool autoOpen) { _server.run(autoOpen); }

  // Make listen() return. Safe to call from any thread.
  void stop() noexcept { _server.stop(); }

  [[nodiscard]] uint16_t port() const noexcept { return _server.port(); }

  [[nodiscard]] const WebServiceConfig& config() const noexcept { return _server.config(); }

  [[nodiscard]] const std::shared_ptr<SharedState<T>>& sharedState() const noexcept { return _sharedState; }

  [[nodiscard]] Router& router() noexcept { return _server.router(); }

 private:
  std::shared_ptr<SharedState<T>> _sharedState;
  TcpServer _server;
};

}  // namespace deadsimple
