#include "deadsimple/tcp-server.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "deadsimple/browser-open.hpp"
#include "deadsimple/connection.hpp"
#include "deadsimple/dispatcher.hpp"
#include "deadsimple/log.hpp"
#include "deadsimple/signal-handler.hpp"
#include "deadsimple/socket.hpp"
#include "deadsimple/web-service-config.hpp"

namespace deadsimple {

TcpServer::TcpServer(WebServiceConfig config)
    : _config(std::move(config)), _dispatcher(std::make_shared<Dispatcher>(_config.readChunkBytes)) {
  _config.validate();
}

uint16_t TcpServer::bind() {
  if (!_listener) {
    Socket listener(0);
    listener.bindAndListen(_config.bindAddress, _config.reusePort, _config.port);
    _listener = std::move(listener);
    log::debug("Listening socket fd # {} bound to {}", _listener.fd(), _config.url());
  }
  return _config.port;
}

void TcpServer::run(bool autoOpen) {
  bind();

  const std::string url = _config.url();
  if (autoOpen && !OpenInBrowser(url)) {
    log::debug("Could not open {} in a browser", url);
  }

  log::info("Listening on {}", url);

  while (!_stopRequested.load(std::memory_order_relaxed) && !SignalHandler::IsStopRequested()) {
    Connection connection = _listener.accept(_config.pollInterval);
    if (!connection) {
      continue;
    }
    log::debug("Connection fd # {} accepted from {}", connection.fd(), connection.peer());
    try {
      std::thread([dispatcher = _dispatcher, connection = std::move(connection)]() mutable {
        dispatcher->serve(std::move(connection));
      }).detach();
    } catch (const std::system_error& ex) {
      log::error("Unable to start a thread for a new connection: {}", ex.what());
    }
  }

  if (SignalHandler::IsStopRequested()) {
    log::warn("Signal {} received, stopping the accept loop", SignalHandler::ReceivedSignal());
  }
  log::info("Stopped listening on {}", url);
  _listener.close();
}

}  // namespace deadsimple
