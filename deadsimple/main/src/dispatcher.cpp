#include "deadsimple/dispatcher.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "deadsimple/connection.hpp"
#include "deadsimple/http-constants.hpp"
#include "deadsimple/http-method.hpp"
#include "deadsimple/log.hpp"
#include "deadsimple/request-context.hpp"
#include "deadsimple/request-parser.hpp"
#include "deadsimple/response.hpp"
#include "deadsimple/router.hpp"

namespace deadsimple {

namespace {

void SendInternalServerError(const Connection& connection) noexcept {
  if (!connection.sendAll(http::InternalServerErrorResponse)) {
    log::debug("Error response to {} was not fully written", connection.peer());
  }
}

}  // namespace

void Dispatcher::serve(Connection connection) const {
  try {
    const std::string raw = ReadRequestBytes(connection, _readChunkBytes);
    const std::optional<ParsedRequest> request = ParseRequest(raw);
    if (request) {
      dispatch(*request, connection);
    } else {
      log::debug("Malformed request of {} bytes from {}", raw.size(), connection.peer());
      SendInternalServerError(connection);
    }
  } catch (const std::exception& ex) {
    // dispatch() only throws before writing
    log::error("Unable to serve request from {}: {}", connection.peer(), ex.what());
    SendInternalServerError(connection);
  } catch (...) {
    log::error("Unable to serve request from {}: unknown exception", connection.peer());
    SendInternalServerError(connection);
  }
  connection.close();
}

void Dispatcher::dispatch(const ParsedRequest& request, const Connection& connection) const {
  log::debug("{} {} from {}", http::MethodToStr(request.method), request.target, connection.peer());

  Router::RoutingResult routingResult = _router.match(request.method, request.path);
  if (!routingResult) {
    routingResult = _router.match(http::Method::GET, http::NotFoundPattern);
  }
  if (!routingResult) {
    if (!connection.sendAll(http::NotFoundResponse)) {
      log::debug("Not found response to {} was not fully written", connection.peer());
    }
    return;
  }

  RequestContext ctx{std::move(routingResult.params), request.args, std::string(request.body), connection};
  // WriteResponse only throws while encoding, before anything is written
  try {
    WriteResponse(connection, (*routingResult.pHandler)(ctx));
  } catch (const std::exception& ex) {
    log::error("Handler for {} {} failed: {}", http::MethodToStr(request.method), request.path, ex.what());
    SendInternalServerError(connection);
  } catch (...) {
    log::error("Handler for {} {} failed with an unknown exception", http::MethodToStr(request.method),
               request.path);
    SendInternalServerError(connection);
  }
}

}  // namespace deadsimple
