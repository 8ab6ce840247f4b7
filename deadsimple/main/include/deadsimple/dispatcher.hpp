#pragma once

#include <cstddef>

#include "deadsimple/connection.hpp"
#include "deadsimple/request-parser.hpp"
#include "deadsimple/router.hpp"

namespace deadsimple {

// Serves one connection: reads and parses its request, resolves the handler, invokes it and writes its response.
//
// Resolution: the route of (method, path) if any, else the GET route of the literal "404" pattern if any,
// else the bare 404 response is written and no handler runs.
// Each connection is dispatched to at most one handler, exactly once, without timeout.
//
// A Dispatcher is shared by all connection threads once serving has started: its router must not be modified
// from that point.
class Dispatcher {
 public:
  explicit Dispatcher(std::size_t readChunkBytes) noexcept : _readChunkBytes(readChunkBytes) {}

  [[nodiscard]] Router& router() noexcept { return _router; }
  [[nodiscard]] const Router& router() const noexcept { return _router; }

  // Full pipeline for one accepted connection, which is closed on return.
  // Unparsable requests are answered with the fixed 500 response without dispatch, as are failures while reading
  // or resolving the request. Nothing thrown escapes.
  void serve(Connection connection) const;

  // Resolve and run the handler of an already parsed request, writing the response on connection.
  // Any exception thrown by the handler is logged and answered with the fixed 500 response.
  void dispatch(const ParsedRequest& request, const Connection& connection) const;

 private:
  Router _router;
  std::size_t _readChunkBytes;
};

}  // namespace deadsimple
