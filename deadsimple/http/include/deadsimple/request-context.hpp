#pragma once

#include <string>
#include <unordered_map>

#include "deadsimple/connection.hpp"
#include "deadsimple/query-args.hpp"

namespace deadsimple {

// Values bound to the wildcard segments of the matched pattern, keyed by wildcard name.
using PathParams = std::unordered_map<std::string, std::string>;

// Untyped per-dispatch request data, built by the Dispatcher and handed to route handlers.
// The connection reference is only valid for the duration of the handler call.
struct RequestContext {
  PathParams params;
  QueryArgs args;
  std::string body;
  const Connection& connection;
};

}  // namespace deadsimple
