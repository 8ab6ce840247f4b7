#pragma once

#include <memory>
#include <string>

#include "deadsimple/connection.hpp"
#include "deadsimple/query-args.hpp"
#include "deadsimple/request-context.hpp"
#include "deadsimple/shared-state.hpp"

namespace deadsimple {

// Request given to application handlers of a WebService<T>.
//  - sharedState: handle on the single application state, only accessible through its lock
//  - params: values of the wildcard segments of the matched pattern
//  - args: query arguments
//  - body: request body bytes, verbatim
//  - connection: the client connection, valid only during the handler call
template <class T>
struct Request {
  std::shared_ptr<SharedState<T>> sharedState;
  PathParams params;
  QueryArgs args;
  std::string body;
  const Connection& connection;
};

}  // namespace deadsimple
