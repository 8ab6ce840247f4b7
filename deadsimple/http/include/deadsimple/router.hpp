#pragma once

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "deadsimple/http-method.hpp"
#include "deadsimple/request-context.hpp"
#include "deadsimple/response.hpp"
#include "deadsimple/vector.hpp"

namespace deadsimple {

// Per-method ordered table of (pattern, handler) routes.
//
// A pattern is a '/' separated sequence of segments. A segment starting with '{' and ending with '}' is a
// wildcard matching any single path segment, binding it to the name between the braces. Other segments must be
// equal byte for byte. Examples:
//  - "/user/{id}/post/{pid}" matches "/user/42/post/7" with id=42 and pid=7
//  - "/a/" does not match "/a" (segment counts differ)
//  - "404" is an ordinary literal pattern, conventionally registered as the not-found page
//
// Patterns are not validated: a malformed pattern simply never matches or matches literally.
class Router {
 public:
  using Handler = std::function<Response(RequestContext&)>;

  struct Route {
    std::string pattern;
    Handler handler;
  };

  struct RoutingResult {
    explicit operator bool() const noexcept { return pHandler != nullptr; }

    // Points into the Router, valid as long as no route is registered nor cleared.
    const Handler* pHandler{nullptr};
    PathParams params;
  };

  Router() = default;

  // Append a route to the bucket of method. Routes of a method are tried in registration order.
  void setPath(http::Method method, std::string_view pattern, Handler handler);

  // Find the first route of method whose pattern is compatible with path, ignoring any query string in path.
  // The wildcard values of the winning pattern are extracted in the result params.
  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

  // Routes registered for method, in registration order.
  [[nodiscard]] std::span<const Route> routes(http::Method method) const noexcept;

  // Remove all routes of all methods.
  void clear() noexcept { _buckets.clear(); }

  // Tells whether pattern and path have the same number of segments, and each pattern segment is a wildcard or
  // equal to the path segment at the same position.
  [[nodiscard]] static bool IsCompatible(std::string_view pattern, std::string_view path);

  // Bind each wildcard name of pattern to the path segment at the same position.
  // Extra segments of the longest of both are ignored. Later duplicate names overwrite earlier ones.
  [[nodiscard]] static PathParams Extract(std::string_view pattern, std::string_view path);

 private:
  std::unordered_map<http::Method, vector<Route>> _buckets;
};

}  // namespace deadsimple
