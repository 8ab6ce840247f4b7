#include "deadsimple/router.hpp"

#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "deadsimple/http-method.hpp"
#include "deadsimple/request-context.hpp"

namespace deadsimple {

namespace {

bool IsWildcard(std::string_view segment) {
  return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

// Iterates over the '/' separated segments of a path, including empty ones.
// "/a/b" gives "", "a", "b" and "/" gives "", "".
class SegmentIterator {
 public:
  explicit SegmentIterator(std::string_view str) noexcept : _remaining(str) {}

  // Store the next segment in segment and return true, or return false if there is none left.
  bool next(std::string_view& segment) noexcept {
    if (_done) {
      return false;
    }
    const auto slashPos = _remaining.find('/');
    segment = _remaining.substr(0, slashPos);
    if (slashPos == std::string_view::npos) {
      _done = true;
    } else {
      _remaining.remove_prefix(slashPos + 1);
    }
    return true;
  }

 private:
  std::string_view _remaining;
  bool _done{false};
};

std::string_view StripQuery(std::string_view path) { return path.substr(0, path.find('?')); }

}  // namespace

void Router::setPath(http::Method method, std::string_view pattern, Handler handler) {
  _buckets[method].push_back(Route{std::string(pattern), std::move(handler)});
}

Router::RoutingResult Router::match(http::Method method, std::string_view path) const {
  RoutingResult result;
  path = StripQuery(path);
  for (const Route& route : routes(method)) {
    if (IsCompatible(route.pattern, path)) {
      result.pHandler = &route.handler;
      result.params = Extract(route.pattern, path);
      break;
    }
  }
  return result;
}

std::span<const Router::Route> Router::routes(http::Method method) const noexcept {
  const auto it = _buckets.find(method);
  if (it == _buckets.end()) {
    return {};
  }
  return {it->second.data(), it->second.size()};
}

bool Router::IsCompatible(std::string_view pattern, std::string_view path) {
  SegmentIterator patternIt(pattern);
  SegmentIterator pathIt(path);
  std::string_view patternSegment;
  std::string_view pathSegment;
  while (true) {
    const bool hasPatternSegment = patternIt.next(patternSegment);
    const bool hasPathSegment = pathIt.next(pathSegment);
    if (hasPatternSegment != hasPathSegment) {
      return false;
    }
    if (!hasPatternSegment) {
      return true;
    }
    if (patternSegment != pathSegment && !IsWildcard(patternSegment)) {
      return false;
    }
  }
}

PathParams Router::Extract(std::string_view pattern, std::string_view path) {
  PathParams params;
  SegmentIterator patternIt(pattern);
  SegmentIterator pathIt(path);
  std::string_view patternSegment;
  std::string_view pathSegment;
  while (patternIt.next(patternSegment) && pathIt.next(pathSegment)) {
    if (IsWildcard(patternSegment)) {
      params.insert_or_assign(std::string(patternSegment.substr(1, patternSegment.size() - 2)),
                              std::string(pathSegment));
    }
  }
  return params;
}

}  // namespace deadsimple
