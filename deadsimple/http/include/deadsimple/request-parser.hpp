#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "deadsimple/connection.hpp"
#include "deadsimple/http-method.hpp"
#include "deadsimple/query-args.hpp"
#include "deadsimple/vector.hpp"

namespace deadsimple {

struct HeaderView {
  std::string_view name;
  std::string_view value;
};

// Result of parsing the raw bytes of one request.
// All views point into the buffer given to ParseRequest, which must outlive this object.
struct ParsedRequest {
  http::Method method{http::Method::GET};

  // Request target as received, path and query string.
  std::string_view target;

  // The target without its query string.
  std::string_view path;

  QueryArgs args;

  // Header lines in order of appearance. Not forwarded to handlers.
  vector<HeaderView> headers;

  // Bytes following the first blank line, verbatim.
  std::string_view body;
};

// Read the bytes of one request from connection.
// Reads chunks of chunkSize bytes until one read returns fewer bytes than chunkSize, which is taken as the end
// of the request. Content-Length is not considered: a request whose size is an exact multiple of chunkSize keeps
// waiting for more data until the peer sends some or closes its side. A read error ends the loop and returns
// what was accumulated so far.
[[nodiscard]] std::string ReadRequestBytes(const Connection& connection, std::size_t chunkSize);

// Parse a request made of a request line, header lines and an optional body.
// Returns std::nullopt if the request line has no method, target or HTTP version, if a header line is malformed,
// or if there is no header line at all.
// Unknown method tokens are accepted and mapped to GET.
[[nodiscard]] std::optional<ParsedRequest> ParseRequest(std::string_view raw);

}  // namespace deadsimple
