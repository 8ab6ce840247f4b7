#pragma once

#include <string_view>

namespace deadsimple::http {

inline constexpr std::string_view HTTPVersionPrefix = "HTTP/";

inline constexpr std::string_view ContentType = "Content-Type";

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Fixed status lines written by the server.
inline constexpr std::string_view StatusLineOK = "HTTP/1.1 200 OK";
inline constexpr std::string_view InternalServerErrorResponse = "HTTP/1.1 500 INTERNAL SERVER ERROR\r\n\r\n";
inline constexpr std::string_view NotFoundResponse = "HTTP/1.1 404 NOT FOUND\r\n\r\n";

// Literal GET pattern looked up when no route matches a request.
inline constexpr std::string_view NotFoundPattern = "404";

}  // namespace deadsimple::http
