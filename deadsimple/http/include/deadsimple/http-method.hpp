#pragma once

#include <cstdint>
#include <string_view>

namespace deadsimple::http {

enum class Method : uint8_t { GET, POST, PUT, PATCH, DELETE, HEAD, OPTIONS, TRACE };

inline constexpr Method kAllMethods[] = {Method::GET,    Method::POST, Method::PUT,     Method::PATCH,
                                         Method::DELETE, Method::HEAD, Method::OPTIONS, Method::TRACE};

constexpr std::string_view MethodToStr(Method method) {
  switch (method) {
    case Method::GET:
      return "GET";
    case Method::POST:
      return "POST";
    case Method::PUT:
      return "PUT";
    case Method::PATCH:
      return "PATCH";
    case Method::DELETE:
      return "DELETE";
    case Method::HEAD:
      return "HEAD";
    case Method::OPTIONS:
      return "OPTIONS";
    case Method::TRACE:
      return "TRACE";
  }
  return "GET";
}

}  // namespace deadsimple::http
