#include "deadsimple/response.hpp"

#include <string>
#include <string_view>
#include <variant>

#include "deadsimple/connection.hpp"
#include "deadsimple/http-constants.hpp"
#include "deadsimple/log.hpp"

namespace deadsimple {

WebError Response::error() const noexcept {
  const auto* pError = std::get_if<WebError>(&_payload);
  return pError == nullptr ? WebError::InternalServerError : *pError;
}

std::string_view Response::payload() const noexcept {
  const auto* pStr = std::get_if<std::string>(&_payload);
  return pStr == nullptr ? std::string_view{} : std::string_view(*pStr);
}

std::string_view Response::ContentTypeOf(Kind kind) noexcept {
  switch (kind) {
    case Kind::Html:
      return "text/html";
    case Kind::Xml:
      return "text/xml";
    case Kind::Svg:
      return "image/svg+xml";
    case Kind::Js:
      return "application/javascript";
    case Kind::Json:
      return "application/json";
    case Kind::Text:
      return "text/plain";
    case Kind::Css:
      return "text/css";
    case Kind::Png:
      return "image/png";
    case Kind::Jpg:
      return "image/jpeg";
    case Kind::Gif:
      return "image/gif";
    case Kind::Webp:
      return "image/webp";
    default:
      return {};
  }
}

std::string EncodeResponse(const Response& response) {
  const std::string_view contentType = response.contentType();
  if (contentType.empty()) {
    return std::string(http::InternalServerErrorResponse);
  }

  const std::string_view payload = response.payload();

  std::string out;
  out.reserve(http::StatusLineOK.size() + http::ContentType.size() + contentType.size() + 8U + payload.size());
  out.append(http::StatusLineOK);
  out.append(http::CRLF);
  out.append(http::ContentType);
  out.append(": ");
  out.append(contentType);
  out.append(http::DoubleCRLF);
  out.append(payload);
  return out;
}

void WriteResponse(const Connection& connection, const Response& response) {
  if (response.isError()) {
    log::debug("Handler answered error {} on fd # {}", static_cast<int>(response.error()), connection.fd());
  }
  if (!connection.sendAll(EncodeResponse(response))) {
    log::debug("Response to {} was not fully written", connection.peer());
  }
}

}  // namespace deadsimple
