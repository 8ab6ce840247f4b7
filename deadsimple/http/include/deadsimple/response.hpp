#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "deadsimple/connection.hpp"
#include "deadsimple/json-serializer.hpp"

namespace deadsimple {

// Error kinds a handler can answer with. The value is the conventional HTTP status code,
// but the encoder always answers errors with a generic 500.
enum class WebError : uint16_t { BadRequest = 400, NotFound = 404, InternalServerError = 500 };

// Typed result of a handler, consumed once by the encoder.
// Text kinds carry a string, image kinds carry raw bytes, Error carries a WebError only.
class Response {
 public:
  enum class Kind : uint8_t { Html, Xml, Svg, Js, Json, Text, Css, Png, Jpg, Gif, Webp, Error };

  static Response Html(std::string html) { return {Kind::Html, std::move(html)}; }
  static Response Xml(std::string xml) { return {Kind::Xml, std::move(xml)}; }
  static Response Svg(std::string svg) { return {Kind::Svg, std::move(svg)}; }
  static Response Js(std::string script) { return {Kind::Js, std::move(script)}; }
  static Response Text(std::string text) { return {Kind::Text, std::move(text)}; }
  static Response Css(std::string css) { return {Kind::Css, std::move(css)}; }

  // JSON response from any value glaze can serialize.
  template <class T>
  static Response Json(const T& value) {
    return {Kind::Json, SerializeToJson(value)};
  }

  // JSON response from already serialized JSON text, sent as is.
  static Response JsonText(std::string json) { return {Kind::Json, std::move(json)}; }

  static Response Png(std::string bytes) { return {Kind::Png, std::move(bytes)}; }
  static Response Jpg(std::string bytes) { return {Kind::Jpg, std::move(bytes)}; }
  static Response Gif(std::string bytes) { return {Kind::Gif, std::move(bytes)}; }
  static Response Webp(std::string bytes) { return {Kind::Webp, std::move(bytes)}; }

  static Response Png(std::span<const std::byte> bytes) { return {Kind::Png, ToChars(bytes)}; }
  static Response Jpg(std::span<const std::byte> bytes) { return {Kind::Jpg, ToChars(bytes)}; }
  static Response Gif(std::span<const std::byte> bytes) { return {Kind::Gif, ToChars(bytes)}; }
  static Response Webp(std::span<const std::byte> bytes) { return {Kind::Webp, ToChars(bytes)}; }

  static Response Error(WebError error) { return Response(error); }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool isError() const noexcept { return _kind == Kind::Error; }

  // The error carried by an Error response. Only meaningful if isError().
  [[nodiscard]] WebError error() const noexcept;

  // Payload bytes. Empty for Error responses.
  [[nodiscard]] std::string_view payload() const noexcept;

  // Content-Type associated with the kind, empty for Error responses.
  [[nodiscard]] std::string_view contentType() const noexcept { return ContentTypeOf(_kind); }

  [[nodiscard]] static std::string_view ContentTypeOf(Kind kind) noexcept;

 private:
  Response(Kind kind, std::string payload) noexcept : _kind(kind), _payload(std::move(payload)) {}

  explicit Response(WebError error) noexcept : _kind(Kind::Error), _payload(error) {}

  static std::string ToChars(std::span<const std::byte> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
  }

  Kind _kind;
  std::variant<std::string, WebError> _payload;
};

// Serialize a response into its wire form: status line, Content-Type header, blank line and payload.
// Responses without a content type (errors) give the fixed 500 response.
[[nodiscard]] std::string EncodeResponse(const Response& response);

// Encode response and write it on connection.
// Write failures are not reported: the connection is simply left partially written.
void WriteResponse(const Connection& connection, const Response& response);

}  // namespace deadsimple
