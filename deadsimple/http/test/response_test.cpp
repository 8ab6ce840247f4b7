#include "deadsimple/response.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace deadsimple {

namespace {

struct Greeting {
  std::string test;
};

}  // namespace

TEST(Response, ContentTypeTable) {
  EXPECT_EQ(Response::Html("").contentType(), "text/html");
  EXPECT_EQ(Response::Xml("").contentType(), "text/xml");
  EXPECT_EQ(Response::Svg("").contentType(), "image/svg+xml");
  EXPECT_EQ(Response::Js("").contentType(), "application/javascript");
  EXPECT_EQ(Response::JsonText("{}").contentType(), "application/json");
  EXPECT_EQ(Response::Text("").contentType(), "text/plain");
  EXPECT_EQ(Response::Css("").contentType(), "text/css");
  EXPECT_EQ(Response::Png(std::string{}).contentType(), "image/png");
  EXPECT_EQ(Response::Jpg(std::string{}).contentType(), "image/jpeg");
  EXPECT_EQ(Response::Gif(std::string{}).contentType(), "image/gif");
  EXPECT_EQ(Response::Webp(std::string{}).contentType(), "image/webp");
  EXPECT_TRUE(Response::Error(WebError::NotFound).contentType().empty());
}

TEST(Response, EncodeHtml) {
  EXPECT_EQ(EncodeResponse(Response::Html("<h1>Hello</h1>")),
            "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n<h1>Hello</h1>");
}

TEST(Response, EncodeJsonFromValue) {
  auto resp = Response::Json(Greeting{"value"});
  EXPECT_EQ(resp.kind(), Response::Kind::Json);
  EXPECT_EQ(EncodeResponse(resp), "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n\r\n{\"test\":\"value\"}");
}

TEST(Response, EncodeBinaryKeepsRawBytes) {
  const std::vector<std::byte> bytes{std::byte{0x89}, std::byte{'P'}, std::byte{0x00}, std::byte{0xFF}};
  auto resp = Response::Png(bytes);
  const std::string encoded = EncodeResponse(resp);
  constexpr std::string_view kHead = "HTTP/1.1 200 OK\r\nContent-Type: image/png\r\n\r\n";
  ASSERT_EQ(encoded.size(), kHead.size() + bytes.size());
  EXPECT_EQ(std::string_view(encoded).substr(0, kHead.size()), kHead);
  EXPECT_EQ(encoded[kHead.size() + 2], '\0');
  EXPECT_EQ(static_cast<unsigned char>(encoded.back()), 0xFFU);
}

TEST(Response, EveryErrorKindIsAGeneric500) {
  for (WebError error : {WebError::BadRequest, WebError::NotFound, WebError::InternalServerError}) {
    auto resp = Response::Error(error);
    EXPECT_TRUE(resp.isError());
    EXPECT_EQ(resp.error(), error);
    EXPECT_TRUE(resp.payload().empty());
    EXPECT_EQ(EncodeResponse(resp), "HTTP/1.1 500 INTERNAL SERVER ERROR\r\n\r\n");
  }
}

TEST(Response, EncodeEmptyText) {
  EXPECT_EQ(EncodeResponse(Response::Text("")), "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\n");
}

}  // namespace deadsimple
