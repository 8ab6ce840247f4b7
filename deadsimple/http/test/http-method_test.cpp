#include "deadsimple/http-method.hpp"

#include <gtest/gtest.h>

#include <optional>

#include "deadsimple/http-method-parse.hpp"

namespace deadsimple::http {

TEST(HttpMethod, ParseEveryKnownMethod) {
  for (Method method : kAllMethods) {
    auto parsed = MethodStrToOptEnum(MethodToStr(method));
    ASSERT_TRUE(parsed.has_value()) << MethodToStr(method);
    EXPECT_EQ(*parsed, method);
  }
}

TEST(HttpMethod, ParseIsCaseSensitive) {
  EXPECT_EQ(MethodStrToOptEnum("get"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("Post"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("delete"), std::nullopt);
}

TEST(HttpMethod, ParseUnknownTokens) {
  EXPECT_EQ(MethodStrToOptEnum(""), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("CONNECT"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("GETX"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("PUTS"), std::nullopt);
  EXPECT_EQ(MethodStrToOptEnum("BREW"), std::nullopt);
}

TEST(HttpMethod, MethodToStr) {
  EXPECT_EQ(MethodToStr(Method::GET), "GET");
  EXPECT_EQ(MethodToStr(Method::PATCH), "PATCH");
  EXPECT_EQ(MethodToStr(Method::TRACE), "TRACE");
}

}  // namespace deadsimple::http
