#include "deadsimple/web-service-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <stdexcept>

namespace deadsimple {

TEST(WebServiceConfig, Defaults) {
  WebServiceConfig config;
  EXPECT_EQ(config.bindAddress, "127.0.0.1");
  EXPECT_EQ(config.port, 8000);
  EXPECT_EQ(config.readChunkBytes, 2048U);
  EXPECT_FALSE(config.reusePort);
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.url(), "http://127.0.0.1:8000");
}

TEST(WebServiceConfig, FromAddress) {
  auto config = WebServiceConfig::FromAddress("0.0.0.0:8080");
  EXPECT_EQ(config.bindAddress, "0.0.0.0");
  EXPECT_EQ(config.port, 8080);

  config = WebServiceConfig::FromAddress("localhost:0");
  EXPECT_EQ(config.bindAddress, "localhost");
  EXPECT_EQ(config.port, 0);
}

TEST(WebServiceConfig, FromAddressInvalid) {
  EXPECT_THROW(WebServiceConfig::FromAddress("127.0.0.1"), std::invalid_argument);
  EXPECT_THROW(WebServiceConfig::FromAddress("127.0.0.1:"), std::invalid_argument);
  EXPECT_THROW(WebServiceConfig::FromAddress("127.0.0.1:http"), std::invalid_argument);
  EXPECT_THROW(WebServiceConfig::FromAddress("127.0.0.1:70000"), std::invalid_argument);
  EXPECT_THROW(WebServiceConfig::FromAddress("127.0.0.1:80x"), std::invalid_argument);
}

TEST(WebServiceConfig, FluentSetters) {
  WebServiceConfig config;
  config.withBindAddress("10.0.0.1")
      .withPort(1234)
      .withReusePort()
      .withReadChunkBytes(512)
      .withPollInterval(std::chrono::milliseconds{20});
  EXPECT_EQ(config.bindAddress, "10.0.0.1");
  EXPECT_EQ(config.port, 1234);
  EXPECT_TRUE(config.reusePort);
  EXPECT_EQ(config.readChunkBytes, 512U);
  EXPECT_EQ(config.pollInterval, std::chrono::milliseconds{20});
}

TEST(WebServiceConfig, ValidateRejectsUnusableValues) {
  EXPECT_THROW(WebServiceConfig{}.withBindAddress("").validate(), std::invalid_argument);
  EXPECT_THROW(WebServiceConfig{}.withReadChunkBytes(0).validate(), std::invalid_argument);
  EXPECT_THROW(WebServiceConfig{}.withPollInterval(std::chrono::milliseconds{-1}).validate(), std::invalid_argument);
  EXPECT_THROW(WebServiceConfig{}
                   .withPollInterval(std::chrono::milliseconds{std::numeric_limits<int>::max() + 1LL})
                   .validate(),
               std::invalid_argument);
}

}  // namespace deadsimple
