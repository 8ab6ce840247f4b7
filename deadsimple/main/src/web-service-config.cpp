#include "deadsimple/web-service-config.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace deadsimple {

WebServiceConfig WebServiceConfig::FromAddress(std::string_view address) {
  const auto colonPos = address.rfind(':');
  if (colonPos == std::string_view::npos) {
    throw std::invalid_argument(std::format("missing port in address '{}'", address));
  }
  const std::string_view portStr = address.substr(colonPos + 1);
  uint16_t port{};
  const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (portStr.empty() || errc != std::errc{} || ptr != portStr.data() + portStr.size()) {
    throw std::invalid_argument(std::format("invalid port in address '{}'", address));
  }

  WebServiceConfig config;
  config.withBindAddress(address.substr(0, colonPos)).withPort(port);
  return config;
}

WebServiceConfig& WebServiceConfig::withBindAddress(std::string_view address) {
  this->bindAddress = address;
  return *this;
}

WebServiceConfig& WebServiceConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

WebServiceConfig& WebServiceConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

WebServiceConfig& WebServiceConfig::withReadChunkBytes(std::size_t readChunkBytes) {
  this->readChunkBytes = readChunkBytes;
  return *this;
}

WebServiceConfig& WebServiceConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

void WebServiceConfig::validate() const {
  if (bindAddress.empty()) {
    throw std::invalid_argument("bindAddress must not be empty");
  }
  if (readChunkBytes == 0) {
    throw std::invalid_argument("readChunkBytes must be > 0");
  }
  if (pollInterval.count() < 0) {
    throw std::invalid_argument("pollInterval must be non-negative");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
}

std::string WebServiceConfig::url() const { return std::format("http://{}:{}", bindAddress, port); }

}  // namespace deadsimple
