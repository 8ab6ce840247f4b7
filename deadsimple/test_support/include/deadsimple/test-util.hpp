#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace deadsimple::test {

using namespace std::chrono_literals;

// Minimal parsed view of a server response for test assertions.
struct ParsedResponse {
  std::string statusLine;
  std::string contentType;  // empty if absent
  std::string body;
};

// Send all of data on fd. Throws std::system_error on failure.
void sendAll(int fd, std::string_view data);

// Read from fd until the peer closes the connection or timeout expires.
// Throws std::runtime_error on timeout.
std::string recvUntilClosed(int fd, std::chrono::milliseconds timeout = 5000ms);

// Connect to the loopback port, send raw as is and return everything received until the server closes.
std::string sendAndCollect(uint16_t port, std::string_view raw);

// Build a minimal request with a Host header, and a Content-Type header if body is not empty.
std::string buildRequest(std::string_view method, std::string_view target, std::string_view body = {},
                         std::string_view contentType = "application/json");

// Very small response parser: status line, Content-Type header and body. std::nullopt if there is no status line.
std::optional<ParsedResponse> parseResponse(std::string_view raw);

}  // namespace deadsimple::test
