#include "deadsimple/test-util.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "deadsimple/errno-throw.hpp"
#include "deadsimple/socket-ops.hpp"
#include "deadsimple/socket.hpp"

namespace deadsimple::test {

namespace {
constexpr std::size_t kChunkSize = 1 << 13;
constexpr std::string_view kCRLF = "\r\n";
constexpr std::string_view kDoubleCRLF = "\r\n\r\n";
constexpr std::string_view kContentTypePrefix = "Content-Type: ";
}  // namespace

void sendAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto sent = SafeSend(fd, data);
    if (sent == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("sendAll failed on fd # {}", fd);
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds timeout) {
  std::string out;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[kChunkSize];
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw std::runtime_error("recvUntilClosed timed out");
    }
    pollfd pfd{fd, POLLIN, 0};
    const int nbReady = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (nbReady == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("poll failed on fd # {}", fd);
    }
    if (nbReady == 0) {
      continue;
    }
    const auto nbRead = SafeRecv(fd, buf, sizeof(buf));
    if (nbRead == 0) {
      break;
    }
    if (nbRead == -1) {
      if (errno == ECONNRESET) {
        break;
      }
      throw_errno("recv failed on fd # {}", fd);
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
  return out;
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  Socket client(0);
  client.connect("127.0.0.1", port);
  sendAll(client.fd(), raw);
  return recvUntilClosed(client.fd());
}

std::string buildRequest(std::string_view method, std::string_view target, std::string_view body,
                         std::string_view contentType) {
  std::string req;
  req.append(method).append(" ").append(target).append(" HTTP/1.1").append(kCRLF);
  req.append("Host: localhost").append(kCRLF);
  if (!body.empty()) {
    req.append(kContentTypePrefix).append(contentType).append(kCRLF);
  }
  req.append(kCRLF);
  req.append(body);
  return req;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  const auto statusEnd = raw.find(kCRLF);
  if (statusEnd == std::string_view::npos || !raw.starts_with("HTTP/")) {
    return std::nullopt;
  }
  ParsedResponse resp;
  resp.statusLine = raw.substr(0, statusEnd);

  const auto headersEnd = raw.find(kDoubleCRLF);
  if (headersEnd == std::string_view::npos) {
    return resp;
  }
  const std::string_view headers = raw.substr(0, headersEnd);
  const auto ctPos = headers.find(kContentTypePrefix);
  if (ctPos != std::string_view::npos) {
    const auto valueStart = ctPos + kContentTypePrefix.size();
    resp.contentType = headers.substr(valueStart, headers.find(kCRLF, valueStart) - valueStart);
  }
  resp.body = raw.substr(headersEnd + kDoubleCRLF.size());
  return resp;
}

}  // namespace deadsimple::test
