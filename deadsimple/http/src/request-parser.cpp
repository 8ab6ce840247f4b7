#include "deadsimple/request-parser.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "deadsimple/connection.hpp"
#include "deadsimple/http-constants.hpp"
#include "deadsimple/http-method-parse.hpp"
#include "deadsimple/http-method.hpp"
#include "deadsimple/log.hpp"
#include "deadsimple/query-args.hpp"

namespace deadsimple {

namespace {

constexpr std::string_view kOws = " \t";

std::string_view TrimOws(std::string_view str) {
  const auto first = str.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = str.find_last_not_of(kOws);
  return str.substr(first, last - first + 1);
}

// Split "METHOD SP TARGET SP VERSION". Returns false if one of the three parts is missing.
bool SplitRequestLine(std::string_view line, std::string_view& method, std::string_view& target,
                      std::string_view& version) {
  const auto firstSp = line.find(' ');
  if (firstSp == std::string_view::npos) {
    return false;
  }
  method = line.substr(0, firstSp);
  line.remove_prefix(firstSp + 1);

  const auto secondSp = line.find(' ');
  if (secondSp == std::string_view::npos) {
    return false;
  }
  target = line.substr(0, secondSp);
  version = line.substr(secondSp + 1);

  return !method.empty() && !target.empty() && version.starts_with(http::HTTPVersionPrefix);
}

}  // namespace

std::string ReadRequestBytes(const Connection& connection, std::size_t chunkSize) {
  std::string data;
  while (true) {
    const std::size_t oldSize = data.size();
    data.resize(oldSize + chunkSize);
    const auto nbRead = connection.recvSome(data.data() + oldSize, chunkSize);
    if (nbRead <= 0) {
      if (nbRead == -1) {
        log::debug("recv failed on fd # {} after {} bytes", connection.fd(), oldSize);
      }
      data.resize(oldSize);
      break;
    }
    data.resize(oldSize + static_cast<std::size_t>(nbRead));
    if (static_cast<std::size_t>(nbRead) < chunkSize) {
      break;
    }
  }
  return data;
}

std::optional<ParsedRequest> ParseRequest(std::string_view raw) {
  const auto requestLineEnd = raw.find(http::CRLF);
  if (requestLineEnd == std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view methodStr;
  std::string_view version;
  ParsedRequest req;
  if (!SplitRequestLine(raw.substr(0, requestLineEnd), methodStr, req.target, version)) {
    return std::nullopt;
  }

  std::size_t pos = requestLineEnd + http::CRLF.size();
  while (true) {
    const auto lineEnd = raw.find(http::CRLF, pos);
    if (lineEnd == std::string_view::npos) {
      // Incomplete trailing line, headers read so far are kept
      break;
    }
    const std::string_view line = raw.substr(pos, lineEnd - pos);
    if (line.empty()) {
      break;
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0) {
      return std::nullopt;
    }
    req.headers.push_back(HeaderView{line.substr(0, colonPos), TrimOws(line.substr(colonPos + 1))});
    pos = lineEnd + http::CRLF.size();
  }

  if (req.headers.empty()) {
    return std::nullopt;
  }

  const auto bodyStart = raw.find(http::DoubleCRLF);
  if (bodyStart != std::string_view::npos) {
    req.body = raw.substr(bodyStart + http::DoubleCRLF.size());
  }

  const auto optMethod = http::MethodStrToOptEnum(methodStr);
  if (optMethod) {
    req.method = *optMethod;
  } else {
    log::debug("Unknown method '{}', treated as GET", methodStr);
  }

  const auto questionPos = req.target.find('?');
  req.path = req.target.substr(0, questionPos);
  if (questionPos != std::string_view::npos) {
    req.args = ParseQueryArgs(req.target.substr(questionPos + 1));
  }

  return req;
}

}  // namespace deadsimple
