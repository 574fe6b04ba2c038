#include "keelson/test_util.hpp"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "keelson/http-constants.hpp"
#include "keelson/http-status-code.hpp"
#include "keelson/log.hpp"
#include "keelson/simple-charconv.hpp"
#include "keelson/socket.hpp"
#include "keelson/string-equal-ignore-case.hpp"

namespace keelson::test {

namespace {

constexpr std::size_t kChunkSize = static_cast<std::size_t>(64) * 1024ULL;

void connectLoop(int fd, uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  for (const auto deadline = std::chrono::steady_clock::now() + timeout; std::chrono::steady_clock::now() < deadline;
       std::this_thread::sleep_for(std::chrono::milliseconds{1})) {
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
      return;
    }
    log::debug("connect failed for fd={}: {}", fd, std::strerror(errno));
  }
  throw std::runtime_error("Unable to connect to test server");
}

// Size of the first complete response in raw, or nullopt if incomplete.
std::optional<std::size_t> CompleteResponseSize(std::string_view raw) {
  const auto headerEnd = raw.find(http::DoubleCRLF);
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const std::size_t bodyStart = headerEnd + http::DoubleCRLF.size();
  const std::string_view headers = raw.substr(0, headerEnd);
  if (headers.starts_with("HTTP/1.1 1")) {
    // Interim response, no body.
    return bodyStart;
  }
  if (headers.find("Transfer-Encoding: chunked") != std::string_view::npos) {
    const auto lastChunk = raw.find("\r\n0\r\n\r\n", bodyStart - 2);
    if (lastChunk == std::string_view::npos) {
      return std::nullopt;
    }
    return lastChunk + 7;
  }
  const auto clPos = headers.find("Content-Length: ");
  if (clPos == std::string_view::npos) {
    return std::nullopt;
  }
  const auto lineEnd = headers.find(http::CRLF, clPos);
  const std::string_view lengthStr =
      headers.substr(clPos + 16, (lineEnd == std::string_view::npos ? headers.size() : lineEnd) - clPos - 16);
  std::size_t contentLength = 0;
  const auto [ptr, ec] = std::from_chars(lengthStr.data(), lengthStr.data() + lengthStr.size(), contentLength);
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  if (raw.size() < bodyStart + contentLength) {
    return std::nullopt;
  }
  return bodyStart + contentLength;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout) : _socket(Socket::Type::Stream) {
  connectLoop(_socket.fd(), port, timeout);
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const char* cursor = data.data();
  std::size_t remaining = data.size();
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  while (remaining > 0) {
    const auto sent = ::send(fd, cursor, remaining, MSG_NOSIGNAL);
    if (sent <= 0) {
      log::error("sendAll failed with error {}", std::strerror(errno));
      if (std::chrono::steady_clock::now() >= maxTs) {
        log::error("sendAll timed out after {} ms", totalTimeout.count());
        return false;
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  std::array<char, kChunkSize> buf;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  while (std::chrono::steady_clock::now() < maxTs) {
    const auto recvBytes = ::recv(fd, buf.data(), buf.size(), MSG_DONTWAIT);
    if (recvBytes > 0) {
      out.append(buf.data(), static_cast<std::size_t>(recvBytes));
      // Skip interim responses before deciding whether the final one is complete.
      std::string_view remaining(out);
      while (remaining.starts_with("HTTP/1.1 1")) {
        const auto interimEnd = remaining.find(http::DoubleCRLF);
        if (interimEnd == std::string_view::npos) {
          break;
        }
        remaining.remove_prefix(interimEnd + http::DoubleCRLF.size());
      }
      if (!remaining.empty() && CompleteResponseSize(remaining)) {
        break;
      }
      continue;
    }
    if (recvBytes == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
      // Closed or error.
      break;
    }
    std::this_thread::sleep_for(1ms);
  }
  return out;
}

std::string recvUntilClosed(int fd) {
  std::string out;
  std::array<char, kChunkSize> buf;
  for (;;) {
    const auto recvBytes = ::recv(fd, buf.data(), buf.size(), 0);
    if (recvBytes <= 0) {
      break;
    }
    out.append(buf.data(), static_cast<std::size_t>(recvBytes));
  }
  return out;
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  ClientConnection clientConnection(port);
  const int fd = clientConnection.fd();
  setRecvTimeout(fd, std::chrono::milliseconds{2000});
  sendAll(fd, raw);
  return recvUntilClosed(fd);
}

int countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  std::size_t pos = 0;
  while ((pos = haystack.find(needle, pos)) != std::string_view::npos) {
    ++count;
    pos += needle.size();
  }
  return count;
}

std::string dechunk(std::string_view body) {
  std::string out;
  std::size_t bpos = 0;
  while (bpos < body.size()) {
    const std::size_t lineEnd = body.find(http::CRLF, bpos);
    if (lineEnd == std::string_view::npos) {
      break;
    }
    std::string_view lenHex = body.substr(bpos, lineEnd - bpos);
    bpos = lineEnd + http::CRLF.size();
    lenHex = lenHex.substr(0, lenHex.find(';'));
    std::size_t chunkLen = 0;
    const auto fc = std::from_chars(lenHex.data(), lenHex.data() + lenHex.size(), chunkLen, 16);
    if (fc.ec != std::errc() || chunkLen == 0) {
      // Either parse error or terminating 0 chunk
      break;
    }
    if (bpos + chunkLen > body.size()) {
      break;  // truncated
    }
    out.append(body.substr(bpos, chunkLen));
    bpos += chunkLen + http::CRLF.size();
  }
  return out;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  ParsedResponse pr;
  const std::size_t pos = raw.find(http::CRLF);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view statusLine = raw.substr(0, pos);
  // Expect: HTTP/1.1 <code> <reason>
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4) {
    return std::nullopt;
  }
  pr.statusCode = static_cast<http::StatusCode>(ParseUnsigned(statusLine.substr(firstSpace + 1, 3)).value_or(0));
  if (statusLine.size() > firstSpace + 5) {
    pr.reason = statusLine.substr(firstSpace + 5);
  }
  const std::size_t headerEnd = raw.find(http::DoubleCRLF);
  if (headerEnd == std::string_view::npos) {
    return std::nullopt;
  }
  std::size_t cursor = pos + http::CRLF.size();
  while (cursor < headerEnd) {
    std::size_t lineEnd = raw.find(http::CRLF, cursor);
    if (lineEnd == std::string_view::npos || lineEnd > headerEnd) {
      lineEnd = headerEnd;
    }
    const std::string_view line = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    pr.headers[std::string(line.substr(0, colon))] = std::string(TrimOws(line.substr(colon + 1)));
  }
  const auto teIt = pr.headers.find("Transfer-Encoding");
  pr.chunked = teIt != pr.headers.end() && CaseInsensitiveEqual(teIt->second, http::Chunked);
  const std::string_view bodyRaw = raw.substr(headerEnd + http::DoubleCRLF.size());
  if (pr.chunked) {
    pr.body = dechunk(bodyRaw);
  } else {
    pr.body = bodyRaw;
    const auto clIt = pr.headers.find("Content-Length");
    if (clIt != pr.headers.end()) {
      std::size_t length = 0;
      std::from_chars(clIt->second.data(), clIt->second.data() + clIt->second.size(), length);
      if (length < pr.body.size()) {
        pr.body.resize(length);
      }
    }
  }
  return pr;
}

std::vector<ParsedResponse> parseResponses(std::string_view raw) {
  std::vector<ParsedResponse> responses;
  while (!raw.empty()) {
    const auto size = CompleteResponseSize(raw);
    auto parsed = parseResponse(raw.substr(0, size.value_or(raw.size())));
    if (!parsed) {
      break;
    }
    responses.push_back(std::move(*parsed));
    if (!size) {
      break;
    }
    raw.remove_prefix(*size);
  }
  return responses;
}

bool setRecvTimeout(int fd, std::chrono::milliseconds timeout) {
  const auto timeoutMs = timeout.count();
  timeval tv{static_cast<time_t>(timeoutMs / 1000), static_cast<suseconds_t>((timeoutMs % 1000) * 1000)};
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.reserve(256 + opt.body.size());
  req.append(opt.method).append(" ").append(opt.target).append(" HTTP/1.1\r\n");
  req.append("Host: ").append(opt.host).append(http::CRLF);
  req.append("Connection: ").append(opt.connection).append(http::CRLF);
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  if (!opt.body.empty()) {
    req.append("Content-Length: ").append(std::to_string(opt.body.size())).append(http::CRLF);
  }
  req.append(http::CRLF);
  req.append(opt.body);
  return req;
}

std::optional<std::string> request(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  const int fd = cnx.fd();
  setRecvTimeout(fd, std::chrono::seconds(opt.recvTimeoutSeconds));
  if (!sendAll(fd, buildRequest(opt))) {
    return std::nullopt;
  }
  std::string out = recvWithTimeout(fd, std::chrono::seconds(opt.recvTimeoutSeconds));
  if (out.empty()) {
    return std::nullopt;
  }
  return out;
}

std::string requestOrThrow(uint16_t port, const RequestOptions& opt) {
  auto resp = request(port, opt);
  if (!resp) {
    throw std::runtime_error("requestOrThrow: request failed (socket/connect/send/recv)");
  }
  return std::move(*resp);
}

std::string simpleGet(uint16_t port, std::string_view path) {
  RequestOptions opt;
  opt.target = path;
  return requestOrThrow(port, opt);
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  std::array<char, kChunkSize> buf;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return false;
    }
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0) {
      continue;
    }
    const auto recvBytes = ::recv(fd, buf.data(), buf.size(), MSG_DONTWAIT);
    if (recvBytes == 0) {
      return true;
    }
    if (recvBytes < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      // reset by peer
      return true;
    }
  }
}

}  // namespace keelson::test
