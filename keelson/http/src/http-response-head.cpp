#include "keelson/http-response-head.hpp"

#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "keelson/http-constants.hpp"
#include "keelson/http-header.hpp"
#include "keelson/http-status-code.hpp"
#include "keelson/simple-charconv.hpp"

namespace keelson::http {

std::string_view ResponseHead::reason() const noexcept {
  return _reason.empty() ? ReasonPhraseFor(_status) : std::string_view(_reason);
}

void AppendStatusLine(std::string& out, StatusCode status, std::string_view reason) {
  out.append(HTTP11Sv);
  fmt::format_to(std::back_inserter(out), " {} ", status);
  out.append(reason);
  out.append(CRLF);
}

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(HeaderSep);
  out.append(value);
  out.append(CRLF);
}

void AppendChunk(std::string& out, std::string_view data) {
  if (data.empty()) {
    return;
  }
  char sizeBuf[sizeof(std::size_t) * 2];
  out.append(sizeBuf, write_hex(sizeBuf, data.size()));
  out.append(CRLF);
  out.append(data);
  out.append(CRLF);
}

std::string BuildSimpleResponse(StatusCode status, std::span<const Header> defaultHeaders, std::string_view date,
                                std::string_view body) {
  if (body.empty()) {
    body = ReasonPhraseFor(status);
  }
  std::string out;
  out.reserve(128 + body.size());
  AppendStatusLine(out, status, ReasonPhraseFor(status));
  if (!date.empty()) {
    AppendHeader(out, Date, date);
  }
  for (const Header& header : defaultHeaders) {
    AppendHeader(out, header.name, header.value);
  }
  AppendHeader(out, ContentType, ContentTypeTextPlain);
  AppendHeader(out, ContentLength, fmt::format_int(body.size()).str());
  AppendHeader(out, Connection, ConnectionClose);
  out.append(CRLF);
  out.append(body);
  return out;
}

}  // namespace keelson::http
