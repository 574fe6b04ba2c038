#include "keelson/http-request-head.hpp"

#include <string_view>

#include "keelson/http-constants.hpp"
#include "keelson/string-equal-ignore-case.hpp"

namespace keelson::http {

std::string_view RequestHead::path() const noexcept {
  const std::string_view target(_target);
  return target.substr(0, target.find('?'));
}

std::string_view RequestHead::query() const noexcept {
  const std::string_view target(_target);
  const auto queryPos = target.find('?');
  return queryPos == std::string_view::npos ? std::string_view{} : target.substr(queryPos + 1);
}

bool RequestHead::isHead() const noexcept { return _method == HEAD; }

bool RequestHead::clientRequestsClose() const noexcept {
  const auto connection = headerValue(Connection);
  if (connection && ContainsTokenIgnoreCase(*connection, ConnectionClose)) {
    return true;
  }
  if (_version < HTTP_1_1) {
    return !connection || !ContainsTokenIgnoreCase(*connection, ConnectionKeepAlive);
  }
  return false;
}

bool RequestHead::expectsContinue() const noexcept {
  if (_version < HTTP_1_1) {
    return false;
  }
  const auto expect = headerValue(Expect);
  return expect && CaseInsensitiveEqual(TrimOws(*expect), Expect100Continue);
}

}  // namespace keelson::http
