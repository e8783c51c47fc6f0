#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httplib {
struct Request;
}

namespace CG::Http {

using Cookie = std::pair<std::string, std::string>;

// Splits a Cookie header into (name, value) pairs in header order. A segment
// without '=' is a cookie with an empty value; blank segments are dropped.
auto parse_cookie_header(std::string_view header) -> std::vector<Cookie>;

// Every cookie the request carries, from all Cookie headers.
auto read_cookies(httplib::Request const& req) -> std::vector<Cookie>;

} // namespace CG::Http
