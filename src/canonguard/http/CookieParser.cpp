#include "http/CookieParser.hpp"

#include <httplib.h>

#include <cctype>
#include <iterator>

namespace CG::Http {

namespace {

std::string trim_view(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return std::string{value};
}

} // namespace

auto parse_cookie_header(std::string_view header) -> std::vector<Cookie> {
    std::vector<Cookie> cookies;
    while (!header.empty()) {
        auto             semicolon = header.find(';');
        std::string_view segment;
        if (semicolon == std::string_view::npos) {
            segment = header;
            header  = {};
        } else {
            segment = header.substr(0, semicolon);
            header.remove_prefix(semicolon + 1);
        }
        auto equals = segment.find('=');
        if (equals == std::string_view::npos) {
            auto name = trim_view(segment);
            if (!name.empty()) {
                cookies.emplace_back(std::move(name), std::string{});
            }
            continue;
        }
        cookies.emplace_back(trim_view(segment.substr(0, equals)), trim_view(segment.substr(equals + 1)));
    }
    return cookies;
}

auto read_cookies(httplib::Request const& req) -> std::vector<Cookie> {
    std::vector<Cookie> cookies;
    auto [begin, end] = req.headers.equal_range("Cookie");
    for (auto it = begin; it != end; ++it) {
        auto parsed = parse_cookie_header(it->second);
        cookies.insert(cookies.end(), std::make_move_iterator(parsed.begin()), std::make_move_iterator(parsed.end()));
    }
    return cookies;
}

} // namespace CG::Http
