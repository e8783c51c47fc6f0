#include "canonguard/codec/Codec.hpp"

#include <array>
#include <cstdint>
#include <utility>

namespace CG {

namespace {

constexpr char32_t kMaxCodePoint = 0x10FFFF;

// Named references accepted by the decoder. Terminating ';' is mandatory.
constexpr std::array<std::pair<std::string_view, char32_t>, 24> kNamedEntities{{
        {"amp", U'&'},     {"lt", U'<'},      {"gt", U'>'},      {"quot", U'"'},
        {"apos", U'\''},   {"nbsp", 0xA0},    {"iexcl", 0xA1},   {"cent", 0xA2},
        {"pound", 0xA3},   {"yen", 0xA5},     {"sect", 0xA7},    {"copy", 0xA9},
        {"laquo", 0xAB},   {"not", 0xAC},     {"shy", 0xAD},     {"reg", 0xAE},
        {"deg", 0xB0},     {"plusmn", 0xB1},  {"micro", 0xB5},   {"para", 0xB6},
        {"middot", 0xB7},  {"raquo", 0xBB},   {"times", 0xD7},   {"divide", 0xF7},
}};

auto digit_value(char ch, bool hex) -> int {
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (hex && ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (hex && ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

// Parses a numeric reference starting after "&#". Returns consumed length.
auto parse_numeric(std::string_view rest, char32_t& codePoint) -> std::size_t {
    std::size_t pos = 0;
    bool        hex = false;
    if (pos < rest.size() && (rest[pos] == 'x' || rest[pos] == 'X')) {
        hex = true;
        ++pos;
    }
    std::size_t const digitsStart = pos;
    std::uint32_t     value       = 0;
    bool              overflow    = false;
    while (pos < rest.size()) {
        int digit = digit_value(rest[pos], hex);
        if (digit < 0)
            break;
        value = value * (hex ? 16u : 10u) + static_cast<std::uint32_t>(digit);
        if (value > kMaxCodePoint) {
            overflow = true;
            value    = kMaxCodePoint + 1;
        }
        ++pos;
    }
    if (pos == digitsStart) {
        return 0;
    }
    if (pos < rest.size() && rest[pos] == ';') {
        ++pos;
    }
    codePoint = overflow ? char32_t{0xFFFD} : static_cast<char32_t>(value);
    return pos;
}

auto parse_named(std::string_view rest, char32_t& codePoint) -> std::size_t {
    auto semicolon = rest.find(';');
    if (semicolon == std::string_view::npos || semicolon == 0 || semicolon > 8) {
        return 0;
    }
    auto candidate = rest.substr(0, semicolon);
    for (auto const& [name, value] : kNamedEntities) {
        if (name == candidate) {
            codePoint = value;
            return semicolon + 1;
        }
    }
    return 0;
}

} // namespace

auto HtmlEntityCodec::decode(std::string_view input) const -> std::string {
    std::string out;
    out.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '&') {
            out.push_back(input[i++]);
            continue;
        }
        char32_t    codePoint = 0;
        std::size_t consumed  = 0;
        if (i + 1 < input.size() && input[i + 1] == '#') {
            consumed = parse_numeric(input.substr(i + 2), codePoint);
            if (consumed > 0) {
                consumed += 2;
            }
        } else {
            consumed = parse_named(input.substr(i + 1), codePoint);
            if (consumed > 0) {
                consumed += 1;
            }
        }
        if (consumed == 0) {
            out.push_back(input[i++]);
            continue;
        }
        appendUtf8(out, codePoint);
        i += consumed;
    }
    return out;
}

} // namespace CG
