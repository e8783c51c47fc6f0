#include "canonguard/codec/Codec.hpp"

#include <optional>

namespace CG {

namespace {

auto hex_value(char ch) -> std::optional<unsigned> {
    if (ch >= '0' && ch <= '9')
        return static_cast<unsigned>(ch - '0');
    if (ch >= 'a' && ch <= 'f')
        return static_cast<unsigned>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F')
        return static_cast<unsigned>(ch - 'A' + 10);
    return std::nullopt;
}

} // namespace

auto PercentCodec::decode(std::string_view input) const -> std::string {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        char const ch = input[i];
        if (ch == '%' && i + 2 < input.size()) {
            auto hi = hex_value(input[i + 1]);
            auto lo = hex_value(input[i + 2]);
            if (hi && lo) {
                out.push_back(static_cast<char>((*hi << 4) | *lo));
                i += 2;
                continue;
            }
        }
        out.push_back(ch);
    }
    return out;
}

} // namespace CG
