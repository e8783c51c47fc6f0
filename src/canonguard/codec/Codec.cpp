#include "canonguard/codec/Codec.hpp"

namespace CG {

void appendUtf8(std::string& out, char32_t codePoint) {
    if (codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        codePoint = 0xFFFD;
    }
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

auto isKnownCodec(std::string_view name) noexcept -> bool {
    return name == "PercentCodec" || name == "HTMLEntityCodec";
}

auto makeCodec(std::string_view name) -> Expected<std::unique_ptr<Codec>> {
    if (name == "PercentCodec") {
        return std::make_unique<PercentCodec>();
    }
    if (name == "HTMLEntityCodec") {
        return std::make_unique<HtmlEntityCodec>();
    }
    return std::unexpected(Error{Error::Code::ConfigurationError,
                                 "Unknown codec",
                                 "Unknown codec name: " + std::string{name}});
}

} // namespace CG
