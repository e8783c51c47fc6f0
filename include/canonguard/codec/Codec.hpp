#pragma once
#include "canonguard/core/Error.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace CG {

/**
 * One decoding scheme. decode() performs a single left-to-right pass and leaves
 * anything it does not recognise untouched; it never fails.
 */
class Codec {
public:
    virtual ~Codec() = default;

    virtual auto name() const noexcept -> std::string_view       = 0;
    virtual auto decode(std::string_view input) const -> std::string = 0;
};

// %XX hex escapes.
class PercentCodec final : public Codec {
public:
    auto name() const noexcept -> std::string_view override { return "PercentCodec"; }
    auto decode(std::string_view input) const -> std::string override;
};

// Numeric (&#65; &#x41;) and named (&lt;) character references, decoded to UTF-8.
class HtmlEntityCodec final : public Codec {
public:
    auto name() const noexcept -> std::string_view override { return "HTMLEntityCodec"; }
    auto decode(std::string_view input) const -> std::string override;
};

// Codec registry by name: "PercentCodec", "HTMLEntityCodec".
auto makeCodec(std::string_view name) -> Expected<std::unique_ptr<Codec>>;

auto isKnownCodec(std::string_view name) noexcept -> bool;

// Appends the UTF-8 encoding of a code point; invalid code points become U+FFFD.
void appendUtf8(std::string& out, char32_t codePoint);

} // namespace CG
