#pragma once
#include "canonguard/codec/Codec.hpp"
#include "canonguard/core/Error.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace CG {

/**
 * Reduces text to its canonical form: the value on which no known decode
 * transform makes any further change. Fails with Error::Code::EncodingFailed when
 * the input cannot be safely resolved. Implementations must be safe to call
 * concurrently.
 */
class Canonicalizer {
public:
    virtual ~Canonicalizer() = default;

    virtual auto canonicalize(std::string_view input) const -> Expected<std::string> = 0;
};

/**
 * Loops every codec until a whole pass changes nothing. A value that needed more
 * than one changing pass was encoded multiple times; a value touched by more than
 * one codec used mixed encodings. Strict mode rejects both, lenient mode logs them
 * and returns the fixed point.
 */
class CodecCanonicalizer final : public Canonicalizer {
public:
    explicit CodecCanonicalizer(std::vector<std::unique_ptr<Codec>> codecs, bool strict = true);

    static auto fromNames(std::vector<std::string> const& names, bool strict = true)
            -> Expected<std::shared_ptr<CodecCanonicalizer const>>;

    auto canonicalize(std::string_view input) const -> Expected<std::string> override;

    auto codecNames() const -> std::vector<std::string>;
    auto isStrict() const noexcept -> bool { return strict_; }

private:
    std::vector<std::unique_ptr<Codec>> codecs_;
    bool                                strict_;
};

// The dedicated canonicalizer for filesystem paths: HTML entities then percent escapes, strict.
auto makeFileCanonicalizer() -> std::shared_ptr<Canonicalizer const>;

} // namespace CG
