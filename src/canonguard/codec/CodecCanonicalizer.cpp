#include "canonguard/codec/Canonicalizer.hpp"

#include "log/TaggedLogger.hpp"

#include <string>

namespace CG {

CodecCanonicalizer::CodecCanonicalizer(std::vector<std::unique_ptr<Codec>> codecs, bool strict)
    : codecs_(std::move(codecs)), strict_(strict) {}

auto CodecCanonicalizer::fromNames(std::vector<std::string> const& names, bool strict)
        -> Expected<std::shared_ptr<CodecCanonicalizer const>> {
    std::vector<std::unique_ptr<Codec>> codecs;
    codecs.reserve(names.size());
    for (auto const& name : names) {
        auto codec = makeCodec(name);
        if (!codec) {
            return std::unexpected(codec.error());
        }
        codecs.push_back(std::move(*codec));
    }
    return std::make_shared<CodecCanonicalizer const>(std::move(codecs), strict);
}

auto CodecCanonicalizer::codecNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(codecs_.size());
    for (auto const& codec : codecs_) {
        names.emplace_back(codec->name());
    }
    return names;
}

auto CodecCanonicalizer::canonicalize(std::string_view input) const -> Expected<std::string> {
    std::string  working{input};
    Codec const* codecFound = nullptr;
    int          foundCount = 0;
    int          mixedCount = 1;
    bool         clean      = false;

    // Every changing decode strictly shortens the text, so this reaches a fixed point.
    while (!clean) {
        clean = true;
        for (auto const& codec : codecs_) {
            std::string decoded = codec->decode(working);
            if (decoded == working) {
                continue;
            }
            if (codecFound != nullptr && codecFound != codec.get()) {
                ++mixedCount;
            }
            codecFound = codec.get();
            if (clean) {
                ++foundCount;
            }
            clean   = false;
            working = std::move(decoded);
        }
    }

    std::string problem;
    if (foundCount >= 2 && mixedCount > 1) {
        problem = "Multiple (" + std::to_string(foundCount) + "x) and mixed encoding (" + std::to_string(mixedCount)
                  + "x) detected";
    } else if (foundCount >= 2) {
        problem = "Multiple (" + std::to_string(foundCount) + "x) encoding detected";
    } else if (mixedCount > 1) {
        problem = "Mixed encoding (" + std::to_string(mixedCount) + "x) detected";
    }

    if (!problem.empty()) {
        if (strict_) {
            return std::unexpected(Error{Error::Code::EncodingFailed,
                                         "Input validation failure",
                                         problem + " in " + std::string{input}});
        }
        cg_log("Possible encoding attack: " + problem + " in " + std::string{input}, "Encoding");
    }
    return working;
}

auto makeFileCanonicalizer() -> std::shared_ptr<Canonicalizer const> {
    std::vector<std::unique_ptr<Codec>> codecs;
    codecs.push_back(std::make_unique<HtmlEntityCodec>());
    codecs.push_back(std::make_unique<PercentCodec>());
    return std::make_shared<CodecCanonicalizer const>(std::move(codecs), true);
}

} // namespace CG
