#include "canonguard/codec/Canonicalizer.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace CG;

namespace {

auto makeCanonicalizer(bool strict) -> std::shared_ptr<CodecCanonicalizer const> {
    auto canonicalizer = CodecCanonicalizer::fromNames({"HTMLEntityCodec", "PercentCodec"}, strict);
    REQUIRE(canonicalizer.has_value());
    return *canonicalizer;
}

} // namespace

TEST_SUITE("codec.canonicalizer") {
    TEST_CASE("Plain and singly encoded input") {
        auto canonicalizer = makeCanonicalizer(true);
        CHECK(canonicalizer->canonicalize("hello world").value() == "hello world");
        CHECK(canonicalizer->canonicalize("%3Cscript%3E").value() == "<script>");
        CHECK(canonicalizer->canonicalize("&lt;b&gt;").value() == "<b>");
        CHECK(canonicalizer->canonicalize("").value().empty());
    }

    TEST_CASE("Strict mode rejects multiple encoding") {
        auto canonicalizer = makeCanonicalizer(true);
        auto result        = canonicalizer->canonicalize("%253Cscript%253E");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::EncodingFailed);
        CHECK(result.error().detail.find("Multiple") != std::string::npos);
    }

    TEST_CASE("Strict mode rejects mixed encoding") {
        auto canonicalizer = makeCanonicalizer(true);
        auto result        = canonicalizer->canonicalize("&lt;script%3E");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::EncodingFailed);
        CHECK(result.error().detail.find("ixed") != std::string::npos);
    }

    TEST_CASE("Percent then entity layering is caught") {
        auto canonicalizer = makeCanonicalizer(true);
        auto result        = canonicalizer->canonicalize("%26lt%3B");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::EncodingFailed);
    }

    TEST_CASE("Lenient mode returns the fixed point") {
        auto canonicalizer = makeCanonicalizer(false);
        CHECK(canonicalizer->canonicalize("%253Cscript%253E").value() == "<script>");
        CHECK(canonicalizer->canonicalize("&lt;script%3E").value() == "<script>");
        CHECK_FALSE(canonicalizer->isStrict());
    }

    TEST_CASE("Canonicalization is idempotent") {
        auto lenient = makeCanonicalizer(false);
        auto strict  = makeCanonicalizer(true);
        std::vector<std::string> samples{"plain",
                                         "a%20b",
                                         "%25%32%35",
                                         "&amp;amp;amp;",
                                         "%26%2338%3B",
                                         "&#37;41",
                                         "100%",
                                         "&lt;img src=x onerror=alert(1)&gt;"};
        for (auto const& sample : samples) {
            CAPTURE(sample);
            auto once = lenient->canonicalize(sample);
            REQUIRE(once.has_value());
            auto twice = lenient->canonicalize(*once);
            REQUIRE(twice.has_value());
            CHECK(*twice == *once);

            auto accepted = strict->canonicalize(sample);
            if (accepted) {
                auto again = strict->canonicalize(*accepted);
                REQUIRE(again.has_value());
                CHECK(*again == *accepted);
            }
        }
    }

    TEST_CASE("Unknown codec names are configuration errors") {
        auto result = CodecCanonicalizer::fromNames({"PercentCodec", "NoSuchCodec"});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ConfigurationError);
    }

    TEST_CASE("File canonicalizer uses both codecs strictly") {
        auto canonicalizer = makeFileCanonicalizer();
        CHECK(canonicalizer->canonicalize("report%20final.pdf").value() == "report final.pdf");
        CHECK_FALSE(canonicalizer->canonicalize("..%252F..%252Fetc").has_value());
    }
}
