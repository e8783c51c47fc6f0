#include "canonguard/codec/Canonicalizer.hpp"
#include "canonguard/rules/Rules.hpp"

#include <doctest/doctest.h>

using namespace CG;

namespace {

auto canonicalizer() -> Canonicalizer const& {
    static auto instance = makeFileCanonicalizer();
    return *instance;
}

auto makeRule() -> HtmlRule {
    HtmlRule rule{"SafeHTML", {"a", "B", "i", "br"}, {"href", "TITLE"}};
    rule.setMaximumLength(64);
    return rule;
}

auto accepts(HtmlRule const& rule, std::string_view markup) -> bool {
    return rule.validate("html", markup, canonicalizer()).has_value();
}

} // namespace

TEST_SUITE("rules.html") {
    TEST_CASE("Whitelisted markup passes unchanged") {
        auto rule = makeRule();
        auto result = rule.validate("html", "<b>bold</b> and <i>it</i>", canonicalizer());
        REQUIRE(result.has_value());
        CHECK(result->value() == "<b>bold</b> and <i>it</i>");

        CHECK(accepts(rule, "plain text"));
        CHECK(accepts(rule, "line<br/>break"));
        CHECK(accepts(rule, "<a href='/docs' title=Docs>docs</a>"));
        CHECK(accepts(rule, "<A HREF=\"/x\">upper</A>"));
    }

    TEST_CASE("Unknown tags and declarations are rejected") {
        auto rule = makeRule();
        CHECK_FALSE(accepts(rule, "<script>alert(1)</script>"));
        CHECK_FALSE(accepts(rule, "<iframe src=x>"));
        CHECK_FALSE(accepts(rule, "<!-- note -->"));
        CHECK_FALSE(accepts(rule, "<?xml version='1.0'?>"));
        CHECK_FALSE(accepts(rule, "1 < 2"));
        CHECK_FALSE(accepts(rule, "<b"));
    }

    TEST_CASE("Event handlers and script URLs are rejected") {
        auto rule = makeRule();
        CHECK_FALSE(accepts(rule, "<b onclick=\"steal()\">x</b>"));
        CHECK_FALSE(accepts(rule, "<a href=\"javascript:alert(1)\">x</a>"));
        CHECK_FALSE(accepts(rule, "<a href=\"java\tscript:alert(1)\">x</a>"));
        CHECK_FALSE(accepts(rule, "<a href='data:text/html,hi'>x</a>"));
        CHECK_FALSE(accepts(rule, "<a style='x'>x</a>"));
        CHECK_FALSE(accepts(rule, "<a href=\"/open>x</a>"));
    }

    TEST_CASE("Encoded markup is checked after decoding") {
        auto rule = makeRule();
        auto result = rule.validate("html", "&lt;script&gt;alert(1)&lt;/script&gt;", canonicalizer());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message->find("Invalid HTML input") != std::string::npos);
    }

    TEST_CASE("Length is measured on the canonical markup") {
        auto rule = makeRule();
        auto result = rule.validate("html", std::string(65, 'x'), canonicalizer());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::LengthExceeded);
        CHECK(result.error().message->find("You entered 65 characters") != std::string::npos);
    }

    TEST_CASE("Blank markup honours allowNull") {
        auto rule = makeRule();
        CHECK(rule.validate("html", "", canonicalizer()).error().code == Error::Code::InputRequired);
        rule.setAllowNull(true);
        auto absent = rule.validate("html", "  ", canonicalizer());
        REQUIRE(absent.has_value());
        CHECK_FALSE(absent->has_value());
    }
}
