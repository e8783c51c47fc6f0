#include "canonguard/codec/Canonicalizer.hpp"
#include "canonguard/rules/RuleRegistry.hpp"

#include <doctest/doctest.h>

using namespace CG;

namespace {

auto canonicalizer() -> Canonicalizer const& {
    static auto instance = makeFileCanonicalizer();
    return *instance;
}

auto letters(std::string name, std::string const& pattern) -> StringRule {
    StringRule rule{std::move(name)};
    REQUIRE(rule.addWhitelistPattern(pattern).has_value());
    return rule;
}

} // namespace

TEST_SUITE("rules.registry") {
    TEST_CASE("Lookup by type name") {
        RuleRegistry registry;
        CHECK(registry.lookup("Username") == nullptr);

        registry.add(letters("Username", "^[a-z]+$"));
        registry.add(IntegerRule{"Age", 0, 150});
        CHECK(registry.size() == 2);

        auto const* rule = registry.lookup("Age");
        REQUIRE(rule != nullptr);
        CHECK(std::holds_alternative<IntegerRule>(*rule));
        CHECK(ruleTypeName(*rule) == "Age");
    }

    TEST_CASE("A later rule under the same name replaces the earlier one") {
        RuleRegistry registry;
        registry.add(letters("Code", "^[a-z]+$"));
        registry.add(letters("Code", "^[0-9]+$"));
        CHECK(registry.size() == 1);

        auto const* rule = registry.lookup("Code");
        REQUIRE(rule != nullptr);
        CHECK(validateRule(*rule, "code", "123", canonicalizer()).has_value());
        CHECK_FALSE(validateRule(*rule, "code", "abc", canonicalizer()).has_value());
    }

    TEST_CASE("validateRule dispatches on the rule kind") {
        auto number = validateRule(Rule{NumberRule{"number", 0, 100}}, "n", "42.5", canonicalizer());
        REQUIRE(number.has_value());
        REQUIRE(std::holds_alternative<double>(*number));
        CHECK(std::get<double>(*number) == doctest::Approx(42.5));

        auto text = validateRule(Rule{letters("Word", "^[a-z]+$")}, "w", "word", canonicalizer());
        REQUIRE(text.has_value());
        CHECK(std::get<std::string>(*text) == "word");

        IntegerRule optional{"Count", 0, 10};
        optional.setAllowNull(true);
        auto absent = validateRule(Rule{optional}, "c", "", canonicalizer());
        REQUIRE(absent.has_value());
        CHECK(std::holds_alternative<std::monostate>(*absent));

        auto failed = validateRule(Rule{DateRule{"Date", "%Y-%m-%d"}}, "d", "not a date", canonicalizer());
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::MalformedInput);
    }
}
