#pragma once
#include "canonguard/codec/Canonicalizer.hpp"
#include "canonguard/config/SecurityPolicy.hpp"
#include "canonguard/core/Error.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace CG {

// Settings shared by every rule kind.
class RuleBase {
public:
    explicit RuleBase(std::string typeName, std::size_t maxLength = 4096)
        : typeName_(std::move(typeName)), maxLength_(maxLength) {}

    auto typeName() const noexcept -> std::string const& { return typeName_; }
    auto allowNull() const noexcept -> bool { return allowNull_; }
    auto maximumLength() const noexcept -> std::size_t { return maxLength_; }

    void setAllowNull(bool allowNull) noexcept { allowNull_ = allowNull; }
    void setMaximumLength(std::size_t maxLength) noexcept { maxLength_ = maxLength; }

private:
    std::string typeName_;
    bool        allowNull_{false};
    std::size_t maxLength_;
};

/**
 * Closed whitelist over the canonical value. A value is accepted when it matches
 * at least one whitelist pattern (tried in registration order) and no blacklist
 * pattern. An empty whitelist accepts nothing.
 */
class StringRule : public RuleBase {
public:
    explicit StringRule(std::string typeName)
        : RuleBase(std::move(typeName)) {}

    void addWhitelistPattern(CompiledPattern pattern) { whitelist_.push_back(std::move(pattern)); }
    void addBlacklistPattern(CompiledPattern pattern) { blacklist_.push_back(std::move(pattern)); }
    auto addWhitelistPattern(std::string const& source) -> Expected<void>;
    auto addBlacklistPattern(std::string const& source) -> Expected<void>;

    void setMinimumLength(std::size_t minLength) noexcept { minLength_ = minLength; }

    auto whitelist() const noexcept -> std::vector<CompiledPattern> const& { return whitelist_; }

    auto validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
            -> Expected<std::optional<std::string>>;

    // Steps after canonicalization; shared with rules that embed a StringRule.
    auto checkCanonical(std::string_view context, std::string const& canonical) const -> Expected<void>;

private:
    std::vector<CompiledPattern> whitelist_;
    std::vector<CompiledPattern> blacklist_;
    std::size_t                  minLength_{0};
};

// Calendar date in a strftime-style format; the whole value must be consumed.
class DateRule : public RuleBase {
public:
    DateRule(std::string typeName, std::string format)
        : RuleBase(std::move(typeName)), format_(std::move(format)) {}

    auto format() const noexcept -> std::string const& { return format_; }

    auto validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
            -> Expected<std::optional<std::chrono::sys_seconds>>;

private:
    std::string format_;
};

// CreditCard pattern plus the Luhn checksum.
class CreditCardRule : public RuleBase {
public:
    CreditCardRule(std::string typeName, CompiledPattern pattern);

    auto validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
            -> Expected<std::optional<std::string>>;

private:
    StringRule format_;
};

class NumberRule : public RuleBase {
public:
    NumberRule(std::string typeName, double minValue, double maxValue)
        : RuleBase(std::move(typeName)), minValue_(minValue), maxValue_(maxValue) {}

    auto validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
            -> Expected<std::optional<double>>;

private:
    double minValue_;
    double maxValue_;
};

class IntegerRule : public RuleBase {
public:
    IntegerRule(std::string typeName, int minValue, int maxValue)
        : RuleBase(std::move(typeName)), minValue_(minValue), maxValue_(maxValue) {}

    auto validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
            -> Expected<std::optional<int>>;

private:
    int minValue_;
    int maxValue_;
};

/**
 * Markup restricted to a closed set of tags and attributes. Event handler
 * attributes and script-bearing URL schemes are always rejected. The rule only
 * accepts or rejects; it never rewrites markup.
 */
class HtmlRule : public RuleBase {
public:
    HtmlRule(std::string typeName, std::vector<std::string> allowedTags, std::vector<std::string> allowedAttributes);

    auto validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
            -> Expected<std::optional<std::string>>;

private:
    std::vector<std::string> allowedTags_;
    std::vector<std::string> allowedAttributes_;
};

using Rule      = std::variant<StringRule, DateRule, CreditCardRule, NumberRule, IntegerRule, HtmlRule>;
using RuleValue = std::variant<std::monostate, std::string, std::chrono::sys_seconds, double, int>;

auto ruleTypeName(Rule const& rule) -> std::string const&;

// Single dispatch point for every rule kind; std::monostate means an allowed null.
auto validateRule(Rule const&          rule,
                  std::string_view     context,
                  std::string_view     input,
                  Canonicalizer const& canonicalizer) -> Expected<RuleValue>;

} // namespace CG
