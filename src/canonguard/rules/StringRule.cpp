#include "canonguard/rules/Rules.hpp"

#include "rules/RuleSupport.hpp"

namespace CG {

auto StringRule::addWhitelistPattern(std::string const& source) -> Expected<void> {
    auto compiled = compilePattern(source);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    whitelist_.push_back(std::move(*compiled));
    return {};
}

auto StringRule::addBlacklistPattern(std::string const& source) -> Expected<void> {
    auto compiled = compilePattern(source);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    blacklist_.push_back(std::move(*compiled));
    return {};
}

auto StringRule::checkCanonical(std::string_view context, std::string const& canonical) const -> Expected<void> {
    auto const ctx = std::string{context};

    if (canonical.size() < minLength_) {
        return std::unexpected(detail::fail(Error::Code::LengthExceeded,
                                            context,
                                            "Invalid input. The minimum length of " + std::to_string(minLength_)
                                                    + " characters was not met.",
                                            "Input does not meet the minimum length of " + std::to_string(minLength_)
                                                    + " by " + std::to_string(minLength_ - canonical.size())
                                                    + " characters: context=" + ctx + ", type=" + typeName()
                                                    + ", input=" + canonical));
    }

    if (canonical.size() > maximumLength()) {
        return std::unexpected(detail::fail(Error::Code::LengthExceeded,
                                            context,
                                            "Invalid input. The maximum length of " + std::to_string(maximumLength())
                                                    + " characters was exceeded.",
                                            "Input exceeds maximum allowed length of " + std::to_string(maximumLength())
                                                    + " by " + std::to_string(canonical.size() - maximumLength())
                                                    + " characters: context=" + ctx + ", type=" + typeName()
                                                    + ", input=" + canonical));
    }

    CompiledPattern const* matched = nullptr;
    for (auto const& pattern : whitelist_) {
        auto match = matchesWhole(pattern, canonical);
        if (!match) {
            return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                                context,
                                                "Invalid input",
                                                "Whitelist evaluation failed: context=" + ctx + ", type=" + typeName())
                                           .withCause(std::move(match.error())));
        }
        if (*match) {
            matched = &pattern;
            break;
        }
    }
    if (matched == nullptr) {
        auto const shown = whitelist_.empty() ? std::string{"<none>"} : whitelist_.front().source;
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid input. Please conform to regex " + shown + " with a maximum length of "
                                                    + std::to_string(maximumLength()),
                                            "Invalid input: context=" + ctx + ", type(" + typeName() + ")=" + shown
                                                    + ", input=" + canonical));
    }

    for (auto const& pattern : blacklist_) {
        auto match = matchesWhole(pattern, canonical);
        if (!match || *match) {
            return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                                context,
                                                "Invalid input. Dangerous input matching " + pattern.source + " detected.",
                                                "Dangerous input: context=" + ctx + ", type(" + typeName()
                                                        + ")=" + pattern.source + ", input=" + canonical));
        }
    }

    return {};
}

auto StringRule::validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
        -> Expected<std::optional<std::string>> {
    if (detail::isBlank(input)) {
        if (allowNull()) {
            return std::optional<std::string>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input", input));
    }

    auto canonical = detail::canonicalizeInput(canonicalizer, context, input, "input");
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    if (auto checked = checkCanonical(context, *canonical); !checked) {
        return std::unexpected(checked.error());
    }
    return std::optional<std::string>{std::move(*canonical)};
}

} // namespace CG
