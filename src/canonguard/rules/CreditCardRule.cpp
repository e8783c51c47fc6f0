#include "canonguard/rules/Rules.hpp"

#include "rules/RuleSupport.hpp"

namespace CG {

namespace {

constexpr std::size_t kMaxCardLength = 19;

auto passes_luhn(std::string_view value) -> bool {
    int  sum       = 0;
    int  digits    = 0;
    bool alternate = false;
    for (auto it = value.rbegin(); it != value.rend(); ++it) {
        if (*it < '0' || *it > '9') {
            continue;
        }
        int digit = *it - '0';
        if (alternate) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        ++digits;
        alternate = !alternate;
    }
    return digits > 0 && sum % 10 == 0;
}

} // namespace

CreditCardRule::CreditCardRule(std::string typeName, CompiledPattern pattern)
    : RuleBase(std::move(typeName), kMaxCardLength), format_("ccrule") {
    format_.addWhitelistPattern(std::move(pattern));
    format_.setMaximumLength(kMaxCardLength);
}

auto CreditCardRule::validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
        -> Expected<std::optional<std::string>> {
    if (detail::isBlank(input)) {
        if (allowNull()) {
            return std::optional<std::string>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input credit card", input));
    }

    auto canonical = format_.validate(context, input, canonicalizer);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    if (!passes_luhn(**canonical)) {
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid credit card input",
                                            "Invalid credit card input: context=" + std::string{context}));
    }
    return canonical;
}

} // namespace CG
