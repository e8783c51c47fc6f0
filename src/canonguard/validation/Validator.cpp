#include "canonguard/validation/Validator.hpp"

#include "io/BoundedLineReader.hpp"
#include "log/TaggedLogger.hpp"
#include "rules/RuleSupport.hpp"
#include "validation/CallModes.hpp"

#include <algorithm>

namespace CG {

Validator::Validator(std::shared_ptr<SecurityPolicy const> policy,
                     std::shared_ptr<Canonicalizer const>  canonicalizer,
                     std::shared_ptr<Validator const>      fileValidator)
    : policy_(std::move(policy)), canonicalizer_(std::move(canonicalizer)), fileValidator_(std::move(fileValidator)) {}

auto Validator::create(std::shared_ptr<SecurityPolicy const> policy) -> std::shared_ptr<Validator> {
    auto fileValidator = createFileValidator(policy);
    auto canonicalizer = policy->canonicalizer();
    return std::make_shared<Validator>(std::move(policy), std::move(canonicalizer), std::move(fileValidator));
}

auto Validator::createFileValidator(std::shared_ptr<SecurityPolicy const> policy) -> std::shared_ptr<Validator const> {
    return std::make_shared<Validator const>(std::move(policy), makeFileCanonicalizer(), nullptr);
}

auto Validator::pathValidator() const -> Validator const& {
    return fileValidator_ ? *fileValidator_ : *this;
}

void Validator::addRule(Rule rule) {
    cg_log("Registering rule " + ruleTypeName(rule), "Rules");
    rules_.add(std::move(rule));
}

auto Validator::getRule(std::string_view name) const -> Rule const* {
    return rules_.lookup(name);
}

// ---------------------------------------------------------------------------
// Core steps
// ---------------------------------------------------------------------------

auto Validator::text(std::string_view context, std::string_view input, std::string_view type, std::size_t maxLength, bool allowNull) const
        -> Expected<std::optional<std::string>> {
    StringRule rule{std::string{type}};
    if (auto const* registered = rules_.lookup(type); registered != nullptr && std::holds_alternative<StringRule>(*registered)) {
        rule = std::get<StringRule>(*registered);
    } else if (auto const* pattern = policy_->validationPattern(type)) {
        rule.addWhitelistPattern(*pattern);
    } else if (auto added = rule.addWhitelistPattern(std::string{type}); !added) {
        // Unknown type names are used as the pattern itself.
        return std::unexpected(std::move(added.error()));
    }
    rule.setMaximumLength(maxLength);
    rule.setAllowNull(allowNull);
    return rule.validate(context, input, *canonicalizer_);
}

auto Validator::date(std::string_view context, std::string_view input, std::string_view format, bool allowNull) const
        -> Expected<std::optional<std::chrono::sys_seconds>> {
    DateRule rule{"SimpleDate", std::string{format}};
    rule.setAllowNull(allowNull);
    return rule.validate(context, input, *canonicalizer_);
}

auto Validator::safeHtml(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
        -> Expected<std::optional<std::string>> {
    auto const& configuration = policy_->configuration();
    HtmlRule    rule{"SafeHTML", configuration.safe_html_tags, configuration.safe_html_attributes};
    rule.setMaximumLength(maxLength);
    rule.setAllowNull(allowNull);
    return rule.validate(context, input, *canonicalizer_);
}

auto Validator::creditCard(std::string_view context, std::string_view input, bool allowNull) const
        -> Expected<std::optional<std::string>> {
    auto const* pattern = policy_->validationPattern("CreditCard");
    if (pattern == nullptr) {
        return std::unexpected(Error{Error::Code::ConfigurationError,
                                     "Credit card validation is not configured",
                                     "No CreditCard validation pattern configured: context=" + std::string{context},
                                     std::string{context}});
    }
    CreditCardRule rule{"CreditCard", *pattern};
    rule.setAllowNull(allowNull);
    return rule.validate(context, input, *canonicalizer_);
}

auto Validator::doubleValue(std::string_view context, std::string_view input, double minValue, double maxValue, bool allowNull) const
        -> Expected<std::optional<double>> {
    NumberRule rule{"number", minValue, maxValue};
    rule.setAllowNull(allowNull);
    return rule.validate(context, input, *canonicalizer_);
}

auto Validator::integerValue(std::string_view context, std::string_view input, int minValue, int maxValue, bool allowNull) const
        -> Expected<std::optional<int>> {
    IntegerRule rule{"number", minValue, maxValue};
    rule.setAllowNull(allowNull);
    return rule.validate(context, input, *canonicalizer_);
}

auto Validator::listItem(std::string_view context, std::string_view input, std::vector<std::string> const& list) const
        -> Expected<std::string> {
    if (std::find(list.begin(), list.end(), input) != list.end()) {
        return std::string{input};
    }
    return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                        context,
                                        "Invalid list item",
                                        "Invalid list item: context=" + std::string{context} + ", input=" + std::string{input}));
}

auto Validator::printable(std::string_view context, std::span<unsigned char const> input, std::size_t maxLength, bool allowNull) const
        -> Expected<std::optional<std::vector<unsigned char>>> {
    if (input.empty()) {
        if (allowNull) {
            return std::optional<std::vector<unsigned char>>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input bytes", {}));
    }
    if (input.size() > maxLength) {
        return std::unexpected(detail::fail(Error::Code::LengthExceeded,
                                            context,
                                            "Input bytes can not exceed " + std::to_string(maxLength) + " bytes",
                                            "Input exceeds maximum allowed length of " + std::to_string(maxLength) + " by "
                                                    + std::to_string(input.size() - maxLength)
                                                    + " bytes: context=" + std::string{context}));
    }
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] <= 0x20 || input[i] >= 0x7E) {
            return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                                context,
                                                "Invalid input bytes",
                                                "Invalid input byte " + std::to_string(static_cast<int>(input[i]))
                                                        + " at offset " + std::to_string(i) + ": context=" + std::string{context}));
        }
    }
    return std::optional<std::vector<unsigned char>>{std::vector<unsigned char>(input.begin(), input.end())};
}

auto Validator::printableText(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
        -> Expected<std::optional<std::string>> {
    if (detail::isBlank(input)) {
        if (allowNull) {
            return std::optional<std::string>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input", input));
    }
    auto canonical = detail::canonicalizeInput(*canonicalizer_, context, input, "printable input");
    if (!canonical) {
        return std::unexpected(std::move(canonical.error()));
    }
    auto const* data  = reinterpret_cast<unsigned char const*>(canonical->data());
    auto        bytes = printable(context, std::span<unsigned char const>{data, canonical->size()}, maxLength, allowNull);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }
    return std::optional<std::string>{std::move(*canonical)};
}

// ---------------------------------------------------------------------------
// Call shapes
// ---------------------------------------------------------------------------

auto Validator::isValidInput(std::string_view context, std::string_view input, std::string_view type, std::size_t maxLength, bool allowNull) const
        -> bool {
    return detail::predicate([&] { return this->text(context, input, type, maxLength, allowNull); });
}

auto Validator::getValidInput(std::string_view context, std::string_view input, std::string_view type, std::size_t maxLength, bool allowNull) const
        -> std::optional<std::string> {
    return detail::strict([&] { return this->text(context, input, type, maxLength, allowNull); });
}

auto Validator::getValidInput(std::string_view     context,
                              std::string_view     input,
                              std::string_view     type,
                              std::size_t          maxLength,
                              bool                 allowNull,
                              ValidationErrorList& errors) const -> std::optional<std::string> {
    return detail::accumulate(context, errors, std::string{input}, [&] {
        return this->text(context, input, type, maxLength, allowNull);
    });
}

auto Validator::isValidDate(std::string_view context, std::string_view input, std::string_view format, bool allowNull) const -> bool {
    return detail::predicate([&] { return date(context, input, format, allowNull); });
}

auto Validator::getValidDate(std::string_view context, std::string_view input, std::string_view format, bool allowNull) const
        -> std::optional<std::chrono::sys_seconds> {
    return detail::strict([&] { return date(context, input, format, allowNull); });
}

auto Validator::getValidDate(std::string_view     context,
                             std::string_view     input,
                             std::string_view     format,
                             bool                 allowNull,
                             ValidationErrorList& errors) const -> std::optional<std::chrono::sys_seconds> {
    return detail::accumulate(context, errors, std::nullopt, [&] { return date(context, input, format, allowNull); });
}

auto Validator::isValidSafeHTML(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const -> bool {
    return detail::predicate([&] { return safeHtml(context, input, maxLength, allowNull); });
}

auto Validator::getValidSafeHTML(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
        -> std::optional<std::string> {
    return detail::strict([&] { return safeHtml(context, input, maxLength, allowNull); });
}

auto Validator::getValidSafeHTML(std::string_view     context,
                                 std::string_view     input,
                                 std::size_t          maxLength,
                                 bool                 allowNull,
                                 ValidationErrorList& errors) const -> std::optional<std::string> {
    return detail::accumulate(context, errors, std::string{input}, [&] { return safeHtml(context, input, maxLength, allowNull); });
}

auto Validator::isValidCreditCard(std::string_view context, std::string_view input, bool allowNull) const -> bool {
    return detail::predicate([&] { return creditCard(context, input, allowNull); });
}

auto Validator::getValidCreditCard(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string> {
    return detail::strict([&] { return creditCard(context, input, allowNull); });
}

auto Validator::getValidCreditCard(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
        -> std::optional<std::string> {
    return detail::accumulate(context, errors, std::string{input}, [&] { return creditCard(context, input, allowNull); });
}

auto Validator::isValidNumber(std::string_view context, std::string_view input, std::int64_t minValue, std::int64_t maxValue, bool allowNull) const
        -> bool {
    auto const low  = static_cast<double>(minValue);
    auto const high = static_cast<double>(maxValue);
    return detail::predicate([&] { return doubleValue(context, input, low, high, allowNull); });
}

auto Validator::getValidNumber(std::string_view context, std::string_view input, std::int64_t minValue, std::int64_t maxValue, bool allowNull) const
        -> std::optional<double> {
    auto const low  = static_cast<double>(minValue);
    auto const high = static_cast<double>(maxValue);
    return detail::strict([&] { return doubleValue(context, input, low, high, allowNull); });
}

auto Validator::getValidNumber(std::string_view     context,
                               std::string_view     input,
                               std::int64_t         minValue,
                               std::int64_t         maxValue,
                               bool                 allowNull,
                               ValidationErrorList& errors) const -> std::optional<double> {
    auto const low  = static_cast<double>(minValue);
    auto const high = static_cast<double>(maxValue);
    return detail::accumulate(context, errors, 0.0, [&] { return doubleValue(context, input, low, high, allowNull); });
}

auto Validator::isValidDouble(std::string_view context, std::string_view input, double minValue, double maxValue, bool allowNull) const -> bool {
    return detail::predicate([&] { return doubleValue(context, input, minValue, maxValue, allowNull); });
}

auto Validator::getValidDouble(std::string_view context, std::string_view input, double minValue, double maxValue, bool allowNull) const
        -> std::optional<double> {
    return detail::strict([&] { return doubleValue(context, input, minValue, maxValue, allowNull); });
}

auto Validator::getValidDouble(std::string_view     context,
                               std::string_view     input,
                               double               minValue,
                               double               maxValue,
                               bool                 allowNull,
                               ValidationErrorList& errors) const -> std::optional<double> {
    return detail::accumulate(context, errors, 0.0, [&] { return doubleValue(context, input, minValue, maxValue, allowNull); });
}

auto Validator::isValidInteger(std::string_view context, std::string_view input, int minValue, int maxValue, bool allowNull) const -> bool {
    return detail::predicate([&] { return integerValue(context, input, minValue, maxValue, allowNull); });
}

auto Validator::getValidInteger(std::string_view context, std::string_view input, int minValue, int maxValue, bool allowNull) const
        -> std::optional<int> {
    return detail::strict([&] { return integerValue(context, input, minValue, maxValue, allowNull); });
}

auto Validator::getValidInteger(std::string_view     context,
                                std::string_view     input,
                                int                  minValue,
                                int                  maxValue,
                                bool                 allowNull,
                                ValidationErrorList& errors) const -> std::optional<int> {
    return detail::accumulate(context, errors, 0, [&] { return integerValue(context, input, minValue, maxValue, allowNull); });
}

auto Validator::isValidListItem(std::string_view context, std::string_view input, std::vector<std::string> const& list) const -> bool {
    return detail::predicate([&] { return listItem(context, input, list); });
}

auto Validator::getValidListItem(std::string_view context, std::string_view input, std::vector<std::string> const& list) const -> std::string {
    return detail::strict([&] { return listItem(context, input, list); });
}

auto Validator::getValidListItem(std::string_view                context,
                                 std::string_view                input,
                                 std::vector<std::string> const& list,
                                 ValidationErrorList&            errors) const -> std::string {
    return detail::accumulate(context, errors, std::string{input}, [&] { return listItem(context, input, list); });
}

auto Validator::isValidPrintable(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const -> bool {
    return detail::predicate([&] { return printableText(context, input, maxLength, allowNull); });
}

auto Validator::getValidPrintable(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
        -> std::optional<std::string> {
    return detail::strict([&] { return printableText(context, input, maxLength, allowNull); });
}

auto Validator::getValidPrintable(std::string_view     context,
                                  std::string_view     input,
                                  std::size_t          maxLength,
                                  bool                 allowNull,
                                  ValidationErrorList& errors) const -> std::optional<std::string> {
    return detail::accumulate(context, errors, std::string{input}, [&] { return printableText(context, input, maxLength, allowNull); });
}

auto Validator::isValidPrintable(std::string_view context, std::span<unsigned char const> input, std::size_t maxLength, bool allowNull) const
        -> bool {
    return detail::predicate([&] { return printable(context, input, maxLength, allowNull); });
}

auto Validator::getValidPrintable(std::string_view context, std::span<unsigned char const> input, std::size_t maxLength, bool allowNull) const
        -> std::optional<std::vector<unsigned char>> {
    return detail::strict([&] { return printable(context, input, maxLength, allowNull); });
}

auto Validator::getValidPrintable(std::string_view               context,
                                  std::span<unsigned char const> input,
                                  std::size_t                    maxLength,
                                  bool                           allowNull,
                                  ValidationErrorList&           errors) const -> std::optional<std::vector<unsigned char>> {
    return detail::accumulate(context, errors, std::vector<unsigned char>(input.begin(), input.end()), [&] {
        return printable(context, input, maxLength, allowNull);
    });
}

auto Validator::isValidRedirectLocation(std::string_view context, std::string_view input, bool allowNull) const -> bool {
    auto const maxLength = policy_->configuration().redirect_max_length;
    return detail::predicate([&] { return this->text(context, input, "Redirect", maxLength, allowNull); });
}

auto Validator::getValidRedirectLocation(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string> {
    auto const maxLength = policy_->configuration().redirect_max_length;
    return detail::strict([&] { return this->text(context, input, "Redirect", maxLength, allowNull); });
}

auto Validator::getValidRedirectLocation(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
        -> std::optional<std::string> {
    auto const maxLength = policy_->configuration().redirect_max_length;
    return detail::accumulate(context, errors, std::string{input}, [&] {
        return this->text(context, input, "Redirect", maxLength, allowNull);
    });
}

auto Validator::safeReadLine(std::istream& in, int maxLength) const -> std::optional<std::string> {
    return detail::strict([&] { return IO::read_bounded_line(in, maxLength); });
}

} // namespace CG
