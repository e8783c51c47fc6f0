#include "canonguard/rules/Rules.hpp"

#include "rules/RuleSupport.hpp"

#include <charconv>
#include <cmath>

namespace CG {

namespace {

template <typename T>
auto format_number(T value) -> std::string {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, result.ptr);
}

// Accepts an optional leading '+', which std::from_chars does not.
auto strip_plus(std::string_view text) -> std::string_view {
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

template <typename T>
auto parse_whole(std::string_view text, T& out) -> bool {
    text = strip_plus(text);
    if (text.empty()) {
        return false;
    }
    auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

auto bad_format(std::string_view context, std::string const& canonical) -> Error {
    return detail::fail(Error::Code::MalformedInput,
                        context,
                        "Invalid number input",
                        "Invalid number input format: context=" + std::string{context} + ", input=" + canonical);
}

template <typename T>
auto bad_bounds(std::string_view context, T minValue, T maxValue) -> Error {
    return detail::fail(Error::Code::InvalidArgument,
                        context,
                        "Invalid number input: context",
                        "Validation parameter error for number: maxValue ( " + format_number(maxValue)
                                + ") must be greater than minValue ( " + format_number(minValue) + ") for "
                                + std::string{context});
}

template <typename T>
auto out_of_range(std::string_view context, T minValue, T maxValue, std::string const& canonical) -> Error {
    auto range = format_number(minValue) + " and " + format_number(maxValue);
    return detail::fail(Error::Code::OutOfRange,
                        context,
                        "Invalid number input must be between " + range,
                        "Invalid number input must be between " + range + ": context=" + std::string{context}
                                + ", input=" + canonical);
}

} // namespace

auto NumberRule::validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
        -> Expected<std::optional<double>> {
    if (detail::isBlank(input)) {
        if (allowNull()) {
            return std::optional<double>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input number", input));
    }
    if (minValue_ > maxValue_) {
        return std::unexpected(bad_bounds(context, minValue_, maxValue_));
    }

    auto canonical = detail::canonicalizeInput(canonicalizer, context, input, "number input");
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    double value = 0.0;
    if (!parse_whole(detail::trimmed(*canonical), value)) {
        return std::unexpected(bad_format(context, *canonical));
    }
    if (std::isnan(value)) {
        return std::unexpected(detail::fail(Error::Code::MalformedInput,
                                            context,
                                            "Invalid number input: context",
                                            "Invalid double input is not a number: context=" + std::string{context}
                                                    + ", input=" + *canonical));
    }
    if (std::isinf(value)) {
        return std::unexpected(detail::fail(Error::Code::MalformedInput,
                                            context,
                                            "Invalid number input: context",
                                            "Invalid double input is infinite: context=" + std::string{context}
                                                    + ", input=" + *canonical));
    }
    if (value < minValue_ || value > maxValue_) {
        return std::unexpected(out_of_range(context, minValue_, maxValue_, *canonical));
    }
    return std::optional<double>{value};
}

auto IntegerRule::validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
        -> Expected<std::optional<int>> {
    if (detail::isBlank(input)) {
        if (allowNull()) {
            return std::optional<int>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input number", input));
    }
    if (minValue_ > maxValue_) {
        return std::unexpected(bad_bounds(context, minValue_, maxValue_));
    }

    auto canonical = detail::canonicalizeInput(canonicalizer, context, input, "number input");
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    int value = 0;
    if (!parse_whole(std::string_view{*canonical}, value)) {
        return std::unexpected(bad_format(context, *canonical));
    }
    if (value < minValue_ || value > maxValue_) {
        return std::unexpected(out_of_range(context, minValue_, maxValue_, *canonical));
    }
    return std::optional<int>{value};
}

} // namespace CG
