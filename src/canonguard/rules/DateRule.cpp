#include "canonguard/rules/Rules.hpp"

#include "rules/RuleSupport.hpp"

#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace CG {

namespace {

auto invalid_date(std::string_view context, std::string const& format, std::string const& canonical) -> Error {
    return detail::fail(Error::Code::MalformedInput,
                        context,
                        "Invalid date must follow the " + format + " format",
                        "Invalid date: context=" + std::string{context} + ", format=" + format + ", input=" + canonical);
}

} // namespace

auto DateRule::validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
        -> Expected<std::optional<std::chrono::sys_seconds>> {
    if (detail::isBlank(input)) {
        if (allowNull()) {
            return std::optional<std::chrono::sys_seconds>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input date", input));
    }

    auto canonical = detail::canonicalizeInput(canonicalizer, context, input, "date");
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    if (canonical->size() > maximumLength()) {
        return std::unexpected(invalid_date(context, format_, *canonical));
    }

    std::tm parsed{};
    parsed.tm_mday = 1;
    std::istringstream stream{*canonical};
    stream.imbue(std::locale::classic());
    stream >> std::get_time(&parsed, format_.c_str());
    if (stream.fail() || stream.peek() != std::char_traits<char>::eof()) {
        return std::unexpected(invalid_date(context, format_, *canonical));
    }

    // Reject values that only parse through field rollover, e.g. February 30th.
    std::tm normalized = parsed;
    auto    seconds    = timegm(&normalized);
    if (normalized.tm_year != parsed.tm_year || normalized.tm_mon != parsed.tm_mon
        || normalized.tm_mday != parsed.tm_mday || normalized.tm_hour != parsed.tm_hour
        || normalized.tm_min != parsed.tm_min) {
        return std::unexpected(invalid_date(context, format_, *canonical));
    }

    return std::optional<std::chrono::sys_seconds>{std::chrono::sys_seconds{std::chrono::seconds{seconds}}};
}

} // namespace CG
