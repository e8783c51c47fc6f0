#include "canonguard/validation/Validator.hpp"

#include "http/CookieParser.hpp"
#include "log/TaggedLogger.hpp"
#include "rules/RuleSupport.hpp"
#include "validation/CallModes.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace CG {

namespace {

constexpr std::size_t kMaxNameLength  = 100;
constexpr std::size_t kMaxValueLength = 65535;

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

auto join_names(std::set<std::string> const& names) -> std::string {
    std::string out;
    for (auto const& name : names) {
        if (!out.empty()) {
            out.append(", ");
        }
        out.append(name);
    }
    return out;
}

} // namespace

auto Validator::httpRequest(httplib::Request const* request) const -> Expected<void> {
    if (request == nullptr) {
        return std::unexpected(detail::fail(Error::Code::InputRequired,
                                            "HTTP request",
                                            "Input required",
                                            "Input required: HTTP request is null"));
    }

    if (request->method != "GET" && request->method != "POST") {
        return std::unexpected(Error{Error::Code::IntrusionDetected,
                                     "Bad HTTP method received",
                                     "Bad HTTP method received: " + request->method + " " + request->path,
                                     "HTTP request"});
    }

    // Names are never null, values may be.
    auto check = [this](std::string const& context, std::string const& name, std::string const& value, std::string_view kind)
            -> Expected<void> {
        auto validName = text(context, name, "HTTP" + std::string{kind} + "Name", kMaxNameLength, false);
        if (!validName) {
            return std::unexpected(std::move(validName.error()));
        }
        auto validValue = text(context, value, "HTTP" + std::string{kind} + "Value", kMaxValueLength, true);
        if (!validValue) {
            return std::unexpected(std::move(validValue.error()));
        }
        return {};
    };

    for (auto const& [name, value] : request->params) {
        if (auto checked = check("HTTP request parameter: " + name, name, value, "Parameter"); !checked) {
            return checked;
        }
    }

    for (auto const& [name, value] : Http::read_cookies(*request)) {
        if (auto checked = check("HTTP request cookie: " + name, name, value, "Cookie"); !checked) {
            return checked;
        }
    }

    for (auto const& [name, value] : request->headers) {
        if (equals_ignore_case(name, "Cookie")) {
            continue;
        }
        if (auto checked = check("HTTP request header: " + name, name, value, "Header"); !checked) {
            return checked;
        }
    }
    return {};
}

auto Validator::parameterSet(std::string_view             context,
                             httplib::Request const&      request,
                             std::set<std::string> const& required,
                             std::set<std::string> const& optional) const -> Expected<void> {
    std::set<std::string> actual;
    for (auto const& entry : request.params) {
        actual.insert(entry.first);
    }

    std::set<std::string> missing;
    std::set_difference(required.begin(), required.end(), actual.begin(), actual.end(), std::inserter(missing, missing.end()));
    if (!missing.empty()) {
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid HTTP request missing parameters",
                                            "Invalid HTTP request missing parameters " + join_names(missing)
                                                    + ": context=" + std::string{context}));
    }

    std::set<std::string> extra;
    for (auto const& name : actual) {
        if (!required.contains(name) && !optional.contains(name)) {
            extra.insert(name);
        }
    }
    if (!extra.empty()) {
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid HTTP request extra parameters",
                                            "Invalid HTTP request extra parameters " + join_names(extra)
                                                    + ": context=" + std::string{context}));
    }
    return {};
}

auto Validator::isValidHTTPRequest(httplib::Request const* request) const -> bool {
    return detail::predicate([&] { return httpRequest(request); });
}

void Validator::assertIsValidHTTPRequest(httplib::Request const* request) const {
    detail::strict([&] { return httpRequest(request); });
}

void Validator::assertIsValidHTTPRequest(httplib::Request const* request, ValidationErrorList& errors) const {
    detail::accumulateVoid("HTTP request", errors, [&] { return httpRequest(request); });
}

auto Validator::isValidHTTPRequestParameterSet(std::string_view             context,
                                               httplib::Request const&      request,
                                               std::set<std::string> const& required,
                                               std::set<std::string> const& optional) const -> bool {
    return detail::predicate([&] { return parameterSet(context, request, required, optional); });
}

void Validator::assertIsValidHTTPRequestParameterSet(std::string_view             context,
                                                     httplib::Request const&      request,
                                                     std::set<std::string> const& required,
                                                     std::set<std::string> const& optional) const {
    detail::strict([&] { return parameterSet(context, request, required, optional); });
}

void Validator::assertIsValidHTTPRequestParameterSet(std::string_view             context,
                                                     httplib::Request const&      request,
                                                     std::set<std::string> const& required,
                                                     std::set<std::string> const& optional,
                                                     ValidationErrorList&         errors) const {
    detail::accumulateVoid(context, errors, [&] { return parameterSet(context, request, required, optional); });
}

} // namespace CG
