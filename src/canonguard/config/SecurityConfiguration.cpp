#include "canonguard/config/SecurityConfiguration.hpp"

#include "canonguard/codec/Codec.hpp"

#include <boost/regex.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace CG {

namespace {

using json = nlohmann::json;

auto config_error(std::string detail) -> Error {
    return Error{Error::Code::ConfigurationError, "Invalid security configuration", std::move(detail)};
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto split_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> items;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())) != 0) {
            token.remove_prefix(1);
        }
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())) != 0) {
            token.remove_suffix(1);
        }
        if (!token.empty()) {
            items.emplace_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return items;
}

auto read_string_array(json const& node, char const* key, std::vector<std::string>& out) -> std::optional<Error> {
    if (!node.is_array()) {
        return config_error(std::string{key} + " must be an array of strings");
    }
    std::vector<std::string> values;
    for (auto const& entry : node) {
        if (!entry.is_string()) {
            return config_error(std::string{key} + " must contain only strings");
        }
        values.push_back(entry.get<std::string>());
    }
    out = std::move(values);
    return std::nullopt;
}

} // namespace

auto DefaultValidationPatterns() -> std::map<std::string, std::string> {
    return {
            {"SafeString", R"(^[.a-zA-Z0-9 \t\r\n]{0,1024}$)"},
            {"Email", R"(^[A-Za-z0-9._%'-]+@[A-Za-z0-9.-]+\.[a-zA-Z]{2,4}$)"},
            {"IPAddress", R"(^(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$)"},
            {"URL", R"(^(ht|f)tp(s?)://[0-9a-zA-Z]([-.\w]*[0-9a-zA-Z])*(:[0-9]*)*(/?)([a-zA-Z0-9\-.?,:'/\\+=&%$#_]*)?$)"},
            {"CreditCard", R"(^(\d{4}[- ]?){3}\d{4}$)"},
            {"AccountName", R"(^[a-zA-Z0-9]{3,20}$)"},
            {"SystemCommand", R"(^[a-zA-Z\-/]{1,64}$)"},
            {"RoleName", R"(^[a-z]{1,20}$)"},
            {"Redirect", R"(^/[a-zA-Z0-9_\-/.?=&]*$)"},
            {"HTTPScheme", R"(^(http|https)$)"},
            {"HTTPServerName", R"(^[a-zA-Z0-9_.\-]*$)"},
            {"HTTPParameterName", R"(^[a-zA-Z0-9_]{1,32}$)"},
            {"HTTPParameterValue", R"(^[a-zA-Z0-9.\-/+=_ ]*$)"},
            {"HTTPCookieName", R"(^[a-zA-Z0-9\-_]{1,32}$)"},
            {"HTTPCookieValue", R"(^[a-zA-Z0-9\-/+=_ ]*$)"},
            {"HTTPHeaderName", R"(^[a-zA-Z0-9\-_]{1,32}$)"},
            {"HTTPHeaderValue", R"(^[a-zA-Z0-9()\-=*.?;,+/:&_ ]*$)"},
            {"HTTPPath", R"(^[a-zA-Z0-9.\-_/]*$)"},
            {"HTTPQueryString", R"(^[a-zA-Z0-9()\-=*.?;,+/:&_ %]*$)"},
            {"HTTPSessionId", R"(^[A-Z0-9]{10,30}$)"},
            {"FileName", R"(^[a-zA-Z0-9!@#$%^&{}\[\]()_+\-=,.~'` ]{1,255}$)"},
            {"DirectoryName", R"(^[a-zA-Z0-9:/\\!@#$%^&{}\[\]()_+\-=,.~'` ]{1,255}$)"},
    };
}

auto ParseSecurityConfiguration(std::string_view text) -> Expected<SecurityConfiguration> {
    auto document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(config_error("security configuration is not valid JSON"));
    }
    if (!document.is_object()) {
        return std::unexpected(config_error("security configuration must be a JSON object"));
    }

    SecurityConfiguration configuration{};

    if (auto it = document.find("validation_patterns"); it != document.end()) {
        if (!it->is_object()) {
            return std::unexpected(config_error("validation_patterns must be an object"));
        }
        for (auto const& [name, pattern] : it->items()) {
            if (!pattern.is_string()) {
                return std::unexpected(config_error("validation pattern '" + name + "' must be a string"));
            }
            configuration.validation_patterns[name] = pattern.get<std::string>();
        }
    }

    if (auto it = document.find("allowed_file_extensions"); it != document.end()) {
        if (auto error = read_string_array(*it, "allowed_file_extensions", configuration.allowed_file_extensions)) {
            return std::unexpected(*error);
        }
    }

    if (auto it = document.find("allowed_file_upload_size"); it != document.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected(config_error("allowed_file_upload_size must be a non-negative integer"));
        }
        configuration.allowed_file_upload_size = it->get<std::uint64_t>();
    }

    if (auto it = document.find("canonicalizer_codecs"); it != document.end()) {
        if (auto error = read_string_array(*it, "canonicalizer_codecs", configuration.canonicalizer_codecs)) {
            return std::unexpected(*error);
        }
    }

    if (auto it = document.find("strict_canonicalization"); it != document.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(config_error("strict_canonicalization must be a boolean"));
        }
        configuration.strict_canonicalization = it->get<bool>();
    }

    if (auto it = document.find("redirect_max_length"); it != document.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected(config_error("redirect_max_length must be a non-negative integer"));
        }
        configuration.redirect_max_length = it->get<std::size_t>();
    }

    if (auto it = document.find("safe_html"); it != document.end()) {
        if (!it->is_object()) {
            return std::unexpected(config_error("safe_html must be an object"));
        }
        if (auto tags = it->find("tags"); tags != it->end()) {
            if (auto error = read_string_array(*tags, "safe_html.tags", configuration.safe_html_tags)) {
                return std::unexpected(*error);
            }
        }
        if (auto attributes = it->find("attributes"); attributes != it->end()) {
            if (auto error = read_string_array(*attributes, "safe_html.attributes", configuration.safe_html_attributes)) {
                return std::unexpected(*error);
            }
        }
    }

    return configuration;
}

auto LoadSecurityConfiguration(std::filesystem::path const& path) -> Expected<SecurityConfiguration> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(Error{Error::Code::NotFound,
                                     "Security configuration not found",
                                     "Security configuration file does not exist: " + path.string()});
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::IoError,
                                     "Security configuration could not be read",
                                     "Failed to open security configuration: " + path.string()});
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    auto configuration = ParseSecurityConfiguration(buffer.str());
    if (!configuration) {
        auto error = configuration.error();
        error.detail += " (" + path.string() + ")";
        return std::unexpected(std::move(error));
    }
    return configuration;
}

bool ApplySecurityConfigurationEnvOverrides(SecurityConfiguration& configuration) {
    if (!apply_env("CANONGUARD_MAX_UPLOAD_SIZE", [&](std::string_view value) {
            std::uint64_t parsed = 0;
            auto result = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (result.ec != std::errc{} || result.ptr != value.data() + value.size() || parsed == 0) {
                std::cerr << "CANONGUARD_MAX_UPLOAD_SIZE must be a positive integer\n";
                return false;
            }
            configuration.allowed_file_upload_size = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("CANONGUARD_ALLOWED_EXTENSIONS", [&](std::string_view value) {
            auto extensions = split_list(value);
            if (extensions.empty()) {
                std::cerr << "CANONGUARD_ALLOWED_EXTENSIONS must list at least one extension\n";
                return false;
            }
            configuration.allowed_file_extensions = std::move(extensions);
            return true;
        })) {
        return false;
    }

    if (!apply_env("CANONGUARD_STRICT_CANONICALIZATION", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "CANONGUARD_STRICT_CANONICALIZATION must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            configuration.strict_canonicalization = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

auto ValidateSecurityConfiguration(SecurityConfiguration const& configuration) -> std::optional<std::string> {
    if (configuration.allowed_file_upload_size == 0) {
        return std::string{"allowed_file_upload_size must be > 0"};
    }
    if (configuration.redirect_max_length == 0) {
        return std::string{"redirect_max_length must be > 0"};
    }
    for (auto const& extension : configuration.allowed_file_extensions) {
        if (extension.empty()) {
            return std::string{"allowed_file_extensions must not contain empty entries"};
        }
    }
    if (configuration.canonicalizer_codecs.empty()) {
        return std::string{"canonicalizer_codecs must name at least one codec"};
    }
    for (auto const& codec : configuration.canonicalizer_codecs) {
        if (!isKnownCodec(codec)) {
            return std::string{"Unsupported canonicalizer codec: " + codec};
        }
    }
    for (auto const& [name, pattern] : configuration.validation_patterns) {
        try {
            boost::regex compiled{pattern, boost::regex::ECMAScript};
            (void)compiled;
        } catch (boost::regex_error const& e) {
            return std::string{"validation pattern '" + name + "' does not compile: " + e.what()};
        }
    }
    for (auto const& tag : configuration.safe_html_tags) {
        if (tag.empty()) {
            return std::string{"safe_html.tags must not contain empty entries"};
        }
    }
    return std::nullopt;
}

} // namespace CG
