#pragma once
#include "canonguard/core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CG {

auto DefaultValidationPatterns() -> std::map<std::string, std::string>;

struct SecurityConfiguration {
    // Type name -> ECMAScript (Boost.Regex perl syntax) source, matched against the whole canonical value.
    std::map<std::string, std::string> validation_patterns{DefaultValidationPatterns()};
    std::vector<std::string>           allowed_file_extensions{".zip", ".pdf", ".tar", ".gz", ".xls", ".properties", ".txt", ".xml"};
    std::uint64_t                      allowed_file_upload_size{500000000};
    std::vector<std::string>           canonicalizer_codecs{"HTMLEntityCodec", "PercentCodec"};
    bool                               strict_canonicalization{true};
    std::size_t                        redirect_max_length{512};
    std::vector<std::string>           safe_html_tags{"a", "b", "br", "code", "em", "i", "li", "ol", "p", "pre", "strong", "u", "ul"};
    std::vector<std::string>           safe_html_attributes{"href", "title"};
};

/**
 * Parses a JSON document on top of the defaults. Keys that are absent keep their
 * default; "validation_patterns" entries are merged over the default pattern set.
 */
auto ParseSecurityConfiguration(std::string_view json) -> Expected<SecurityConfiguration>;

auto LoadSecurityConfiguration(std::filesystem::path const& path) -> Expected<SecurityConfiguration>;

bool ApplySecurityConfigurationEnvOverrides(SecurityConfiguration& configuration);

auto ValidateSecurityConfiguration(SecurityConfiguration const& configuration) -> std::optional<std::string>;

} // namespace CG
