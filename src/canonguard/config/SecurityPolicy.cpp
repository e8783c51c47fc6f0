#include "canonguard/config/SecurityPolicy.hpp"

#include "log/TaggedLogger.hpp"

#include <stdexcept>

namespace CG {

auto compilePattern(std::string const& source) -> Expected<CompiledPattern> {
    try {
        return CompiledPattern{source, std::make_shared<boost::regex const>(source, boost::regex::ECMAScript)};
    } catch (boost::regex_error const& e) {
        return std::unexpected(Error{Error::Code::ConfigurationError,
                                     "Validation pattern is invalid",
                                     "Validation pattern '" + source + "' does not compile: " + e.what()});
    }
}

auto matchesWhole(CompiledPattern const& pattern, std::string const& value) -> Expected<bool> {
    try {
        return boost::regex_match(value, *pattern.regex);
    } catch (std::runtime_error const& e) {
        cg_log("Pattern " + pattern.source + " abandoned on " + std::to_string(value.size()) + " characters: " + e.what(),
               "Validation",
               "Error");
        return std::unexpected(Error{Error::Code::ValidationFailed,
                                     "Invalid input",
                                     "Pattern '" + pattern.source + "' could not be evaluated: " + e.what()});
    }
}

SecurityPolicy::SecurityPolicy(SecurityConfiguration configuration)
    : configuration_(std::move(configuration)) {}

auto SecurityPolicy::create(SecurityConfiguration configuration) -> Expected<std::shared_ptr<SecurityPolicy const>> {
    if (auto problem = ValidateSecurityConfiguration(configuration)) {
        return std::unexpected(Error{Error::Code::ConfigurationError, "Invalid security configuration", *problem});
    }

    std::shared_ptr<SecurityPolicy> policy{new SecurityPolicy(std::move(configuration))};

    for (auto const& [name, source] : policy->configuration_.validation_patterns) {
        auto compiled = compilePattern(source);
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        policy->patterns_.emplace(name, std::move(*compiled));
    }

    auto canonicalizer = CodecCanonicalizer::fromNames(policy->configuration_.canonicalizer_codecs,
                                                       policy->configuration_.strict_canonicalization);
    if (!canonicalizer) {
        return std::unexpected(canonicalizer.error());
    }
    policy->canonicalizer_ = std::move(*canonicalizer);

    cg_log("Security policy ready with " + std::to_string(policy->patterns_.size()) + " validation patterns", "Config");
    return std::shared_ptr<SecurityPolicy const>{std::move(policy)};
}

auto SecurityPolicy::validationPattern(std::string_view typeName) const -> CompiledPattern const* {
    auto it = patterns_.find(std::string{typeName});
    if (it == patterns_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace CG
