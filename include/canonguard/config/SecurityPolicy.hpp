#pragma once
#include "canonguard/codec/Canonicalizer.hpp"
#include "canonguard/config/SecurityConfiguration.hpp"
#include "canonguard/core/Error.hpp"

#include <boost/regex.hpp>
#include <parallel_hashmap/phmap.h>

#include <memory>
#include <string>
#include <string_view>

namespace CG {

struct CompiledPattern {
    std::string                         source;
    std::shared_ptr<boost::regex const> regex;
};

auto compilePattern(std::string const& source) -> Expected<CompiledPattern>;

/**
 * Whole-value match. Boost.Regex matches without recursion, so value length is
 * bounded only by the caller's maximum length. A match the engine abandons as too
 * complex fails with Error::Code::ValidationFailed.
 */
auto matchesWhole(CompiledPattern const& pattern, std::string const& value) -> Expected<bool>;

/**
 * Immutable, compiled form of a SecurityConfiguration. Built once at startup and
 * shared read-only between validators and threads; nothing mutates it afterwards.
 */
class SecurityPolicy {
public:
    static auto create(SecurityConfiguration configuration) -> Expected<std::shared_ptr<SecurityPolicy const>>;

    auto configuration() const noexcept -> SecurityConfiguration const& { return configuration_; }

    // nullptr when no pattern is configured under that type name.
    auto validationPattern(std::string_view typeName) const -> CompiledPattern const*;

    // Canonicalizer assembled from the configured codec list.
    auto canonicalizer() const noexcept -> std::shared_ptr<Canonicalizer const> const& { return canonicalizer_; }

private:
    explicit SecurityPolicy(SecurityConfiguration configuration);

    SecurityConfiguration                                configuration_;
    phmap::flat_hash_map<std::string, CompiledPattern>   patterns_;
    std::shared_ptr<Canonicalizer const>                 canonicalizer_;
};

} // namespace CG
