#pragma once
#include "canonguard/rules/Rules.hpp"

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace CG {

/**
 * Rules keyed by type name. Populated during startup, read-only afterwards, so
 * concurrent lookups need no locking. Adding a rule under an existing name
 * replaces it.
 */
class RuleRegistry {
public:
    void add(Rule rule);

    auto lookup(std::string_view name) const -> Rule const*;

    auto size() const noexcept -> std::size_t { return rules_.size(); }

private:
    phmap::flat_hash_map<std::string, Rule> rules_;
};

} // namespace CG
