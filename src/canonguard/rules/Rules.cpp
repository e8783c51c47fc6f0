#include "canonguard/rules/Rules.hpp"
#include "canonguard/rules/RuleRegistry.hpp"

#include <type_traits>

namespace CG {

auto ruleTypeName(Rule const& rule) -> std::string const& {
    return std::visit([](auto const& r) -> std::string const& { return r.typeName(); }, rule);
}

auto validateRule(Rule const&          rule,
                  std::string_view     context,
                  std::string_view     input,
                  Canonicalizer const& canonicalizer) -> Expected<RuleValue> {
    return std::visit(
            [&](auto const& r) -> Expected<RuleValue> {
                auto result = r.validate(context, input, canonicalizer);
                if (!result) {
                    return std::unexpected(result.error());
                }
                if (!result->has_value()) {
                    return RuleValue{std::monostate{}};
                }
                return RuleValue{std::move(**result)};
            },
            rule);
}

void RuleRegistry::add(Rule rule) {
    auto name = ruleTypeName(rule);
    rules_.insert_or_assign(std::move(name), std::move(rule));
}

auto RuleRegistry::lookup(std::string_view name) const -> Rule const* {
    auto it = rules_.find(std::string{name});
    if (it == rules_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace CG
