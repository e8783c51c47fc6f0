#pragma once
#include "canonguard/core/Error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CG {

/**
 * Caller-owned accumulator for the error-collecting call shape. Append-only for
 * the duration of one validation pass; not safe to share between threads.
 */
class ValidationErrorList {
public:
    struct Entry {
        std::string context;
        Error       error;
    };

    void addError(std::string context, Error error) {
        entries_.push_back(Entry{std::move(context), std::move(error)});
    }

    auto isEmpty() const noexcept -> bool { return entries_.empty(); }
    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto errors() const noexcept -> std::vector<Entry> const& { return entries_; }

    auto find(std::string_view context) const -> Error const* {
        for (auto const& entry : entries_) {
            if (entry.context == context) {
                return &entry.error;
            }
        }
        return nullptr;
    }

private:
    std::vector<Entry> entries_;
};

} // namespace CG
