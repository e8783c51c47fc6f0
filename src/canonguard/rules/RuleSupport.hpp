#pragma once
#include "canonguard/codec/Canonicalizer.hpp"
#include "canonguard/core/Error.hpp"

#include <algorithm>
#include <string>
#include <string_view>

namespace CG::detail {

// Null, empty and whitespace-only (every char <= 0x20) input all count as absent.
inline auto isBlank(std::string_view input) -> bool {
    return std::all_of(input.begin(), input.end(), [](char ch) {
        return static_cast<unsigned char>(ch) <= 0x20;
    });
}

inline auto trimmed(std::string_view input) -> std::string_view {
    while (!input.empty() && static_cast<unsigned char>(input.front()) <= 0x20) {
        input.remove_prefix(1);
    }
    while (!input.empty() && static_cast<unsigned char>(input.back()) <= 0x20) {
        input.remove_suffix(1);
    }
    return input;
}

inline auto fail(Error::Code code, std::string_view context, std::string userMessage, std::string logMessage) -> Error {
    return Error{code, std::string{context} + ": " + userMessage, std::move(logMessage), std::string{context}};
}

inline auto inputRequired(std::string_view context, std::string_view what, std::string_view input) -> Error {
    return fail(Error::Code::InputRequired,
                context,
                std::string{what} + " required",
                std::string{what} + " required: context=" + std::string{context} + ", input=" + std::string{input});
}

/**
 * Canonicalizes and converts an encoding failure into a validation failure that
 * keeps the encoding error as its cause.
 */
inline auto canonicalizeInput(Canonicalizer const& canonicalizer,
                              std::string_view     context,
                              std::string_view     input,
                              std::string_view     what) -> Expected<std::string> {
    auto canonical = canonicalizer.canonicalize(input);
    if (!canonical) {
        return std::unexpected(fail(Error::Code::ValidationFailed,
                                    context,
                                    "Invalid " + std::string{what} + ". Encoding problem detected.",
                                    "Error canonicalizing user input: context=" + std::string{context})
                                       .withCause(canonical.error()));
    }
    return canonical;
}

} // namespace CG::detail
