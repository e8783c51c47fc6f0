#pragma once
#include "canonguard/core/Error.hpp"

#include <stdexcept>
#include <string>

namespace CG {

/**
 * Raised by the strict call shape when input does not satisfy policy.
 * what() returns the user-presentable message only.
 */
class ValidationException : public std::runtime_error {
public:
    explicit ValidationException(Error error)
        : std::runtime_error(error.message.value_or(std::string{errorCodeToString(error.code)}))
        , error_(std::move(error)) {}

    auto error() const noexcept -> Error const& { return error_; }
    auto userMessage() const -> std::string { return what(); }
    auto logMessage() const noexcept -> std::string const& { return error_.detail; }
    auto context() const noexcept -> std::string const& { return error_.context; }

private:
    Error error_;
};

// Raised by the bounded line reader for overflow, transport faults and bad limits.
class ValidationAvailabilityException : public ValidationException {
public:
    explicit ValidationAvailabilityException(Error error)
        : ValidationException(std::move(error)) {}
};

/**
 * Raised when the failure itself is evidence of an attack. Deliberately outside the
 * ValidationException hierarchy so that accumulating calls never swallow it.
 */
class IntrusionException : public std::runtime_error {
public:
    explicit IntrusionException(Error error)
        : std::runtime_error(error.message.value_or(std::string{errorCodeToString(error.code)}))
        , error_(std::move(error)) {}

    auto error() const noexcept -> Error const& { return error_; }
    auto userMessage() const -> std::string { return what(); }
    auto logMessage() const noexcept -> std::string const& { return error_.detail; }

private:
    Error error_;
};

} // namespace CG
