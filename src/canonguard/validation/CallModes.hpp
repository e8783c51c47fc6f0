#pragma once
#include "canonguard/core/Error.hpp"
#include "canonguard/core/Exceptions.hpp"
#include "canonguard/core/ValidationErrorList.hpp"

#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Adapters turning one Expected-returning validation step into the three public call shapes.
namespace CG::detail {

inline void logRejection(Error const& error) {
    if (error.code == Error::Code::IntrusionDetected) {
        cg_log(describeErrorChain(error), "Intrusion");
    } else {
        cg_log(describeErrorChain(error), "Validation");
    }
}

[[noreturn]] inline void raise(Error error) {
    switch (error.code) {
    case Error::Code::IntrusionDetected:
        throw IntrusionException(std::move(error));
    case Error::Code::Unavailable:
        throw ValidationAvailabilityException(std::move(error));
    default:
        throw ValidationException(std::move(error));
    }
}

// Predicate shape. Internal faults read as "invalid" too.
template <typename Step>
auto predicate(Step&& step) -> bool {
    try {
        auto result = std::forward<Step>(step)();
        if (!result) {
            logRejection(result.error());
            return false;
        }
        return true;
    } catch (std::exception const& e) {
        cg_log(std::string{"Validation step failed: "} + e.what(), "Validation", "Error");
        return false;
    }
}

// Strict shape.
template <typename Step>
auto strict(Step&& step) {
    auto result = std::forward<Step>(step)();
    if (!result) {
        logRejection(result.error());
        raise(std::move(result.error()));
    }
    if constexpr (!std::is_void_v<typename decltype(result)::value_type>) {
        return std::move(*result);
    }
}

// Accumulating shape. Intrusion is never recorded, it propagates.
template <typename Step, typename Fallback>
auto accumulate(std::string_view context, ValidationErrorList& errors, Fallback&& fallback, Step&& step) {
    auto result = std::forward<Step>(step)();
    using Value = typename decltype(result)::value_type;
    if (!result) {
        logRejection(result.error());
        if (result.error().code == Error::Code::IntrusionDetected) {
            raise(std::move(result.error()));
        }
        errors.addError(std::string{context}, std::move(result.error()));
        return Value(std::forward<Fallback>(fallback));
    }
    return std::move(*result);
}

// Accumulating shape for steps with no value.
template <typename Step>
void accumulateVoid(std::string_view context, ValidationErrorList& errors, Step&& step) {
    auto result = std::forward<Step>(step)();
    if (!result) {
        logRejection(result.error());
        if (result.error().code == Error::Code::IntrusionDetected) {
            raise(std::move(result.error()));
        }
        errors.addError(std::string{context}, std::move(result.error()));
    }
}

} // namespace CG::detail
