#include "canonguard/core/Error.hpp"
#include "canonguard/core/Exceptions.hpp"
#include "canonguard/core/ValidationErrorList.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace CG;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError); i <= static_cast<int>(Error::Code::NotFound); ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::LengthExceeded, "too long"};
        CHECK(describeError(withMsg) == "length_exceeded:too long");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Cause chain keeps every diagnostic") {
        auto error = Error{Error::Code::ValidationFailed, "Invalid input", "outer detail", "field"}.withCause(
                Error{Error::Code::EncodingFailed, "Input validation failure", "Multiple (2x) encoding detected in %2541"});

        REQUIRE(error.cause);
        CHECK(error.cause->code == Error::Code::EncodingFailed);
        CHECK(describeErrorChain(error) == "outer detail <- Multiple (2x) encoding detected in %2541");
        CHECK(error.context == "field");
    }

    TEST_CASE("Exceptions keep user and log messages apart") {
        Error error{Error::Code::ValidationFailed, "field: Invalid input", "Invalid input: context=field, input=<script>", "field"};

        ValidationException validation{error};
        CHECK(std::string{validation.what()} == "field: Invalid input");
        CHECK(validation.userMessage() == "field: Invalid input");
        CHECK(validation.logMessage() == "Invalid input: context=field, input=<script>");
        CHECK(validation.context() == "field");
        CHECK(validation.userMessage().find("<script>") == std::string::npos);

        ValidationAvailabilityException availability{Error{Error::Code::Unavailable, "Invalid input", "overflow"}};
        ValidationException&            asBase = availability;
        CHECK(asBase.error().code == Error::Code::Unavailable);

        IntrusionException intrusion{Error{Error::Code::IntrusionDetected, "Bad HTTP method received", "PUT /"}};
        CHECK(intrusion.userMessage() == "Bad HTTP method received");
        CHECK(intrusion.logMessage() == "PUT /");
    }

    TEST_CASE("ValidationErrorList keeps insertion order") {
        ValidationErrorList errors;
        CHECK(errors.isEmpty());

        errors.addError("first", Error{Error::Code::InputRequired, "first: Input required"});
        errors.addError("second", Error{Error::Code::LengthExceeded, "second: too long"});

        CHECK(errors.size() == 2);
        CHECK(errors.errors()[0].context == "first");
        CHECK(errors.errors()[1].context == "second");
        REQUIRE(errors.find("second") != nullptr);
        CHECK(errors.find("second")->code == Error::Code::LengthExceeded);
        CHECK(errors.find("missing") == nullptr);
    }
}
