#include "CanonGuardTestHelper.hpp"

#include <httplib.h>

using namespace CG;
using CG::Test::makeValidator;

namespace {

auto makeRequest(std::string method, std::string path = "/") -> httplib::Request {
    httplib::Request req;
    req.method = std::move(method);
    req.path   = std::move(path);
    req.headers.emplace("Host", "localhost:8080");
    req.headers.emplace("User-Agent", "doctest");
    return req;
}

} // namespace

TEST_SUITE("validation.http") {
    TEST_CASE("GET and POST requests with clean input pass") {
        auto validator = makeValidator();

        auto get = makeRequest("GET", "/search");
        get.params.emplace("q", "red shoes");
        get.params.emplace("page", "2");
        CHECK(validator->isValidHTTPRequest(&get));

        auto post = makeRequest("POST", "/login");
        post.params.emplace("user", "ann");
        post.headers.emplace("Cookie", "session=ABC123; theme=dark");
        CHECK_NOTHROW(validator->assertIsValidHTTPRequest(&post));
    }

    TEST_CASE("Other methods are intrusions in every call shape") {
        auto validator = makeValidator();
        auto put       = makeRequest("PUT", "/admin");

        CHECK_FALSE(validator->isValidHTTPRequest(&put));
        CHECK_THROWS_AS(validator->assertIsValidHTTPRequest(&put), IntrusionException);

        ValidationErrorList errors;
        try {
            validator->assertIsValidHTTPRequest(&put, errors);
            FAIL("expected IntrusionException");
        } catch (IntrusionException const& e) {
            CHECK(e.userMessage() == "Bad HTTP method received");
            CHECK(e.logMessage().find("PUT /admin") != std::string::npos);
        }
        CHECK(errors.isEmpty());
    }

    TEST_CASE("A null request is invalid") {
        auto validator = makeValidator();
        CHECK_FALSE(validator->isValidHTTPRequest(nullptr));
        CHECK_THROWS_AS(validator->assertIsValidHTTPRequest(nullptr), ValidationException);

        ValidationErrorList errors;
        validator->assertIsValidHTTPRequest(nullptr, errors);
        CHECK(errors.find("HTTP request") != nullptr);
    }

    TEST_CASE("Parameter names and values are screened") {
        auto validator = makeValidator();

        auto badName = makeRequest("GET");
        badName.params.emplace("user name", "ann");
        CHECK_FALSE(validator->isValidHTTPRequest(&badName));

        auto badValue = makeRequest("GET");
        badValue.params.emplace("q", "<script>alert(1)</script>");
        try {
            validator->assertIsValidHTTPRequest(&badValue);
            FAIL("expected ValidationException");
        } catch (ValidationException const& e) {
            CHECK(e.context() == "HTTP request parameter: q");
        }

        auto empty = makeRequest("GET");
        empty.params.emplace("q", "");
        CHECK(validator->isValidHTTPRequest(&empty));
    }

    TEST_CASE("Parameter values up to 65535 characters are matched in full") {
        auto validator = makeValidator();

        auto atCap = makeRequest("POST", "/upload");
        atCap.params.emplace("body", std::string(65535, 'a'));
        CHECK_NOTHROW(validator->assertIsValidHTTPRequest(&atCap));
        CHECK(validator->isValidHTTPRequest(&atCap));

        auto mixed = makeRequest("POST", "/upload");
        std::string text;
        while (text.size() < 65535) {
            text += "word-12/";
        }
        text.resize(65535);
        mixed.params.emplace("body", text);
        CHECK(validator->isValidHTTPRequest(&mixed));

        auto overCap = makeRequest("POST", "/upload");
        overCap.params.emplace("body", std::string(65536, 'a'));
        try {
            validator->assertIsValidHTTPRequest(&overCap);
            FAIL("expected ValidationException");
        } catch (ValidationException const& e) {
            CHECK(e.error().code == Error::Code::LengthExceeded);
            CHECK(e.context() == "HTTP request parameter: body");
        }

        auto badTail = makeRequest("POST", "/upload");
        badTail.params.emplace("body", std::string(65534, 'a') + "<");
        CHECK_FALSE(validator->isValidHTTPRequest(&badTail));
    }

    TEST_CASE("Parameter names are capped at 100 characters") {
        SecurityConfiguration configuration;
        configuration.validation_patterns["HTTPParameterName"] = R"(^[a-zA-Z0-9_]+$)";
        auto validator = makeValidator(configuration);

        auto atCap = makeRequest("GET");
        atCap.params.emplace(std::string(100, 'n'), "1");
        CHECK_NOTHROW(validator->assertIsValidHTTPRequest(&atCap));

        auto overCap = makeRequest("GET");
        overCap.params.emplace(std::string(101, 'n'), "1");
        try {
            validator->assertIsValidHTTPRequest(&overCap);
            FAIL("expected ValidationException");
        } catch (ValidationException const& e) {
            CHECK(e.error().code == Error::Code::LengthExceeded);
        }

        // The default name pattern stops at 32 characters.
        auto defaults = makeValidator();
        CHECK_FALSE(defaults->isValidHTTPRequest(&atCap));
    }

    TEST_CASE("Cookies and headers are screened") {
        auto validator = makeValidator();

        auto badCookie = makeRequest("GET");
        badCookie.headers.emplace("Cookie", "session=<x>");
        CHECK_FALSE(validator->isValidHTTPRequest(&badCookie));

        auto badHeader = makeRequest("GET");
        badHeader.headers.emplace("X-Custom", "\"quoted\"");
        CHECK_FALSE(validator->isValidHTTPRequest(&badHeader));

        auto encodedHeader = makeRequest("GET");
        encodedHeader.headers.emplace("X-Custom", "%253Cscript%253E");
        CHECK_FALSE(validator->isValidHTTPRequest(&encodedHeader));
    }

    TEST_CASE("Parameter sets must be required plus optional") {
        auto                        validator = makeValidator();
        std::set<std::string> const required{"id"};
        std::set<std::string> const optional{"page"};

        auto exact = makeRequest("GET");
        exact.params.emplace("id", "1");
        exact.params.emplace("page", "2");
        CHECK(validator->isValidHTTPRequestParameterSet("listing", exact, required, optional));

        auto requiredOnly = makeRequest("GET");
        requiredOnly.params.emplace("id", "1");
        CHECK(validator->isValidHTTPRequestParameterSet("listing", requiredOnly, required, optional));

        auto extra = makeRequest("GET");
        extra.params.emplace("id", "1");
        extra.params.emplace("page", "2");
        extra.params.emplace("evil", "1");
        CHECK_THROWS_WITH_AS(validator->assertIsValidHTTPRequestParameterSet("listing", extra, required, optional),
                             "listing: Invalid HTTP request extra parameters",
                             ValidationException);

        auto missing = makeRequest("GET");
        missing.params.emplace("page", "2");
        missing.params.emplace("evil", "1");
        ValidationErrorList errors;
        validator->assertIsValidHTTPRequestParameterSet("listing", missing, required, optional, errors);
        REQUIRE(errors.find("listing") != nullptr);
        CHECK(*errors.find("listing")->message == "listing: Invalid HTTP request missing parameters");
    }
}
