#include "io/BoundedLineReader.hpp"

#include <doctest/doctest.h>

#include <sstream>

using CG::Error;
using CG::IO::read_bounded_line;

TEST_CASE("Bounded reader stops at each terminator") {
    std::istringstream in{"one\r\ntwo"};
    CHECK(read_bounded_line(in, 8).value() == std::optional<std::string>{"one"});
    // "\r\n" is two terminators, so an empty line sits between them.
    CHECK(read_bounded_line(in, 8).value() == std::optional<std::string>{""});
    CHECK(read_bounded_line(in, 8).value() == std::optional<std::string>{"two"});
    CHECK(read_bounded_line(in, 8).value() == std::nullopt);
}

TEST_CASE("Bounded reader reports overflow as unavailable") {
    std::istringstream in{"abcdef"};
    auto               line = read_bounded_line(in, 5);
    REQUIRE_FALSE(line.has_value());
    CHECK(line.error().code == Error::Code::Unavailable);
    CHECK(line.error().detail == "Read more than maximum characters allowed (5)");
}

TEST_CASE("Bounded reader converts stream exceptions") {
    std::istringstream in{"abc"};
    in.exceptions(std::ios_base::badbit | std::ios_base::failbit | std::ios_base::eofbit);
    (void)in.get();
    (void)in.get();
    (void)in.get();
    auto line = read_bounded_line(in, 5);
    REQUIRE_FALSE(line.has_value());
    CHECK(line.error().code == Error::Code::Unavailable);
    REQUIRE(line.error().cause);
    CHECK(line.error().cause->code == Error::Code::IoError);
}
