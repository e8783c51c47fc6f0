#pragma once
#include "canonguard/core/Error.hpp"

#include <istream>
#include <optional>
#include <string>

namespace CG::IO {

/**
 * Reads characters up to '\n', '\r' or end of stream; the terminator is consumed
 * but not returned. std::nullopt means end of stream before any character.
 * Overflow, a non-positive limit and stream faults all fail with
 * Error::Code::Unavailable; a stream fault keeps the underlying error as cause.
 */
auto read_bounded_line(std::istream& in, int maxLength) -> Expected<std::optional<std::string>>;

} // namespace CG::IO
