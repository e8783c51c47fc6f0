#include "io/BoundedLineReader.hpp"

#include "log/TaggedLogger.hpp"

namespace CG::IO {

namespace {

auto unavailable(std::string detail) -> Error {
    return Error{Error::Code::Unavailable, "Invalid input", std::move(detail)};
}

} // namespace

auto read_bounded_line(std::istream& in, int maxLength) -> Expected<std::optional<std::string>> {
    if (maxLength <= 0) {
        return std::unexpected(unavailable("Must read a positive number of characters from the stream"));
    }

    std::string line;
    int         count = 0;
    try {
        while (true) {
            auto const ch = in.get();
            if (ch == std::istream::traits_type::eof()) {
                if (in.bad()) {
                    return std::unexpected(unavailable("Problem reading from input stream")
                                                   .withCause(Error{Error::Code::IoError, "Stream read failed", "badbit set on input stream"}));
                }
                if (count == 0) {
                    return std::optional<std::string>{};
                }
                break;
            }
            if (ch == '\n' || ch == '\r') {
                break;
            }
            if (++count > maxLength) {
                return std::unexpected(unavailable("Read more than maximum characters allowed (" + std::to_string(maxLength) + ")"));
            }
            line.push_back(static_cast<char>(ch));
        }
    } catch (std::ios_base::failure const& e) {
        cg_log(std::string{"Stream fault while reading line: "} + e.what(), "IO", "Error");
        return std::unexpected(unavailable("Problem reading from input stream")
                                       .withCause(Error{Error::Code::IoError, "Stream read failed", e.what()}));
    }
    return std::optional<std::string>{std::move(line)};
}

} // namespace CG::IO
