#pragma once
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace CG {

/**
 * Failure value carried by every internal validation step.
 *
 * `message` is safe to show to an end user. `detail` is the diagnostic meant for
 * logs and may contain raw input or canonical paths; the two are never merged.
 */
struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        ValidationFailed,
        InputRequired,
        LengthExceeded,
        OutOfRange,
        MalformedInput,
        EncodingFailed,
        IntrusionDetected,
        Unavailable,
        InvalidArgument,
        ConfigurationError,
        IoError,
        NotFound
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Error(Code c, std::string m, std::string d, std::string ctx = {})
        : code(c), message(std::move(m)), detail(std::move(d)), context(std::move(ctx)) {}

    auto withCause(Error nested) && -> Error {
        cause = std::make_shared<Error const>(std::move(nested));
        return std::move(*this);
    }

    Code                         code;
    std::optional<std::string>   message;
    std::string                  detail;
    std::string                  context;
    std::shared_ptr<Error const> cause;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::ValidationFailed:
        return "validation_failed";
    case Error::Code::InputRequired:
        return "input_required";
    case Error::Code::LengthExceeded:
        return "length_exceeded";
    case Error::Code::OutOfRange:
        return "out_of_range";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::EncodingFailed:
        return "encoding_failed";
    case Error::Code::IntrusionDetected:
        return "intrusion_detected";
    case Error::Code::Unavailable:
        return "unavailable";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::ConfigurationError:
        return "configuration_error";
    case Error::Code::IoError:
        return "io_error";
    case Error::Code::NotFound:
        return "not_found";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Walks the cause chain and joins every detail, outermost first.
[[nodiscard]] inline auto describeErrorChain(Error const& error) -> std::string {
    std::string out = error.detail.empty() ? describeError(error) : error.detail;
    for (auto cause = error.cause; cause; cause = cause->cause) {
        out.append(" <- ");
        out.append(cause->detail.empty() ? describeError(*cause) : cause->detail);
    }
    return out;
}

} // namespace CG
