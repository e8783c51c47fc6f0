#include "canonguard/tools/CheckCommand.hpp"

#include "canonguard/config/SecurityConfiguration.hpp"
#include "canonguard/config/SecurityPolicy.hpp"
#include "canonguard/core/Exceptions.hpp"
#include "canonguard/validation/Validator.hpp"

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <cstdlib>
#include <ostream>
#include <string_view>

namespace CG::Tools {

namespace {

constexpr std::string_view kContext = "canonguard_check";

} // namespace

void PrintCheckUsage(std::ostream& out) {
    out << "Usage: canonguard_check [options] <value>\n"
           "Options:\n"
           "  --config <file>        Security configuration JSON (defaults when omitted)\n"
           "  --type <name>          Validation pattern name (default SafeString)\n"
           "  --max-length <n>       Maximum canonical length (default 256)\n"
           "  --allow-null           Accept blank input\n"
           "  --directory            Validate <value> as a canonical directory path\n"
           "  --file-name            Validate <value> as a file name with an allowed extension\n"
           "  --help                 Show this message\n"
           "Prints 'valid' and exits 0, or prints the rejection and exits 1.\n";
}

auto ParseCheckArguments(int argc, char** argv, std::ostream& err) -> std::optional<CheckOptions> {
    CheckOptions options;

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            err << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--config") {
            auto value = require_value(i, "--config");
            if (!value) {
                return std::nullopt;
            }
            options.config_path = std::string{*value};
        } else if (arg == "--type") {
            auto value = require_value(i, "--type");
            if (!value) {
                return std::nullopt;
            }
            if (value->empty()) {
                err << "--type requires a pattern name\n";
                return std::nullopt;
            }
            options.type = std::string{*value};
        } else if (arg == "--max-length") {
            auto value = require_value(i, "--max-length");
            if (!value) {
                return std::nullopt;
            }
            std::size_t parsed = 0;
            auto        result = std::from_chars(value->data(), value->data() + value->size(), parsed);
            if (result.ec != std::errc{} || result.ptr != value->data() + value->size() || parsed == 0) {
                err << "--max-length must be a positive number\n";
                return std::nullopt;
            }
            options.max_length = parsed;
        } else if (arg == "--allow-null") {
            options.allow_null = true;
        } else if (arg == "--directory") {
            options.kind = CheckKind::Directory;
        } else if (arg == "--file-name") {
            options.kind = CheckKind::FileName;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.starts_with("--")) {
            err << "Unknown flag '" << arg << "'\n";
            return std::nullopt;
        } else if (!options.has_value) {
            options.value     = std::string{arg};
            options.has_value = true;
        } else {
            err << "Only one value may be checked per run\n";
            return std::nullopt;
        }
    }

    if (!options.show_help && !options.has_value && !options.allow_null) {
        err << "Missing value to check\n";
        return std::nullopt;
    }
    return options;
}

auto RunCheck(CheckOptions const& options, std::ostream& out, std::ostream& err) -> int {
    auto configuration = options.config_path.empty() ? Expected<SecurityConfiguration>{SecurityConfiguration{}}
                                                     : LoadSecurityConfiguration(options.config_path);
    if (!configuration) {
        err << describeErrorChain(configuration.error()) << "\n";
        return EXIT_FAILURE;
    }
    if (!ApplySecurityConfigurationEnvOverrides(*configuration)) {
        return EXIT_FAILURE;
    }
    auto policy = SecurityPolicy::create(std::move(*configuration));
    if (!policy) {
        err << describeErrorChain(policy.error()) << "\n";
        return EXIT_FAILURE;
    }
    auto validator = Validator::create(std::move(*policy));

    try {
        switch (options.kind) {
        case CheckKind::Directory:
            (void)validator->getValidDirectoryPath(kContext, options.value, options.allow_null);
            break;
        case CheckKind::FileName:
            (void)validator->getValidFileName(kContext, options.value, options.allow_null);
            break;
        case CheckKind::Input:
            (void)validator->getValidInput(kContext, options.value, options.type, options.max_length, options.allow_null);
            break;
        }
    } catch (ValidationException const& e) {
        cg_log("Rejected " + e.logMessage(), "Tools");
        out << "invalid: " << e.userMessage() << "\n";
        err << e.logMessage() << "\n";
        return EXIT_FAILURE;
    }

    out << "valid\n";
    return EXIT_SUCCESS;
}

auto RunCheckCommand(int argc, char** argv, std::ostream& out, std::ostream& err) -> int {
    auto options = ParseCheckArguments(argc, argv, err);
    if (!options) {
        PrintCheckUsage(err);
        return EXIT_FAILURE;
    }
    if (options->show_help) {
        PrintCheckUsage(out);
        return EXIT_SUCCESS;
    }
    return RunCheck(*options, out, err);
}

} // namespace CG::Tools
