#include "canonguard/validation/Validator.hpp"

#include "log/TaggedLogger.hpp"
#include "rules/RuleSupport.hpp"
#include "validation/CallModes.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace CG {

namespace {

constexpr std::size_t kMaxPathNameLength = 255;

auto ends_with_ignore_case(std::string_view value, std::string_view suffix) -> bool {
    if (suffix.size() > value.size()) {
        return false;
    }
    auto tail = value.substr(value.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

auto join_extensions(std::vector<std::string> const& extensions) -> std::string {
    std::string out;
    for (auto const& extension : extensions) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out.append(extension);
    }
    return out;
}

} // namespace

auto Validator::directoryPath(std::string_view context, std::string_view input, bool allowNull) const
        -> Expected<std::optional<std::string>> {
    namespace fs = std::filesystem;
    auto const ctx = std::string{context};

    if (detail::isBlank(input)) {
        if (allowNull) {
            return std::optional<std::string>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input directory path", input));
    }

    fs::path const  path{std::string{input}};
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(detail::fail(Error::Code::NotFound,
                                            context,
                                            "Invalid directory, does not exist",
                                            "Invalid directory, requested directory does not exist: context=" + ctx
                                                    + ", input=" + std::string{input}));
    }
    if (!fs::is_directory(path, ec)) {
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid directory, not a directory",
                                            "Invalid directory, requested path is not a directory: context=" + ctx
                                                    + ", input=" + std::string{input}));
    }

    auto const canonical = fs::canonical(path, ec);
    if (ec) {
        return std::unexpected(detail::fail(Error::Code::IoError,
                                            context,
                                            "Invalid directory name",
                                            "Failure to canonicalize directory: context=" + ctx + ", input="
                                                    + std::string{input} + ", error=" + ec.message()));
    }
    auto const canonicalText = canonical.string();

    auto shaped = pathValidator().text(context, canonicalText, "DirectoryName", kMaxPathNameLength, false);
    if (!shaped) {
        return std::unexpected(std::move(shaped.error()));
    }

    if (canonicalText != input) {
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid directory name",
                                            "Invalid directory name does not match the canonical path: context=" + ctx
                                                    + ", input=" + std::string{input} + ", canonical=" + canonicalText));
    }
    return std::optional<std::string>{canonicalText};
}

auto Validator::fileName(std::string_view context, std::string_view input, std::vector<std::string> const& allowedExtensions, bool allowNull) const
        -> Expected<std::optional<std::string>> {
    namespace fs = std::filesystem;
    auto const ctx = std::string{context};

    if (detail::isBlank(input)) {
        if (allowNull) {
            return std::optional<std::string>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input file name", input));
    }

    std::error_code ec;
    auto const      absolute = fs::absolute(fs::path{std::string{input}}, ec);
    fs::path        resolved;
    if (!ec) {
        resolved = fs::weakly_canonical(absolute, ec);
    }
    if (ec) {
        return std::unexpected(detail::fail(Error::Code::IoError,
                                            context,
                                            "Invalid file name",
                                            "Failure to canonicalize file name: context=" + ctx + ", input="
                                                    + std::string{input} + ", error=" + ec.message()));
    }
    auto const canonicalName = resolved.filename().string();
    if (canonicalName != input) {
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid file name",
                                            "Invalid file name does not match the canonical file name: context=" + ctx
                                                    + ", input=" + std::string{input} + ", canonical=" + canonicalName));
    }

    auto shaped = pathValidator().text(context, input, "FileName", kMaxPathNameLength, true);
    if (!shaped) {
        return std::unexpected(std::move(shaped.error()));
    }

    for (auto const& extension : allowedExtensions) {
        if (ends_with_ignore_case(input, extension)) {
            return std::optional<std::string>{std::string{input}};
        }
    }
    return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                        context,
                                        "Invalid file name does not have valid extension ( " + join_extensions(allowedExtensions) + " )",
                                        "Invalid file name does not have valid extension ( " + join_extensions(allowedExtensions)
                                                + " ): context=" + ctx + ", input=" + std::string{input}));
}

auto Validator::fileContent(std::string_view context, std::string_view content, std::size_t maxBytes, bool allowNull) const
        -> Expected<std::optional<std::string>> {
    if (content.empty()) {
        if (allowNull) {
            return std::optional<std::string>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input file content", {}));
    }

    auto const ceiling = policy_->configuration().allowed_file_upload_size;
    if (content.size() > ceiling) {
        return std::unexpected(detail::fail(Error::Code::LengthExceeded,
                                            context,
                                            "Invalid file content can not exceed " + std::to_string(ceiling) + " bytes",
                                            "Exceeded maximum upload size of " + std::to_string(ceiling) + " by "
                                                    + std::to_string(content.size() - ceiling)
                                                    + " bytes: context=" + std::string{context}));
    }
    if (content.size() > maxBytes) {
        return std::unexpected(detail::fail(Error::Code::LengthExceeded,
                                            context,
                                            "Invalid file content can not exceed " + std::to_string(maxBytes) + " bytes",
                                            "Exceeded maxBytes of " + std::to_string(maxBytes) + " by "
                                                    + std::to_string(content.size() - maxBytes)
                                                    + " bytes: context=" + std::string{context}));
    }
    return std::optional<std::string>{std::string{content}};
}

auto Validator::isValidDirectoryPath(std::string_view context, std::string_view input, bool allowNull) const -> bool {
    return detail::predicate([&] { return directoryPath(context, input, allowNull); });
}

auto Validator::getValidDirectoryPath(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string> {
    return detail::strict([&] { return directoryPath(context, input, allowNull); });
}

auto Validator::getValidDirectoryPath(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
        -> std::optional<std::string> {
    return detail::accumulate(context, errors, std::string{input}, [&] { return directoryPath(context, input, allowNull); });
}

auto Validator::isValidFileName(std::string_view context, std::string_view input, bool allowNull) const -> bool {
    return isValidFileName(context, input, policy_->configuration().allowed_file_extensions, allowNull);
}

auto Validator::isValidFileName(std::string_view context, std::string_view input, std::vector<std::string> const& allowedExtensions, bool allowNull) const
        -> bool {
    return detail::predicate([&] { return fileName(context, input, allowedExtensions, allowNull); });
}

auto Validator::getValidFileName(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string> {
    return getValidFileName(context, input, policy_->configuration().allowed_file_extensions, allowNull);
}

auto Validator::getValidFileName(std::string_view context, std::string_view input, std::vector<std::string> const& allowedExtensions, bool allowNull) const
        -> std::optional<std::string> {
    return detail::strict([&] { return fileName(context, input, allowedExtensions, allowNull); });
}

auto Validator::getValidFileName(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
        -> std::optional<std::string> {
    return getValidFileName(context, input, policy_->configuration().allowed_file_extensions, allowNull, errors);
}

auto Validator::getValidFileName(std::string_view                context,
                                 std::string_view                input,
                                 std::vector<std::string> const& allowedExtensions,
                                 bool                            allowNull,
                                 ValidationErrorList&            errors) const -> std::optional<std::string> {
    return detail::accumulate(context, errors, std::string{input}, [&] {
        return fileName(context, input, allowedExtensions, allowNull);
    });
}

auto Validator::isValidFileContent(std::string_view context, std::string_view content, std::size_t maxBytes, bool allowNull) const -> bool {
    return detail::predicate([&] { return fileContent(context, content, maxBytes, allowNull); });
}

auto Validator::getValidFileContent(std::string_view context, std::string_view content, std::size_t maxBytes, bool allowNull) const
        -> std::optional<std::string> {
    return detail::strict([&] { return fileContent(context, content, maxBytes, allowNull); });
}

auto Validator::getValidFileContent(std::string_view     context,
                                    std::string_view     content,
                                    std::size_t          maxBytes,
                                    bool                 allowNull,
                                    ValidationErrorList& errors) const -> std::optional<std::string> {
    return detail::accumulate(context, errors, std::string{content}, [&] {
        return fileContent(context, content, maxBytes, allowNull);
    });
}

auto Validator::isValidFileUpload(std::string_view context,
                                  std::string_view directoryPath,
                                  std::string_view fileName,
                                  std::string_view content,
                                  std::size_t      maxBytes,
                                  bool             allowNull) const -> bool {
    return isValidFileName(context, fileName, allowNull) && isValidDirectoryPath(context, directoryPath, allowNull)
           && isValidFileContent(context, content, maxBytes, allowNull);
}

void Validator::assertValidFileUpload(std::string_view context,
                                      std::string_view directoryPath,
                                      std::string_view fileName,
                                      std::string_view content,
                                      std::size_t      maxBytes,
                                      bool             allowNull) const {
    (void)getValidFileName(context, fileName, allowNull);
    (void)getValidDirectoryPath(context, directoryPath, allowNull);
    (void)getValidFileContent(context, content, maxBytes, allowNull);
}

void Validator::assertValidFileUpload(std::string_view     context,
                                      std::string_view     directoryPath,
                                      std::string_view     fileName,
                                      std::string_view     content,
                                      std::size_t          maxBytes,
                                      bool                 allowNull,
                                      ValidationErrorList& errors) const {
    (void)getValidFileName(context, fileName, allowNull, errors);
    (void)getValidDirectoryPath(context, directoryPath, allowNull, errors);
    (void)getValidFileContent(context, content, maxBytes, allowNull, errors);
}

} // namespace CG
