#pragma once
#include "canonguard/codec/Canonicalizer.hpp"
#include "canonguard/config/SecurityPolicy.hpp"
#include "canonguard/core/Error.hpp"
#include "canonguard/core/ValidationErrorList.hpp"
#include "canonguard/rules/RuleRegistry.hpp"
#include "canonguard/rules/Rules.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace httplib {
struct Request;
}

namespace CG {

/**
 * Canonicalization-aware whitelist validator.
 *
 * Every semantic input kind is offered in three call shapes with identical
 * validation semantics:
 *   - isValidX(...)            returns false on any failure and never throws.
 *   - getValidX(...)           returns the canonical value or throws
 *                              ValidationException / IntrusionException.
 *   - getValidX(..., errors)   appends a ValidationException-class failure to
 *                              `errors` and returns a placeholder (the raw input,
 *                              0 for numbers, nullopt for dates). IntrusionException
 *                              always propagates.
 *
 * Blank input (empty or only chars <= 0x20) counts as null. When null is allowed
 * the typed forms return std::nullopt.
 *
 * A Validator is populated once (addRule) and read-only afterwards; concurrent
 * validation calls on a populated instance are safe.
 */
class Validator {
public:
    /**
     * `canonicalizer` normalizes caller input. `fileValidator` validates directory
     * and file name shapes; it is built around the dedicated file canonicalizer so
     * application customization of `canonicalizer` never weakens path checks. A
     * null `fileValidator` makes this instance validate its own paths.
     */
    Validator(std::shared_ptr<SecurityPolicy const> policy,
              std::shared_ptr<Canonicalizer const>  canonicalizer,
              std::shared_ptr<Validator const>      fileValidator);

    // Caller-facing validator using the policy's codecs plus its dedicated file validator.
    static auto create(std::shared_ptr<SecurityPolicy const> policy) -> std::shared_ptr<Validator>;

    // Standalone path validator built on makeFileCanonicalizer().
    static auto createFileValidator(std::shared_ptr<SecurityPolicy const> policy) -> std::shared_ptr<Validator const>;

    auto policy() const noexcept -> SecurityPolicy const& { return *policy_; }
    auto canonicalizer() const noexcept -> Canonicalizer const& { return *canonicalizer_; }

    // Registers a rule under its type name; a later rule with the same name replaces it.
    void addRule(Rule rule);
    auto getRule(std::string_view name) const -> Rule const*;

    // ---- Free text against a named pattern ----
    auto isValidInput(std::string_view context, std::string_view input, std::string_view type, std::size_t maxLength, bool allowNull) const -> bool;
    auto getValidInput(std::string_view context, std::string_view input, std::string_view type, std::size_t maxLength, bool allowNull) const
            -> std::optional<std::string>;
    auto getValidInput(std::string_view context, std::string_view input, std::string_view type, std::size_t maxLength, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;

    // ---- Dates ----
    auto isValidDate(std::string_view context, std::string_view input, std::string_view format, bool allowNull) const -> bool;
    auto getValidDate(std::string_view context, std::string_view input, std::string_view format, bool allowNull) const
            -> std::optional<std::chrono::sys_seconds>;
    auto getValidDate(std::string_view context, std::string_view input, std::string_view format, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::chrono::sys_seconds>;

    // ---- Safe HTML fragments ----
    auto isValidSafeHTML(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const -> bool;
    auto getValidSafeHTML(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
            -> std::optional<std::string>;
    auto getValidSafeHTML(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;

    // ---- Credit card numbers ----
    auto isValidCreditCard(std::string_view context, std::string_view input, bool allowNull) const -> bool;
    auto getValidCreditCard(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string>;
    auto getValidCreditCard(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;

    // ---- Directory paths: the canonical path must equal the input byte for byte ----
    // The input must name an existing directory. An existing plain file is rejected
    // with "Invalid directory, not a directory", not just a missing path.
    auto isValidDirectoryPath(std::string_view context, std::string_view input, bool allowNull) const -> bool;
    auto getValidDirectoryPath(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string>;
    auto getValidDirectoryPath(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;

    // ---- File names, against the configured extensions or an explicit list ----
    auto isValidFileName(std::string_view context, std::string_view input, bool allowNull) const -> bool;
    auto isValidFileName(std::string_view context, std::string_view input, std::vector<std::string> const& allowedExtensions, bool allowNull) const
            -> bool;
    auto getValidFileName(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string>;
    auto getValidFileName(std::string_view context, std::string_view input, std::vector<std::string> const& allowedExtensions, bool allowNull) const
            -> std::optional<std::string>;
    auto getValidFileName(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;
    auto getValidFileName(std::string_view context,
                          std::string_view input,
                          std::vector<std::string> const& allowedExtensions,
                          bool allowNull,
                          ValidationErrorList& errors) const -> std::optional<std::string>;

    /**
     * ---- Numbers with integral bounds ----
     * The bounds are converted to double and the value is validated as a double,
     * so bounds beyond 2^53 are rounded before the comparison.
     */
    auto isValidNumber(std::string_view context, std::string_view input, std::int64_t minValue, std::int64_t maxValue, bool allowNull) const
            -> bool;
    auto getValidNumber(std::string_view context, std::string_view input, std::int64_t minValue, std::int64_t maxValue, bool allowNull) const
            -> std::optional<double>;
    auto getValidNumber(std::string_view     context,
                        std::string_view     input,
                        std::int64_t         minValue,
                        std::int64_t         maxValue,
                        bool                 allowNull,
                        ValidationErrorList& errors) const -> std::optional<double>;

    // ---- Doubles ----
    auto isValidDouble(std::string_view context, std::string_view input, double minValue, double maxValue, bool allowNull) const -> bool;
    auto getValidDouble(std::string_view context, std::string_view input, double minValue, double maxValue, bool allowNull) const
            -> std::optional<double>;
    auto getValidDouble(std::string_view context, std::string_view input, double minValue, double maxValue, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<double>;

    // ---- Integers ----
    auto isValidInteger(std::string_view context, std::string_view input, int minValue, int maxValue, bool allowNull) const -> bool;
    auto getValidInteger(std::string_view context, std::string_view input, int minValue, int maxValue, bool allowNull) const
            -> std::optional<int>;
    auto getValidInteger(std::string_view context, std::string_view input, int minValue, int maxValue, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<int>;

    // ---- File content: both the global upload ceiling and maxBytes apply ----
    auto isValidFileContent(std::string_view context, std::string_view content, std::size_t maxBytes, bool allowNull) const -> bool;
    auto getValidFileContent(std::string_view context, std::string_view content, std::size_t maxBytes, bool allowNull) const
            -> std::optional<std::string>;
    auto getValidFileContent(std::string_view context, std::string_view content, std::size_t maxBytes, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;

    /**
     * ---- File uploads: file name, then directory path, then content ----
     * The strict form stops at the first failing check. The accumulating form
     * runs all three and records every failure.
     */
    auto isValidFileUpload(std::string_view context,
                           std::string_view directoryPath,
                           std::string_view fileName,
                           std::string_view content,
                           std::size_t      maxBytes,
                           bool             allowNull) const -> bool;
    void assertValidFileUpload(std::string_view context,
                               std::string_view directoryPath,
                               std::string_view fileName,
                               std::string_view content,
                               std::size_t      maxBytes,
                               bool             allowNull) const;
    void assertValidFileUpload(std::string_view     context,
                               std::string_view     directoryPath,
                               std::string_view     fileName,
                               std::string_view     content,
                               std::size_t          maxBytes,
                               bool                 allowNull,
                               ValidationErrorList& errors) const;

    /**
     * ---- Whole HTTP requests ----
     * A null request is a validation failure. Any method other than GET or POST
     * raises IntrusionException, including from the accumulating form.
     */
    auto isValidHTTPRequest(httplib::Request const* request) const -> bool;
    void assertIsValidHTTPRequest(httplib::Request const* request) const;
    void assertIsValidHTTPRequest(httplib::Request const* request, ValidationErrorList& errors) const;

    // ---- Parameter names must be exactly required plus any subset of optional ----
    auto isValidHTTPRequestParameterSet(std::string_view             context,
                                        httplib::Request const&      request,
                                        std::set<std::string> const& required,
                                        std::set<std::string> const& optional) const -> bool;
    void assertIsValidHTTPRequestParameterSet(std::string_view             context,
                                              httplib::Request const&      request,
                                              std::set<std::string> const& required,
                                              std::set<std::string> const& optional) const;
    void assertIsValidHTTPRequestParameterSet(std::string_view             context,
                                              httplib::Request const&      request,
                                              std::set<std::string> const& required,
                                              std::set<std::string> const& optional,
                                              ValidationErrorList&         errors) const;

    // ---- List membership (exact, no canonicalization) ----
    auto isValidListItem(std::string_view context, std::string_view input, std::vector<std::string> const& list) const -> bool;
    auto getValidListItem(std::string_view context, std::string_view input, std::vector<std::string> const& list) const -> std::string;
    auto getValidListItem(std::string_view context, std::string_view input, std::vector<std::string> const& list, ValidationErrorList& errors) const
            -> std::string;

    // ---- Printable ASCII (0x21..0x7D); the text form is canonicalized first ----
    auto isValidPrintable(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const -> bool;
    auto getValidPrintable(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
            -> std::optional<std::string>;
    auto getValidPrintable(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;
    auto isValidPrintable(std::string_view context, std::span<unsigned char const> input, std::size_t maxLength, bool allowNull) const -> bool;
    auto getValidPrintable(std::string_view context, std::span<unsigned char const> input, std::size_t maxLength, bool allowNull) const
            -> std::optional<std::vector<unsigned char>>;
    auto getValidPrintable(std::string_view               context,
                           std::span<unsigned char const> input,
                           std::size_t                    maxLength,
                           bool                           allowNull,
                           ValidationErrorList&           errors) const -> std::optional<std::vector<unsigned char>>;

    // ---- Redirect targets, "Redirect" pattern bounded by redirect_max_length ----
    auto isValidRedirectLocation(std::string_view context, std::string_view input, bool allowNull) const -> bool;
    auto getValidRedirectLocation(std::string_view context, std::string_view input, bool allowNull) const -> std::optional<std::string>;
    auto getValidRedirectLocation(std::string_view context, std::string_view input, bool allowNull, ValidationErrorList& errors) const
            -> std::optional<std::string>;

    /**
     * Reads one line (terminated by '\n', '\r' or end of stream) of at most
     * `maxLength` characters. Returns std::nullopt at end of stream with nothing
     * read. Throws ValidationAvailabilityException for a non-positive limit, an
     * overlong line or a stream fault.
     */
    auto safeReadLine(std::istream& in, int maxLength) const -> std::optional<std::string>;

private:
    auto text(std::string_view context, std::string_view input, std::string_view type, std::size_t maxLength, bool allowNull) const
            -> Expected<std::optional<std::string>>;
    auto date(std::string_view context, std::string_view input, std::string_view format, bool allowNull) const
            -> Expected<std::optional<std::chrono::sys_seconds>>;
    auto safeHtml(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
            -> Expected<std::optional<std::string>>;
    auto creditCard(std::string_view context, std::string_view input, bool allowNull) const -> Expected<std::optional<std::string>>;
    auto directoryPath(std::string_view context, std::string_view input, bool allowNull) const -> Expected<std::optional<std::string>>;
    auto fileName(std::string_view context, std::string_view input, std::vector<std::string> const& allowedExtensions, bool allowNull) const
            -> Expected<std::optional<std::string>>;
    auto doubleValue(std::string_view context, std::string_view input, double minValue, double maxValue, bool allowNull) const
            -> Expected<std::optional<double>>;
    auto integerValue(std::string_view context, std::string_view input, int minValue, int maxValue, bool allowNull) const
            -> Expected<std::optional<int>>;
    auto fileContent(std::string_view context, std::string_view content, std::size_t maxBytes, bool allowNull) const
            -> Expected<std::optional<std::string>>;
    auto httpRequest(httplib::Request const* request) const -> Expected<void>;
    auto parameterSet(std::string_view             context,
                      httplib::Request const&      request,
                      std::set<std::string> const& required,
                      std::set<std::string> const& optional) const -> Expected<void>;
    auto listItem(std::string_view context, std::string_view input, std::vector<std::string> const& list) const -> Expected<std::string>;
    auto printable(std::string_view context, std::span<unsigned char const> input, std::size_t maxLength, bool allowNull) const
            -> Expected<std::optional<std::vector<unsigned char>>>;
    auto printableText(std::string_view context, std::string_view input, std::size_t maxLength, bool allowNull) const
            -> Expected<std::optional<std::string>>;

    auto pathValidator() const -> Validator const&;

    std::shared_ptr<SecurityPolicy const> policy_;
    std::shared_ptr<Canonicalizer const>  canonicalizer_;
    std::shared_ptr<Validator const>      fileValidator_;
    RuleRegistry                          rules_;
};

} // namespace CG
