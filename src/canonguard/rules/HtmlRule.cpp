#include "canonguard/rules/Rules.hpp"

#include "rules/RuleSupport.hpp"

#include <algorithm>
#include <cctype>

namespace CG {

namespace {

auto lowercase(std::string_view value) -> std::string {
    std::string out{value};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

auto is_name_char(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '_' || ch == ':';
}

auto is_space(char ch) -> bool {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

// URL schemes that execute or smuggle content. Control chars and spaces are ignored,
// matching how browsers read "java\tscript:".
auto has_dangerous_scheme(std::string_view value) -> bool {
    std::string compact;
    for (char ch : value) {
        if (static_cast<unsigned char>(ch) > 0x20) {
            compact.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    return compact.starts_with("javascript:") || compact.starts_with("vbscript:") || compact.starts_with("data:");
}

class MarkupScanner {
public:
    MarkupScanner(std::string_view                text,
                  std::vector<std::string> const& tags,
                  std::vector<std::string> const& attributes)
        : text_(text), tags_(tags), attributes_(attributes) {}

    // Empty string on success, otherwise the reason for rejection.
    auto scan() -> std::string {
        while (pos_ < text_.size()) {
            if (text_[pos_] != '<') {
                ++pos_;
                continue;
            }
            ++pos_;
            if (auto problem = scanTag(); !problem.empty()) {
                return problem;
            }
        }
        return {};
    }

private:
    auto allowed(std::vector<std::string> const& set, std::string const& name) const -> bool {
        return std::find(set.begin(), set.end(), name) != set.end();
    }

    auto readName() -> std::string {
        auto start = pos_;
        while (pos_ < text_.size() && is_name_char(text_[pos_])) {
            ++pos_;
        }
        return lowercase(text_.substr(start, pos_ - start));
    }

    void skipSpace() {
        while (pos_ < text_.size() && is_space(text_[pos_])) {
            ++pos_;
        }
    }

    auto scanTag() -> std::string {
        if (pos_ < text_.size() && text_[pos_] == '/') {
            ++pos_;
        }
        if (pos_ >= text_.size() || std::isalpha(static_cast<unsigned char>(text_[pos_])) == 0) {
            return "markup declaration or stray '<' is not allowed";
        }
        auto tag = readName();
        if (!allowed(tags_, tag)) {
            return "tag <" + tag + "> is not allowed";
        }
        while (true) {
            skipSpace();
            if (pos_ >= text_.size()) {
                return "unterminated tag <" + tag + ">";
            }
            if (text_[pos_] == '>') {
                ++pos_;
                return {};
            }
            if (text_[pos_] == '/' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '>') {
                pos_ += 2;
                return {};
            }
            auto attribute = readName();
            if (attribute.empty()) {
                return "malformed attribute in <" + tag + ">";
            }
            if (attribute.starts_with("on") || !allowed(attributes_, attribute)) {
                return "attribute '" + attribute + "' is not allowed";
            }
            skipSpace();
            if (pos_ < text_.size() && text_[pos_] == '=') {
                ++pos_;
                skipSpace();
                auto value = readValue();
                if (!value) {
                    return "unterminated value for attribute '" + attribute + "'";
                }
                if (has_dangerous_scheme(*value)) {
                    return "attribute '" + attribute + "' carries a script URL";
                }
            }
        }
    }

    auto readValue() -> std::optional<std::string_view> {
        if (pos_ >= text_.size()) {
            return std::nullopt;
        }
        char const quote = text_[pos_];
        if (quote == '"' || quote == '\'') {
            auto end = text_.find(quote, pos_ + 1);
            if (end == std::string_view::npos) {
                return std::nullopt;
            }
            auto value = text_.substr(pos_ + 1, end - pos_ - 1);
            pos_       = end + 1;
            return value;
        }
        auto start = pos_;
        while (pos_ < text_.size() && !is_space(text_[pos_]) && text_[pos_] != '>') {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    std::string_view                text_;
    std::vector<std::string> const& tags_;
    std::vector<std::string> const& attributes_;
    std::size_t                     pos_{0};
};

} // namespace

HtmlRule::HtmlRule(std::string typeName, std::vector<std::string> allowedTags, std::vector<std::string> allowedAttributes)
    : RuleBase(std::move(typeName)) {
    for (auto const& tag : allowedTags) {
        allowedTags_.push_back(lowercase(tag));
    }
    for (auto const& attribute : allowedAttributes) {
        allowedAttributes_.push_back(lowercase(attribute));
    }
}

auto HtmlRule::validate(std::string_view context, std::string_view input, Canonicalizer const& canonicalizer) const
        -> Expected<std::optional<std::string>> {
    if (detail::isBlank(input)) {
        if (allowNull()) {
            return std::optional<std::string>{};
        }
        return std::unexpected(detail::inputRequired(context, "Input HTML", input));
    }

    auto canonical = detail::canonicalizeInput(canonicalizer, context, input, "HTML");
    if (!canonical) {
        return std::unexpected(canonical.error());
    }

    if (canonical->size() > maximumLength()) {
        return std::unexpected(detail::fail(Error::Code::LengthExceeded,
                                            context,
                                            "Invalid HTML. You entered " + std::to_string(canonical->size())
                                                    + " characters. Input can not exceed "
                                                    + std::to_string(maximumLength()) + " characters.",
                                            "Input exceeds maximum allowed length of " + std::to_string(maximumLength())
                                                    + " by " + std::to_string(canonical->size() - maximumLength())
                                                    + " characters: context=" + std::string{context}));
    }

    MarkupScanner scanner{*canonical, allowedTags_, allowedAttributes_};
    if (auto problem = scanner.scan(); !problem.empty()) {
        return std::unexpected(detail::fail(Error::Code::ValidationFailed,
                                            context,
                                            "Invalid HTML input",
                                            "Unsafe HTML (" + problem + "): context=" + std::string{context}
                                                    + ", input=" + *canonical));
    }
    return std::optional<std::string>{std::move(*canonical)};
}

} // namespace CG
