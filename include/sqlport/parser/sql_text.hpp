#pragma once

#include "sqlport/parser/diagnostics.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlport::parser {

[[nodiscard]] std::string trim_copy(std::string_view text);
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs);
[[nodiscard]] bool starts_with_ci(std::string_view text, std::string_view prefix);
[[nodiscard]] bool contains_ci(std::string_view text, std::string_view needle);
[[nodiscard]] std::string uppercase_copy(std::string_view text);
[[nodiscard]] std::string collapse_whitespace(std::string_view text);

[[nodiscard]] std::string strip_leading_comments(std::string_view text);
[[nodiscard]] std::string strip_trailing_semicolon(std::string_view text);

// Removes line and block comments outside string literals and quoted identifiers.
[[nodiscard]] std::string strip_sql_comments(std::string_view text);

[[nodiscard]] std::string_view next_token(std::string_view text, std::size_t& offset);

[[nodiscard]] std::string escape_single_quotes(std::string_view text);
[[nodiscard]] std::string unescape_string_literal(std::string_view literal);

std::size_t replace_all(std::string& text, std::string_view from, std::string_view to);

// Replaces every "{name}" occurrence with the matching value; unknown placeholders stay.
[[nodiscard]] std::string substitute_placeholders(
    std::string_view pattern,
    std::initializer_list<std::pair<std::string_view, std::string_view>> values);

[[nodiscard]] std::size_t line_number_at(std::string_view text, std::size_t offset) noexcept;

struct StatementSpan final {
    std::size_t offset = 0U;
    std::size_t length = 0U;
    std::size_t line = 1U;
};

struct ScriptSplitResult final {
    std::vector<StatementSpan> spans{};
    std::optional<ParserDiagnostic> error{};

    [[nodiscard]] bool success() const noexcept { return !error.has_value(); }
};

// Splits a script on ';' outside quotes, comments and $$ bodies. An unterminated quote,
// block comment or $$ body is reported as an error and no spans are returned.
[[nodiscard]] ScriptSplitResult split_sql_script(std::string_view input);

}  // namespace sqlport::parser
