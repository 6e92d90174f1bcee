#include "sqlport/parser/sql_text.hpp"

#include <cctype>

namespace sqlport::parser {
namespace {

[[nodiscard]] bool is_space(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

[[nodiscard]] bool at_pair(std::string_view input, std::size_t index, char first, char second) noexcept
{
    return index + 1U < input.size() && input[index] == first && input[index + 1U] == second;
}

ParserDiagnostic make_split_error(std::string_view input, std::size_t offset, std::string message, std::string hint)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = std::move(message);
    diagnostic.line = line_number_at(input, offset);
    const auto line_start = input.rfind('\n', offset == 0U ? 0U : offset - 1U);
    diagnostic.column = line_start == std::string_view::npos || offset == 0U ? offset + 1U : offset - line_start;
    constexpr std::size_t kExcerptLength = 80U;
    diagnostic.statement = trim_copy(input.substr(offset, kExcerptLength));
    diagnostic.remediation_hints = {std::move(hint)};
    return diagnostic;
}

}  // namespace

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return std::string{text.substr(first, last - first + 1)};
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }

    return true;
}

bool starts_with_ci(std::string_view text, std::string_view prefix)
{
    if (prefix.size() > text.size()) {
        return false;
    }
    return iequals(text.substr(0, prefix.size()), prefix);
}

bool contains_ci(std::string_view text, std::string_view needle)
{
    if (needle.empty()) {
        return true;
    }
    if (needle.size() > text.size()) {
        return false;
    }
    for (std::size_t index = 0; index + needle.size() <= text.size(); ++index) {
        if (iequals(text.substr(index, needle.size()), needle)) {
            return true;
        }
    }
    return false;
}

std::string uppercase_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (unsigned char ch : text) {
        result.push_back(static_cast<char>(std::toupper(ch)));
    }
    return result;
}

std::string collapse_whitespace(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (const char ch : text) {
        if (is_space(ch)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(ch);
    }
    return result;
}

std::string strip_leading_comments(std::string_view text)
{
    std::size_t position = 0U;
    while (position < text.size()) {
        while (position < text.size() && is_space(text[position])) {
            ++position;
        }

        if (at_pair(text, position, '-', '-')) {
            position += 2U;
            while (position < text.size() && text[position] != '\n' && text[position] != '\r') {
                ++position;
            }
            continue;
        }

        if (at_pair(text, position, '/', '*')) {
            position += 2U;
            while (position + 1U < text.size() && !at_pair(text, position, '*', '/')) {
                ++position;
            }
            position = position + 1U < text.size() ? position + 2U : text.size();
            continue;
        }

        break;
    }

    return trim_copy(text.substr(position));
}

std::string strip_trailing_semicolon(std::string_view text)
{
    auto stripped = trim_copy(text);
    while (!stripped.empty() && stripped.back() == ';') {
        stripped.pop_back();
        stripped = trim_copy(stripped);
    }
    return stripped;
}

std::string strip_sql_comments(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    char quote = '\0';
    for (std::size_t index = 0; index < text.size(); ++index) {
        const char ch = text[index];

        if (quote != '\0') {
            result.push_back(ch);
            if (ch == quote) {
                if (index + 1U < text.size() && text[index + 1U] == quote) {
                    result.push_back(text[++index]);
                } else {
                    quote = '\0';
                }
            }
            continue;
        }

        if (ch == '\'' || ch == '"') {
            quote = ch;
            result.push_back(ch);
            continue;
        }

        if (at_pair(text, index, '-', '-')) {
            while (index < text.size() && text[index] != '\n') {
                ++index;
            }
            if (index < text.size()) {
                result.push_back('\n');
            }
            continue;
        }

        if (at_pair(text, index, '/', '*')) {
            index += 2U;
            while (index < text.size() && !at_pair(text, index, '*', '/')) {
                ++index;
            }
            ++index;
            result.push_back(' ');
            continue;
        }

        result.push_back(ch);
    }

    return trim_copy(result);
}

std::string_view next_token(std::string_view text, std::size_t& offset)
{
    while (offset < text.size() && is_space(text[offset])) {
        ++offset;
    }

    const auto start = offset;
    while (offset < text.size() && !is_space(text[offset]) && text[offset] != '(') {
        ++offset;
    }

    return text.substr(start, offset - start);
}

std::string escape_single_quotes(std::string_view text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const char ch : text) {
        escaped.push_back(ch);
        if (ch == '\'') {
            escaped.push_back('\'');
        }
    }
    return escaped;
}

std::string unescape_string_literal(std::string_view literal)
{
    if (literal.size() >= 2U && literal.front() == '\'' && literal.back() == '\'') {
        literal = literal.substr(1U, literal.size() - 2U);
    }

    std::string value;
    value.reserve(literal.size());
    for (std::size_t index = 0; index < literal.size(); ++index) {
        value.push_back(literal[index]);
        if (literal[index] == '\'' && index + 1U < literal.size() && literal[index + 1U] == '\'') {
            ++index;
        }
    }
    return value;
}

std::size_t replace_all(std::string& text, std::string_view from, std::string_view to)
{
    if (from.empty()) {
        return 0U;
    }

    std::size_t replaced = 0U;
    std::size_t position = text.find(from);
    while (position != std::string::npos) {
        text.replace(position, from.size(), to);
        position = text.find(from, position + to.size());
        ++replaced;
    }
    return replaced;
}

std::string substitute_placeholders(std::string_view pattern,
                                    std::initializer_list<std::pair<std::string_view, std::string_view>> values)
{
    std::string result;
    result.reserve(pattern.size());

    std::size_t position = 0U;
    while (position < pattern.size()) {
        const auto open = pattern.find('{', position);
        if (open == std::string_view::npos) {
            result.append(pattern.substr(position));
            break;
        }
        result.append(pattern.substr(position, open - position));

        const auto close = pattern.find('}', open + 1U);
        if (close == std::string_view::npos) {
            result.append(pattern.substr(open));
            break;
        }

        const auto key = pattern.substr(open + 1U, close - open - 1U);
        bool substituted = false;
        for (const auto& [name, value] : values) {
            if (name == key) {
                result.append(value);
                substituted = true;
                break;
            }
        }
        if (!substituted) {
            result.append(pattern.substr(open, close - open + 1U));
        }
        position = close + 1U;
    }

    return result;
}

std::size_t line_number_at(std::string_view text, std::size_t offset) noexcept
{
    std::size_t line = 1U;
    const auto limit = offset < text.size() ? offset : text.size();
    for (std::size_t index = 0; index < limit; ++index) {
        if (text[index] == '\n') {
            ++line;
        }
    }
    return line;
}

ScriptSplitResult split_sql_script(std::string_view input)
{
    ScriptSplitResult result{};

    enum class Mode : std::uint8_t {
        Code = 0,
        SingleQuote,
        DoubleQuote,
        LineComment,
        BlockComment,
        DollarBody
    };

    Mode mode = Mode::Code;
    std::size_t mode_start = 0U;
    std::size_t statement_start = std::string_view::npos;
    std::size_t last_code = 0U;

    auto mark_code = [&](std::size_t index) {
        if (statement_start == std::string_view::npos) {
            statement_start = index;
        }
        last_code = index;
    };

    auto close_statement = [&]() {
        if (statement_start != std::string_view::npos) {
            StatementSpan span{};
            span.offset = statement_start;
            span.length = last_code - statement_start + 1U;
            span.line = line_number_at(input, statement_start);
            result.spans.push_back(span);
        }
        statement_start = std::string_view::npos;
    };

    for (std::size_t index = 0; index < input.size(); ++index) {
        const char ch = input[index];

        switch (mode) {
        case Mode::LineComment:
            if (ch == '\n') {
                mode = Mode::Code;
            }
            continue;
        case Mode::BlockComment:
            if (at_pair(input, index, '*', '/')) {
                mode = Mode::Code;
                ++index;
            }
            continue;
        case Mode::SingleQuote:
        case Mode::DoubleQuote: {
            const char quote = mode == Mode::SingleQuote ? '\'' : '"';
            last_code = index;
            if (ch == quote) {
                if (index + 1U < input.size() && input[index + 1U] == quote) {
                    ++index;
                    last_code = index;
                } else {
                    mode = Mode::Code;
                }
            }
            continue;
        }
        case Mode::DollarBody:
            last_code = index;
            if (at_pair(input, index, '$', '$')) {
                ++index;
                last_code = index;
                mode = Mode::Code;
            }
            continue;
        case Mode::Code:
        default:
            break;
        }

        if (is_space(ch)) {
            continue;
        }

        if (at_pair(input, index, '-', '-')) {
            mode = Mode::LineComment;
            ++index;
            continue;
        }

        if (at_pair(input, index, '/', '*')) {
            mode = Mode::BlockComment;
            mode_start = index;
            ++index;
            continue;
        }

        if (ch == ';') {
            close_statement();
            continue;
        }

        mark_code(index);

        if (ch == '\'') {
            mode = Mode::SingleQuote;
            mode_start = index;
        } else if (ch == '"') {
            mode = Mode::DoubleQuote;
            mode_start = index;
        } else if (at_pair(input, index, '$', '$')) {
            mode = Mode::DollarBody;
            mode_start = index;
            ++index;
            last_code = index;
        }
    }

    switch (mode) {
    case Mode::SingleQuote:
        result.error = make_split_error(input, mode_start, "Unterminated string literal",
                                        "Close the string literal with a matching single quote.");
        break;
    case Mode::DoubleQuote:
        result.error = make_split_error(input, mode_start, "Unterminated quoted identifier",
                                        "Close the identifier with a matching double quote.");
        break;
    case Mode::BlockComment:
        result.error = make_split_error(input, mode_start, "Unterminated block comment",
                                        "Close the comment with */.");
        break;
    case Mode::DollarBody:
        result.error = make_split_error(input, mode_start, "Unterminated $$ body",
                                        "Close the procedural body with a matching $$.");
        break;
    case Mode::Code:
    case Mode::LineComment:
    default:
        close_statement();
        break;
    }

    if (result.error) {
        result.spans.clear();
    }
    return result;
}

}  // namespace sqlport::parser
