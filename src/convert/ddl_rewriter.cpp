#include "sqlport/convert/ddl_rewriter.hpp"

#include "sqlport/common/logger.hpp"
#include "sqlport/convert/manual_review.hpp"
#include "sqlport/dialect/clause_extension.hpp"
#include "sqlport/dialect/dialect.hpp"
#include "sqlport/parser/grammar.hpp"
#include "sqlport/parser/sql_printer.hpp"
#include "sqlport/parser/sql_text.hpp"
#include "sqlport/rules/rule_set.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <utility>

namespace sqlport::convert {

struct DdlRewriter::Context final {
    std::string file{};
    std::size_t line = 0U;
    std::string table_name{};
    std::vector<ConversionLogEntry> logs{};
    std::optional<std::string> table_comment{};
    std::vector<std::pair<std::string, std::string>> column_comments{};

    void log(ConversionAction action, std::string details)
    {
        logs.push_back(ConversionLogEntry{action, std::move(details), file});
    }
};

namespace {

constexpr std::string_view kComponent = "ddl_rewriter";

constexpr std::array<std::string_view, 5> kComplexTypes{"VARIANT", "OBJECT", "ARRAY", "GEOGRAPHY", "GEOMETRY"};

std::optional<std::size_t> parse_size(std::string_view text)
{
    const auto trimmed = parser::trim_copy(text);
    if (trimmed.empty() || trimmed.size() > 18U
        || !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::stoull(trimmed));
}

bool is_complex_type(std::string_view upper_name)
{
    return std::find(kComplexTypes.begin(), kComplexTypes.end(), upper_name) != kComplexTypes.end();
}

bool has_constraint(const parser::ColumnDefinition& column, parser::ColumnConstraintKind kind)
{
    return std::any_of(column.constraints.begin(), column.constraints.end(), [kind](const auto& constraint) {
        return constraint.kind == kind;
    });
}

void flag(ManualReviewCollector* review,
          std::string_view file,
          std::string_view object,
          std::string_view issue,
          std::string message,
          std::string suggested_action,
          std::size_t line)
{
    if (review == nullptr) {
        return;
    }
    ReviewRequest request{};
    request.file_path = std::string{file};
    request.object_name = std::string{object};
    request.object_type = "TABLE";
    request.issue_type = std::string{issue};
    request.message = std::move(message);
    request.severity = ReviewSeverity::Info;
    request.suggested_action = std::move(suggested_action);
    if (line != 0U) {
        request.line = line;
    }
    review->record(std::move(request));
}


bool is_identifier_char(char ch) noexcept
{
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '$';
}

bool is_space(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::size_t skip_spaces(std::string_view sql, std::size_t pos)
{
    while (pos < sql.size() && is_space(sql[pos])) {
        ++pos;
    }
    return pos;
}

// Length of the literal, quoted identifier, comment or $$ body starting at `pos`; 0 when
// none starts there. Unterminated sections run to the end of the text.
std::size_t quoted_length(std::string_view sql, std::size_t pos)
{
    const auto ch = sql[pos];
    const auto next = pos + 1U < sql.size() ? sql[pos + 1U] : '\0';
    if (ch == '\'' || ch == '"') {
        for (auto end = pos + 1U; end < sql.size(); ++end) {
            if (sql[end] != ch) {
                continue;
            }
            if (end + 1U < sql.size() && sql[end + 1U] == ch) {
                ++end;
                continue;
            }
            return end + 1U - pos;
        }
        return sql.size() - pos;
    }

    std::size_t end = std::string_view::npos;
    std::size_t terminator = 0U;
    if (ch == '-' && next == '-') {
        end = sql.find('\n', pos + 2U);
    } else if (ch == '/' && next == '*') {
        end = sql.find("*/", pos + 2U);
        terminator = 2U;
    } else if (ch == '$' && next == '$') {
        end = sql.find("$$", pos + 2U);
        terminator = 2U;
    } else {
        return 0U;
    }
    return (end == std::string_view::npos ? sql.size() : end + terminator) - pos;
}

// End of a type name starting at `pos`, including a parenthesised argument list.
std::size_t type_extent(std::string_view sql, std::size_t pos)
{
    auto end = pos;
    while (end < sql.size() && is_identifier_char(sql[end])) {
        ++end;
    }
    if (end == pos) {
        return pos;
    }
    const auto paren = skip_spaces(sql, end);
    if (paren < sql.size() && sql[paren] == '(') {
        if (const auto close = sql.find(')', paren); close != std::string_view::npos) {
            end = close + 1U;
        }
    }
    return end;
}

// Multi-word type names (DOUBLE PRECISION, TIMESTAMP WITH TIME ZONE) are not rewritten inline.
bool continues_type_name(std::string_view sql, std::size_t end)
{
    const auto next = skip_spaces(sql, end);
    auto word_end = next;
    while (word_end < sql.size() && is_identifier_char(sql[word_end])) {
        ++word_end;
    }
    const auto word = parser::uppercase_copy(sql.substr(next, word_end - next));
    return word == "PRECISION" || word == "VARYING" || word == "WITH" || word == "WITHOUT";
}

}  // namespace

DdlRewriter::DdlRewriter(const rules::RuleSet& rules, const dialect::Dialect& target, ManualReviewCollector* review)
    : rules_{rules}
    , target_{target}
    , review_{review}
{
}

TypeConversion DdlRewriter::convert_type(const parser::DataType& source, std::vector<std::string>* warnings) const
{
    TypeConversion result{source, false};

    const auto type_name = parser::uppercase_copy(source.name);
    const auto* mapped = rules_.find_type_mapping(type_name);
    if (mapped == nullptr) {
        return result;
    }

    auto target_text = *mapped;
    bool drop_arguments = false;
    bool sized_by_template = false;

    if (const auto* dynamic = rules_.find_dynamic_rule(type_name); dynamic != nullptr && !source.arguments.empty()) {
        if (const auto size = parse_size(source.arguments.front())) {
            if (*size > dynamic->max_size) {
                if (dynamic->overflow_type) {
                    target_text = *dynamic->overflow_type;
                }
                drop_arguments = true;
            } else if (dynamic->size_template) {
                const auto size_text = std::to_string(*size);
                target_text = parser::substitute_placeholders(*dynamic->size_template, {{"size", size_text}});
                sized_by_template = true;
            }
        } else if (warnings != nullptr) {
            warnings->push_back("Dynamic rule evaluation failed for " + type_name + ": size '"
                                + source.arguments.front() + "' is not numeric");
        }
    }

    auto parsed = parser::parse_data_type(target_text);
    if (!parsed.ast) {
        std::string reason = "mapped type '" + target_text + "' is not a valid data type";
        if (!parsed.diagnostics.empty()) {
            reason += ": " + parsed.diagnostics.front().message;
        }
        throw std::runtime_error(reason);
    }

    auto converted = std::move(*parsed.ast);
    if (rules_.is_paramless(converted.name) || rules_.is_paramless(target_text)) {
        converted.arguments.clear();
    } else if (!source.arguments.empty() && !drop_arguments && !sized_by_template) {
        // Source precision wins over arguments written into the mapped target.
        converted.arguments = source.arguments;
    }

    result.changed = parser::render_data_type(converted) != parser::render_data_type(source);
    result.type = std::move(converted);
    return result;
}

void DdlRewriter::convert_data_types(parser::CreateTableStatement& statement, Context& context) const
{
    for (auto& column : statement.columns) {
        if (!column.type) {
            continue;
        }

        const auto original = parser::render_data_type(*column.type);
        if (rules_.find_type_mapping(column.type->name) == nullptr) {
            const auto upper = parser::uppercase_copy(column.type->name);
            if (is_complex_type(upper)) {
                flag(review_,
                     context.file,
                     context.table_name + "." + column.name.value,
                     "Complex_data_types",
                     "Column type " + upper + " has no mapping for " + std::string{target_.name()},
                     "Review complex data types (ARRAY, VARIANT, etc.) for target equivalents",
                     context.line);
            }
            continue;
        }

        try {
            std::vector<std::string> warnings;
            auto conversion = convert_type(*column.type, &warnings);
            for (const auto& warning : warnings) {
                common::log_warning(kComponent, warning);
            }

            if (conversion.changed) {
                const auto converted = parser::render_data_type(conversion.type);
                context.log(ConversionAction::DataTypeConverted,
                            "Converted column " + column.name.value + ": " + original + " -> " + converted);
                common::log_debug(kComponent, "data type " + original + " replaced with " + converted);
            }
            column.type = std::move(conversion.type);
        } catch (const std::exception& error) {
            const auto details = "Type conversion failed for column " + column.name.value + " (" + original
                                 + "): " + error.what();
            common::log_error(kComponent, details);
            context.log(ConversionAction::TypeConversionError, details);
        }
    }
}

void DdlRewriter::convert_virtual_columns(parser::CreateTableStatement& statement, Context& context) const
{
    if (!rules_.behaviors.virtual_column_conversion.enabled) {
        return;
    }

    for (auto& column : statement.columns) {
        if (has_constraint(column, parser::ColumnConstraintKind::Identity)) {
            continue;
        }
        auto it = std::find_if(column.constraints.begin(), column.constraints.end(), [](const auto& constraint) {
            return constraint.kind == parser::ColumnConstraintKind::Computed;
        });
        if (it == column.constraints.end()) {
            continue;
        }

        auto computed = std::move(*it);
        column.constraints.erase(it);
        computed.computed_style = parser::ComputedStyle::Virtual;
        column.constraints.push_back(std::move(computed));

        context.log(ConversionAction::VirtualColumnConverted,
                    "Converted column " + column.name.value + " to a virtual column");
    }
}

void DdlRewriter::remove_clauses(parser::CreateTableStatement& statement, Context& context) const
{
    const auto& removal = rules_.behaviors.clause_removal;
    if (!removal.enabled) {
        return;
    }

    const bool remove_partition =
        std::find(removal.clauses.begin(), removal.clauses.end(), "PARTITION BY") != removal.clauses.end();

    auto& properties = statement.properties;
    for (auto it = properties.begin(); it != properties.end();) {
        const bool remove = it->kind == parser::TablePropertyKind::ClusterBy
                            || (remove_partition && it->kind == parser::TablePropertyKind::PartitionBy);
        if (remove) {
            context.log(ConversionAction::ClauseRemoved, "Removed " + parser::render_table_property(*it));
            it = properties.erase(it);
        } else {
            ++it;
        }
    }
}

void DdlRewriter::remove_with_properties(parser::CreateTableStatement& statement, Context& context) const
{
    const auto& removal = rules_.behaviors.with_property_removal;
    if (!removal.enabled) {
        return;
    }

    auto& properties = statement.properties;
    for (auto it = properties.begin(); it != properties.end();) {
        if (it->kind == parser::TablePropertyKind::Comment) {
            ++it;
            continue;
        }

        const auto rendered = parser::render_table_property(*it);
        bool remove = false;
        bool heuristic = false;

        if (it->kind == parser::TablePropertyKind::Extension && it->extension != nullptr
            && (it->extension->name() == "row_access_policy" || it->extension->name() == "tags")) {
            remove = true;
        } else if ((it->kind == parser::TablePropertyKind::Generic || it->kind == parser::TablePropertyKind::Flag)
                   && removal.properties.count(parser::uppercase_copy(it->name)) != 0U) {
            remove = true;
        } else if (parser::contains_ci(rendered, "TAG")) {
            remove = true;
            heuristic = true;
        }

        if (!remove) {
            ++it;
            continue;
        }

        context.log(ConversionAction::PropertyRemoved, "Removed table property: " + rendered);
        if (heuristic) {
            flag(review_,
                 context.file,
                 context.table_name,
                 "Tag_heuristic_removal",
                 "Property removed only because its text contains 'TAG': " + rendered,
                 "Confirm the removed property was a tag and not table data",
                 context.line);
        }
        it = properties.erase(it);
    }
}

void DdlRewriter::extract_comments(parser::CreateTableStatement& statement, Context& context) const
{
    auto& properties = statement.properties;
    for (auto it = properties.begin(); it != properties.end();) {
        if (it->kind == parser::TablePropertyKind::Comment) {
            context.table_comment = it->value;
            it = properties.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& column : statement.columns) {
        auto& constraints = column.constraints;
        for (auto it = constraints.begin(); it != constraints.end();) {
            if (it->kind == parser::ColumnConstraintKind::Comment) {
                context.column_comments.emplace_back(parser::format_identifier(column.name, target_), it->text);
                it = constraints.erase(it);
            } else {
                ++it;
            }
        }
    }

    const auto extracted = context.column_comments.size() + (context.table_comment ? 1U : 0U);
    if (extracted != 0U) {
        context.log(ConversionAction::CommentExtracted,
                    "Extracted " + std::to_string(extracted) + " comment(s) from " + context.table_name);
    }
}

std::vector<std::string> DdlRewriter::render_comments(Context& context) const
{
    std::vector<std::string> statements;
    const auto& comments = rules_.behaviors.comment_conversion;
    std::size_t dropped = 0U;

    if (context.table_comment) {
        if (comments.enabled && !comments.target_table_template.empty()) {
            const auto escaped = parser::escape_single_quotes(*context.table_comment);
            statements.push_back(parser::substitute_placeholders(
                comments.target_table_template, {{"table_name", context.table_name}, {"comment_text", escaped}}));
        } else {
            ++dropped;
        }
    }

    for (const auto& [column, text] : context.column_comments) {
        if (comments.enabled && !comments.target_column_template.empty()) {
            const auto escaped = parser::escape_single_quotes(text);
            statements.push_back(parser::substitute_placeholders(
                comments.target_column_template,
                {{"table_name", context.table_name}, {"column_name", column}, {"comment_text", escaped}}));
        } else {
            ++dropped;
        }
    }

    if (dropped != 0U) {
        context.log(ConversionAction::CommentDropped,
                    "Dropped " + std::to_string(dropped) + " comment(s) from " + context.table_name
                        + " because comment conversion is not configured");
        flag(review_,
             context.file,
             context.table_name,
             "Comment_dropped",
             std::to_string(dropped) + " comment(s) were not converted",
             "Re-add the table and column comments manually",
             context.line);
    }

    return statements;
}

std::string DdlRewriter::post_cleanup(std::string sql) const
{
    const auto& clauses = rules_.behaviors.clause_removal.clauses;
    if (!clauses.empty()) {
        std::string kept;
        std::size_t start = 0U;
        while (start <= sql.size()) {
            auto end = sql.find('\n', start);
            if (end == std::string::npos) {
                end = sql.size();
            }
            const std::string_view line{sql.data() + start, end - start};
            const auto upper = parser::uppercase_copy(line);
            const bool drop = std::any_of(clauses.begin(), clauses.end(), [&upper](const std::string& clause) {
                return !clause.empty() && upper.find(clause) != std::string::npos;
            });
            if (!drop) {
                if (!kept.empty()) {
                    kept.push_back('\n');
                }
                kept.append(line);
            }
            if (end == sql.size()) {
                break;
            }
            start = end + 1U;
        }
        sql = std::move(kept);
    }

    for (const auto& [alias, long_form] : rules_.types.output_aliases) {
        parser::replace_all(sql, alias, long_form);
    }

    static const std::regex kTimestampPrecision(R"(TIMESTAMP WITH (LOCAL )?TIME ZONE\((\d+)\))",
                                                std::regex::ECMAScript | std::regex::icase);
    return std::regex_replace(sql, kTimestampPrecision, "TIMESTAMP($2) WITH $1TIME ZONE");
}

InlineTypeConversion DdlRewriter::convert_inline_types(std::string_view sql) const
{
    InlineTypeConversion result{};
    std::vector<bool> cast_frames;
    std::string last_word;
    std::size_t copied = 0U;
    std::size_t pos = 0U;

    while (pos < sql.size()) {
        if (const auto quoted = quoted_length(sql, pos); quoted != 0U) {
            pos += quoted;
            last_word.clear();
            continue;
        }

        const auto ch = sql[pos];
        std::size_t type_start = std::string_view::npos;
        bool inside_cast = false;
        if (ch == '(') {
            cast_frames.push_back(last_word == "CAST" || last_word == "TRY_CAST");
            last_word.clear();
            ++pos;
            continue;
        }
        if (ch == ')') {
            if (!cast_frames.empty()) {
                cast_frames.pop_back();
            }
            last_word.clear();
            ++pos;
            continue;
        }
        if (ch == ':' && pos + 1U < sql.size() && sql[pos + 1U] == ':') {
            type_start = pos + 2U;
        } else if (is_identifier_char(ch)) {
            auto end = pos;
            while (end < sql.size() && is_identifier_char(sql[end])) {
                ++end;
            }
            last_word = parser::uppercase_copy(sql.substr(pos, end - pos));
            pos = end;
            if (last_word != "AS" || cast_frames.empty() || !cast_frames.back()) {
                continue;
            }
            type_start = end;
            inside_cast = true;
        } else {
            if (!is_space(ch)) {
                last_word.clear();
            }
            ++pos;
            continue;
        }

        last_word.clear();
        const auto begin = skip_spaces(sql, type_start);
        const auto end = type_extent(sql, begin);
        pos = std::max(end, type_start);
        if (end == begin || continues_type_name(sql, end)) {
            continue;
        }
        if (inside_cast) {
            const auto close = skip_spaces(sql, end);
            if (close >= sql.size() || sql[close] != ')') {
                continue;
            }
        }

        const auto text = sql.substr(begin, end - begin);
        auto parsed = parser::parse_data_type(text);
        if (!parsed.ast || rules_.find_type_mapping(parsed.ast->name) == nullptr) {
            continue;
        }
        try {
            const auto conversion = convert_type(*parsed.ast);
            if (!conversion.changed) {
                continue;
            }
            const auto rendered = post_cleanup(parser::render_data_type(conversion.type));
            result.sql.append(sql.substr(copied, begin - copied));
            result.sql += rendered;
            copied = end;
            result.converted.push_back(std::string{text} + " -> " + rendered);
        } catch (const std::exception& error) {
            result.errors.push_back("Error converting inline type " + std::string{text} + ": " + error.what());
        }
    }

    result.sql.append(sql.substr(copied));
    return result;
}

DdlRewriteResult DdlRewriter::rewrite(parser::CreateTableStatement statement,
                                      std::string_view original_text,
                                      std::string_view file,
                                      std::size_t line) const
{
    DdlRewriteResult result{};
    Context context{};
    context.file = std::string{file};
    context.line = line;

    try {
        context.table_name = parser::format_qualified_name(statement.name, target_);

        convert_data_types(statement, context);
        convert_virtual_columns(statement, context);
        remove_clauses(statement, context);
        remove_with_properties(statement, context);
        extract_comments(statement, context);

        if (statement.or_replace) {
            statement.or_replace = false;
            context.log(ConversionAction::ReplaceRemoved,
                        "Changed 'CREATE OR REPLACE' to 'CREATE' for '" + context.table_name + "'.");
        }

        auto create_text = post_cleanup(parser::render_create_table(statement, target_));
        result.statements.push_back(std::move(create_text));
        for (auto& comment : render_comments(context)) {
            result.statements.push_back(std::move(comment));
        }
        common::log_info(kComponent, "converted table " + context.table_name);
    } catch (const std::exception& error) {
        const auto message = "Error handling statement: " + std::string{error.what()} + ". SQL: "
                             + parser::collapse_whitespace(original_text);
        common::log_error(kComponent, message);
        context.log(ConversionAction::Error, message);
        result.statements.assign(1U, std::string{kErrorMarkerPrefix} + message);
        result.failed = true;
    }

    result.logs = std::move(context.logs);
    return result;
}

}  // namespace sqlport::convert
