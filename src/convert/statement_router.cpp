#include "sqlport/convert/statement_router.hpp"

#include "sqlport/common/logger.hpp"
#include "sqlport/convert/manual_review.hpp"
#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"
#include "sqlport/parser/sql_printer.hpp"
#include "sqlport/parser/sql_text.hpp"
#include "sqlport/rules/rule_set.hpp"

#include <regex>
#include <utility>
#include <variant>

namespace sqlport::convert {
namespace {

constexpr std::string_view kComponent = "router";

std::string describe_failure(const std::vector<parser::ParserDiagnostic>& diagnostics)
{
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.severity != parser::ParserSeverity::Info) {
            return parser::describe_diagnostic(diagnostic);
        }
    }
    return "statement is not supported by the CREATE TABLE grammar";
}

}  // namespace

bool is_create_table(const parser::ParsedStatement& statement)
{
    if (std::holds_alternative<parser::CreateTableStatement>(statement.ast)) {
        return true;
    }
    if (!std::holds_alternative<parser::OpaqueStatement>(statement.ast)) {
        return false;
    }
    static const std::regex kCreateTable(R"(^\s*CREATE\s+(OR\s+REPLACE\s+)?TABLE\b)",
                                         std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(statement.text, kCreateTable);
}

StatementRouter::StatementRouter(const rules::RuleSet& rules,
                                 const dialect::Dialect& source,
                                 const dialect::Dialect& target,
                                 ManualReviewCollector* review)
    : source_{source}
    , target_{target}
    , review_{review}
    , rewriter_{rules, target, review}
{
}

RoutedStatement StatementRouter::route(const parser::ParsedStatement& statement, std::string_view file) const
{
    if (review_ != nullptr) {
        scan_for_manual_review(statement.text, file, statement.line, *review_);
    }

    if (const auto* create = std::get_if<parser::CreateTableStatement>(&statement.ast)) {
        auto rewritten = rewriter_.rewrite(*create, statement.text, file, statement.line);
        return RoutedStatement{RouteKind::DdlRewrite,
                               std::move(rewritten.statements),
                               std::move(rewritten.logs),
                               rewritten.failed};
    }

    if (!is_create_table(statement)) {
        return fallback(statement, file, "no specialised handler for this statement");
    }

    const auto repaired = dialect::strip_unparseable_clauses(statement.text);
    auto reparsed = parser::parse_create_table(repaired, source_);
    if (!reparsed.ast) {
        return fallback(statement, file, describe_failure(reparsed.diagnostics.empty() ? statement.diagnostics
                                                                                        : reparsed.diagnostics));
    }

    common::log_info(kComponent, "recovered CREATE TABLE after removing unsupported clauses");
    auto rewritten = rewriter_.rewrite(std::move(*reparsed.ast), statement.text, file, statement.line);

    RoutedStatement routed{};
    routed.route = RouteKind::RecoveredDdlRewrite;
    routed.logs.push_back(ConversionLogEntry{ConversionAction::RecoveryReparse,
                                             "Reparsed CREATE TABLE after removing unsupported clauses",
                                             std::string{file}});
    for (auto& entry : rewritten.logs) {
        routed.logs.push_back(std::move(entry));
    }
    routed.statements = std::move(rewritten.statements);
    routed.failed = rewritten.failed;
    return routed;
}

RoutedStatement StatementRouter::fallback(const parser::ParsedStatement& statement,
                                          std::string_view file,
                                          std::string reason) const
{
    RoutedStatement routed{};
    routed.route = RouteKind::Fallback;
    auto adapted = rewriter_.convert_inline_types(parser::render_statement(statement, target_));
    routed.statements.push_back(std::move(adapted.sql));
    routed.logs.push_back(ConversionLogEntry{ConversionAction::TranspileFallback,
                                             "Re-printed statement for " + std::string{target_.name()} + ": "
                                                 + std::move(reason),
                                             std::string{file}});
    for (auto& converted : adapted.converted) {
        routed.logs.push_back(ConversionLogEntry{ConversionAction::DataTypeConverted,
                                                 "Inline type at line " + std::to_string(statement.line) + ": "
                                                     + std::move(converted),
                                                 std::string{file}});
    }
    for (auto& error : adapted.errors) {
        common::log_warning(kComponent, error);
        routed.logs.push_back(ConversionLogEntry{ConversionAction::TypeConversionError, std::move(error), std::string{file}});
    }
    common::log_debug(kComponent, "fallback re-print at line " + std::to_string(statement.line));
    return routed;
}

}  // namespace sqlport::convert
