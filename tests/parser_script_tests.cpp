#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"
#include "sqlport/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

using namespace sqlport::parser;
using sqlport::dialect::DialectKind;
using sqlport::dialect::dialect_for;

namespace {

sqlport::dialect::Dialect& snowflake()
{
    auto& dialect = dialect_for(DialectKind::Snowflake);
    sqlport::dialect::install_grammar_extensions(dialect);
    return dialect;
}

}  // namespace

TEST_CASE("classify_statement looks past statement modifiers")
{
    CHECK(classify_statement("create temporary table t (a int)") == StatementKind::CreateTable);
    CHECK(classify_statement("CREATE OR REPLACE TRANSIENT TABLE t(a INT)") == StatementKind::CreateTable);
    CHECK(classify_statement("CREATE SECURE MATERIALIZED VIEW v AS SELECT 1") == StatementKind::CreateView);
    CHECK(classify_statement("drop view v") == StatementKind::DropObject);
    CHECK(classify_statement("CREATE STAGE s") == StatementKind::Opaque);
    CHECK(classify_statement("INSERT INTO t VALUES (1)") == StatementKind::Opaque);
    CHECK(classify_statement("") == StatementKind::Opaque);
}

TEST_CASE("parse_sql_script types each statement and records its line")
{
    const std::string script = "CREATE TABLE a (x INT);\n"
                               "USE ROLE r;\n"
                               "\n"
                               "DROP TABLE IF EXISTS s.b CASCADE;\n"
                               "CREATE OR REPLACE SECURE VIEW v (c) AS SELECT x FROM a;\n";

    const auto result = parse_sql_script(script, snowflake());
    REQUIRE(result.success());
    REQUIRE(result.statements.size() == 4U);

    const auto& table = result.statements[0];
    CHECK(table.kind == StatementKind::CreateTable);
    CHECK(table.line == 1U);
    CHECK(table.text == "CREATE TABLE a (x INT)");

    const auto& use = result.statements[1];
    CHECK(use.opaque());
    CHECK(use.line == 2U);
    REQUIRE(use.diagnostics.size() == 1U);
    CHECK(use.diagnostics.front().severity == ParserSeverity::Info);
    CHECK(std::get<OpaqueStatement>(use.ast).text == "USE ROLE r");

    const auto& drop = result.statements[2];
    CHECK(drop.kind == StatementKind::DropObject);
    CHECK(drop.line == 4U);
    const auto& drop_ast = std::get<DropObjectStatement>(drop.ast);
    CHECK(drop_ast.object_type == "TABLE");
    CHECK(drop_ast.if_exists);
    CHECK(drop_ast.cascade);
    REQUIRE(drop_ast.name.parts.size() == 2U);
    CHECK(drop_ast.name.parts[0].value == "s");
    CHECK(drop_ast.name.object().value == "b");

    const auto& view = result.statements[3];
    CHECK(view.kind == StatementKind::CreateView);
    const auto& view_ast = std::get<CreateViewStatement>(view.ast);
    CHECK(view_ast.or_replace);
    REQUIRE(view_ast.modifiers.size() == 1U);
    CHECK(view_ast.modifiers.front() == "SECURE");
    REQUIRE(view_ast.columns.size() == 1U);
    CHECK(view_ast.columns.front().value == "c");
    CHECK(view_ast.query == "SELECT x FROM a");
}

TEST_CASE("statements rejected by a grammar stay opaque with a positioned warning")
{
    const std::string script = "SELECT 1;\n"
                               "CREATE TABLE broken (a INT MASKING POLICY p);\n"
                               "DROP FUNCTION f(INT);";

    const auto result = parse_sql_script(script, snowflake());
    REQUIRE(result.success());
    REQUIRE(result.statements.size() == 3U);

    const auto& broken = result.statements[1];
    CHECK(broken.opaque());
    CHECK(broken.line == 2U);
    REQUIRE(broken.diagnostics.size() == 1U);
    const auto& diagnostic = broken.diagnostics.front();
    CHECK(diagnostic.severity == ParserSeverity::Warning);
    CHECK(diagnostic.message == "Unsupported CREATE TABLE syntax near 'MASKING'");
    CHECK(diagnostic.line == 2U);
    CHECK_FALSE(diagnostic.remediation_hints.empty());

    const auto& drop = result.statements[2];
    CHECK(drop.opaque());
    REQUIRE(drop.diagnostics.size() == 1U);
    CHECK(drop.diagnostics.front().message == "input did not match DROP grammar");
}

TEST_CASE("parse_sql_script fails as a whole on an unterminated literal")
{
    const auto result = parse_sql_script("CREATE TABLE a (x INT);\nINSERT INTO a VALUES ('oops);", snowflake());
    CHECK_FALSE(result.success());
    CHECK(result.statements.empty());
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK(result.diagnostics.front().severity == ParserSeverity::Error);
    CHECK(describe_diagnostic(result.diagnostics.front()).find("Unterminated string literal") != std::string::npos);
}

TEST_CASE("comment-only scripts yield no statements")
{
    const auto result = parse_sql_script("-- nothing here\n/* still nothing */;\n", snowflake());
    CHECK(result.success());
    CHECK(result.statements.empty());
}
