#include "sqlport/convert/ddl_rewriter.hpp"
#include "sqlport/convert/manual_review.hpp"
#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"
#include "sqlport/parser/grammar.hpp"
#include "sqlport/parser/sql_printer.hpp"
#include "sqlport/rules/rule_loader.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rapidjson/document.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sqlport::convert;
using sqlport::dialect::DialectKind;
using sqlport::dialect::dialect_for;

namespace {

sqlport::rules::RuleSet oracle_rules(std::optional<std::string> version = std::nullopt)
{
    const sqlport::rules::RuleLoader loader(sqlport::rules::RuleLoader::Config{SQLPORT_TEST_CONFIG_ROOT, std::move(version)});
    return loader.load_rule_set("snowflake", "oracle");
}

sqlport::rules::BehaviorRules behaviors_from(const char* json)
{
    rapidjson::Document document;
    document.Parse(json);
    REQUIRE_FALSE(document.HasParseError());
    return sqlport::rules::parse_behavior_rules(document);
}

sqlport::parser::CreateTableStatement parse_table(std::string_view sql)
{
    auto& snowflake = dialect_for(DialectKind::Snowflake);
    sqlport::dialect::install_grammar_extensions(snowflake);
    auto result = sqlport::parser::parse_create_table(sql, snowflake);
    REQUIRE(result.success());
    return std::move(*result.ast);
}

std::string convert(const DdlRewriter& rewriter, std::string_view type_text)
{
    const auto parsed = sqlport::parser::parse_data_type(type_text);
    REQUIRE(parsed.success());
    return sqlport::parser::render_data_type(rewriter.convert_type(*parsed.ast).type);
}

bool has_action(const std::vector<ConversionLogEntry>& logs, ConversionAction action)
{
    return std::any_of(logs.begin(), logs.end(), [action](const auto& entry) { return entry.action == action; });
}

}  // namespace

TEST_CASE("oversized varchar becomes CLOB and its comment moves to a statement")
{
    const auto rules = oracle_rules();
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    const std::string sql = "CREATE TABLE T (A VARCHAR_NTZ(5000) COMMENT 'desc')";
    const auto result = rewriter.rewrite(parse_table(sql), sql, "tables.sql", 1U);

    CHECK_FALSE(result.failed);
    REQUIRE(result.statements.size() == 2U);
    CHECK(result.statements[0] == "CREATE TABLE T (\n  A CLOB\n)");
    CHECK(result.statements[1] == "COMMENT ON COLUMN T.A IS 'desc'");

    REQUIRE_FALSE(result.logs.empty());
    CHECK(result.logs.front().action == ConversionAction::DataTypeConverted);
    CHECK(result.logs.front().details == "Converted column A: VARCHAR_NTZ(5000) -> CLOB");
    CHECK(result.logs.front().file == "tables.sql");
    CHECK(has_action(result.logs, ConversionAction::CommentExtracted));
}

TEST_CASE("dynamic sizing honours the maximum inclusively")
{
    const auto rules = oracle_rules();
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    CHECK(convert(rewriter, "VARCHAR(4000)") == "VARCHAR2(4000)");
    CHECK(convert(rewriter, "VARCHAR(4001)") == "CLOB");
    CHECK(convert(rewriter, "STRING(16777216)") == "CLOB");
    CHECK(convert(rewriter, "BINARY(16)") == "RAW(16)");
    CHECK(convert(rewriter, "BINARY(3000)") == "BLOB");
    CHECK(convert(rewriter, "INT") == "NUMBER(38)");
    CHECK(convert(rewriter, "GEOGRAPHY") == "GEOGRAPHY");

    const auto odd = sqlport::parser::parse_data_type("VARCHAR(MAX)");
    REQUIRE(odd.success());
    std::vector<std::string> warnings;
    const auto conversion = rewriter.convert_type(*odd.ast, &warnings);
    CHECK(sqlport::parser::render_data_type(conversion.type) == "VARCHAR2(MAX)");
    REQUIRE(warnings.size() == 1U);
    CHECK(warnings.front().find("VARCHAR") != std::string::npos);
}

TEST_CASE("source precision replaces arguments written into the mapped type")
{
    const auto rules = oracle_rules();
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    CHECK(convert(rewriter, "TIME(9)") == "VARCHAR2(9)");
    CHECK(convert(rewriter, "TIME") == "VARCHAR2(20)");
    CHECK(convert(rewriter, "INT(5)") == "NUMBER(5)");
    CHECK(convert(rewriter, "BOOLEAN") == "NUMBER(1)");
    CHECK(convert(rewriter, "VARCHAR(9000)") == "CLOB");
}

TEST_CASE("paramless targets never carry arguments")
{
    const auto rules = oracle_rules(std::string{"23ai"});
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    CHECK(convert(rewriter, "FLOAT(53)") == "BINARY_DOUBLE");
    CHECK(convert(rewriter, "VARIANT") == "JSON");
    CHECK(convert(rewriter, "BOOLEAN") == "BOOLEAN");
    CHECK(convert(rewriter, "DATETIME(6)") == "TIMESTAMP(6)");
    CHECK(convert(rewriter, "NUMBER(10, 2)") == "NUMBER(10, 2)");
}

TEST_CASE("converting an already converted type is a no-op")
{
    const auto rules = oracle_rules();
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    for (const auto* source : {"VARCHAR(100)", "VARCHAR(9000)", "INT", "NUMBER(38, 0)", "TIMESTAMP_LTZ(9)",
                               "TIMESTAMP_NTZ", "BINARY(10)", "VARIANT", "FLOAT", "BOOLEAN", "DATE", "TIME"}) {
        const auto once = convert(rewriter, source);
        const auto twice = convert(rewriter, once);
        INFO(source);
        CHECK(once == twice);
    }

    const auto parsed = sqlport::parser::parse_data_type("NUMBER(38)");
    REQUIRE(parsed.success());
    CHECK_FALSE(rewriter.convert_type(*parsed.ast).changed);
}

TEST_CASE("rewrite applies every table-level step")
{
    const auto rules = oracle_rules();
    ManualReviewCollector review;
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle), &review);

    const std::string sql = "CREATE OR REPLACE TABLE sales.orders (\n"
                            "  id NUMBER(38, 0) NOT NULL,\n"
                            "  placed_at TIMESTAMP_LTZ(9),\n"
                            "  total NUMBER(10, 2) AS (price * qty),\n"
                            "  note VARCHAR(100) COMMENT 'it''s'\n"
                            ") CLUSTER BY (placed_at) COMMENT = 'Orders' DATA_RETENTION_TIME_IN_DAYS = 1 "
                            "WITH TAG (env = 'prod')";

    const auto result = rewriter.rewrite(parse_table(sql), sql, "orders.sql", 3U);
    CHECK_FALSE(result.failed);
    REQUIRE(result.statements.size() == 3U);
    CHECK(result.statements[0] == "CREATE TABLE sales.orders (\n"
                                  "  id NUMBER(38, 0) NOT NULL,\n"
                                  "  placed_at TIMESTAMP(9) WITH LOCAL TIME ZONE,\n"
                                  "  total NUMBER(10, 2) GENERATED ALWAYS AS (price * qty) VIRTUAL,\n"
                                  "  note VARCHAR2(100)\n"
                                  ")");
    CHECK(result.statements[1] == "COMMENT ON TABLE sales.orders IS 'Orders'");
    CHECK(result.statements[2] == "COMMENT ON COLUMN sales.orders.note IS 'it''s'");

    CHECK(has_action(result.logs, ConversionAction::VirtualColumnConverted));
    CHECK(has_action(result.logs, ConversionAction::ClauseRemoved));
    CHECK(has_action(result.logs, ConversionAction::PropertyRemoved));
    CHECK(has_action(result.logs, ConversionAction::ReplaceRemoved));
    CHECK(std::count_if(result.logs.begin(), result.logs.end(), [](const auto& entry) {
              return entry.action == ConversionAction::PropertyRemoved;
          }) == 2);
    CHECK(review.empty());
}

TEST_CASE("disabled comment conversion drops comments and asks for review")
{
    sqlport::rules::RuleSet rules{};
    rules.behaviors = behaviors_from(R"({"comment_conversion": {"enabled": false}})");
    ManualReviewCollector review;
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle), &review);

    const std::string sql = "CREATE TABLE t (a INT COMMENT 'x') COMMENT = 'y'";
    const auto result = rewriter.rewrite(parse_table(sql), sql, "t.sql", 7U);

    REQUIRE(result.statements.size() == 1U);
    CHECK(result.statements.front() == "CREATE TABLE t (\n  a INT\n)");
    CHECK(has_action(result.logs, ConversionAction::CommentDropped));

    const auto items = review.items();
    REQUIRE(items.size() == 1U);
    CHECK(items.front().issue_type == "Comment_dropped");
    CHECK(items.front().severity == ReviewSeverity::Info);
    CHECK(items.front().object_type == "TABLE");
    CHECK(items.front().line == std::size_t{7U});
}

TEST_CASE("properties mentioning TAG are removed heuristically and flagged")
{
    sqlport::rules::RuleSet rules{};
    rules.behaviors = behaviors_from(R"({"with_property_removal": {"enabled": true, "properties": ["COPY GRANTS"]}})");
    ManualReviewCollector review;
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle), &review);

    const std::string sql = "CREATE TABLE t (a INT) OBJECT_TAGS = 'x' COPY GRANTS STORAGE = 'fast'";
    const auto result = rewriter.rewrite(parse_table(sql), sql, "t.sql", 1U);

    REQUIRE(result.statements.size() == 1U);
    CHECK(result.statements.front() == "CREATE TABLE t (\n  a INT\n)\nSTORAGE = 'fast'");

    const auto items = review.items();
    REQUIRE(items.size() == 1U);
    CHECK(items.front().issue_type == "Tag_heuristic_removal");
    CHECK(items.front().object_name == "t");
}

TEST_CASE("unmapped complex types are kept and flagged")
{
    const auto rules = oracle_rules();
    ManualReviewCollector review;
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle), &review);

    const std::string sql = "CREATE TABLE geo (shape GEOGRAPHY)";
    const auto result = rewriter.rewrite(parse_table(sql), sql, "geo.sql", 2U);

    REQUIRE_FALSE(result.statements.empty());
    CHECK(result.statements.front() == "CREATE TABLE geo (\n  shape GEOGRAPHY\n)");
    const auto items = review.items();
    REQUIRE(items.size() == 1U);
    CHECK(items.front().issue_type == "Complex_data_types");
    CHECK(items.front().object_name == "geo.shape");
}

TEST_CASE("an invalid mapped type keeps the source type and logs the failure")
{
    sqlport::rules::RuleSet rules{};
    rules.types.type_map["FOO"] = "BAD TYPE((";
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    const auto foo = sqlport::parser::parse_data_type("FOO");
    REQUIRE(foo.success());
    CHECK_THROWS_AS(rewriter.convert_type(*foo.ast), std::runtime_error);

    const std::string sql = "CREATE TABLE t (a FOO, b INT)";
    const auto result = rewriter.rewrite(parse_table(sql), sql, "t.sql", 1U);
    CHECK_FALSE(result.failed);
    REQUIRE(result.statements.size() == 1U);
    CHECK(result.statements.front() == "CREATE TABLE t (\n  a FOO,\n  b INT\n)");
    CHECK(has_action(result.logs, ConversionAction::TypeConversionError));
}

TEST_CASE("an empty rule set only adapts the header to the target")
{
    const sqlport::rules::RuleSet rules{};
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    const std::string sql = "CREATE OR REPLACE TABLE IF NOT EXISTS t (a VARCHAR(10), b NUMBER AS (a))";
    const auto result = rewriter.rewrite(parse_table(sql), sql, "t.sql", 1U);
    REQUIRE(result.statements.size() == 1U);
    CHECK(result.statements.front() == "CREATE TABLE t (\n  a VARCHAR(10),\n  b NUMBER AS (a)\n)");
}

TEST_CASE("post_cleanup filters clause lines and expands aliases")
{
    const auto rules = oracle_rules();
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    CHECK(rewriter.post_cleanup("CREATE TABLE t (\n  a TIMESTAMPTZ(6)\n)\nCLUSTER BY (a)\nCOPY GRANTS") ==
          "CREATE TABLE t (\n  a TIMESTAMP(6) WITH TIME ZONE\n)");
    CHECK(rewriter.post_cleanup("a TIMESTAMPLTZ") == "a TIMESTAMP WITH LOCAL TIME ZONE");
}

TEST_CASE("inline types in casts are mapped outside literals and comments")
{
    const auto rules = oracle_rules();
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    const auto result = rewriter.convert_inline_types(
        "SELECT CAST(COALESCE(a, 0) AS INT), TRY_CAST(b AS STRING(20)), c::VARIANT -- CAST(d AS INT)\n"
        "FROM t WHERE e::DATE > '2020-01-01'::TIMESTAMP_NTZ AND f = 'CAST(g AS INT)'");
    CHECK(result.sql ==
          "SELECT CAST(COALESCE(a, 0) AS NUMBER(38)), TRY_CAST(b AS VARCHAR2(20)), c::CLOB -- CAST(d AS INT)\n"
          "FROM t WHERE e::DATE > '2020-01-01'::TIMESTAMP AND f = 'CAST(g AS INT)'");
    REQUIRE(result.converted.size() == 4U);
    CHECK(result.converted.front() == "INT -> NUMBER(38)");
    CHECK(result.errors.empty());

    const auto untouched = rewriter.convert_inline_types(
        "SELECT a AS INT_COL, CAST(c AS DOUBLE PRECISION), x::INT AS y FROM t $$ CAST(z AS INT) $$");
    CHECK(untouched.sql == "SELECT a AS INT_COL, CAST(c AS DOUBLE PRECISION), x::NUMBER(38) AS y FROM t $$ CAST(z AS INT) $$");
}

TEST_CASE("an inline type with an invalid mapping is kept and reported")
{
    sqlport::rules::RuleSet rules{};
    rules.types.type_map["FOO"] = "BAD TYPE((";
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle));

    const auto result = rewriter.convert_inline_types("SELECT CAST(a AS FOO) FROM t");
    CHECK(result.sql == "SELECT CAST(a AS FOO) FROM t");
    CHECK(result.converted.empty());
    REQUIRE(result.errors.size() == 1U);
    CHECK(result.errors.front().find("FOO") != std::string::npos);
}

TEST_CASE("table comments are exempt from the TAG substring heuristic")
{
    const auto rules = oracle_rules();
    ManualReviewCollector review;
    const DdlRewriter rewriter(rules, dialect_for(DialectKind::Oracle), &review);

    const std::string sql = "CREATE TABLE t (id NUMBER(38, 0)) COMMENT = 'staging table'";
    const auto result = rewriter.rewrite(parse_table(sql), sql, "t.sql", 1U);
    REQUIRE(result.statements.size() == 2U);
    CHECK(result.statements[0] == "CREATE TABLE t (\n  id NUMBER(38, 0)\n)");
    CHECK(result.statements[1] == "COMMENT ON TABLE t IS 'staging table'");
    CHECK_FALSE(has_action(result.logs, ConversionAction::PropertyRemoved));
    CHECK(review.empty());
}
