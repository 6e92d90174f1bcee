#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"
#include "sqlport/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace sqlport::parser;
using sqlport::dialect::DialectKind;
using sqlport::dialect::dialect_for;

namespace {

const sqlport::dialect::Dialect& snowflake()
{
    auto& dialect = dialect_for(DialectKind::Snowflake);
    sqlport::dialect::install_grammar_extensions(dialect);
    return dialect;
}

}  // namespace

TEST_CASE("parse_data_type keeps multi-word names and arguments")
{
    const auto varchar = parse_data_type("varchar(100)");
    REQUIRE(varchar.success());
    CHECK(varchar.ast->name == "varchar");
    REQUIRE(varchar.ast->arguments.size() == 1U);
    CHECK(varchar.ast->arguments.front() == "100");

    const auto number = parse_data_type("NUMBER(38, 0)");
    REQUIRE(number.success());
    REQUIRE(number.ast->arguments.size() == 2U);
    CHECK(number.ast->arguments[1] == "0");

    const auto local = parse_data_type("TIMESTAMP(9) with local time zone");
    REQUIRE(local.success());
    CHECK(local.ast->name == "TIMESTAMP WITH LOCAL TIME ZONE");
    REQUIRE(local.ast->arguments.size() == 1U);
    CHECK(local.ast->arguments.front() == "9");

    const auto zoned = parse_data_type("TIMESTAMP WITH TIME ZONE");
    REQUIRE(zoned.success());
    CHECK(zoned.ast->name == "TIMESTAMP WITH TIME ZONE");
    CHECK(zoned.ast->arguments.empty());

    const auto precision = parse_data_type("DOUBLE PRECISION");
    REQUIRE(precision.success());
    CHECK(precision.ast->name == "DOUBLE PRECISION");

    const auto broken = parse_data_type("VARCHAR(");
    CHECK_FALSE(broken.success());
    REQUIRE(broken.diagnostics.size() == 1U);
    CHECK(broken.diagnostics.front().message == "input did not match data type grammar");
}

TEST_CASE("parse_create_table captures header columns constraints and properties")
{
    const std::string sql = "CREATE OR REPLACE TRANSIENT TABLE IF NOT EXISTS db.sch.\"Mixed Name\" (\n"
                            "  id NUMBER(38, 0) AUTOINCREMENT START 1 INCREMENT 1 NOT NULL,\n"
                            "  name VARCHAR(100) DEFAULT 'n/a' COMMENT 'it''s a name',\n"
                            "  total NUMBER(10, 2) AS (price * qty),\n"
                            "  ts TIMESTAMP_TZ(9),\n"
                            "  CONSTRAINT pk PRIMARY KEY (id)\n"
                            ") CLUSTER BY (ts) COMMENT = 'table note' DATA_RETENTION_TIME_IN_DAYS = 1 COPY GRANTS;";

    const auto result = parse_create_table(sql, snowflake());
    REQUIRE(result.success());
    CHECK(result.diagnostics.empty());
    const auto& table = *result.ast;

    CHECK(table.or_replace);
    CHECK(table.if_not_exists);
    REQUIRE(table.modifiers.size() == 1U);
    CHECK(table.modifiers.front() == "TRANSIENT");
    REQUIRE(table.name.parts.size() == 3U);
    CHECK(table.name.parts[0].value == "db");
    CHECK(table.name.object().value == "Mixed Name");
    CHECK(table.name.object().quoted);

    REQUIRE(table.columns.size() == 4U);

    const auto& id = table.columns[0];
    REQUIRE(id.type.has_value());
    CHECK(id.type->name == "NUMBER");
    REQUIRE(id.constraints.size() == 2U);
    CHECK(id.constraints[0].kind == ColumnConstraintKind::Identity);
    CHECK(id.constraints[0].identity_start == std::string{"1"});
    CHECK(id.constraints[0].identity_increment == std::string{"1"});
    CHECK_FALSE(id.constraints[0].identity_always);
    CHECK(id.constraints[1].kind == ColumnConstraintKind::NotNull);

    const auto& name = table.columns[1];
    REQUIRE(name.constraints.size() == 2U);
    CHECK(name.constraints[0].kind == ColumnConstraintKind::Default);
    CHECK(name.constraints[0].text == "'n/a'");
    CHECK(name.constraints[1].kind == ColumnConstraintKind::Comment);
    CHECK(name.constraints[1].text == "it's a name");

    const auto& total = table.columns[2];
    REQUIRE(total.constraints.size() == 1U);
    CHECK(total.constraints[0].kind == ColumnConstraintKind::Computed);
    CHECK(total.constraints[0].computed_style == ComputedStyle::Bare);
    CHECK(total.constraints[0].text == "price * qty");

    const auto& ts = table.columns[3];
    REQUIRE(ts.type.has_value());
    CHECK(ts.type->name == "TIMESTAMP_TZ");
    CHECK(ts.constraints.empty());

    REQUIRE(table.constraints.size() == 1U);
    CHECK(table.constraints.front().text == "CONSTRAINT pk PRIMARY KEY (id)");

    REQUIRE(table.properties.size() == 4U);
    CHECK(table.properties[0].kind == TablePropertyKind::ClusterBy);
    CHECK(table.properties[0].value == "ts");
    CHECK(table.properties[1].kind == TablePropertyKind::Comment);
    CHECK(table.properties[1].value == "table note");
    CHECK(table.properties[2].kind == TablePropertyKind::Generic);
    CHECK(table.properties[2].name == "DATA_RETENTION_TIME_IN_DAYS");
    CHECK(table.properties[2].value == "1");
    CHECK(table.properties[3].kind == TablePropertyKind::Flag);
    CHECK(table.properties[3].name == "COPY GRANTS");
}

TEST_CASE("parse_create_table distinguishes generated columns from identities")
{
    const auto result = parse_create_table("CREATE TABLE g (a INT, "
                                           "b INT GENERATED ALWAYS AS (a + 1) VIRTUAL, "
                                           "c INT GENERATED ALWAYS AS IDENTITY (START WITH 5 INCREMENT BY 2), "
                                           "d INT CONSTRAINT d_positive CHECK (d > 0))",
                                           snowflake());
    REQUIRE(result.success());
    const auto& columns = result.ast->columns;
    REQUIRE(columns.size() == 4U);

    REQUIRE(columns[1].constraints.size() == 1U);
    CHECK(columns[1].constraints[0].kind == ColumnConstraintKind::Computed);
    CHECK(columns[1].constraints[0].computed_style == ComputedStyle::Virtual);
    CHECK(columns[1].constraints[0].text == "a + 1");

    REQUIRE(columns[2].constraints.size() == 1U);
    const auto& identity = columns[2].constraints[0];
    CHECK(identity.kind == ColumnConstraintKind::Identity);
    CHECK(identity.identity_always);
    CHECK(identity.identity_start == std::string{"5"});
    CHECK(identity.identity_increment == std::string{"2"});

    REQUIRE(columns[3].constraints.size() == 1U);
    const auto& check = columns[3].constraints[0];
    CHECK(check.kind == ColumnConstraintKind::Check);
    REQUIRE(check.name.has_value());
    CHECK(check.name->value == "d_positive");
    CHECK(check.text == "(d > 0)");
}

TEST_CASE("snowflake table clauses parse through the dialect extensions")
{
    const auto result = parse_create_table(
        "CREATE TABLE t (a INT, b INT) WITH ROW ACCESS POLICY gov.p ON (a) WITH TAG (env = 'prod', owner = 'o''k')",
        snowflake());
    REQUIRE(result.success());
    const auto& properties = result.ast->properties;
    REQUIRE(properties.size() == 2U);

    CHECK(properties[0].kind == TablePropertyKind::Extension);
    CHECK(properties[0].name == "row_access_policy");
    CHECK(properties[0].value == "gov.p");
    REQUIRE(properties[0].columns.size() == 1U);
    CHECK(properties[0].columns.front().value == "a");
    REQUIRE(properties[0].extension != nullptr);

    CHECK(properties[1].name == "tags");
    REQUIRE(properties[1].entries.size() == 2U);
    CHECK(properties[1].entries[0].first == "env");
    CHECK(properties[1].entries[0].second == "prod");
    CHECK(properties[1].entries[1].second == "o'k");
}

TEST_CASE("dialects without extensions reject vendor table clauses")
{
    const auto& oracle = dialect_for(DialectKind::Oracle);
    const auto result = parse_create_table("CREATE TABLE t (a INT) WITH ROW ACCESS POLICY p ON (a)", oracle);
    CHECK_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);
    CHECK(result.diagnostics.front().severity == ParserSeverity::Warning);
}

TEST_CASE("parse_create_table reports duplicate columns and mismatches")
{
    const auto duplicate = parse_create_table("CREATE TABLE d (a INT, A VARCHAR)", snowflake());
    REQUIRE(duplicate.success());
    REQUIRE(duplicate.diagnostics.size() == 1U);
    CHECK(duplicate.diagnostics.front().severity == ParserSeverity::Warning);
    CHECK(duplicate.diagnostics.front().message == "Duplicate column name 'A'");

    const auto mismatch = parse_create_table("CREATE VIEW v AS SELECT 1", snowflake());
    CHECK_FALSE(mismatch.success());
    REQUIRE(mismatch.diagnostics.size() == 1U);
    CHECK(mismatch.diagnostics.front().message == "input did not match CREATE TABLE grammar");
}
