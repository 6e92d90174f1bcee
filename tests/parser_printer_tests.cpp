#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"
#include "sqlport/parser/grammar.hpp"
#include "sqlport/parser/sql_printer.hpp"

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

CreateTableStatement parse_table(std::string_view sql)
{
    auto result = parse_create_table(sql, snowflake());
    REQUIRE(result.success());
    return std::move(*result.ast);
}

}  // namespace

TEST_CASE("format_identifier quotes with the dialect quote character")
{
    const Identifier plain{"orders", false};
    const Identifier quoted{"a\"b", true};
    const Identifier ticked{"my col", true};

    CHECK(format_identifier(plain, dialect_for(DialectKind::Oracle)) == "orders");
    CHECK(format_identifier(quoted, dialect_for(DialectKind::Oracle)) == "\"a\"\"b\"");
    CHECK(format_identifier(ticked, dialect_for(DialectKind::MySql)) == "`my col`");

    QualifiedName name{};
    name.parts = {Identifier{"sch", false}, Identifier{"Mixed", true}};
    CHECK(format_qualified_name(name, dialect_for(DialectKind::PostgreSql)) == "sch.\"Mixed\"");
}

TEST_CASE("render_create_table drops header features the target lacks")
{
    const auto table = parse_table("create or replace transient table if not exists s.t "
                                   "(id int not null, label varchar(10) default 'x')");

    CHECK(render_create_table(table, snowflake(), PrintOptions{false}) ==
          "CREATE OR REPLACE TRANSIENT TABLE IF NOT EXISTS s.t (id INT NOT NULL, label VARCHAR(10) DEFAULT 'x')");

    CHECK(render_create_table(table, dialect_for(DialectKind::Oracle), PrintOptions{true}) ==
          "CREATE TABLE s.t (\n  id INT NOT NULL,\n  label VARCHAR(10) DEFAULT 'x'\n)");
}

TEST_CASE("render_create_table prints properties on their own lines")
{
    const auto table = parse_table("CREATE TABLE t (a INT, CONSTRAINT pk PRIMARY KEY (a)) "
                                   "CLUSTER BY (a) COMMENT = 'it''s' COPY GRANTS WITH TAG (env = 'prod')");

    CHECK(render_create_table(table, snowflake(), PrintOptions{true}) ==
          "CREATE TABLE t (\n"
          "  a INT,\n"
          "  CONSTRAINT pk PRIMARY KEY (a)\n"
          ")\n"
          "CLUSTER BY (a)\n"
          "COMMENT = 'it''s'\n"
          "COPY GRANTS\n"
          "WITH TAG (env = 'prod')");
}

TEST_CASE("identity columns follow the target identity style")
{
    const auto table = parse_table("CREATE TABLE t (id NUMBER AUTOINCREMENT START 10 INCREMENT 5)");
    REQUIRE(table.columns.size() == 1U);
    const auto& column = table.columns.front();

    CHECK(render_column_definition(column, dialect_for(DialectKind::Oracle)) ==
          "id NUMBER GENERATED BY DEFAULT AS IDENTITY (START WITH 10 INCREMENT BY 5)");
    CHECK(render_column_definition(column, dialect_for(DialectKind::MySql)) == "id NUMBER AUTO_INCREMENT");
    CHECK(render_column_definition(column, snowflake()) == "id NUMBER AUTOINCREMENT START 10 INCREMENT 5");
}

TEST_CASE("computed columns render in their parsed style")
{
    ColumnConstraint constraint{};
    constraint.kind = ColumnConstraintKind::Computed;
    constraint.text = "a + 1";

    CHECK(render_column_constraint(constraint, snowflake()) == "AS (a + 1)");
    constraint.computed_style = ComputedStyle::Virtual;
    CHECK(render_column_constraint(constraint, snowflake()) == "GENERATED ALWAYS AS (a + 1) VIRTUAL");
    constraint.computed_style = ComputedStyle::Stored;
    constraint.name = Identifier{"calc", false};
    CHECK(render_column_constraint(constraint, snowflake()) == "CONSTRAINT calc GENERATED ALWAYS AS (a + 1) STORED");
}

TEST_CASE("render_drop_object uses the target cascade keyword")
{
    const auto parsed = parse_drop_object("DROP TABLE IF EXISTS s.t CASCADE");
    REQUIRE(parsed.success());

    CHECK(render_drop_object(*parsed.ast, dialect_for(DialectKind::Oracle)) == "DROP TABLE s.t CASCADE CONSTRAINTS");
    CHECK(render_drop_object(*parsed.ast, dialect_for(DialectKind::PostgreSql)) == "DROP TABLE IF EXISTS s.t CASCADE");
}

TEST_CASE("render_statement covers views and opaque text")
{
    const auto view = parse_statement("CREATE OR REPLACE SECURE VIEW v AS SELECT 1;", snowflake());
    REQUIRE(view.kind == StatementKind::CreateView);
    CHECK(render_statement(view, dialect_for(DialectKind::Oracle)) == "CREATE OR REPLACE VIEW v AS SELECT 1");
    CHECK(render_statement(view, snowflake()) == "CREATE OR REPLACE SECURE VIEW v AS SELECT 1");

    const auto opaque = parse_statement("-- lead\nGRANT SELECT ON t TO r;", snowflake());
    REQUIRE(opaque.opaque());
    CHECK(render_statement(opaque, dialect_for(DialectKind::Oracle)) == "GRANT SELECT ON t TO r");
}
