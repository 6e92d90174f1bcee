#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace sqlport::dialect;

TEST_CASE("dialect_from_name resolves names and aliases")
{
    CHECK(dialect_from_name("snowflake") == DialectKind::Snowflake);
    CHECK(dialect_from_name("Oracle") == DialectKind::Oracle);
    CHECK(dialect_from_name("postgres") == DialectKind::PostgreSql);
    CHECK(dialect_from_name("greenplum") == DialectKind::PostgreSql);
    CHECK(dialect_from_name(" ANSI ") == DialectKind::Generic);
    CHECK_FALSE(dialect_from_name("teradata").has_value());

    for (const auto kind : all_dialects()) {
        CHECK(dialect_from_name(dialect_name(kind)) == kind);
        CHECK(dialect_for(kind).name() == dialect_name(kind));
    }
}

TEST_CASE("dialect traits describe target syntax")
{
    const auto& oracle = dialect_for(DialectKind::Oracle);
    CHECK(oracle.traits().cascade_keyword == "CASCADE CONSTRAINTS");
    CHECK_FALSE(oracle.traits().supports_if_exists);
    CHECK_FALSE(oracle.traits().supports_or_replace_table);
    CHECK(oracle.supports_table_modifier("global"));
    CHECK_FALSE(oracle.supports_table_modifier("TRANSIENT"));

    const auto& snowflake = dialect_for(DialectKind::Snowflake);
    CHECK(snowflake.traits().supports_or_replace_table);
    CHECK(snowflake.supports_view_modifier("secure"));
    CHECK(dialect_for(DialectKind::MySql).traits().identifier_quote == '`');
}

TEST_CASE("extend_once runs the factory a single time per marker")
{
    Dialect dialect{DialectKind::Generic, DialectTraits{}};
    int calls = 0;
    const auto factory = [&calls]() {
        ++calls;
        std::vector<std::unique_ptr<ClauseExtension>> extensions;
        extensions.push_back(std::make_unique<TagListExtension>());
        return extensions;
    };

    CHECK(dialect.extend_once("tests.tags", factory));
    CHECK_FALSE(dialect.extend_once("tests.tags", factory));
    CHECK(calls == 1);
    CHECK(dialect.has_marker("tests.tags"));
    REQUIRE(dialect.extensions().size() == 1U);
    CHECK(dialect.extensions().front()->name() == "tags");

    CHECK(dialect.extend_once("tests.other", {}));
    CHECK(dialect.extensions().size() == 1U);
}

TEST_CASE("install_grammar_extensions registers snowflake clauses once")
{
    auto& snowflake = dialect_for(DialectKind::Snowflake);
    install_grammar_extensions(snowflake);
    CHECK(snowflake.has_marker(kDdlPropertiesMarker));
    CHECK_FALSE(install_grammar_extensions(snowflake));

    const auto extensions = snowflake.extensions();
    REQUIRE(extensions.size() == 2U);
    CHECK(extensions[0]->name() == "row_access_policy");
    CHECK(extensions[1]->name() == "tags");

    auto& oracle = dialect_for(DialectKind::Oracle);
    install_grammar_extensions(oracle);
    CHECK(oracle.has_marker(kDdlPropertiesMarker));
    CHECK(oracle.extensions().empty());
}

TEST_CASE("row access policy extension consumes only its clause")
{
    const RowAccessPolicyExtension extension{};
    const std::string input = "ROW ACCESS POLICY gov.p ON (a, \"B\") COMMENT = 'x'";

    const auto match = extension.parse(input);
    REQUIRE(match.has_value());
    CHECK(input.substr(match->consumed) == " COMMENT = 'x'");
    CHECK(match->property.value == "gov.p");
    REQUIRE(match->property.columns.size() == 2U);
    CHECK(match->property.columns[1].quoted);
    CHECK(extension.print(match->property) == "WITH ROW ACCESS POLICY gov.p ON (a, \"B\")");

    CHECK_FALSE(extension.parse("CLUSTER BY (a)").has_value());
    CHECK_FALSE(extension.parse("WITH ROW ACCESS POLICY p").has_value());
}

TEST_CASE("tag list extension keeps keys and unescaped values")
{
    const TagListExtension extension{};
    const auto match = extension.parse("WITH TAG (gov.cost_center = 'fin', note = 'it''s')");
    REQUIRE(match.has_value());
    REQUIRE(match->property.entries.size() == 2U);
    CHECK(match->property.entries[0].first == "gov.cost_center");
    CHECK(match->property.entries[1].second == "it's");
    CHECK(extension.print(match->property) == "WITH TAG (gov.cost_center = 'fin', note = 'it''s')");
}

TEST_CASE("strip_unparseable_clauses removes a row access policy")
{
    CHECK(strip_unparseable_clauses("CREATE TABLE t (a INT) WITH ROW ACCESS POLICY p ON (a) COMMENT = 'x'") ==
          "CREATE TABLE t (a INT) COMMENT = 'x'");
    CHECK(strip_unparseable_clauses("CREATE TABLE t (a INT)") == "CREATE TABLE t (a INT)");
}
