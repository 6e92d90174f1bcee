#include "sqlport/parser/expression_primitives.hpp"

#include <catch2/catch_test_macros.hpp>
#include <tao/pegtl.hpp>

using namespace sqlport::parser;

namespace {

template <typename Rule>
void expect_parse_success(std::string_view input)
{
    tao::pegtl::memory_input in(input, "primitive_rule_success");
    CAPTURE(input);
    using complete_rule = tao::pegtl::seq<Rule, tao::pegtl::eof>;
    CHECK(tao::pegtl::parse<complete_rule>(in));
}

template <typename Rule>
void expect_parse_failure(std::string_view input)
{
    tao::pegtl::memory_input in(input, "primitive_rule_failure");
    CAPTURE(input);
    using complete_rule = tao::pegtl::seq<Rule, tao::pegtl::eof>;
    CHECK_FALSE(tao::pegtl::parse<complete_rule>(in));
}

}  // namespace

TEST_CASE("string_literal accepts doubled quotes")
{
    expect_parse_success<expr::string_literal>("'can''t stop'");
    expect_parse_success<expr::string_literal>("''");
    expect_parse_failure<expr::string_literal>("'oops");
}

TEST_CASE("numeric_literal accepts signed integers and decimals")
{
    expect_parse_success<expr::numeric_literal>("4000");
    expect_parse_success<expr::numeric_literal>("-17");
    expect_parse_success<expr::numeric_literal>("+38.2");
    expect_parse_failure<expr::numeric_literal>("--1");
    expect_parse_failure<expr::numeric_literal>("12.");
    expect_parse_failure<expr::numeric_literal>(".5");
}

TEST_CASE("identifier accepts bare, quoted and backtick forms")
{
    expect_parse_success<expr::identifier>("order_total$1");
    expect_parse_success<expr::identifier>("\"Mixed \"\"Case\"\"\"");
    expect_parse_success<expr::identifier>("`weird name`");
    expect_parse_failure<expr::identifier>("1abc");
    expect_parse_failure<expr::identifier>("\"open");
}

TEST_CASE("keyword matches case-insensitively at a word boundary")
{
    using table_keyword = expr::keyword<'T', 'A', 'B', 'L', 'E'>;
    expect_parse_success<table_keyword>("table");
    expect_parse_success<table_keyword>("TaBlE");
    expect_parse_failure<table_keyword>("tables");
    expect_parse_failure<table_keyword>("table$");
}

TEST_CASE("blank skips whitespace and both comment styles")
{
    expect_parse_success<expr::optional_space>("  -- note\n /* block\n comment */\t");
    expect_parse_success<expr::optional_space>("");
    expect_parse_failure<expr::required_space>("");
    expect_parse_failure<expr::optional_space>("/* unterminated");
}

TEST_CASE("parenthesized balances nested groups and ignores quoted parentheses")
{
    expect_parse_success<expr::parenthesized>("(a, (b + c), ')', \"x)\")");
    expect_parse_success<expr::parenthesized>("(id /* ) */ , -- )\n name)");
    expect_parse_failure<expr::parenthesized>("(a, (b)");
    expect_parse_failure<expr::parenthesized>("(a))");
}
