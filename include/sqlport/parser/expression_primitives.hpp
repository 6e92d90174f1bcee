#pragma once

#include <tao/pegtl.hpp>

namespace sqlport::parser::expr {

namespace pegtl = tao::pegtl;

struct line_comment : pegtl::seq<pegtl::two<'-'>, pegtl::until<pegtl::eolf>> {
};

struct block_comment : pegtl::seq<pegtl::string<'/', '*'>, pegtl::until<pegtl::string<'*', '/'>>> {
};

struct comment_start : pegtl::sor<pegtl::two<'-'>, pegtl::string<'/', '*'>> {
};

struct blank : pegtl::sor<pegtl::space, line_comment, block_comment> {
};

struct optional_space : pegtl::star<blank> {
};

struct required_space : pegtl::plus<blank> {
};

template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::sor<pegtl::identifier_other, pegtl::one<'$'>>>> {
};

struct string_literal_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct string_literal : pegtl::seq<pegtl::one<'\''>, pegtl::star<string_literal_char>, pegtl::one<'\''>> {
};

struct signed_integer : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>> {
};

struct fractional_part : pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>> {
};

struct numeric_literal : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>, pegtl::opt<fractional_part>> {
};

struct bare_identifier
    : pegtl::seq<pegtl::identifier_first, pegtl::star<pegtl::sor<pegtl::identifier_other, pegtl::one<'$'>>>> {
};

struct quoted_identifier_char : pegtl::sor<pegtl::two<'"'>, pegtl::not_one<'"'>> {
};

struct quoted_identifier : pegtl::seq<pegtl::one<'"'>, pegtl::star<quoted_identifier_char>, pegtl::one<'"'>> {
};

struct backtick_identifier : pegtl::seq<pegtl::one<'`'>, pegtl::star<pegtl::not_one<'`'>>, pegtl::one<'`'>> {
};

struct identifier : pegtl::sor<quoted_identifier, backtick_identifier, bare_identifier> {
};

struct dot_separator : pegtl::seq<optional_space, pegtl::one<'.'>, optional_space> {
};

struct parenthesized;

struct parenthesized_atom
    : pegtl::sor<string_literal, quoted_identifier, parenthesized, blank, pegtl::not_one<'(', ')', '\'', '"'>> {
};

// Balanced parenthesised text, quotes and comments respected.
struct parenthesized : pegtl::seq<pegtl::one<'('>, pegtl::star<parenthesized_atom>, pegtl::one<')'>> {
};

}  // namespace sqlport::parser::expr
