#include "sqlport/parser/grammar.hpp"

#include "sqlport/dialect/dialect.hpp"
#include "sqlport/parser/expression_primitives.hpp"
#include "sqlport/parser/sql_text.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <type_traits>
#include <unordered_set>
#include <utility>

namespace sqlport::parser {
namespace {

namespace pegtl = tao::pegtl;

using expr::keyword;
using expr::optional_space;
using expr::required_space;

struct kw_always : keyword<'A', 'L', 'W', 'A', 'Y', 'S'> {
};

struct kw_as : keyword<'A', 'S'> {
};

struct kw_auto_increment : keyword<'A', 'U', 'T', 'O', '_', 'I', 'N', 'C', 'R', 'E', 'M', 'E', 'N', 'T'> {
};

struct kw_autoincrement : keyword<'A', 'U', 'T', 'O', 'I', 'N', 'C', 'R', 'E', 'M', 'E', 'N', 'T'> {
};

struct kw_by : keyword<'B', 'Y'> {
};

struct kw_cascade : keyword<'C', 'A', 'S', 'C', 'A', 'D', 'E'> {
};

struct kw_check : keyword<'C', 'H', 'E', 'C', 'K'> {
};

struct kw_cluster : keyword<'C', 'L', 'U', 'S', 'T', 'E', 'R'> {
};

struct kw_collate : keyword<'C', 'O', 'L', 'L', 'A', 'T', 'E'> {
};

struct kw_comment : keyword<'C', 'O', 'M', 'M', 'E', 'N', 'T'> {
};

struct kw_constraint : keyword<'C', 'O', 'N', 'S', 'T', 'R', 'A', 'I', 'N', 'T'> {
};

struct kw_constraints : keyword<'C', 'O', 'N', 'S', 'T', 'R', 'A', 'I', 'N', 'T', 'S'> {
};

struct kw_copy : keyword<'C', 'O', 'P', 'Y'> {
};

struct kw_create : keyword<'C', 'R', 'E', 'A', 'T', 'E'> {
};

struct kw_database : keyword<'D', 'A', 'T', 'A', 'B', 'A', 'S', 'E'> {
};

struct kw_default : keyword<'D', 'E', 'F', 'A', 'U', 'L', 'T'> {
};

struct kw_drop : keyword<'D', 'R', 'O', 'P'> {
};

struct kw_exists : keyword<'E', 'X', 'I', 'S', 'T', 'S'> {
};

struct kw_force : keyword<'F', 'O', 'R', 'C', 'E'> {
};

struct kw_foreign : keyword<'F', 'O', 'R', 'E', 'I', 'G', 'N'> {
};

struct kw_generated : keyword<'G', 'E', 'N', 'E', 'R', 'A', 'T', 'E', 'D'> {
};

struct kw_global : keyword<'G', 'L', 'O', 'B', 'A', 'L'> {
};

struct kw_grants : keyword<'G', 'R', 'A', 'N', 'T', 'S'> {
};

struct kw_identity : keyword<'I', 'D', 'E', 'N', 'T', 'I', 'T', 'Y'> {
};

struct kw_if : keyword<'I', 'F'> {
};

struct kw_increment : keyword<'I', 'N', 'C', 'R', 'E', 'M', 'E', 'N', 'T'> {
};

struct kw_index : keyword<'I', 'N', 'D', 'E', 'X'> {
};

struct kw_key : keyword<'K', 'E', 'Y'> {
};

struct kw_linear : keyword<'L', 'I', 'N', 'E', 'A', 'R'> {
};

struct kw_local : keyword<'L', 'O', 'C', 'A', 'L'> {
};

struct kw_materialized : keyword<'M', 'A', 'T', 'E', 'R', 'I', 'A', 'L', 'I', 'Z', 'E', 'D'> {
};

struct kw_noorder : keyword<'N', 'O', 'O', 'R', 'D', 'E', 'R'> {
};

struct kw_not : keyword<'N', 'O', 'T'> {
};

struct kw_null : keyword<'N', 'U', 'L', 'L'> {
};

struct kw_on : keyword<'O', 'N'> {
};

struct kw_or : keyword<'O', 'R'> {
};

struct kw_order : keyword<'O', 'R', 'D', 'E', 'R'> {
};

struct kw_partition : keyword<'P', 'A', 'R', 'T', 'I', 'T', 'I', 'O', 'N'> {
};

struct kw_precision : keyword<'P', 'R', 'E', 'C', 'I', 'S', 'I', 'O', 'N'> {
};

struct kw_primary : keyword<'P', 'R', 'I', 'M', 'A', 'R', 'Y'> {
};

struct kw_private : keyword<'P', 'R', 'I', 'V', 'A', 'T', 'E'> {
};

struct kw_recursive : keyword<'R', 'E', 'C', 'U', 'R', 'S', 'I', 'V', 'E'> {
};

struct kw_references : keyword<'R', 'E', 'F', 'E', 'R', 'E', 'N', 'C', 'E', 'S'> {
};

struct kw_replace : keyword<'R', 'E', 'P', 'L', 'A', 'C', 'E'> {
};

struct kw_restrict : keyword<'R', 'E', 'S', 'T', 'R', 'I', 'C', 'T'> {
};

struct kw_schema : keyword<'S', 'C', 'H', 'E', 'M', 'A'> {
};

struct kw_secure : keyword<'S', 'E', 'C', 'U', 'R', 'E'> {
};

struct kw_sequence : keyword<'S', 'E', 'Q', 'U', 'E', 'N', 'C', 'E'> {
};

struct kw_stage : keyword<'S', 'T', 'A', 'G', 'E'> {
};

struct kw_start : keyword<'S', 'T', 'A', 'R', 'T'> {
};

struct kw_stored : keyword<'S', 'T', 'O', 'R', 'E', 'D'> {
};

struct kw_stream : keyword<'S', 'T', 'R', 'E', 'A', 'M'> {
};

struct kw_synonym : keyword<'S', 'Y', 'N', 'O', 'N', 'Y', 'M'> {
};

struct kw_table : keyword<'T', 'A', 'B', 'L', 'E'> {
};

struct kw_task : keyword<'T', 'A', 'S', 'K'> {
};

struct kw_temp : keyword<'T', 'E', 'M', 'P'> {
};

struct kw_temporary : keyword<'T', 'E', 'M', 'P', 'O', 'R', 'A', 'R', 'Y'> {
};

struct kw_time : keyword<'T', 'I', 'M', 'E'> {
};

struct kw_transient : keyword<'T', 'R', 'A', 'N', 'S', 'I', 'E', 'N', 'T'> {
};

struct kw_unique : keyword<'U', 'N', 'I', 'Q', 'U', 'E'> {
};

struct kw_unlogged : keyword<'U', 'N', 'L', 'O', 'G', 'G', 'E', 'D'> {
};

struct kw_varying : keyword<'V', 'A', 'R', 'Y', 'I', 'N', 'G'> {
};

struct kw_view : keyword<'V', 'I', 'E', 'W'> {
};

struct kw_virtual : keyword<'V', 'I', 'R', 'T', 'U', 'A', 'L'> {
};

struct kw_volatile : keyword<'V', 'O', 'L', 'A', 'T', 'I', 'L', 'E'> {
};

struct kw_with : keyword<'W', 'I', 'T', 'H'> {
};

struct kw_without : keyword<'W', 'I', 'T', 'H', 'O', 'U', 'T'> {
};

struct kw_zone : keyword<'Z', 'O', 'N', 'E'> {
};

struct semicolon : pegtl::one<';'> {
};

struct left_paren : pegtl::one<'('> {
};

struct right_paren : pegtl::one<')'> {
};

struct comma_separator : pegtl::seq<optional_space, pegtl::one<','>, optional_space> {
};

struct statement_end : pegtl::seq<optional_space, pegtl::opt<semicolon, optional_space>, pegtl::eof> {
};

struct or_replace_rule : pegtl::seq<required_space, kw_or, required_space, kw_replace> {
};

struct if_not_exists_rule : pegtl::seq<kw_if, required_space, kw_not, required_space, kw_exists> {
};

struct if_exists_rule : pegtl::seq<kw_if, required_space, kw_exists> {
};

// Data types

struct type_word : expr::bare_identifier {
};

struct type_continuation_word : pegtl::sor<kw_precision, kw_varying> {
};

struct type_name_rule : pegtl::seq<type_word, pegtl::opt<required_space, type_continuation_word>> {
};

struct type_argument
    : pegtl::plus<pegtl::sor<expr::parenthesized, expr::string_literal, pegtl::not_one<',', ')', '(', '\''>>> {
};

struct type_argument_list
    : pegtl::seq<left_paren, optional_space, type_argument, pegtl::star<pegtl::one<','>, optional_space, type_argument>, right_paren> {
};

struct type_zone_rule
    : pegtl::seq<required_space,
                 pegtl::sor<kw_without, kw_with>,
                 pegtl::opt<required_space, kw_local>,
                 required_space,
                 kw_time,
                 required_space,
                 kw_zone> {
};

struct data_type_rule
    : pegtl::seq<type_name_rule,
                 pegtl::opt<optional_space, type_argument_list>,
                 pegtl::opt<type_zone_rule>,
                 pegtl::opt<optional_space, type_argument_list>> {
};

struct data_type_grammar : pegtl::seq<optional_space, data_type_rule, optional_space, pegtl::eof> {
};

// CREATE TABLE

struct table_modifier_rule
    : pegtl::sor<kw_local, kw_global, kw_private, kw_temporary, kw_temp, kw_volatile, kw_transient, kw_unlogged> {
};

struct table_name_part : expr::identifier {
};

struct table_name_rule : pegtl::seq<table_name_part, pegtl::star<expr::dot_separator, table_name_part>> {
};

struct column_constraint_keyword
    : pegtl::sor<kw_not,
                 kw_null,
                 kw_primary,
                 kw_unique,
                 kw_default,
                 kw_comment,
                 kw_as,
                 kw_generated,
                 kw_autoincrement,
                 kw_auto_increment,
                 kw_identity,
                 kw_collate,
                 kw_references,
                 kw_check,
                 kw_constraint> {
};

struct expression_stop : pegtl::sor<expr::comment_start, pegtl::seq<optional_space, column_constraint_keyword>> {
};

struct expression_word : pegtl::plus<pegtl::sor<pegtl::identifier_other, pegtl::one<'$', '.'>>> {
};

struct expression_head
    : pegtl::sor<expr::string_literal,
                 expr::quoted_identifier,
                 expr::parenthesized,
                 expression_word,
                 pegtl::not_one<',', ')', '(', '\'', '"', ' ', '\t', '\r', '\n'>> {
};

struct expression_atom
    : pegtl::sor<expr::string_literal,
                 expr::quoted_identifier,
                 expr::parenthesized,
                 expression_word,
                 pegtl::plus<pegtl::space>,
                 pegtl::not_one<',', ')', '(', '\'', '"'>> {
};

struct default_expression_rule
    : pegtl::seq<expression_head, pegtl::star<pegtl::not_at<expression_stop>, expression_atom>> {
};

struct constraint_name_rule : expr::identifier {
};

struct not_null_rule : pegtl::seq<kw_not, required_space, kw_null> {
};

struct null_rule : kw_null {
};

struct primary_key_rule : pegtl::seq<kw_primary, required_space, kw_key> {
};

struct unique_rule : kw_unique {
};

struct default_clause_rule : pegtl::seq<kw_default, required_space, default_expression_rule> {
};

struct comment_text_rule : expr::string_literal {
};

struct comment_clause_rule
    : pegtl::seq<kw_comment, optional_space, pegtl::opt<pegtl::one<'='>, optional_space>, comment_text_rule> {
};

struct identity_generated_rule
    : pegtl::seq<kw_generated,
                 required_space,
                 pegtl::sor<kw_always,
                            pegtl::seq<kw_by, required_space, kw_default, pegtl::opt<required_space, kw_on, required_space, kw_null>>>,
                 required_space,
                 kw_as,
                 required_space,
                 kw_identity,
                 pegtl::opt<optional_space, expr::parenthesized>> {
};

struct identity_start_increment_rule
    : pegtl::seq<required_space,
                 kw_start,
                 required_space,
                 pegtl::opt<kw_with, required_space>,
                 expr::signed_integer,
                 required_space,
                 kw_increment,
                 required_space,
                 pegtl::opt<kw_by, required_space>,
                 expr::signed_integer> {
};

struct identity_keyword_rule
    : pegtl::seq<pegtl::sor<kw_autoincrement, kw_auto_increment, kw_identity>,
                 pegtl::opt<pegtl::sor<pegtl::seq<optional_space, expr::parenthesized>, identity_start_increment_rule>>,
                 pegtl::opt<required_space, pegtl::sor<kw_order, kw_noorder>>> {
};

struct identity_clause_rule : pegtl::sor<identity_generated_rule, identity_keyword_rule> {
};

struct generated_expression_rule : expr::parenthesized {
};

struct computed_storage_rule : pegtl::sor<kw_virtual, kw_stored> {
};

struct generated_computed_rule
    : pegtl::seq<kw_generated,
                 required_space,
                 kw_always,
                 required_space,
                 kw_as,
                 optional_space,
                 generated_expression_rule,
                 pegtl::opt<required_space, computed_storage_rule>> {
};

struct bare_expression_rule : expr::parenthesized {
};

struct bare_computed_rule : pegtl::seq<kw_as, optional_space, bare_expression_rule> {
};

struct collate_value_rule : pegtl::sor<expr::string_literal, expr::identifier> {
};

struct collate_clause_rule : pegtl::seq<kw_collate, required_space, collate_value_rule> {
};

struct references_target_rule
    : pegtl::seq<expr::identifier, pegtl::star<expr::dot_separator, expr::identifier>, pegtl::opt<optional_space, expr::parenthesized>> {
};

struct references_clause_rule : pegtl::seq<kw_references, required_space, references_target_rule> {
};

struct check_body_rule : expr::parenthesized {
};

struct check_clause_rule : pegtl::seq<kw_check, optional_space, check_body_rule> {
};

struct column_constraint_body
    : pegtl::sor<not_null_rule,
                 null_rule,
                 primary_key_rule,
                 unique_rule,
                 default_clause_rule,
                 comment_clause_rule,
                 identity_clause_rule,
                 generated_computed_rule,
                 bare_computed_rule,
                 collate_clause_rule,
                 references_clause_rule,
                 check_clause_rule> {
};

struct column_constraint_rule
    : pegtl::seq<required_space,
                 pegtl::opt<kw_constraint, required_space, constraint_name_rule, required_space>,
                 column_constraint_body> {
};

struct column_identifier : expr::identifier {
};

struct column_type_rule : data_type_rule {
};

struct column_definition_rule
    : pegtl::seq<column_identifier,
                 pegtl::opt<required_space, pegtl::not_at<column_constraint_keyword>, column_type_rule>,
                 pegtl::star<column_constraint_rule>> {
};

struct table_constraint_head
    : pegtl::sor<pegtl::seq<kw_primary, required_space, kw_key>,
                 kw_unique,
                 pegtl::seq<kw_foreign, required_space, kw_key>,
                 kw_check> {
};

struct table_constraint_atom
    : pegtl::sor<expr::parenthesized, expr::string_literal, expr::quoted_identifier, expr::blank, pegtl::not_one<',', ')', '(', '\'', '"'>> {
};

struct table_constraint_rule
    : pegtl::seq<pegtl::opt<kw_constraint, required_space, expr::identifier, required_space>,
                 table_constraint_head,
                 pegtl::star<table_constraint_atom>> {
};

struct table_element : pegtl::sor<table_constraint_rule, column_definition_rule> {
};

struct column_list_rule
    : pegtl::seq<left_paren,
                 optional_space,
                 table_element,
                 pegtl::star<comma_separator, table_element>,
                 optional_space,
                 pegtl::must<right_paren>> {
};

struct CreateTableParseState final {
    std::vector<const dialect::ClauseExtension*> extensions{};
    std::optional<Identifier> pending_constraint_name{};
    std::string pending_property_key{};
};

// Offers the remaining input to the dialect's clause extensions.
struct extension_property_rule {
    using rule_t = extension_property_rule;
    using subs_t = pegtl::empty_list;

    template <pegtl::apply_mode A,
              pegtl::rewind_mode M,
              template <typename...> class Action,
              template <typename...> class Control,
              typename ParseInput>
    [[nodiscard]] static bool match(ParseInput& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        if (state.extensions.empty() || in.empty()) {
            return false;
        }

        const std::string_view remaining{in.current(), in.size()};
        for (const auto* extension : state.extensions) {
            auto matched = extension->parse(remaining);
            if (!matched || matched->consumed == 0U || matched->consumed > remaining.size()) {
                continue;
            }
            if constexpr (A == pegtl::apply_mode::action) {
                matched->property.kind = TablePropertyKind::Extension;
                matched->property.extension = extension;
                statement.properties.push_back(std::move(matched->property));
            }
            in.bump(matched->consumed);
            return true;
        }
        return false;
    }
};

struct cluster_expression_rule : expr::parenthesized {
};

struct cluster_by_rule
    : pegtl::seq<kw_cluster, required_space, kw_by, optional_space, pegtl::opt<kw_linear, optional_space>, cluster_expression_rule> {
};

struct partition_expression_rule
    : pegtl::seq<pegtl::opt<expr::bare_identifier, optional_space>, expr::parenthesized> {
};

struct partition_by_rule : pegtl::seq<kw_partition, required_space, kw_by, optional_space, partition_expression_rule> {
};

struct comment_property_value : expr::string_literal {
};

struct comment_property_rule
    : pegtl::seq<kw_comment, optional_space, pegtl::opt<pegtl::one<'='>, optional_space>, comment_property_value> {
};

struct copy_grants_rule : pegtl::seq<kw_copy, required_space, kw_grants> {
};

struct property_key : expr::bare_identifier {
};

struct property_value
    : pegtl::sor<expr::string_literal,
                 expr::parenthesized,
                 pegtl::plus<pegtl::not_one<' ', '\t', '\r', '\n', ',', ';', ')', '(', '\''>>> {
};

struct generic_property_rule : pegtl::seq<property_key, optional_space, pegtl::one<'='>, optional_space, property_value> {
};

struct table_property_rule
    : pegtl::sor<extension_property_rule,
                 cluster_by_rule,
                 partition_by_rule,
                 comment_property_rule,
                 copy_grants_rule,
                 generic_property_rule> {
};

struct table_properties_rule
    : pegtl::star<optional_space, pegtl::opt<pegtl::one<','>, optional_space>, table_property_rule> {
};

struct create_table_grammar
    : pegtl::seq<optional_space,
                 kw_create,
                 pegtl::opt<or_replace_rule>,
                 pegtl::star<required_space, table_modifier_rule>,
                 required_space,
                 kw_table,
                 required_space,
                 pegtl::opt<if_not_exists_rule, required_space>,
                 table_name_rule,
                 optional_space,
                 column_list_rule,
                 table_properties_rule,
                 pegtl::must<statement_end>> {
};

// CREATE VIEW

struct view_modifier_rule
    : pegtl::sor<kw_secure, kw_recursive, kw_materialized, kw_force, kw_temporary, kw_temp, kw_volatile> {
};

struct view_name_part : expr::identifier {
};

struct view_column_name : expr::identifier {
};

struct view_column_list
    : pegtl::seq<left_paren, optional_space, view_column_name, pegtl::star<comma_separator, view_column_name>, optional_space, right_paren> {
};

struct view_query_rule : pegtl::plus<pegtl::any> {
};

struct create_view_grammar
    : pegtl::seq<optional_space,
                 kw_create,
                 pegtl::opt<or_replace_rule>,
                 pegtl::star<required_space, view_modifier_rule>,
                 required_space,
                 kw_view,
                 required_space,
                 pegtl::opt<if_not_exists_rule, required_space>,
                 view_name_part,
                 pegtl::star<expr::dot_separator, view_name_part>,
                 optional_space,
                 pegtl::opt<view_column_list, optional_space>,
                 kw_as,
                 required_space,
                 view_query_rule,
                 pegtl::eof> {
};

// DROP

struct drop_object_type_rule
    : pegtl::sor<pegtl::seq<kw_materialized, required_space, kw_view>,
                 kw_table,
                 kw_view,
                 kw_sequence,
                 kw_schema,
                 kw_database,
                 kw_index,
                 kw_synonym,
                 kw_stage,
                 kw_stream,
                 kw_task> {
};

struct drop_name_part : expr::identifier {
};

struct drop_cascade_rule : pegtl::seq<kw_cascade, pegtl::opt<required_space, kw_constraints>> {
};

struct drop_object_grammar
    : pegtl::seq<optional_space,
                 kw_drop,
                 required_space,
                 drop_object_type_rule,
                 required_space,
                 pegtl::opt<if_exists_rule, required_space>,
                 drop_name_part,
                 pegtl::star<expr::dot_separator, drop_name_part>,
                 pegtl::opt<required_space, pegtl::sor<drop_cascade_rule, kw_restrict>>,
                 statement_end> {
};

// Helpers

std::string strip_outer_parens(std::string_view text)
{
    auto trimmed = trim_copy(text);
    if (trimmed.size() >= 2U && trimmed.front() == '(' && trimmed.back() == ')') {
        return trim_copy(std::string_view(trimmed).substr(1U, trimmed.size() - 2U));
    }
    return trimmed;
}

std::string_view extract_token(std::string_view input, std::size_t offset)
{
    if (input.empty()) {
        return {};
    }

    offset = std::min(offset, input.size() - 1U);

    auto is_separator = [](char ch) {
        const auto unsigned_ch = static_cast<unsigned char>(ch);
        return std::isspace(unsigned_ch) != 0 || ch == ';' || ch == ',' || ch == '(' || ch == ')';
    };

    std::size_t begin = offset;
    while (begin > 0U && !is_separator(input[begin - 1U])) {
        --begin;
    }

    std::size_t end = offset;
    while (end < input.size() && !is_separator(input[end])) {
        ++end;
    }

    return input.substr(begin, end - begin);
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source, std::string_view grammar)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Warning;
    diagnostic.message = "Unsupported " + std::string{grammar} + " syntax";
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);

        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (!source.empty() && byte_index < source.size()) {
            const auto token = trim_copy(extract_token(source, byte_index));
            if (!token.empty()) {
                diagnostic.message += " near '" + token + "'";
            }
        } else if (byte_index >= source.size()) {
            diagnostic.message += " at end of input";
        }
    }

    return diagnostic;
}

ParserDiagnostic make_mismatch(std::string_view source, std::string_view grammar)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Warning;
    diagnostic.message = "input did not match " + std::string{grammar} + " grammar";
    diagnostic.line = 1U;
    diagnostic.column = 1U;
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};
    return diagnostic;
}

void append_duplicate_column_diagnostics(const CreateTableStatement& statement,
                                         std::string_view source,
                                         std::vector<ParserDiagnostic>& diagnostics)
{
    std::unordered_set<std::string> seen{};
    for (const auto& column : statement.columns) {
        auto [_, inserted] = seen.insert(uppercase_copy(column.name.value));
        if (!inserted) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Warning;
            diagnostic.message = "Duplicate column name '" + column.name.value + "'";
            diagnostic.statement = trim_copy(source);
            diagnostic.remediation_hints = {"Remove or rename the duplicate column before converting the statement."};
            diagnostics.push_back(std::move(diagnostic));
        }
    }
}

void apply_identity_options(ColumnConstraint& constraint)
{
    static const std::regex kStartPattern(R"(\bSTART\s+(?:WITH\s+)?([+-]?\d+))", std::regex::icase);
    static const std::regex kIncrementPattern(R"(\bINCREMENT\s+(?:BY\s+)?([+-]?\d+))", std::regex::icase);
    static const std::regex kPairPattern(R"(\(\s*([+-]?\d+)\s*,\s*([+-]?\d+)\s*\))");

    std::smatch match;
    if (std::regex_search(constraint.text, match, kStartPattern)) {
        constraint.identity_start = match[1].str();
    }
    if (std::regex_search(constraint.text, match, kIncrementPattern)) {
        constraint.identity_increment = match[1].str();
    }
    if (!constraint.identity_start && std::regex_search(constraint.text, match, kPairPattern)) {
        constraint.identity_start = match[1].str();
        constraint.identity_increment = match[2].str();
    }
    constraint.identity_always = contains_ci(constraint.text, "ALWAYS");
}

void push_column_constraint(CreateTableStatement& statement, CreateTableParseState& state, ColumnConstraint constraint)
{
    if (!statement.columns.empty()) {
        if (state.pending_constraint_name) {
            constraint.name = std::move(*state.pending_constraint_name);
        }
        statement.columns.back().constraints.push_back(std::move(constraint));
    }
    state.pending_constraint_name.reset();
}

ColumnConstraint make_constraint(ColumnConstraintKind kind, std::string text = {})
{
    ColumnConstraint constraint{};
    constraint.kind = kind;
    constraint.text = std::move(text);
    return constraint;
}

// Actions

template <typename Rule>
struct data_type_action {
    template <typename Input>
    static void apply(const Input&, DataType&)
    {
    }
};

template <>
struct data_type_action<type_word> {
    template <typename Input>
    static void apply(const Input& in, DataType& type)
    {
        type.name = in.string();
    }
};

template <>
struct data_type_action<type_continuation_word> {
    template <typename Input>
    static void apply(const Input& in, DataType& type)
    {
        type.name += " " + uppercase_copy(in.string());
    }
};

template <>
struct data_type_action<type_zone_rule> {
    template <typename Input>
    static void apply(const Input& in, DataType& type)
    {
        type.name += " " + collapse_whitespace(uppercase_copy(in.string()));
    }
};

template <>
struct data_type_action<type_argument> {
    template <typename Input>
    static void apply(const Input& in, DataType& type)
    {
        type.arguments.push_back(trim_copy(in.string()));
    }
};

template <typename Rule>
struct create_table_action {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement&, CreateTableParseState&)
    {
    }
};

template <>
struct create_table_action<or_replace_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState&)
    {
        statement.or_replace = true;
    }
};

template <>
struct create_table_action<table_modifier_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        statement.modifiers.push_back(uppercase_copy(in.string()));
    }
};

template <>
struct create_table_action<if_not_exists_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState&)
    {
        statement.if_not_exists = true;
    }
};

template <>
struct create_table_action<table_name_part> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        statement.name.parts.push_back(make_identifier(in.string()));
    }
};

template <>
struct create_table_action<column_identifier> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        auto& column = statement.columns.emplace_back();
        column.name = make_identifier(in.string());
        state.pending_constraint_name.reset();
    }
};

template <>
struct create_table_action<column_type_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        if (statement.columns.empty()) {
            return;
        }
        auto parsed = parse_data_type(in.string());
        if (parsed.ast) {
            statement.columns.back().type = std::move(*parsed.ast);
        }
    }
};

template <>
struct create_table_action<constraint_name_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement&, CreateTableParseState& state)
    {
        state.pending_constraint_name = make_identifier(in.string());
    }
};

template <>
struct create_table_action<not_null_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement, state, make_constraint(ColumnConstraintKind::NotNull));
    }
};

template <>
struct create_table_action<null_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement, state, make_constraint(ColumnConstraintKind::Null));
    }
};

template <>
struct create_table_action<primary_key_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement, state, make_constraint(ColumnConstraintKind::PrimaryKey));
    }
};

template <>
struct create_table_action<unique_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement, state, make_constraint(ColumnConstraintKind::Unique));
    }
};

template <>
struct create_table_action<default_expression_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement, state, make_constraint(ColumnConstraintKind::Default, trim_copy(in.string())));
    }
};

template <>
struct create_table_action<comment_text_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement,
                               state,
                               make_constraint(ColumnConstraintKind::Comment, unescape_string_literal(in.string())));
    }
};

template <>
struct create_table_action<identity_clause_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        auto constraint = make_constraint(ColumnConstraintKind::Identity, collapse_whitespace(in.string()));
        apply_identity_options(constraint);
        push_column_constraint(statement, state, std::move(constraint));
    }
};

template <>
struct create_table_action<generated_expression_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        auto constraint = make_constraint(ColumnConstraintKind::Computed, strip_outer_parens(in.string()));
        constraint.computed_style = ComputedStyle::GeneratedAlways;
        push_column_constraint(statement, state, std::move(constraint));
    }
};

template <>
struct create_table_action<computed_storage_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        if (statement.columns.empty() || statement.columns.back().constraints.empty()) {
            return;
        }
        auto& constraint = statement.columns.back().constraints.back();
        constraint.computed_style = iequals(in.string(), "STORED") ? ComputedStyle::Stored : ComputedStyle::Virtual;
    }
};

template <>
struct create_table_action<bare_expression_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement,
                               state,
                               make_constraint(ColumnConstraintKind::Computed, strip_outer_parens(in.string())));
    }
};

template <>
struct create_table_action<collate_value_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement, state, make_constraint(ColumnConstraintKind::Collate, in.string()));
    }
};

template <>
struct create_table_action<references_target_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement,
                               state,
                               make_constraint(ColumnConstraintKind::References, collapse_whitespace(in.string())));
    }
};

template <>
struct create_table_action<check_body_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        push_column_constraint(statement, state, make_constraint(ColumnConstraintKind::Check, trim_copy(in.string())));
    }
};

template <>
struct create_table_action<table_constraint_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        statement.constraints.push_back(TableConstraint{collapse_whitespace(in.string())});
    }
};

template <>
struct create_table_action<cluster_expression_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        TableProperty property{};
        property.kind = TablePropertyKind::ClusterBy;
        property.name = "CLUSTER BY";
        property.value = strip_outer_parens(in.string());
        statement.properties.push_back(std::move(property));
    }
};

template <>
struct create_table_action<partition_expression_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        TableProperty property{};
        property.kind = TablePropertyKind::PartitionBy;
        property.name = "PARTITION BY";
        property.value = collapse_whitespace(in.string());
        statement.properties.push_back(std::move(property));
    }
};

template <>
struct create_table_action<comment_property_value> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState&)
    {
        TableProperty property{};
        property.kind = TablePropertyKind::Comment;
        property.name = "COMMENT";
        property.value = unescape_string_literal(in.string());
        statement.properties.push_back(std::move(property));
    }
};

template <>
struct create_table_action<copy_grants_rule> {
    template <typename Input>
    static void apply(const Input&, CreateTableStatement& statement, CreateTableParseState&)
    {
        TableProperty property{};
        property.kind = TablePropertyKind::Flag;
        property.name = "COPY GRANTS";
        statement.properties.push_back(std::move(property));
    }
};

template <>
struct create_table_action<property_key> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement&, CreateTableParseState& state)
    {
        state.pending_property_key = in.string();
    }
};

template <>
struct create_table_action<property_value> {
    template <typename Input>
    static void apply(const Input& in, CreateTableStatement& statement, CreateTableParseState& state)
    {
        TableProperty property{};
        property.kind = TablePropertyKind::Generic;
        property.name = std::move(state.pending_property_key);
        property.value = trim_copy(in.string());
        statement.properties.push_back(std::move(property));
        state.pending_property_key.clear();
    }
};

template <typename Rule>
struct create_view_action {
    template <typename Input>
    static void apply(const Input&, CreateViewStatement&)
    {
    }
};

template <>
struct create_view_action<or_replace_rule> {
    template <typename Input>
    static void apply(const Input&, CreateViewStatement& statement)
    {
        statement.or_replace = true;
    }
};

template <>
struct create_view_action<view_modifier_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateViewStatement& statement)
    {
        statement.modifiers.push_back(uppercase_copy(in.string()));
    }
};

template <>
struct create_view_action<if_not_exists_rule> {
    template <typename Input>
    static void apply(const Input&, CreateViewStatement& statement)
    {
        statement.if_not_exists = true;
    }
};

template <>
struct create_view_action<view_name_part> {
    template <typename Input>
    static void apply(const Input& in, CreateViewStatement& statement)
    {
        statement.name.parts.push_back(make_identifier(in.string()));
    }
};

template <>
struct create_view_action<view_column_name> {
    template <typename Input>
    static void apply(const Input& in, CreateViewStatement& statement)
    {
        statement.columns.push_back(make_identifier(in.string()));
    }
};

template <>
struct create_view_action<view_query_rule> {
    template <typename Input>
    static void apply(const Input& in, CreateViewStatement& statement)
    {
        statement.query = trim_copy(in.string());
    }
};

template <typename Rule>
struct drop_object_action {
    template <typename Input>
    static void apply(const Input&, DropObjectStatement&)
    {
    }
};

template <>
struct drop_object_action<drop_object_type_rule> {
    template <typename Input>
    static void apply(const Input& in, DropObjectStatement& statement)
    {
        statement.object_type = collapse_whitespace(uppercase_copy(in.string()));
    }
};

template <>
struct drop_object_action<if_exists_rule> {
    template <typename Input>
    static void apply(const Input&, DropObjectStatement& statement)
    {
        statement.if_exists = true;
    }
};

template <>
struct drop_object_action<drop_name_part> {
    template <typename Input>
    static void apply(const Input& in, DropObjectStatement& statement)
    {
        statement.name.parts.push_back(make_identifier(in.string()));
    }
};

template <>
struct drop_object_action<drop_cascade_rule> {
    template <typename Input>
    static void apply(const Input&, DropObjectStatement& statement)
    {
        statement.cascade = true;
    }
};

bool is_statement_modifier(std::string_view token)
{
    static constexpr std::string_view kModifiers[] = {"OR",        "REPLACE",  "LOCAL",     "GLOBAL",   "PRIVATE",
                                                      "TEMP",      "TEMPORARY", "VOLATILE", "TRANSIENT", "UNLOGGED",
                                                      "SECURE",    "RECURSIVE", "MATERIALIZED", "FORCE"};
    return std::any_of(std::begin(kModifiers), std::end(kModifiers), [token](std::string_view modifier) {
        return iequals(modifier, token);
    });
}

}  // namespace

Identifier make_identifier(std::string_view text)
{
    Identifier identifier{};
    const auto trimmed = trim_copy(text);
    if (trimmed.size() >= 2U && trimmed.front() == '"' && trimmed.back() == '"') {
        identifier.quoted = true;
        std::string value;
        const auto body = std::string_view(trimmed).substr(1U, trimmed.size() - 2U);
        value.reserve(body.size());
        for (std::size_t index = 0; index < body.size(); ++index) {
            value.push_back(body[index]);
            if (body[index] == '"' && index + 1U < body.size() && body[index + 1U] == '"') {
                ++index;
            }
        }
        identifier.value = std::move(value);
    } else if (trimmed.size() >= 2U && trimmed.front() == '`' && trimmed.back() == '`') {
        identifier.quoted = true;
        identifier.value = trimmed.substr(1U, trimmed.size() - 2U);
    } else {
        identifier.value = trimmed;
    }
    return identifier;
}

StatementKind classify_statement(std::string_view text)
{
    std::size_t offset = 0U;
    const auto first = next_token(text, offset);

    if (iequals(first, "DROP")) {
        return StatementKind::DropObject;
    }

    if (!iequals(first, "CREATE")) {
        return StatementKind::Opaque;
    }

    auto token = next_token(text, offset);
    while (!token.empty() && is_statement_modifier(token)) {
        token = next_token(text, offset);
    }

    if (iequals(token, "TABLE")) {
        return StatementKind::CreateTable;
    }
    if (iequals(token, "VIEW")) {
        return StatementKind::CreateView;
    }
    return StatementKind::Opaque;
}

ParseResult<DataType> parse_data_type(std::string_view input)
{
    ParseResult<DataType> result{};
    pegtl::memory_input in(input, "data_type");
    DataType type{};

    try {
        const auto parsed = pegtl::parse<data_type_grammar, data_type_action>(in, type);
        if (parsed) {
            result.ast = std::move(type);
        } else {
            result.diagnostics.push_back(make_mismatch(input, "data type"));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input, "data type"));
    }

    return result;
}

ParseResult<CreateTableStatement> parse_create_table(std::string_view input, const dialect::Dialect& dialect)
{
    ParseResult<CreateTableStatement> result{};
    pegtl::memory_input in(input, "create_table");
    CreateTableStatement statement{};
    CreateTableParseState state{};
    state.extensions = dialect.extensions();

    try {
        const auto parsed = pegtl::parse<create_table_grammar, create_table_action>(in, statement, state);
        if (parsed) {
            append_duplicate_column_diagnostics(statement, input, result.diagnostics);
            result.ast = std::move(statement);
        } else {
            result.diagnostics.push_back(make_mismatch(input, "CREATE TABLE"));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input, "CREATE TABLE"));
    }

    return result;
}

ParseResult<CreateViewStatement> parse_create_view(std::string_view input)
{
    ParseResult<CreateViewStatement> result{};
    const auto statement_text = strip_trailing_semicolon(input);
    pegtl::memory_input in(statement_text, "create_view");
    CreateViewStatement statement{};

    try {
        const auto parsed = pegtl::parse<create_view_grammar, create_view_action>(in, statement);
        if (parsed) {
            result.ast = std::move(statement);
        } else {
            result.diagnostics.push_back(make_mismatch(input, "CREATE VIEW"));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, statement_text, "CREATE VIEW"));
    }

    return result;
}

ParseResult<DropObjectStatement> parse_drop_object(std::string_view input)
{
    ParseResult<DropObjectStatement> result{};
    pegtl::memory_input in(input, "drop_object");
    DropObjectStatement statement{};

    try {
        const auto parsed = pegtl::parse<drop_object_grammar, drop_object_action>(in, statement);
        if (parsed) {
            result.ast = std::move(statement);
        } else {
            result.diagnostics.push_back(make_mismatch(input, "DROP"));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input, "DROP"));
    }

    return result;
}

ParsedStatement parse_statement(std::string_view input, const dialect::Dialect& dialect)
{
    ParsedStatement statement{};
    statement.text = strip_trailing_semicolon(strip_leading_comments(input));
    statement.ast = OpaqueStatement{statement.text};
    if (statement.text.empty()) {
        return statement;
    }

    auto propagate = [&statement](auto&& parse_result, StatementKind kind) {
        statement.diagnostics = std::move(parse_result.diagnostics);
        if (parse_result.ast) {
            statement.kind = kind;
            using AstType = std::decay_t<decltype(*parse_result.ast)>;
            statement.ast.template emplace<AstType>(std::move(*parse_result.ast));
        }
    };

    const auto kind = classify_statement(statement.text);
    switch (kind) {
    case StatementKind::CreateTable:
        propagate(parse_create_table(statement.text, dialect), kind);
        break;
    case StatementKind::CreateView:
        propagate(parse_create_view(statement.text), kind);
        break;
    case StatementKind::DropObject:
        propagate(parse_drop_object(statement.text), kind);
        break;
    case StatementKind::Opaque:
    default: {
        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Info;
        diagnostic.message = "Statement has no typed grammar; kept as source text";
        diagnostic.statement = statement.text;
        statement.diagnostics.push_back(std::move(diagnostic));
        break;
    }
    }

    return statement;
}

ScriptParseResult parse_sql_script(std::string_view input, const dialect::Dialect& dialect)
{
    ScriptParseResult result{};

    auto split = split_sql_script(input);
    if (!split.success()) {
        result.diagnostics.push_back(std::move(*split.error));
        return result;
    }

    result.statements.reserve(split.spans.size());
    for (const auto& span : split.spans) {
        auto statement = parse_statement(input.substr(span.offset, span.length), dialect);
        if (statement.text.empty()) {
            continue;
        }
        statement.line = span.line;
        for (auto& diagnostic : statement.diagnostics) {
            if (diagnostic.line != 0U) {
                diagnostic.line += span.line - 1U;
            }
        }
        result.statements.push_back(std::move(statement));
    }

    return result;
}

}  // namespace sqlport::parser
