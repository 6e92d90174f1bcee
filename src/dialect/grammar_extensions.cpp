#include "sqlport/dialect/grammar_extensions.hpp"

#include "sqlport/common/logger.hpp"
#include "sqlport/parser/expression_primitives.hpp"
#include "sqlport/parser/grammar.hpp"
#include "sqlport/parser/sql_text.hpp"

#include <tao/pegtl.hpp>

#include <memory>
#include <regex>
#include <utility>
#include <vector>

namespace sqlport::dialect {
namespace {

namespace pegtl = tao::pegtl;
namespace expr = parser::expr;

using expr::keyword;
using expr::optional_space;
using expr::required_space;

struct kw_access : keyword<'A', 'C', 'C', 'E', 'S', 'S'> {
};

struct kw_on : keyword<'O', 'N'> {
};

struct kw_policy : keyword<'P', 'O', 'L', 'I', 'C', 'Y'> {
};

struct kw_row : keyword<'R', 'O', 'W'> {
};

struct kw_tag : keyword<'T', 'A', 'G'> {
};

struct kw_with : keyword<'W', 'I', 'T', 'H'> {
};

struct comma_separator : pegtl::seq<optional_space, pegtl::one<','>, optional_space> {
};

struct policy_name_part : expr::identifier {
};

struct policy_name : pegtl::seq<policy_name_part, pegtl::star<expr::dot_separator, policy_name_part>> {
};

struct policy_column : expr::identifier {
};

struct policy_columns
    : pegtl::seq<pegtl::one<'('>,
                 optional_space,
                 policy_column,
                 pegtl::star<comma_separator, policy_column>,
                 optional_space,
                 pegtl::one<')'>> {
};

struct row_access_policy_grammar
    : pegtl::seq<pegtl::opt<kw_with, required_space>,
                 kw_row,
                 required_space,
                 kw_access,
                 required_space,
                 kw_policy,
                 required_space,
                 policy_name,
                 required_space,
                 kw_on,
                 optional_space,
                 policy_columns> {
};

struct tag_key_part : expr::identifier {
};

struct tag_key : pegtl::seq<tag_key_part, pegtl::star<expr::dot_separator, tag_key_part>> {
};

struct tag_value : expr::string_literal {
};

struct tag_entry : pegtl::seq<tag_key, optional_space, pegtl::one<'='>, optional_space, tag_value> {
};

struct tag_list_grammar
    : pegtl::seq<pegtl::opt<kw_with, required_space>,
                 kw_tag,
                 optional_space,
                 pegtl::one<'('>,
                 optional_space,
                 tag_entry,
                 pegtl::star<comma_separator, tag_entry>,
                 optional_space,
                 pegtl::one<')'>> {
};

struct ExtensionParseState final {
    parser::TableProperty property{};
    std::string pending_key{};
};

template <typename Rule>
struct extension_action {
    template <typename Input>
    static void apply(const Input&, ExtensionParseState&)
    {
    }
};

template <>
struct extension_action<policy_name> {
    template <typename Input>
    static void apply(const Input& in, ExtensionParseState& state)
    {
        state.property.value = parser::collapse_whitespace(in.string());
    }
};

template <>
struct extension_action<policy_column> {
    template <typename Input>
    static void apply(const Input& in, ExtensionParseState& state)
    {
        state.property.columns.push_back(parser::make_identifier(in.string()));
    }
};

template <>
struct extension_action<tag_key> {
    template <typename Input>
    static void apply(const Input& in, ExtensionParseState& state)
    {
        state.pending_key = parser::collapse_whitespace(in.string());
    }
};

template <>
struct extension_action<tag_value> {
    template <typename Input>
    static void apply(const Input& in, ExtensionParseState& state)
    {
        state.property.entries.emplace_back(std::move(state.pending_key),
                                            parser::unescape_string_literal(in.string()));
        state.pending_key.clear();
    }
};

template <typename Grammar>
std::optional<ExtensionMatch> parse_extension(std::string_view input, std::string_view property_name)
{
    pegtl::memory_input in(input.data(), input.size(), std::string{property_name});
    ExtensionParseState state{};
    state.property.kind = parser::TablePropertyKind::Extension;
    state.property.name = std::string{property_name};

    try {
        if (!pegtl::parse<Grammar, extension_action>(in, state)) {
            return std::nullopt;
        }
    } catch (const pegtl::parse_error&) {
        return std::nullopt;
    }

    ExtensionMatch match{};
    match.consumed = static_cast<std::size_t>(in.current() - input.data());
    match.property = std::move(state.property);
    return match;
}

std::string join_identifiers(const std::vector<parser::Identifier>& identifiers)
{
    std::string joined;
    for (const auto& identifier : identifiers) {
        if (!joined.empty()) {
            joined += ", ";
        }
        if (identifier.quoted) {
            joined += '"' + identifier.value + '"';
        } else {
            joined += identifier.value;
        }
    }
    return joined;
}

}  // namespace

std::optional<ExtensionMatch> RowAccessPolicyExtension::parse(std::string_view input) const
{
    return parse_extension<row_access_policy_grammar>(input, name());
}

std::string RowAccessPolicyExtension::print(const parser::TableProperty& property) const
{
    return "WITH ROW ACCESS POLICY " + property.value + " ON (" + join_identifiers(property.columns) + ")";
}

std::optional<ExtensionMatch> TagListExtension::parse(std::string_view input) const
{
    return parse_extension<tag_list_grammar>(input, name());
}

std::string TagListExtension::print(const parser::TableProperty& property) const
{
    std::string text = "WITH TAG (";
    bool first = true;
    for (const auto& [key, value] : property.entries) {
        if (!first) {
            text += ", ";
        }
        first = false;
        text += key + " = '" + parser::escape_single_quotes(value) + "'";
    }
    text += ")";
    return text;
}

bool install_grammar_extensions(Dialect& dialect)
{
    const auto installed = dialect.extend_once(kDdlPropertiesMarker, [&dialect]() {
        std::vector<std::unique_ptr<ClauseExtension>> extensions;
        if (dialect.kind() == DialectKind::Snowflake) {
            extensions.push_back(std::make_unique<RowAccessPolicyExtension>());
            extensions.push_back(std::make_unique<TagListExtension>());
        }
        return extensions;
    });

    if (installed) {
        common::log_debug("dialect", "installed table clause extensions for " + std::string{dialect.name()});
    }
    return installed;
}

std::string strip_unparseable_clauses(std::string_view statement)
{
    static const std::regex kRowAccessPolicy(R"(\s+WITH\s+ROW\s+ACCESS\s+POLICY\s+[A-Za-z0-9_"\.]+\s+ON\s*\([^)]*\))",
                                             std::regex::icase);
    return std::regex_replace(std::string{statement}, kRowAccessPolicy, "", std::regex_constants::format_first_only);
}

}  // namespace sqlport::dialect
