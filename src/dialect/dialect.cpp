#include "sqlport/dialect/dialect.hpp"

#include "sqlport/parser/sql_text.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace sqlport::dialect {
namespace {

struct DialectAlias final {
    std::string_view name;
    DialectKind kind;
};

constexpr std::array<DialectAlias, 9> kAliases{{
    {"snowflake", DialectKind::Snowflake},
    {"oracle", DialectKind::Oracle},
    {"postgresql", DialectKind::PostgreSql},
    {"postgres", DialectKind::PostgreSql},
    {"greenplum", DialectKind::PostgreSql},
    {"mysql", DialectKind::MySql},
    {"bigquery", DialectKind::BigQuery},
    {"generic", DialectKind::Generic},
    {"ansi", DialectKind::Generic},
}};

DialectTraits make_traits(DialectKind kind)
{
    DialectTraits traits{};
    switch (kind) {
    case DialectKind::Snowflake:
        traits.name = "snowflake";
        traits.supports_or_replace_table = true;
        traits.identity_style = IdentityStyle::Autoincrement;
        traits.table_modifiers = {"LOCAL", "GLOBAL", "TEMP", "TEMPORARY", "VOLATILE", "TRANSIENT"};
        traits.view_modifiers = {"SECURE", "RECURSIVE", "MATERIALIZED", "TEMP", "TEMPORARY", "VOLATILE"};
        break;
    case DialectKind::Oracle:
        traits.name = "oracle";
        traits.supports_if_exists = false;
        traits.supports_if_not_exists = false;
        traits.cascade_keyword = "CASCADE CONSTRAINTS";
        traits.table_modifiers = {"GLOBAL", "PRIVATE", "TEMPORARY"};
        traits.view_modifiers = {"FORCE", "MATERIALIZED"};
        break;
    case DialectKind::PostgreSql:
        traits.name = "postgresql";
        traits.table_modifiers = {"LOCAL", "GLOBAL", "TEMP", "TEMPORARY", "UNLOGGED"};
        traits.view_modifiers = {"TEMP", "TEMPORARY", "RECURSIVE", "MATERIALIZED"};
        break;
    case DialectKind::MySql:
        traits.name = "mysql";
        traits.identifier_quote = '`';
        traits.identity_style = IdentityStyle::AutoIncrementColumn;
        traits.table_modifiers = {"TEMPORARY"};
        break;
    case DialectKind::BigQuery:
        traits.name = "bigquery";
        traits.identifier_quote = '`';
        traits.supports_or_replace_table = true;
        traits.table_modifiers = {"TEMP", "TEMPORARY"};
        traits.view_modifiers = {"MATERIALIZED"};
        break;
    case DialectKind::Generic:
    default:
        traits.name = "generic";
        traits.table_modifiers = {"LOCAL", "GLOBAL", "TEMPORARY"};
        traits.view_modifiers = {"RECURSIVE"};
        break;
    }
    return traits;
}

bool contains_modifier(const std::vector<std::string_view>& modifiers, std::string_view modifier)
{
    return std::any_of(modifiers.begin(), modifiers.end(), [modifier](std::string_view candidate) {
        return parser::iequals(candidate, modifier);
    });
}

}  // namespace

Dialect::Dialect(DialectKind kind, DialectTraits traits)
    : kind_{kind}
    , traits_{std::move(traits)}
{
}

bool Dialect::supports_table_modifier(std::string_view modifier) const
{
    return contains_modifier(traits_.table_modifiers, modifier);
}

bool Dialect::supports_view_modifier(std::string_view modifier) const
{
    return contains_modifier(traits_.view_modifiers, modifier);
}

bool Dialect::extend_once(std::string_view marker, const ExtensionFactory& factory)
{
    std::lock_guard guard(mutex_);
    if (markers_.find(marker) != markers_.end()) {
        return false;
    }

    if (factory) {
        auto created = factory();
        for (auto& extension : created) {
            if (extension != nullptr) {
                extensions_.push_back(std::move(extension));
            }
        }
    }
    markers_.emplace(marker);
    return true;
}

bool Dialect::has_marker(std::string_view marker) const
{
    std::lock_guard guard(mutex_);
    return markers_.find(marker) != markers_.end();
}

std::vector<const ClauseExtension*> Dialect::extensions() const
{
    std::lock_guard guard(mutex_);
    std::vector<const ClauseExtension*> snapshot;
    snapshot.reserve(extensions_.size());
    for (const auto& extension : extensions_) {
        snapshot.push_back(extension.get());
    }
    return snapshot;
}

std::optional<DialectKind> dialect_from_name(std::string_view name)
{
    const auto trimmed = parser::trim_copy(name);
    for (const auto& alias : kAliases) {
        if (parser::iequals(alias.name, trimmed)) {
            return alias.kind;
        }
    }
    return std::nullopt;
}

std::string_view dialect_name(DialectKind kind) noexcept
{
    switch (kind) {
    case DialectKind::Snowflake:
        return "snowflake";
    case DialectKind::Oracle:
        return "oracle";
    case DialectKind::PostgreSql:
        return "postgresql";
    case DialectKind::MySql:
        return "mysql";
    case DialectKind::BigQuery:
        return "bigquery";
    case DialectKind::Generic:
    default:
        return "generic";
    }
}

Dialect& dialect_for(DialectKind kind)
{
    static Dialect snowflake{DialectKind::Snowflake, make_traits(DialectKind::Snowflake)};
    static Dialect oracle{DialectKind::Oracle, make_traits(DialectKind::Oracle)};
    static Dialect postgresql{DialectKind::PostgreSql, make_traits(DialectKind::PostgreSql)};
    static Dialect mysql{DialectKind::MySql, make_traits(DialectKind::MySql)};
    static Dialect bigquery{DialectKind::BigQuery, make_traits(DialectKind::BigQuery)};
    static Dialect generic{DialectKind::Generic, make_traits(DialectKind::Generic)};

    switch (kind) {
    case DialectKind::Snowflake:
        return snowflake;
    case DialectKind::Oracle:
        return oracle;
    case DialectKind::PostgreSql:
        return postgresql;
    case DialectKind::MySql:
        return mysql;
    case DialectKind::BigQuery:
        return bigquery;
    case DialectKind::Generic:
    default:
        return generic;
    }
}

std::vector<DialectKind> all_dialects()
{
    return {DialectKind::Snowflake,
            DialectKind::Oracle,
            DialectKind::PostgreSql,
            DialectKind::MySql,
            DialectKind::BigQuery,
            DialectKind::Generic};
}

}  // namespace sqlport::dialect
