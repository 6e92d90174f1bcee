#pragma once

#include "sqlport/dialect/clause_extension.hpp"
#include "sqlport/dialect/dialect.hpp"

#include <string>
#include <string_view>

namespace sqlport::dialect {

inline constexpr std::string_view kDdlPropertiesMarker = "snowflake.ddl_properties";

// [WITH] ROW ACCESS POLICY name ON (col, ...)
class RowAccessPolicyExtension final : public ClauseExtension {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "row_access_policy"; }
    [[nodiscard]] std::optional<ExtensionMatch> parse(std::string_view input) const override;
    [[nodiscard]] std::string print(const parser::TableProperty& property) const override;
};

// [WITH] TAG (key = 'value', ...)
class TagListExtension final : public ClauseExtension {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "tags"; }
    [[nodiscard]] std::optional<ExtensionMatch> parse(std::string_view input) const override;
    [[nodiscard]] std::string print(const parser::TableProperty& property) const override;
};

// Registers the table clauses the source dialect needs before its DDL is parsed. Safe to
// call repeatedly and from several threads; only the first call for a dialect installs
// anything. Returns true when this call performed the installation.
bool install_grammar_extensions(Dialect& dialect);

// Removes a ROW ACCESS POLICY clause from raw statement text so the base grammar can
// retry a statement it rejected.
[[nodiscard]] std::string strip_unparseable_clauses(std::string_view statement);

}  // namespace sqlport::dialect
