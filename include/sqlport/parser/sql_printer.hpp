#pragma once

#include "sqlport/parser/ast.hpp"
#include "sqlport/parser/grammar.hpp"

#include <string>

namespace sqlport::dialect {
class Dialect;
}

namespace sqlport::parser {

struct PrintOptions final {
    // One column or property per line when true; a single line otherwise.
    bool pretty = true;
};

[[nodiscard]] std::string format_identifier(const Identifier& identifier, const dialect::Dialect& dialect);
[[nodiscard]] std::string format_qualified_name(const QualifiedName& name, const dialect::Dialect& dialect);

[[nodiscard]] std::string render_data_type(const DataType& type);
[[nodiscard]] std::string render_column_constraint(const ColumnConstraint& constraint, const dialect::Dialect& dialect);
[[nodiscard]] std::string render_column_definition(const ColumnDefinition& column, const dialect::Dialect& dialect);
[[nodiscard]] std::string render_table_property(const TableProperty& property);

[[nodiscard]] std::string render_create_table(const CreateTableStatement& statement,
                                              const dialect::Dialect& dialect,
                                              const PrintOptions& options = {});
[[nodiscard]] std::string render_create_view(const CreateViewStatement& statement, const dialect::Dialect& dialect);
[[nodiscard]] std::string render_drop_object(const DropObjectStatement& statement, const dialect::Dialect& dialect);

// Renders any parsed statement without a trailing semicolon.
[[nodiscard]] std::string render_statement(const ParsedStatement& statement,
                                           const dialect::Dialect& dialect,
                                           const PrintOptions& options = {});

}  // namespace sqlport::parser
