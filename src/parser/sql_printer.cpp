#include "sqlport/parser/sql_printer.hpp"

#include "sqlport/dialect/clause_extension.hpp"
#include "sqlport/dialect/dialect.hpp"
#include "sqlport/parser/sql_text.hpp"

#include <sstream>
#include <type_traits>
#include <variant>
#include <vector>

namespace sqlport::parser {
namespace {

std::string render_identity(const ColumnConstraint& constraint, const dialect::Dialect& dialect)
{
    std::string text;
    switch (dialect.traits().identity_style) {
    case dialect::IdentityStyle::Autoincrement:
        text = "AUTOINCREMENT";
        if (constraint.identity_start || constraint.identity_increment) {
            text += " START " + constraint.identity_start.value_or("1");
            text += " INCREMENT " + constraint.identity_increment.value_or("1");
        }
        break;
    case dialect::IdentityStyle::AutoIncrementColumn:
        text = "AUTO_INCREMENT";
        break;
    case dialect::IdentityStyle::SqlStandard:
    default:
        text = constraint.identity_always ? "GENERATED ALWAYS AS IDENTITY" : "GENERATED BY DEFAULT AS IDENTITY";
        if (constraint.identity_start || constraint.identity_increment) {
            text += " (START WITH " + constraint.identity_start.value_or("1");
            text += " INCREMENT BY " + constraint.identity_increment.value_or("1") + ")";
        }
        break;
    }
    return text;
}

std::string render_computed(const ColumnConstraint& constraint)
{
    switch (constraint.computed_style) {
    case ComputedStyle::Bare:
        return "AS (" + constraint.text + ")";
    case ComputedStyle::Virtual:
        return "GENERATED ALWAYS AS (" + constraint.text + ") VIRTUAL";
    case ComputedStyle::Stored:
        return "GENERATED ALWAYS AS (" + constraint.text + ") STORED";
    case ComputedStyle::GeneratedAlways:
    default:
        return "GENERATED ALWAYS AS (" + constraint.text + ")";
    }
}

}  // namespace

std::string format_identifier(const Identifier& identifier, const dialect::Dialect& dialect)
{
    if (!identifier.quoted) {
        return identifier.value;
    }

    const auto quote = dialect.traits().identifier_quote;
    std::string text;
    text.reserve(identifier.value.size() + 2U);
    text.push_back(quote);
    for (const auto ch : identifier.value) {
        text.push_back(ch);
        if (ch == quote) {
            text.push_back(quote);
        }
    }
    text.push_back(quote);
    return text;
}

std::string format_qualified_name(const QualifiedName& name, const dialect::Dialect& dialect)
{
    std::string text;
    for (const auto& part : name.parts) {
        if (!text.empty()) {
            text.push_back('.');
        }
        text += format_identifier(part, dialect);
    }
    return text;
}

std::string render_data_type(const DataType& type)
{
    auto text = uppercase_copy(type.name);
    if (!type.arguments.empty()) {
        text.push_back('(');
        for (std::size_t index = 0; index < type.arguments.size(); ++index) {
            if (index != 0U) {
                text += ", ";
            }
            text += type.arguments[index];
        }
        text.push_back(')');
    }
    return text;
}

std::string render_column_constraint(const ColumnConstraint& constraint, const dialect::Dialect& dialect)
{
    std::string prefix;
    if (constraint.name) {
        prefix = "CONSTRAINT " + format_identifier(*constraint.name, dialect) + " ";
    }

    switch (constraint.kind) {
    case ColumnConstraintKind::NotNull:
        return prefix + "NOT NULL";
    case ColumnConstraintKind::Null:
        return prefix + "NULL";
    case ColumnConstraintKind::PrimaryKey:
        return prefix + "PRIMARY KEY";
    case ColumnConstraintKind::Unique:
        return prefix + "UNIQUE";
    case ColumnConstraintKind::Default:
        return prefix + "DEFAULT " + constraint.text;
    case ColumnConstraintKind::Comment:
        return prefix + "COMMENT '" + escape_single_quotes(constraint.text) + "'";
    case ColumnConstraintKind::Computed:
        return prefix + render_computed(constraint);
    case ColumnConstraintKind::Identity:
        return prefix + render_identity(constraint, dialect);
    case ColumnConstraintKind::Collate:
        return prefix + "COLLATE " + constraint.text;
    case ColumnConstraintKind::References:
        return prefix + "REFERENCES " + constraint.text;
    case ColumnConstraintKind::Check:
        return prefix + "CHECK " + constraint.text;
    }
    return prefix;
}

std::string render_column_definition(const ColumnDefinition& column, const dialect::Dialect& dialect)
{
    auto text = format_identifier(column.name, dialect);
    if (column.type) {
        text += " " + render_data_type(*column.type);
    }
    for (const auto& constraint : column.constraints) {
        text += " " + render_column_constraint(constraint, dialect);
    }
    return text;
}

std::string render_table_property(const TableProperty& property)
{
    switch (property.kind) {
    case TablePropertyKind::Extension:
        if (property.extension != nullptr) {
            return property.extension->print(property);
        }
        return property.name + " " + property.value;
    case TablePropertyKind::Flag:
        return property.name;
    case TablePropertyKind::Comment:
        return "COMMENT = '" + escape_single_quotes(property.value) + "'";
    case TablePropertyKind::ClusterBy:
        return "CLUSTER BY (" + property.value + ")";
    case TablePropertyKind::PartitionBy:
        return "PARTITION BY " + property.value;
    case TablePropertyKind::Generic:
    default:
        return property.name + " = " + property.value;
    }
}

std::string render_create_table(const CreateTableStatement& statement,
                                const dialect::Dialect& dialect,
                                const PrintOptions& options)
{
    const auto& traits = dialect.traits();
    std::ostringstream stream;
    stream << "CREATE ";
    if (statement.or_replace && traits.supports_or_replace_table) {
        stream << "OR REPLACE ";
    }
    for (const auto& modifier : statement.modifiers) {
        if (dialect.supports_table_modifier(modifier)) {
            stream << modifier << ' ';
        }
    }
    stream << "TABLE ";
    if (statement.if_not_exists && traits.supports_if_not_exists) {
        stream << "IF NOT EXISTS ";
    }
    stream << format_qualified_name(statement.name, dialect) << " (";

    std::vector<std::string> elements;
    elements.reserve(statement.columns.size() + statement.constraints.size());
    for (const auto& column : statement.columns) {
        elements.push_back(render_column_definition(column, dialect));
    }
    for (const auto& constraint : statement.constraints) {
        elements.push_back(constraint.text);
    }

    const std::string_view separator = options.pretty ? ",\n  " : ", ";
    if (options.pretty) {
        stream << "\n  ";
    }
    for (std::size_t index = 0; index < elements.size(); ++index) {
        if (index != 0U) {
            stream << separator;
        }
        stream << elements[index];
    }
    stream << (options.pretty ? "\n)" : ")");

    for (const auto& property : statement.properties) {
        stream << (options.pretty ? "\n" : " ") << render_table_property(property);
    }

    return stream.str();
}

std::string render_create_view(const CreateViewStatement& statement, const dialect::Dialect& dialect)
{
    std::string text = "CREATE ";
    if (statement.or_replace) {
        text += "OR REPLACE ";
    }
    for (const auto& modifier : statement.modifiers) {
        if (dialect.supports_view_modifier(modifier)) {
            text += modifier + " ";
        }
    }
    text += "VIEW ";
    if (statement.if_not_exists && dialect.traits().supports_if_not_exists) {
        text += "IF NOT EXISTS ";
    }
    text += format_qualified_name(statement.name, dialect);
    if (!statement.columns.empty()) {
        text += " (";
        for (std::size_t index = 0; index < statement.columns.size(); ++index) {
            if (index != 0U) {
                text += ", ";
            }
            text += format_identifier(statement.columns[index], dialect);
        }
        text += ")";
    }
    text += " AS " + statement.query;
    return text;
}

std::string render_drop_object(const DropObjectStatement& statement, const dialect::Dialect& dialect)
{
    std::string text = "DROP " + statement.object_type + " ";
    if (statement.if_exists && dialect.traits().supports_if_exists) {
        text += "IF EXISTS ";
    }
    text += format_qualified_name(statement.name, dialect);
    if (statement.cascade) {
        text += " " + std::string{dialect.traits().cascade_keyword};
    }
    return text;
}

std::string render_statement(const ParsedStatement& statement,
                             const dialect::Dialect& dialect,
                             const PrintOptions& options)
{
    return std::visit(
        [&](const auto& ast) -> std::string {
            using Ast = std::decay_t<decltype(ast)>;
            if constexpr (std::is_same_v<Ast, CreateTableStatement>) {
                return render_create_table(ast, dialect, options);
            } else if constexpr (std::is_same_v<Ast, CreateViewStatement>) {
                return render_create_view(ast, dialect);
            } else if constexpr (std::is_same_v<Ast, DropObjectStatement>) {
                return render_drop_object(ast, dialect);
            } else {
                return strip_trailing_semicolon(ast.text);
            }
        },
        statement.ast);
}

}  // namespace sqlport::parser
