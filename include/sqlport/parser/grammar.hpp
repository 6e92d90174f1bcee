#pragma once

#include "sqlport/parser/ast.hpp"
#include "sqlport/parser/diagnostics.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqlport::dialect {
class Dialect;
}

namespace sqlport::parser {

enum class StatementKind : std::uint8_t {
    Opaque = 0,
    CreateTable,
    CreateView,
    DropObject
};

using StatementAst = std::variant<OpaqueStatement, CreateTableStatement, CreateViewStatement, DropObjectStatement>;

struct ParsedStatement final {
    StatementKind kind = StatementKind::Opaque;
    std::string text{};
    std::size_t line = 1U;
    StatementAst ast{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool opaque() const noexcept { return kind == StatementKind::Opaque; }
};

struct ScriptParseResult final {
    std::vector<ParsedStatement> statements{};
    std::vector<ParserDiagnostic> diagnostics{};

    // False when the script could not be tokenised; statements is empty in that case.
    [[nodiscard]] bool success() const noexcept { return diagnostics.empty(); }
};

[[nodiscard]] StatementKind classify_statement(std::string_view text);

ParseResult<DataType> parse_data_type(std::string_view input);
ParseResult<CreateTableStatement> parse_create_table(std::string_view input, const dialect::Dialect& dialect);
ParseResult<CreateViewStatement> parse_create_view(std::string_view input);
ParseResult<DropObjectStatement> parse_drop_object(std::string_view input);

// Statements that match no grammar come back as OpaqueStatement with warning diagnostics.
[[nodiscard]] ParsedStatement parse_statement(std::string_view input, const dialect::Dialect& dialect);
[[nodiscard]] ScriptParseResult parse_sql_script(std::string_view input, const dialect::Dialect& dialect);

[[nodiscard]] Identifier make_identifier(std::string_view text);

}  // namespace sqlport::parser
