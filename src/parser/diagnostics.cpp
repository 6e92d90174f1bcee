#include "sqlport/parser/diagnostics.hpp"

namespace sqlport::parser {

std::string_view severity_name(ParserSeverity severity) noexcept
{
    switch (severity) {
    case ParserSeverity::Info:
        return "info";
    case ParserSeverity::Warning:
        return "warning";
    case ParserSeverity::Error:
    default:
        return "error";
    }
}

std::string describe_diagnostic(const ParserDiagnostic& diagnostic)
{
    if (diagnostic.line == 0U) {
        return diagnostic.message;
    }
    return diagnostic.message + " (line " + std::to_string(diagnostic.line) + ", column "
           + std::to_string(diagnostic.column) + ")";
}

}  // namespace sqlport::parser
