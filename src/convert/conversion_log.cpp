#include "sqlport/convert/conversion_log.hpp"

namespace sqlport::convert {

std::string_view conversion_action_name(ConversionAction action) noexcept
{
    switch (action) {
    case ConversionAction::DataTypeConverted:
        return "data_type_converted";
    case ConversionAction::VirtualColumnConverted:
        return "virtual_column_converted";
    case ConversionAction::ClauseRemoved:
        return "clause_removed";
    case ConversionAction::PropertyRemoved:
        return "property_removed";
    case ConversionAction::CommentExtracted:
        return "comment_extracted";
    case ConversionAction::CommentDropped:
        return "comment_dropped";
    case ConversionAction::ReplaceRemoved:
        return "remove_replace";
    case ConversionAction::RecoveryReparse:
        return "recovery_reparse";
    case ConversionAction::TranspileFallback:
        return "transpile_fallback";
    case ConversionAction::StatementSkipped:
        return "statement_skipped";
    case ConversionAction::ParseError:
        return "parse_error";
    case ConversionAction::TypeConversionError:
        return "type_conversion_error";
    case ConversionAction::Error:
    default:
        return "error";
    }
}

}  // namespace sqlport::convert
