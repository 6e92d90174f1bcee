#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sqlport::convert {

enum class ConversionAction : std::uint8_t {
    DataTypeConverted = 0,
    VirtualColumnConverted,
    ClauseRemoved,
    PropertyRemoved,
    CommentExtracted,
    CommentDropped,
    ReplaceRemoved,
    RecoveryReparse,
    TranspileFallback,
    StatementSkipped,
    ParseError,
    TypeConversionError,
    Error
};

[[nodiscard]] std::string_view conversion_action_name(ConversionAction action) noexcept;

struct ConversionLogEntry final {
    ConversionAction action = ConversionAction::Error;
    std::string details{};
    std::string file{};
};

}  // namespace sqlport::convert
