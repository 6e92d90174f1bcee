#pragma once

#include <system_error>

namespace sqlport::convert {

enum class ConversionErrc {
    Success = 0,
    InvalidDialect,
    NoInputFiles,
    OutputDirectoryUnavailable,
    FileReadFailed,
    FileWriteFailed,
    ScriptTokenizeFailed,
    StatementRewriteFailed,
    SummaryWriteFailed,
    ReportWriteFailed
};

const std::error_category& conversion_error_category() noexcept;
std::error_code make_error_code(ConversionErrc value) noexcept;

}  // namespace sqlport::convert

namespace std {

template <>
struct is_error_code_enum<sqlport::convert::ConversionErrc> : true_type {
};

}  // namespace std
