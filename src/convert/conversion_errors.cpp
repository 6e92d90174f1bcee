#include "sqlport/convert/conversion_errors.hpp"

#include <string>

namespace sqlport::convert {

namespace {

class ConversionErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "sqlport.convert";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ConversionErrc>(condition)) {
        case ConversionErrc::Success:
            return "success";
        case ConversionErrc::InvalidDialect:
            return "unsupported dialect";
        case ConversionErrc::NoInputFiles:
            return "no SQL files found in the source directory";
        case ConversionErrc::OutputDirectoryUnavailable:
            return "output directory could not be created";
        case ConversionErrc::FileReadFailed:
            return "source file could not be read";
        case ConversionErrc::FileWriteFailed:
            return "converted file could not be written";
        case ConversionErrc::ScriptTokenizeFailed:
            return "script could not be split into statements";
        case ConversionErrc::StatementRewriteFailed:
            return "statement rewrite failed";
        case ConversionErrc::SummaryWriteFailed:
            return "conversion summary could not be written";
        case ConversionErrc::ReportWriteFailed:
            return "manual review report could not be written";
        default:
            return "unknown conversion error";
        }
    }
};

const ConversionErrorCategory kCategory{};

}  // namespace

const std::error_category& conversion_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ConversionErrc value) noexcept
{
    return {static_cast<int>(value), conversion_error_category()};
}

}  // namespace sqlport::convert
