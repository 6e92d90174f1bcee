#pragma once

#include "sqlport/convert/conversion_log.hpp"
#include "sqlport/convert/conversion_telemetry.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sqlport::convert {

inline constexpr std::string_view kSummaryFileName = "conversion_summary.json";

enum class FileStatus : std::uint8_t {
    Success = 0,
    Skipped,
    Error
};

[[nodiscard]] std::string_view file_status_name(FileStatus status) noexcept;

struct FileResult final {
    std::string file_name{};
    FileStatus status = FileStatus::Error;
    std::string message{};
    std::vector<std::string> statements{};
    std::vector<ConversionLogEntry> logs{};
    std::optional<std::filesystem::path> output_path{};
    std::error_code error{};
    std::size_t skipped_statements = 0U;
};

enum class RunStatus : std::uint8_t {
    Success = 0,
    Error
};

[[nodiscard]] std::string_view run_status_name(RunStatus status) noexcept;

struct RunResult final {
    RunStatus status = RunStatus::Error;
    std::string message{};
    std::optional<std::filesystem::path> output_directory{};
    std::vector<FileResult> file_results{};
    std::optional<std::filesystem::path> summary_file{};
    std::optional<std::filesystem::path> cleanup_script{};
    std::optional<std::filesystem::path> manual_review_report{};
    ConversionTelemetrySnapshot statistics{};
    std::error_code error{};

    [[nodiscard]] bool succeeded() const noexcept { return status == RunStatus::Success; }
};

// Detailed run report: statistics, every file with its statements and conversion logs,
// the flattened log list and the paths of the generated artefacts.
[[nodiscard]] std::error_code write_run_summary(const RunResult& result, const std::filesystem::path& path);

// Slim form of the result without statements or logs, as printed by the CLI.
[[nodiscard]] std::string render_run_result_json(const RunResult& result);

}  // namespace sqlport::convert
