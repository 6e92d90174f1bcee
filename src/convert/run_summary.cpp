#include "sqlport/convert/run_summary.hpp"

#include "sqlport/common/logger.hpp"
#include "sqlport/convert/conversion_errors.hpp"

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>

namespace sqlport::convert {
namespace {

constexpr std::string_view kComponent = "summary";

template <typename Writer>
void write_string(Writer& writer, std::string_view value)
{
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

template <typename Writer>
void write_optional_path(Writer& writer, const char* key, const std::optional<std::filesystem::path>& path)
{
    writer.Key(key);
    if (path) {
        write_string(writer, path->string());
    } else {
        writer.Null();
    }
}

template <typename Writer>
void write_log_entry(Writer& writer, const ConversionLogEntry& entry)
{
    writer.StartObject();
    writer.Key("action");
    write_string(writer, conversion_action_name(entry.action));
    writer.Key("details");
    write_string(writer, entry.details);
    writer.Key("file");
    write_string(writer, entry.file);
    writer.EndObject();
}

template <typename Writer>
void write_statistics(Writer& writer, const RunResult& result)
{
    const auto& stats = result.statistics;
    writer.Key("overall_statistics");
    writer.StartObject();
    writer.Key("files_processed");
    writer.Uint64(stats.files_processed);
    writer.Key("files_converted");
    writer.Uint64(stats.files_converted);
    writer.Key("files_failed");
    writer.Uint64(stats.files_failed);
    writer.Key("files_skipped");
    writer.Uint64(stats.files_skipped);
    writer.Key("statements_parsed");
    writer.Uint64(stats.statements_parsed);
    writer.Key("statements_converted");
    writer.Uint64(stats.statements_converted);
    writer.Key("statements_skipped");
    writer.Uint64(stats.statements_skipped);
    writer.Key("statements_failed");
    writer.Uint64(stats.statements_failed);
    writer.Key("fallbacks");
    writer.Uint64(stats.fallbacks);
    writer.Key("recovery_reparses");
    writer.Uint64(stats.recovery_reparses);
    writer.Key("total_file_duration_ms");
    writer.Double(static_cast<double>(stats.total_file_duration_ns) / 1'000'000.0);
    writer.EndObject();
}

template <typename Writer>
void write_file_result(Writer& writer, const FileResult& file, bool detailed)
{
    writer.StartObject();
    writer.Key("file");
    write_string(writer, file.file_name);
    writer.Key("status");
    write_string(writer, file_status_name(file.status));
    writer.Key("message");
    write_string(writer, file.message);
    write_optional_path(writer, "output_file", file.output_path);
    writer.Key("statements_converted");
    writer.Uint64(static_cast<std::uint64_t>(file.statements.size()));
    writer.Key("statements_skipped");
    writer.Uint64(static_cast<std::uint64_t>(file.skipped_statements));
    if (file.error) {
        writer.Key("error");
        write_string(writer, file.error.message());
    }
    if (detailed) {
        writer.Key("converted_statements");
        writer.StartArray();
        for (const auto& statement : file.statements) {
            write_string(writer, statement);
        }
        writer.EndArray();
        writer.Key("conversion_logs");
        writer.StartArray();
        for (const auto& entry : file.logs) {
            write_log_entry(writer, entry);
        }
        writer.EndArray();
    }
    writer.EndObject();
}

template <typename Writer>
void write_result(Writer& writer, const RunResult& result, bool detailed)
{
    writer.StartObject();
    writer.Key("status");
    write_string(writer, run_status_name(result.status));
    writer.Key("message");
    write_string(writer, result.message);
    write_optional_path(writer, "output_directory", result.output_directory);
    if (result.error) {
        writer.Key("error");
        write_string(writer, result.error.message());
    }
    write_statistics(writer, result);

    writer.Key("files");
    writer.StartArray();
    for (const auto& file : result.file_results) {
        write_file_result(writer, file, detailed);
    }
    writer.EndArray();

    if (detailed) {
        writer.Key("conversion_logs");
        writer.StartArray();
        for (const auto& file : result.file_results) {
            for (const auto& entry : file.logs) {
                write_log_entry(writer, entry);
            }
        }
        writer.EndArray();
    } else {
        write_optional_path(writer, "summary_file", result.summary_file);
    }

    write_optional_path(writer, "cleanup_script", result.cleanup_script);
    write_optional_path(writer, "manual_review_report", result.manual_review_report);
    writer.EndObject();
}

}  // namespace

std::string_view file_status_name(FileStatus status) noexcept
{
    switch (status) {
    case FileStatus::Success:
        return "success";
    case FileStatus::Skipped:
        return "skipped";
    case FileStatus::Error:
    default:
        return "error";
    }
}

std::string_view run_status_name(RunStatus status) noexcept
{
    return status == RunStatus::Success ? "success" : "error";
}

std::error_code write_run_summary(const RunResult& result, const std::filesystem::path& path)
{
    std::ofstream stream(path, std::ios::out | std::ios::trunc);
    if (!stream.is_open()) {
        common::log_error(kComponent, "cannot open conversion summary " + path.string());
        return make_error_code(ConversionErrc::SummaryWriteFailed);
    }

    rapidjson::OStreamWrapper wrapper(stream);
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(wrapper);
    writer.SetIndent(' ', 2);
    write_result(writer, result, true);
    stream << '\n';
    stream.flush();

    if (!stream) {
        common::log_error(kComponent, "failed writing conversion summary " + path.string());
        return make_error_code(ConversionErrc::SummaryWriteFailed);
    }
    common::log_info(kComponent, "conversion summary written to " + path.string());
    return {};
}

std::string render_run_result_json(const RunResult& result)
{
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    write_result(writer, result, false);
    return std::string{buffer.GetString(), buffer.GetSize()};
}

}  // namespace sqlport::convert
