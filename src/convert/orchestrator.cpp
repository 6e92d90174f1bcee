#include "sqlport/convert/orchestrator.hpp"

#include "sqlport/common/logger.hpp"
#include "sqlport/common/timestamp.hpp"
#include "sqlport/convert/cleanup_script.hpp"
#include "sqlport/convert/conversion_errors.hpp"
#include "sqlport/convert/manual_review.hpp"
#include "sqlport/convert/preprocessing.hpp"
#include "sqlport/convert/statement_router.hpp"
#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"
#include "sqlport/parser/grammar.hpp"
#include "sqlport/parser/sql_printer.hpp"
#include "sqlport/parser/sql_text.hpp"
#include "sqlport/rules/rule_loader.hpp"
#include "sqlport/rules/rule_set.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace sqlport::convert {
namespace {

constexpr std::string_view kComponent = "orchestrator";
constexpr std::size_t kMaxDirectoryAttempts = 1000U;

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point started)
{
    const auto elapsed = std::chrono::steady_clock::now() - started;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

bool ends_with_sql_extension(const std::filesystem::path& path)
{
    const auto name = path.filename().string();
    return name.size() > 4U && name.compare(name.size() - 4U, 4U, ".sql") == 0;
}

std::optional<std::string> read_file(const std::filesystem::path& path)
{
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

bool write_file(const std::filesystem::path& path, std::string_view content)
{
    std::ofstream stream(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        return false;
    }
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    stream.flush();
    return static_cast<bool>(stream);
}

RunResult failed_run(std::string message, ConversionErrc error)
{
    RunResult result{};
    result.status = RunStatus::Error;
    result.message = std::move(message);
    result.error = make_error_code(error);
    common::log_error(kComponent, result.message);
    return result;
}

}  // namespace

struct ConversionOrchestrator::RunContext final {
    const rules::RuleSet& rules;
    const dialect::Dialect& source;
    const StatementRouter& router;
    std::filesystem::path output_directory;
    std::size_t total_files = 0U;
    std::atomic<std::size_t> started_files{0U};
};

ConversionOrchestrator::ConversionOrchestrator(Config config)
    : config_{std::move(config)}
{
}

RunResult ConversionOrchestrator::convert(const ConversionRequest& request)
{
    try {
        return run(request);
    } catch (const std::exception& error) {
        return failed_run("Conversion failed: " + std::string{error.what()}, ConversionErrc::StatementRewriteFailed);
    }
}

RunResult ConversionOrchestrator::run(const ConversionRequest& request)
{
    telemetry_.reset();

    const auto source_kind = dialect::dialect_from_name(request.source_dialect);
    const auto target_kind = dialect::dialect_from_name(request.target_dialect);
    if (!source_kind || !target_kind) {
        return failed_run("Unsupported dialect pair: " + request.source_dialect + " -> " + request.target_dialect,
                          ConversionErrc::InvalidDialect);
    }

    common::log_info(kComponent,
                     "Starting SQL conversion: " + request.source_dialect + " -> " + request.target_dialect);

    auto& source = dialect::dialect_for(*source_kind);
    dialect::install_grammar_extensions(source);
    const auto& target = dialect::dialect_for(*target_kind);

    const rules::RuleLoader loader({config_.rules_root, config_.target_version});
    const auto rule_set = loader.load_rule_set(source.name(), target.name());

    const auto files = discover_sql_files(request.source_directory);
    if (files.empty()) {
        return failed_run("No SQL files found in the source directory.", ConversionErrc::NoInputFiles);
    }

    const auto now = std::chrono::system_clock::now();
    std::optional<std::filesystem::path> output_directory;
    if (config_.output_directory) {
        std::error_code ec;
        std::filesystem::create_directories(*config_.output_directory, ec);
        if (!ec) {
            output_directory = config_.output_directory;
        }
    } else {
        output_directory = create_run_directory(request.source_directory, now);
    }
    if (!output_directory) {
        return failed_run("Cannot create the output directory for " + request.source_directory.string(),
                          ConversionErrc::OutputDirectoryUnavailable);
    }

    common::log_info(kComponent,
                     "Processing " + std::to_string(files.size()) + " SQL files from: "
                         + request.source_directory.string());
    common::log_info(kComponent, "Output directory: " + output_directory->string());

    ManualReviewCollector review;
    const StatementRouter router(rule_set, source, target, &review);
    RunContext context{rule_set, source, router, *output_directory, files.size()};

    RunResult result{};
    result.output_directory = output_directory;
    process_all(files, context, result.file_results);

    if (request.generate_cleanup) {
        std::set<CreatedObject> objects;
        for (const auto& file : result.file_results) {
            if (file.status == FileStatus::Success) {
                collect_created_objects(file.statements, objects);
            }
        }
        const auto script = render_cleanup_script(objects, target);
        if (!script.empty()) {
            const auto path = *output_directory / std::string{kCleanupFileName};
            if (write_file(path, script)) {
                result.cleanup_script = path;
                common::log_info(kComponent,
                                 "cleanup script written to " + path.string() + " (" + std::to_string(objects.size())
                                     + " objects)");
            } else {
                common::log_error(kComponent, "failed writing cleanup script " + path.string());
            }
        } else {
            common::log_info(kComponent, "no created objects found; cleanup script not written");
        }
    }

    result.manual_review_report = review.flush(*output_directory, now);
    if (!review.empty()) {
        common::log_warning(kComponent, review.summary_text());
        if (!result.manual_review_report) {
            result.error = make_error_code(ConversionErrc::ReportWriteFailed);
        }
    }

    result.statistics = telemetry_.snapshot();

    const auto all_failed = std::all_of(result.file_results.begin(), result.file_results.end(), [](const auto& file) {
        return file.status == FileStatus::Error;
    });
    result.status = all_failed ? RunStatus::Error : RunStatus::Success;
    result.message = "Conversion finished for " + std::to_string(files.size()) + " files.";

    const auto summary_path = *output_directory / std::string{kSummaryFileName};
    if (const auto ec = write_run_summary(result, summary_path)) {
        result.status = RunStatus::Error;
        result.error = ec;
        result.message = "Conversion finished but the summary could not be written.";
    } else {
        result.summary_file = summary_path;
    }

    common::log_info(kComponent,
                     result.message + " converted=" + std::to_string(result.statistics.files_converted)
                         + " skipped=" + std::to_string(result.statistics.files_skipped)
                         + " failed=" + std::to_string(result.statistics.files_failed));
    return result;
}

void ConversionOrchestrator::process_all(const std::vector<std::filesystem::path>& files,
                                         RunContext& context,
                                         std::vector<FileResult>& results)
{
    results.assign(files.size(), FileResult{});

    const auto worker_count = std::min<std::size_t>(std::max<std::size_t>(1U, config_.worker_count), files.size());
    if (worker_count == 1U) {
        for (std::size_t index = 0; index < files.size(); ++index) {
            results[index] = process_file(files[index], context);
        }
        return;
    }

    std::atomic<std::size_t> next{0U};
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t worker = 0; worker < worker_count; ++worker) {
        workers.emplace_back([&]() {
            for (auto index = next.fetch_add(1U); index < files.size(); index = next.fetch_add(1U)) {
                results[index] = process_file(files[index], context);
            }
        });
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

FileResult ConversionOrchestrator::process_file(const std::filesystem::path& path, RunContext& context)
{
    const auto started = std::chrono::steady_clock::now();
    FileResult result{};
    result.file_name = path.filename().string();

    const auto position = context.started_files.fetch_add(1U) + 1U;
    common::log_info(kComponent,
                     "[" + std::to_string(position) + "/" + std::to_string(context.total_files)
                         + "] Processing: " + result.file_name);

    const auto fail = [&](ConversionErrc error, std::string message) {
        result.status = FileStatus::Error;
        result.error = make_error_code(error);
        result.message = std::move(message);
        result.statements.clear();
        common::log_error(kComponent, result.message);
        telemetry_.record_file_failed(elapsed_ns(started));
        return std::move(result);
    };

    try {
        auto content = read_file(path);
        if (!content) {
            return fail(ConversionErrc::FileReadFailed, "Error reading " + result.file_name);
        }

        auto text = normalize_source_text(*content);
        if (context.rules.behaviors.strip_procedural_blocks) {
            text = strip_procedural_blocks(text);
        }

        const auto script = parser::parse_sql_script(text, context.source);
        if (!script.success()) {
            for (const auto& diagnostic : script.diagnostics) {
                result.logs.push_back(ConversionLogEntry{ConversionAction::ParseError,
                                                         parser::describe_diagnostic(diagnostic),
                                                         result.file_name});
            }
            return fail(ConversionErrc::ScriptTokenizeFailed,
                        "Error parsing " + result.file_name + ": "
                            + parser::describe_diagnostic(script.diagnostics.front()));
        }
        telemetry_.record_statements_parsed(script.statements.size());

        for (const auto& statement : script.statements) {
            std::string pattern;
            const auto rendered = parser::strip_sql_comments(parser::render_statement(statement, context.source));
            if (context.rules.should_skip(rendered, &pattern)) {
                ++result.skipped_statements;
                result.logs.push_back(ConversionLogEntry{ConversionAction::StatementSkipped,
                                                         "Skipped statement at line " + std::to_string(statement.line)
                                                             + " matching pattern '" + pattern + "'",
                                                         result.file_name});
                continue;
            }

            try {
                auto routed = context.router.route(statement, result.file_name);
                if (routed.route == RouteKind::Fallback) {
                    telemetry_.record_fallback();
                } else if (routed.route == RouteKind::RecoveredDdlRewrite) {
                    telemetry_.record_recovery_reparse();
                }
                if (routed.failed) {
                    telemetry_.record_statement_failed();
                }
                for (auto& converted : routed.statements) {
                    result.statements.push_back(std::move(converted));
                }
                for (auto& entry : routed.logs) {
                    result.logs.push_back(std::move(entry));
                }
            } catch (const std::exception& error) {
                const auto message = "Error handling statement at line " + std::to_string(statement.line) + ": "
                                     + error.what();
                common::log_error(kComponent, message);
                telemetry_.record_statement_failed();
                result.statements.push_back(std::string{kErrorMarkerPrefix} + message);
                result.logs.push_back(ConversionLogEntry{ConversionAction::Error, message, result.file_name});
            }
        }
        telemetry_.record_statements_skipped(result.skipped_statements);

        if (result.statements.empty()) {
            result.status = FileStatus::Skipped;
            result.message = "No convertible statements found in " + result.file_name;
            common::log_warning(kComponent,
                                "No statements were converted for file " + result.file_name
                                    + ". Skipping output file creation.");
            telemetry_.record_file_skipped(elapsed_ns(started));
            return result;
        }

        const auto output_path = context.output_directory / path.filename();
        if (!write_file(output_path, join_statements(result.statements))) {
            return fail(ConversionErrc::FileWriteFailed, "Error writing " + output_path.string());
        }

        result.status = FileStatus::Success;
        result.output_path = output_path;
        result.message = "Successfully converted " + result.file_name;
        telemetry_.record_statements_converted(result.statements.size());
        telemetry_.record_file_converted(elapsed_ns(started));
        common::log_info(kComponent,
                         "Successfully wrote " + std::to_string(result.statements.size()) + " statement(s) to: "
                             + output_path.string());
        return result;
    } catch (const std::exception& error) {
        return fail(ConversionErrc::StatementRewriteFailed,
                    "Error processing " + result.file_name + ": " + error.what());
    }
}

std::vector<std::filesystem::path> discover_sql_files(const std::filesystem::path& directory)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return files;
    }
    for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && ends_with_sql_extension(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        common::log_warning(kComponent, "error listing " + directory.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    });
    return files;
}

std::optional<std::filesystem::path> create_run_directory(const std::filesystem::path& source_directory,
                                                          std::chrono::system_clock::time_point now)
{
    auto normalized = source_directory.lexically_normal();
    if (!normalized.has_filename()) {
        normalized = normalized.parent_path();
    }
    const auto base = normalized.parent_path() / "converted";

    std::error_code ec;
    std::filesystem::create_directories(base, ec);
    if (ec) {
        common::log_error(kComponent, "cannot create " + base.string() + ": " + ec.message());
        return std::nullopt;
    }

    const auto stamp = common::compact_timestamp(now);
    for (std::size_t attempt = 1U; attempt <= kMaxDirectoryAttempts; ++attempt) {
        const auto candidate = base / (attempt == 1U ? stamp : stamp + "_" + std::to_string(attempt));
        if (std::filesystem::create_directory(candidate, ec)) {
            return candidate;
        }
        if (ec) {
            common::log_error(kComponent, "cannot create " + candidate.string() + ": " + ec.message());
            return std::nullopt;
        }
    }
    common::log_error(kComponent, "no free run directory under " + base.string() + " for " + stamp);
    return std::nullopt;
}

std::string join_statements(const std::vector<std::string>& statements)
{
    std::string output;
    for (const auto& statement : statements) {
        const auto body = parser::strip_trailing_semicolon(parser::trim_copy(statement));
        if (body.empty()) {
            continue;
        }
        if (!output.empty()) {
            output.append("\n\n");
        }
        output.append(body);
        output.push_back(';');
    }
    if (!output.empty()) {
        output.push_back('\n');
    }
    return output;
}

RunResult convert(const std::string& source_dialect,
                  const std::string& target_dialect,
                  const std::filesystem::path& source_directory,
                  bool generate_cleanup,
                  ConversionOrchestrator::Config config)
{
    ConversionOrchestrator orchestrator(std::move(config));
    return orchestrator.convert(ConversionRequest{source_dialect, target_dialect, source_directory, generate_cleanup});
}

}  // namespace sqlport::convert
