#pragma once

#include "sqlport/convert/conversion_telemetry.hpp"
#include "sqlport/convert/run_summary.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sqlport::dialect {
class Dialect;
}

namespace sqlport::rules {
struct RuleSet;
}

namespace sqlport::convert {

class ManualReviewCollector;
class StatementRouter;

struct ConversionRequest final {
    std::string source_dialect{};
    std::string target_dialect{};
    std::filesystem::path source_directory{};
    bool generate_cleanup = false;
};

// Runs a whole directory through parsing, filtering, routing and writing, then emits the
// cleanup script, the manual review report and the run summary.
class ConversionOrchestrator final {
public:
    struct Config final {
        std::filesystem::path rules_root{};
        std::optional<std::string> target_version{};
        std::size_t worker_count = 1U;
        // Written to directly when set; otherwise <parent>/converted/<timestamp>.
        std::optional<std::filesystem::path> output_directory{};
    };

    explicit ConversionOrchestrator(Config config);

    // Never throws; failures are reported through the returned status and error code.
    [[nodiscard]] RunResult convert(const ConversionRequest& request);

    [[nodiscard]] const ConversionTelemetry& telemetry() const noexcept { return telemetry_; }

private:
    struct RunContext;

    RunResult run(const ConversionRequest& request);
    FileResult process_file(const std::filesystem::path& path, RunContext& context);
    void process_all(const std::vector<std::filesystem::path>& files, RunContext& context, std::vector<FileResult>& results);

    Config config_{};
    ConversionTelemetry telemetry_{};
};

// Immediate regular files ending in .sql, sorted by name.
[[nodiscard]] std::vector<std::filesystem::path> discover_sql_files(const std::filesystem::path& directory);

// Creates <parent of source_directory>/converted/<YYYYMMDD_HHMMSS>, adding _2, _3, ... when
// that directory already exists.
[[nodiscard]] std::optional<std::filesystem::path> create_run_directory(const std::filesystem::path& source_directory,
                                                                      std::chrono::system_clock::time_point now);

// Joins statements with blank lines and guarantees one terminator per statement and a
// trailing newline.
[[nodiscard]] std::string join_statements(const std::vector<std::string>& statements);

RunResult convert(const std::string& source_dialect,
                  const std::string& target_dialect,
                  const std::filesystem::path& source_directory,
                  bool generate_cleanup,
                  ConversionOrchestrator::Config config = {});

}  // namespace sqlport::convert
