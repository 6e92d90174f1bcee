#include "sqlport/common/logger.hpp"
#include "sqlport/convert/orchestrator.hpp"
#include "sqlport/convert/run_summary.hpp"
#include "sqlport/dialect/dialect.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

struct ConvertOptions final {
    std::string source_dialect{};
    std::string target_dialect{};
    std::string input_directory{};
    bool generate_cleanup = false;
    std::string rules_root{"config/conversion"};
    std::string target_version{};
    std::size_t jobs = 1U;
    std::string output_directory{};
    std::string log_level{"info"};
    std::string log_file{};
};

void configure_logging(const ConvertOptions& options)
{
    auto& logger = sqlport::common::Logger::instance();
    if (const auto level = sqlport::common::parse_log_level(options.log_level)) {
        logger.set_level(*level);
    }
    if (!options.log_file.empty() && !logger.set_file(options.log_file)) {
        throw std::runtime_error("unable to open log file " + options.log_file);
    }
}

int run_convert(const ConvertOptions& options)
{
    configure_logging(options);

    sqlport::convert::ConversionOrchestrator::Config config{};
    config.rules_root = std::filesystem::path(options.rules_root);
    if (!options.target_version.empty()) {
        config.target_version = options.target_version;
    }
    config.worker_count = options.jobs;
    if (!options.output_directory.empty()) {
        config.output_directory = std::filesystem::path(options.output_directory);
    }

    sqlport::convert::ConversionOrchestrator orchestrator(std::move(config));
    const auto result = orchestrator.convert(sqlport::convert::ConversionRequest{options.source_dialect,
                                                                                 options.target_dialect,
                                                                                 options.input_directory,
                                                                                 options.generate_cleanup});

    std::cout << sqlport::convert::render_run_result_json(result) << '\n';
    return result.succeeded() ? EXIT_SUCCESS : EXIT_FAILURE;
}

void list_dialects()
{
    for (const auto kind : sqlport::dialect::all_dialects()) {
        const auto& dialect = sqlport::dialect::dialect_for(kind);
        std::cout << dialect.name();
        if (!dialect.traits().cascade_keyword.empty()) {
            std::cout << "  (drop cascade: " << dialect.traits().cascade_keyword << ')';
        }
        std::cout << '\n';
    }
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Convert SQL scripts between database dialects"};
    app.require_subcommand(1);

    int exit_code = EXIT_SUCCESS;

    ConvertOptions options{};
    auto* convert = app.add_subcommand("convert", "Convert every .sql file in a directory");
    convert->add_option("-s,--source", options.source_dialect, "Source dialect (for example snowflake)")->required();
    convert->add_option("-t,--target", options.target_dialect, "Target dialect (for example oracle)")->required();
    convert->add_option("-i,--input", options.input_directory, "Directory containing the .sql files")
        ->required()
        ->check(CLI::ExistingDirectory);
    convert->add_flag("--cleanup", options.generate_cleanup, "Write 00_cleanup.sql with DROP statements");
    convert->add_option("--rules-root", options.rules_root, "Root directory of the conversion rule bundles")
        ->envname("SQLPORT_RULES_ROOT")
        ->capture_default_str();
    convert->add_option("--target-version", options.target_version, "Target version used for type overrides");
    convert->add_option("-j,--jobs", options.jobs, "Number of files converted in parallel")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    convert->add_option("-o,--output", options.output_directory, "Write converted files to this directory");
    convert->add_option("--log-level", options.log_level, "Log level (debug, info, warning, error)")
        ->transform(CLI::CheckedTransformer(
            {{"debug", "debug"}, {"info", "info"}, {"warning", "warning"}, {"error", "error"}}, CLI::ignore_case))
        ->capture_default_str();
    convert->add_option("--log-file", options.log_file, "Append log lines to this file");
    convert->callback([&]() {
        exit_code = run_convert(options);
    });

    auto* dialects = app.add_subcommand("dialects", "List the supported dialects");
    dialects->callback([]() {
        list_dialects();
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return exit_code;
}
