#include "sqlport/common/logger.hpp"
#include "sqlport/convert/statement_router.hpp"
#include "sqlport/dialect/dialect.hpp"
#include "sqlport/dialect/grammar_extensions.hpp"
#include "sqlport/parser/grammar.hpp"
#include "sqlport/rules/rule_loader.hpp"
#include "sqlport/rules/rule_set.hpp"

#include <rapidjson/document.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string_view>

namespace
{

using Clock = std::chrono::steady_clock;

struct Scenario final {
    std::string_view name;
    std::string_view script;
};

constexpr std::string_view warehouse_script = R"(CREATE OR REPLACE TABLE analytics.events (
    event_id NUMBER(38, 0) NOT NULL PRIMARY KEY,
    visitor_id NUMBER(38, 0) NOT NULL,
    payload VARIANT,
    label VARCHAR(200) COMMENT 'display label',
    body VARCHAR(16777216),
    created_at TIMESTAMP_NTZ(9) DEFAULT CURRENT_TIMESTAMP()
) CLUSTER BY (created_at) COMMENT = 'raw events';
CREATE TABLE analytics.sessions (
    session_id VARCHAR(36) PRIMARY KEY,
    visitor_id NUMBER(38, 0) NOT NULL,
    started_at TIMESTAMP_LTZ(9),
    duration NUMBER(10, 0) AS (DATEDIFF('second', started_at, CURRENT_TIMESTAMP()))
) WITH ROW ACCESS POLICY governance.visitor_policy ON (visitor_id) WITH TAG (cost_center = 'analytics');
CREATE VIEW analytics.active_sessions AS
SELECT s.session_id, s.visitor_id
FROM analytics.sessions s
WHERE s.started_at > DATEADD('minute', -15, CURRENT_TIMESTAMP());
)";

constexpr std::string_view maintenance_script = R"(USE ROLE sysadmin;
DROP TABLE IF EXISTS analytics.sessions;
DROP TABLE IF EXISTS analytics.events;
ALTER SESSION SET TIMEZONE = 'UTC';
)";

constexpr std::array scenarios{
    Scenario{"warehouse", warehouse_script},
    Scenario{"maintenance", maintenance_script},
};

constexpr const char* behaviors_json = R"({
    "virtual_column_conversion": {"enabled": true},
    "clause_removal": {"enabled": true, "clauses": ["CLUSTER BY"]},
    "with_property_removal": {"enabled": true, "properties": ["ROW_ACCESS_POLICY", "TAG"]},
    "comment_conversion": {
        "enabled": true,
        "target_table_template": "COMMENT ON TABLE {table_name} IS '{comment_text}'",
        "target_column_template": "COMMENT ON COLUMN {table_name}.{column_name} IS '{comment_text}'"
    },
    "statement_skipping": {"patterns": ["^\\s*USE\\s", "^\\s*ALTER\\s+SESSION\\b"]}
})";

constexpr const char* types_json = R"({
    "default": {"VARCHAR": "VARCHAR2", "NUMBER": "NUMBER", "VARIANT": "CLOB",
                "TIMESTAMP_NTZ": "TIMESTAMP", "TIMESTAMP_LTZ": "TIMESTAMPLTZ"},
    "dynamic_rules": {"VARCHAR": {"max_size": 4000, "overflow_type": "CLOB", "template": "VARCHAR2({size})"}},
    "paramless_targets": ["CLOB"],
    "output_aliases": {"TIMESTAMPLTZ": "TIMESTAMP WITH LOCAL TIME ZONE"}
})";

sqlport::rules::RuleSet benchmark_rules()
{
    sqlport::rules::RuleSet rules{};
    rapidjson::Document behaviors;
    behaviors.Parse(behaviors_json);
    rules.behaviors = sqlport::rules::parse_behavior_rules(behaviors);
    rapidjson::Document types;
    types.Parse(types_json);
    rules.types = sqlport::rules::parse_type_rules(types, std::nullopt);
    return rules;
}

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: sqlport_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }

    return default_iterations;
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t statements = 0U;
    std::size_t skipped = 0U;
    std::size_t emitted = 0U;
    std::size_t fallbacks = 0U;
    std::size_t failed = 0U;
    Clock::duration elapsed{};
};

BenchmarkSummary run_scenario(const Scenario& scenario,
                              const sqlport::rules::RuleSet& rules,
                              const sqlport::convert::StatementRouter& router,
                              const sqlport::dialect::Dialect& source,
                              std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        auto script = sqlport::parser::parse_sql_script(scenario.script, source);
        summary.statements += script.statements.size();
        for (const auto& statement : script.statements) {
            if (rules.should_skip(statement.text)) {
                ++summary.skipped;
                continue;
            }
            auto routed = router.route(statement, scenario.name);
            summary.emitted += routed.statements.size();
            if (routed.route == sqlport::convert::RouteKind::Fallback) {
                ++summary.fallbacks;
            }
            if (routed.failed) {
                ++summary.failed;
            }
        }
    }
    const auto stop = Clock::now();
    summary.elapsed = stop - start;

    return summary;
}

void report_summary(const Scenario& scenario, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto scripts_per_second = seconds > 0.0 ? static_cast<double>(summary.iterations) / seconds : 0.0;
    const auto statements_per_second = seconds > 0.0 ? static_cast<double>(summary.statements) / seconds : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << scenario.name << "\n";
    std::cout << "  Scripts: " << summary.iterations << "\n";
    std::cout << "  Statements/script: "
              << (summary.iterations > 0U ? static_cast<double>(summary.statements) / summary.iterations : 0.0)
              << "\n";
    std::cout << "  Emitted/script: "
              << (summary.iterations > 0U ? static_cast<double>(summary.emitted) / summary.iterations : 0.0) << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Scripts/s: " << scripts_per_second << "\n";
    std::cout << "  Statements/s: " << statements_per_second << "\n";
    if (summary.skipped > 0U) {
        std::cout << "  Skipped statements: " << summary.skipped << "\n";
    }
    if (summary.fallbacks > 0U) {
        std::cout << "  Fallback re-prints: " << summary.fallbacks << "\n";
    }
    if (summary.failed > 0U) {
        std::cout << "  Failed statements: " << summary.failed << "\n";
    }
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 1000U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);
    sqlport::common::Logger::instance().set_level(sqlport::common::LogLevel::Error);

    auto& source = sqlport::dialect::dialect_for(sqlport::dialect::DialectKind::Snowflake);
    sqlport::dialect::install_grammar_extensions(source);
    const auto& target = sqlport::dialect::dialect_for(sqlport::dialect::DialectKind::Oracle);

    const auto rules = benchmark_rules();
    const sqlport::convert::StatementRouter router(rules, source, target);

    for (const auto& scenario : scenarios) {
        auto summary = run_scenario(scenario, rules, router, source, iterations);
        report_summary(scenario, summary);
    }

    return 0;
}
