#include "sqlport/convert/manual_review.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace sqlport::convert;

namespace {

std::filesystem::path make_unique_review_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("sqlport_review_" + std::to_string(stamp));
}

struct TempReviewDirectory final {
    TempReviewDirectory()
        : path{make_unique_review_path()}
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    ~TempReviewDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

ReviewRequest make_request(std::string file, std::string object, std::string issue, ReviewSeverity severity)
{
    ReviewRequest request{};
    request.file_path = std::move(file);
    request.object_name = std::move(object);
    request.issue_type = std::move(issue);
    request.message = "needs a look";
    request.severity = severity;
    return request;
}

rapidjson::Document read_json(const std::filesystem::path& path)
{
    std::ifstream stream(path);
    REQUIRE(stream.is_open());
    rapidjson::IStreamWrapper wrapper(stream);
    rapidjson::Document document;
    document.ParseStream(wrapper);
    REQUIRE_FALSE(document.HasParseError());
    return document;
}

}  // namespace

TEST_CASE("detect_object_type infers kinds from object names")
{
    CHECK(detect_object_type("calc_func") == "FUNCTION");
    CHECK(detect_object_type("LOAD_PROC") == "PROCEDURE");
    CHECK(detect_object_type("orders_tbl") == "TABLE");
    CHECK(detect_object_type("orders") == "UNKNOWN");
}

TEST_CASE("identify_statement names the targeted object")
{
    const auto table = identify_statement("-- lead\nCREATE OR REPLACE TRANSIENT TABLE IF NOT EXISTS db.s.t (a INT)", 1U);
    CHECK(table.name == "db.s.t");
    CHECK(table.type == "TABLE");

    const auto procedure = identify_statement("create procedure load_all() returns int language javascript as $$ $$", 4U);
    CHECK(procedure.name == "load_all");
    CHECK(procedure.type == "PROCEDURE");

    const auto dml = identify_statement("MERGE INTO target t USING src s ON t.id = s.id", 1U);
    CHECK(dml.name == "target");
    CHECK(dml.type == "TABLE");

    const auto unknown = identify_statement("SELECT 1", 9U);
    CHECK(unknown.name == "statement_line_9");
    CHECK(unknown.type.empty());
}

TEST_CASE("record fills defaults and infers the object type")
{
    ManualReviewCollector collector;
    auto request = make_request("a.sql", "refresh_proc", "Dynamic_SQL", ReviewSeverity::Warning);
    request.line = 5U;
    collector.record(std::move(request));

    const auto items = collector.items();
    REQUIRE(items.size() == 1U);
    CHECK(items.front().object_type == "PROCEDURE");
    CHECK(items.front().status == "PENDING_REVIEW");
    CHECK(items.front().timestamp.size() == 23U);
    CHECK(items.front().line == std::size_t{5U});
    CHECK_FALSE(items.front().suggested_action.has_value());
}

TEST_CASE("scan_for_manual_review records one item per matching pattern")
{
    ManualReviewCollector collector;
    const auto recorded = scan_for_manual_review(
        "CREATE OR REPLACE PROCEDURE refresh() RETURNS STRING LANGUAGE JAVASCRIPT AS $$ "
        "snowflake.execute({sqlText: 'EXECUTE IMMEDIATE x'}) $$",
        "procs.sql",
        3U,
        collector);
    CHECK(recorded == 2U);

    const auto items = collector.items();
    REQUIRE(items.size() == 2U);
    CHECK(items[0].issue_type == "Dynamic_SQL");
    CHECK(items[1].issue_type == "External_language");
    CHECK(items[1].severity == ReviewSeverity::Error);
    CHECK(items[1].object_name == "refresh");
    CHECK(items[1].object_type == "PROCEDURE");
    REQUIRE(items[1].suggested_action.has_value());

    CHECK(scan_for_manual_review("-- QUALIFY in a comment only\nSELECT 1", "q.sql", 1U, collector) == 0U);
    CHECK(scan_for_manual_review("SELECT a FROM t, LATERAL FLATTEN(input => t.v) QUALIFY ROW_NUMBER() OVER "
                                 "(ORDER BY a) = 1",
                                 "q.sql",
                                 1U,
                                 collector) == 2U);
}

TEST_CASE("flush writes a single aggregate report only when items exist")
{
    TempReviewDirectory directory;
    const auto now = std::chrono::system_clock::now();

    ManualReviewCollector empty;
    CHECK_FALSE(empty.flush(directory.path, now).has_value());
    CHECK(empty.summary_text() == "No manual review items found.");

    ManualReviewCollector collector;
    collector.record(make_request("a.sql", "t1_table", "QUALIFY_clause", ReviewSeverity::Warning));
    collector.record(make_request("a.sql", "t2_table", "QUALIFY_clause", ReviewSeverity::Warning));
    collector.record(make_request("b.sql", "p_proc", "External_language", ReviewSeverity::Error));

    const auto report = collector.flush(directory.path, now);
    REQUIRE(report.has_value());
    CHECK(report->parent_path() == directory.path);
    CHECK(report->filename().string().rfind("manual_review_required_", 0U) == 0U);
    CHECK(collector.flush(directory.path, now + std::chrono::seconds(5)) == report);

    std::size_t report_count = 0U;
    for (const auto& entry : std::filesystem::directory_iterator(directory.path)) {
        (void)entry;
        ++report_count;
    }
    CHECK(report_count == 1U);

    const auto document = read_json(*report);
    CHECK(document["total_items_requiring_review"].GetUint64() == 3U);
    CHECK(document["summary_by_type"]["QUALIFY_clause"].GetUint64() == 2U);
    CHECK(document["summary_by_severity"]["ERROR"].GetUint64() == 1U);
    CHECK(document["summary_by_file"]["a.sql"].GetUint64() == 2U);
    REQUIRE(document["review_items"].IsArray());
    CHECK(document["review_items"].Size() == 3U);
    CHECK(std::string{document["review_items"][rapidjson::SizeType{2}]["object_type"].GetString()} == "PROCEDURE");
    CHECK(document["review_items"][rapidjson::SizeType{0}]["line_number"].IsNull());
    CHECK(document.HasMember("instructions"));

    const auto summary = collector.summary_text();
    CHECK(summary.find("Total Items Requiring Review: 3") != std::string::npos);
    CHECK(summary.find("HIGH PRIORITY ITEMS (ERRORS):") != std::string::npos);
    CHECK(summary.find("b.sql::p_proc") != std::string::npos);
    CHECK(summary.find(report->string()) != std::string::npos);
}

TEST_CASE("concurrent records are all retained")
{
    ManualReviewCollector collector;
    constexpr std::size_t kThreads = 4U;
    constexpr std::size_t kPerThread = 50U;

    std::vector<std::thread> workers;
    workers.reserve(kThreads);
    for (std::size_t worker = 0; worker < kThreads; ++worker) {
        workers.emplace_back([&collector, worker]() {
            for (std::size_t index = 0; index < kPerThread; ++index) {
                collector.record(make_request("w" + std::to_string(worker) + ".sql",
                                              "obj" + std::to_string(index),
                                              "Dynamic_SQL",
                                              ReviewSeverity::Info));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CHECK(collector.size() == kThreads * kPerThread);
}

TEST_CASE("UPDATE FROM detection matches whole keywords only")
{
    ManualReviewCollector collector;
    CHECK(scan_for_manual_review("update orders\nset total = s.total\nfrom staging s", "u.sql", 1U, collector) == 1U);
    CHECK(scan_for_manual_review("UPDATE t SET last_from = 1 WHERE id = 2", "u.sql", 1U, collector) == 0U);
    CHECK(scan_for_manual_review("SELECT last_update, offset FROM t", "u.sql", 1U, collector) == 0U);
    CHECK(scan_for_manual_review("UPDATE SET FROM", "u.sql", 1U, collector) == 0U);

    std::string large = "UPDATE t SET a = 1 WHERE b IN (1";
    while (large.size() < 150'000U) {
        large += ", 1";
    }
    large += ")";
    CHECK(scan_for_manual_review(large, "u.sql", 1U, collector) == 0U);
    CHECK(scan_for_manual_review(large + " OR c IN (SELECT x FROM s)", "u.sql", 1U, collector) == 1U);

    const auto items = collector.items();
    REQUIRE(items.size() == 2U);
    CHECK(items.front().object_name == "orders");
}
