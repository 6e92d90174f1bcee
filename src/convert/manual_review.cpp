#include "sqlport/convert/manual_review.hpp"

#include "sqlport/common/logger.hpp"
#include "sqlport/common/timestamp.hpp"
#include "sqlport/parser/sql_text.hpp"

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>
#include <utility>

namespace sqlport::convert {
namespace {

constexpr std::string_view kComponent = "manual_review";

bool is_word_char(char ch) noexcept
{
    const auto uc = static_cast<unsigned char>(ch);
    return std::isalnum(uc) != 0 || ch == '_';
}

// Position of the next occurrence of `word` at or after `from` that stands alone as a word.
std::size_t find_word(std::string_view upper, std::string_view word, std::size_t from)
{
    for (auto pos = upper.find(word, from); pos != std::string_view::npos; pos = upper.find(word, pos + 1U)) {
        const auto end = pos + word.size();
        if ((pos == 0U || !is_word_char(upper[pos - 1U])) && (end == upper.size() || !is_word_char(upper[end]))) {
            return pos;
        }
    }
    return std::string_view::npos;
}

bool is_target_char(char ch) noexcept
{
    return is_word_char(ch) || ch == '.' || ch == '"' || ch == '$';
}

// UPDATE <target> ... SET ... FROM, located by keyword positions so the cost stays linear
// in the statement length.
bool has_update_from(std::string_view upper)
{
    for (auto update = find_word(upper, "UPDATE", 0U); update != std::string_view::npos;
         update = find_word(upper, "UPDATE", update + 1U)) {
        auto cursor = update + 6U;
        const auto target = cursor;
        while (cursor < upper.size() && std::isspace(static_cast<unsigned char>(upper[cursor])) != 0) {
            ++cursor;
        }
        if (cursor == target || cursor == upper.size() || !is_target_char(upper[cursor])) {
            continue;
        }
        while (cursor < upper.size() && is_target_char(upper[cursor])) {
            ++cursor;
        }
        const auto set = find_word(upper, "SET", cursor);
        if (set == std::string_view::npos) {
            return false;
        }
        return find_word(upper, "FROM", set + 3U) != std::string_view::npos;
    }
    return false;
}

struct ReviewPattern final {
    std::string_view issue_type;
    ReviewSeverity severity;
    // Either a bounded regular expression or a keyword scanner over the upper-cased text.
    const char* expression;
    bool (*scanner)(std::string_view upper);
    std::string_view message;
    std::string_view suggested_action;
};

constexpr std::array<ReviewPattern, 5> kPatterns{{
    {"UPDATE_FROM_syntax",
     ReviewSeverity::Error,
     nullptr,
     has_update_from,
     "UPDATE ... FROM has no direct equivalent in the target dialect",
     "Convert UPDATE...FROM to a MERGE statement or a correlated subquery"},
    {"LATERAL_FLATTEN",
     ReviewSeverity::Warning,
     R"(\bLATERAL\s+FLATTEN\b)",
     nullptr,
     "LATERAL FLATTEN requires a manual rewrite",
     "Replace LATERAL FLATTEN with JSON_TABLE or XMLTABLE"},
    {"QUALIFY_clause",
     ReviewSeverity::Warning,
     R"(\bQUALIFY\b)",
     nullptr,
     "QUALIFY clause is not supported by the target dialect",
     "Replace QUALIFY with a nested query filtering on ROW_NUMBER()"},
    {"Dynamic_SQL",
     ReviewSeverity::Warning,
     R"(\bEXECUTE\s+IMMEDIATE\b)",
     nullptr,
     "Dynamic SQL is carried over without inspection",
     "Review EXECUTE IMMEDIATE statements for target syntax compatibility"},
    {"External_language",
     ReviewSeverity::Error,
     R"(\bLANGUAGE\s+(JAVASCRIPT|PYTHON|JAVA|SCALA)\b)",
     nullptr,
     "Routine body is written in an external language",
     "Rewrite the routine in the target's procedural language"},
}};

const std::vector<std::regex>& compiled_patterns()
{
    static const std::vector<std::regex> compiled = [] {
        std::vector<std::regex> result;
        result.reserve(kPatterns.size());
        for (const auto& pattern : kPatterns) {
            if (pattern.expression == nullptr) {
                result.emplace_back();
            } else {
                result.emplace_back(pattern.expression, std::regex::ECMAScript | std::regex::icase);
            }
        }
        return result;
    }();
    return compiled;
}

template <typename Key>
std::vector<std::pair<std::string, std::size_t>> count_by(const std::vector<ManualReviewItem>& items, Key key)
{
    std::vector<std::pair<std::string, std::size_t>> counts;
    for (const auto& item : items) {
        auto value = key(item);
        auto it = std::find_if(counts.begin(), counts.end(), [&value](const auto& entry) {
            return entry.first == value;
        });
        if (it == counts.end()) {
            counts.emplace_back(std::move(value), 1U);
        } else {
            ++it->second;
        }
    }
    return counts;
}

std::vector<std::pair<std::string, std::size_t>> sorted_by_count(std::vector<std::pair<std::string, std::size_t>> counts)
{
    std::stable_sort(counts.begin(), counts.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.second > rhs.second;
    });
    return counts;
}

template <typename Writer>
void write_string(Writer& writer, std::string_view value)
{
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

template <typename Writer>
void write_counts(Writer& writer, std::string_view key, const std::vector<std::pair<std::string, std::size_t>>& counts)
{
    write_string(writer, key);
    writer.StartObject();
    for (const auto& [name, count] : counts) {
        write_string(writer, name);
        writer.Uint64(static_cast<std::uint64_t>(count));
    }
    writer.EndObject();
}

template <typename Writer>
void write_item(Writer& writer, const ManualReviewItem& item)
{
    writer.StartObject();
    writer.Key("timestamp");
    write_string(writer, item.timestamp);
    writer.Key("file_path");
    write_string(writer, item.file_path);
    writer.Key("object_name");
    write_string(writer, item.object_name);
    writer.Key("object_type");
    write_string(writer, item.object_type);
    writer.Key("issue_type");
    write_string(writer, item.issue_type);
    writer.Key("severity");
    write_string(writer, review_severity_name(item.severity));
    writer.Key("message");
    write_string(writer, item.message);
    writer.Key("suggested_action");
    if (item.suggested_action) {
        write_string(writer, *item.suggested_action);
    } else {
        writer.Null();
    }
    writer.Key("line_number");
    if (item.line) {
        writer.Uint64(static_cast<std::uint64_t>(*item.line));
    } else {
        writer.Null();
    }
    writer.Key("status");
    write_string(writer, item.status);
    writer.EndObject();
}

template <typename Writer>
void write_instructions(Writer& writer)
{
    writer.Key("instructions");
    writer.StartObject();
    writer.Key("overview");
    writer.String("This file lists every conversion item that could not be converted automatically.");
    writer.Key("next_steps");
    writer.StartArray();
    writer.String("1. Review each item in the review_items section");
    writer.String("2. Apply the suggested_action where one is given");
    writer.String("3. Convert the identified patterns in the source files by hand");
    writer.String("4. Set the status field to COMPLETED when done");
    writer.String("5. Re-run the conversion if needed");
    writer.EndArray();
    writer.Key("severity_levels");
    writer.StartObject();
    writer.Key("ERROR");
    writer.String("Critical issues that will prevent compilation or execution");
    writer.Key("WARNING");
    writer.String("Issues that may cause runtime problems or performance degradation");
    writer.Key("INFO");
    writer.String("Best practice recommendations or potential improvements");
    writer.EndObject();
    writer.EndObject();
}

}  // namespace

std::string_view review_severity_name(ReviewSeverity severity) noexcept
{
    switch (severity) {
    case ReviewSeverity::Info:
        return "INFO";
    case ReviewSeverity::Warning:
        return "WARNING";
    case ReviewSeverity::Error:
    default:
        return "ERROR";
    }
}

std::string detect_object_type(std::string_view object_name)
{
    if (parser::contains_ci(object_name, "func")) {
        return "FUNCTION";
    }
    if (parser::contains_ci(object_name, "proc")) {
        return "PROCEDURE";
    }
    if (parser::contains_ci(object_name, "table") || parser::contains_ci(object_name, "tbl")) {
        return "TABLE";
    }
    return "UNKNOWN";
}

StatementIdentity identify_statement(std::string_view sql, std::size_t line)
{
    static const std::regex kCreatePattern(
        R"(^\s*CREATE\s+(?:OR\s+REPLACE\s+)?(?:[A-Z]+\s+)*?(TABLE|VIEW|SEQUENCE|PROCEDURE|FUNCTION|PACKAGE|TASK|STREAM|STAGE)\s+(?:IF\s+NOT\s+EXISTS\s+)?([\w."$]+))",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex kDmlPattern(R"(^\s*(?:UPDATE|DELETE\s+FROM|INSERT\s+INTO|MERGE\s+INTO)\s+([\w."$]+))",
                                        std::regex::ECMAScript | std::regex::icase);

    const auto text = parser::strip_leading_comments(sql);
    std::smatch match;
    if (std::regex_search(text, match, kCreatePattern)) {
        return {match[2].str(), parser::uppercase_copy(match[1].str())};
    }
    if (std::regex_search(text, match, kDmlPattern)) {
        return {match[1].str(), "TABLE"};
    }
    return {"statement_line_" + std::to_string(line), std::string{}};
}

void ManualReviewCollector::record(ReviewRequest request) noexcept
{
    try {
        ManualReviewItem item{};
        item.timestamp = common::iso_timestamp(std::chrono::system_clock::now());
        item.file_path = std::move(request.file_path);
        item.object_name = std::move(request.object_name);
        item.object_type = request.object_type.empty() || request.object_type == "UNKNOWN"
                               ? detect_object_type(item.object_name)
                               : std::move(request.object_type);
        item.issue_type = std::move(request.issue_type);
        item.severity = request.severity;
        item.message = std::move(request.message);
        item.suggested_action = std::move(request.suggested_action);
        item.line = request.line;

        const auto log_message = "MANUAL REVIEW [" + std::string{review_severity_name(item.severity)} + "] "
                                 + item.file_path + "::" + item.object_name + " - " + item.issue_type + ": "
                                 + item.message;
        if (item.severity == ReviewSeverity::Error) {
            common::log_error(kComponent, log_message);
        } else {
            common::log_warning(kComponent, log_message);
        }

        std::lock_guard guard(mutex_);
        items_.push_back(std::move(item));
    } catch (const std::exception& error) {
        common::log_error(kComponent, std::string{"failed to record review item: "} + error.what());
    }
}

std::optional<std::filesystem::path> ManualReviewCollector::flush(const std::filesystem::path& output_directory,
                                                                  std::chrono::system_clock::time_point now)
{
    std::lock_guard guard(mutex_);
    if (report_path_) {
        return report_path_;
    }
    if (items_.empty()) {
        return std::nullopt;
    }

    const auto stamp = common::compact_timestamp(now);
    const auto path = output_directory / ("manual_review_required_" + stamp + ".json");

    std::error_code ec;
    std::filesystem::create_directories(output_directory, ec);
    if (ec) {
        common::log_error(kComponent, "cannot create report directory " + output_directory.string() + ": " + ec.message());
        return std::nullopt;
    }

    std::ofstream stream(path, std::ios::out | std::ios::trunc);
    if (!stream.is_open()) {
        common::log_error(kComponent, "cannot open manual review report " + path.string());
        return std::nullopt;
    }

    rapidjson::OStreamWrapper wrapper(stream);
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer(wrapper);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("conversion_timestamp");
    write_string(writer, stamp);
    writer.Key("total_items_requiring_review");
    writer.Uint64(static_cast<std::uint64_t>(items_.size()));
    write_counts(writer, "summary_by_type", sorted_by_count(count_by(items_, [](const auto& item) {
                     return item.issue_type;
                 })));
    write_counts(writer, "summary_by_severity", count_by(items_, [](const auto& item) {
                     return std::string{review_severity_name(item.severity)};
                 }));
    write_counts(writer, "summary_by_file", sorted_by_count(count_by(items_, [](const auto& item) {
                     return item.file_path;
                 })));
    writer.Key("review_items");
    writer.StartArray();
    for (const auto& item : items_) {
        write_item(writer, item);
    }
    writer.EndArray();
    write_instructions(writer);
    writer.EndObject();
    stream << '\n';
    stream.flush();

    if (!stream) {
        common::log_error(kComponent, "failed writing manual review report " + path.string());
        return std::nullopt;
    }

    common::log_info(kComponent,
                     "manual review report written to " + path.string() + " (" + std::to_string(items_.size())
                         + " items)");
    report_path_ = path;
    return report_path_;
}

std::vector<ManualReviewItem> ManualReviewCollector::items() const
{
    std::lock_guard guard(mutex_);
    return items_;
}

std::size_t ManualReviewCollector::size() const
{
    std::lock_guard guard(mutex_);
    return items_.size();
}

bool ManualReviewCollector::empty() const
{
    std::lock_guard guard(mutex_);
    return items_.empty();
}

std::string ManualReviewCollector::summary_text() const
{
    std::lock_guard guard(mutex_);
    if (items_.empty()) {
        return "No manual review items found.";
    }

    const std::string rule(80U, '=');
    std::ostringstream stream;
    stream << rule << '\n' << "MANUAL REVIEW REQUIRED - CONVERSION SUMMARY\n" << rule << '\n';
    stream << "Total Items Requiring Review: " << items_.size() << "\n\n";

    stream << "BY SEVERITY:\n";
    for (const auto& [severity, count] : count_by(items_, [](const auto& item) {
             return std::string{review_severity_name(item.severity)};
         })) {
        stream << "  " << severity << ": " << count << " items\n";
    }
    stream << "\nBY ISSUE TYPE:\n";
    for (const auto& [type, count] : sorted_by_count(count_by(items_, [](const auto& item) { return item.issue_type; }))) {
        stream << "  " << type << ": " << count << " items\n";
    }
    stream << "\nBY FILE:\n";
    for (const auto& [file, count] : sorted_by_count(count_by(items_, [](const auto& item) { return item.file_path; }))) {
        stream << "  " << file << ": " << count << " items\n";
    }

    bool header_written = false;
    for (const auto& item : items_) {
        if (item.severity != ReviewSeverity::Error) {
            continue;
        }
        if (!header_written) {
            stream << "\nHIGH PRIORITY ITEMS (ERRORS):\n";
            header_written = true;
        }
        stream << "  - " << item.file_path << "::" << item.object_name << " - " << item.message << '\n';
    }

    if (report_path_) {
        stream << "\nDetailed log available at: " << report_path_->string() << '\n';
    }
    stream << rule;
    return stream.str();
}

std::size_t scan_for_manual_review(std::string_view sql,
                                   std::string_view file,
                                   std::size_t line,
                                   ManualReviewCollector& collector)
{
    const auto text = parser::strip_sql_comments(sql);
    const auto upper = parser::uppercase_copy(text);
    const auto& regexes = compiled_patterns();
    std::optional<StatementIdentity> identity{};

    std::size_t recorded = 0U;
    for (std::size_t index = 0; index < kPatterns.size(); ++index) {
        const auto& scanner = kPatterns[index].scanner;
        const bool matched = scanner != nullptr ? scanner(upper) : std::regex_search(text, regexes[index]);
        if (!matched) {
            continue;
        }
        if (!identity) {
            identity = identify_statement(text, line);
        }
        const auto& pattern = kPatterns[index];
        ReviewRequest request{};
        request.file_path = std::string{file};
        request.object_name = identity->name;
        request.object_type = identity->type;
        request.issue_type = std::string{pattern.issue_type};
        request.message = std::string{pattern.message};
        request.severity = pattern.severity;
        request.suggested_action = std::string{pattern.suggested_action};
        request.line = line;
        collector.record(std::move(request));
        ++recorded;
    }
    return recorded;
}

}  // namespace sqlport::convert
