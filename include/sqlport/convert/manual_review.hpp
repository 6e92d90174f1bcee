#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlport::convert {

enum class ReviewSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

[[nodiscard]] std::string_view review_severity_name(ReviewSeverity severity) noexcept;

struct ManualReviewItem final {
    std::string timestamp{};
    std::string file_path{};
    std::string object_name{};
    std::string object_type{};
    std::string issue_type{};
    ReviewSeverity severity = ReviewSeverity::Warning;
    std::string message{};
    std::optional<std::string> suggested_action{};
    std::optional<std::size_t> line{};
    std::string status = "PENDING_REVIEW";
};

struct ReviewRequest final {
    std::string file_path{};
    std::string object_name{};
    // Taken from the object name when empty.
    std::string object_type{};
    std::string issue_type{};
    std::string message{};
    ReviewSeverity severity = ReviewSeverity::Warning;
    std::optional<std::string> suggested_action{};
    std::optional<std::size_t> line{};
};

// Thread-safe accumulator for findings the converter could not resolve on its own.
class ManualReviewCollector final {
public:
    ManualReviewCollector() = default;

    ManualReviewCollector(const ManualReviewCollector&) = delete;
    ManualReviewCollector& operator=(const ManualReviewCollector&) = delete;

    void record(ReviewRequest request) noexcept;

    // Writes manual_review_required_<stamp>.json under `output_directory` when at least one
    // item was recorded. Repeated calls return the first report path.
    std::optional<std::filesystem::path> flush(const std::filesystem::path& output_directory,
                                               std::chrono::system_clock::time_point now);

    [[nodiscard]] std::vector<ManualReviewItem> items() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    [[nodiscard]] std::string summary_text() const;

private:
    mutable std::mutex mutex_{};
    std::vector<ManualReviewItem> items_{};
    std::optional<std::filesystem::path> report_path_{};
};

// Infers TABLE/FUNCTION/PROCEDURE from substrings of an object name; UNKNOWN otherwise.
[[nodiscard]] std::string detect_object_type(std::string_view object_name);

struct StatementIdentity final {
    std::string name{};
    std::string type{};
};

// Best effort name and kind of the object a statement targets.
[[nodiscard]] StatementIdentity identify_statement(std::string_view sql, std::size_t line);

// Scans one statement for constructs that have no automatic translation and records
// one item per matching pattern. Returns the number of items recorded.
std::size_t scan_for_manual_review(std::string_view sql,
                                   std::string_view file,
                                   std::size_t line,
                                   ManualReviewCollector& collector);

}  // namespace sqlport::convert
