#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace sqlport::convert {

struct ConversionTelemetrySnapshot final {
    std::uint64_t files_processed = 0U;
    std::uint64_t files_converted = 0U;
    std::uint64_t files_failed = 0U;
    std::uint64_t files_skipped = 0U;
    std::uint64_t statements_parsed = 0U;
    std::uint64_t statements_converted = 0U;
    std::uint64_t statements_skipped = 0U;
    std::uint64_t statements_failed = 0U;
    std::uint64_t fallbacks = 0U;
    std::uint64_t recovery_reparses = 0U;
    std::uint64_t total_file_duration_ns = 0U;
    std::uint64_t last_file_duration_ns = 0U;
};

// Counters shared by the conversion workers; every update is relaxed.
class ConversionTelemetry final {
public:
    void record_file_converted(std::uint64_t duration_ns) noexcept;
    void record_file_failed(std::uint64_t duration_ns) noexcept;
    void record_file_skipped(std::uint64_t duration_ns) noexcept;

    void record_statements_parsed(std::size_t count) noexcept;
    void record_statements_converted(std::size_t count) noexcept;
    void record_statements_skipped(std::size_t count) noexcept;
    void record_statement_failed() noexcept;
    void record_fallback() noexcept;
    void record_recovery_reparse() noexcept;

    [[nodiscard]] ConversionTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;
    void record_file(std::atomic<std::uint64_t>& outcome, std::uint64_t duration_ns) noexcept;

    std::atomic<std::uint64_t> files_processed_{0U};
    std::atomic<std::uint64_t> files_converted_{0U};
    std::atomic<std::uint64_t> files_failed_{0U};
    std::atomic<std::uint64_t> files_skipped_{0U};
    std::atomic<std::uint64_t> statements_parsed_{0U};
    std::atomic<std::uint64_t> statements_converted_{0U};
    std::atomic<std::uint64_t> statements_skipped_{0U};
    std::atomic<std::uint64_t> statements_failed_{0U};
    std::atomic<std::uint64_t> fallbacks_{0U};
    std::atomic<std::uint64_t> recovery_reparses_{0U};
    std::atomic<std::uint64_t> total_file_duration_ns_{0U};
    std::atomic<std::uint64_t> last_file_duration_ns_{0U};
};

}  // namespace sqlport::convert
