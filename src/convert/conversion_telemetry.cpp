#include "sqlport/convert/conversion_telemetry.hpp"

namespace sqlport::convert {

void ConversionTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void ConversionTelemetry::record_file(std::atomic<std::uint64_t>& outcome, std::uint64_t duration_ns) noexcept
{
    add_relaxed(files_processed_, 1U);
    add_relaxed(outcome, 1U);
    add_relaxed(total_file_duration_ns_, duration_ns);
    last_file_duration_ns_.store(duration_ns, std::memory_order_relaxed);
}

void ConversionTelemetry::record_file_converted(std::uint64_t duration_ns) noexcept
{
    record_file(files_converted_, duration_ns);
}

void ConversionTelemetry::record_file_failed(std::uint64_t duration_ns) noexcept
{
    record_file(files_failed_, duration_ns);
}

void ConversionTelemetry::record_file_skipped(std::uint64_t duration_ns) noexcept
{
    record_file(files_skipped_, duration_ns);
}

void ConversionTelemetry::record_statements_parsed(std::size_t count) noexcept
{
    add_relaxed(statements_parsed_, static_cast<std::uint64_t>(count));
}

void ConversionTelemetry::record_statements_converted(std::size_t count) noexcept
{
    add_relaxed(statements_converted_, static_cast<std::uint64_t>(count));
}

void ConversionTelemetry::record_statements_skipped(std::size_t count) noexcept
{
    add_relaxed(statements_skipped_, static_cast<std::uint64_t>(count));
}

void ConversionTelemetry::record_statement_failed() noexcept
{
    add_relaxed(statements_failed_, 1U);
}

void ConversionTelemetry::record_fallback() noexcept
{
    add_relaxed(fallbacks_, 1U);
}

void ConversionTelemetry::record_recovery_reparse() noexcept
{
    add_relaxed(recovery_reparses_, 1U);
}

ConversionTelemetrySnapshot ConversionTelemetry::snapshot() const noexcept
{
    ConversionTelemetrySnapshot snapshot{};
    snapshot.files_processed = files_processed_.load(std::memory_order_relaxed);
    snapshot.files_converted = files_converted_.load(std::memory_order_relaxed);
    snapshot.files_failed = files_failed_.load(std::memory_order_relaxed);
    snapshot.files_skipped = files_skipped_.load(std::memory_order_relaxed);
    snapshot.statements_parsed = statements_parsed_.load(std::memory_order_relaxed);
    snapshot.statements_converted = statements_converted_.load(std::memory_order_relaxed);
    snapshot.statements_skipped = statements_skipped_.load(std::memory_order_relaxed);
    snapshot.statements_failed = statements_failed_.load(std::memory_order_relaxed);
    snapshot.fallbacks = fallbacks_.load(std::memory_order_relaxed);
    snapshot.recovery_reparses = recovery_reparses_.load(std::memory_order_relaxed);
    snapshot.total_file_duration_ns = total_file_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_file_duration_ns = last_file_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void ConversionTelemetry::reset() noexcept
{
    files_processed_.store(0U, std::memory_order_relaxed);
    files_converted_.store(0U, std::memory_order_relaxed);
    files_failed_.store(0U, std::memory_order_relaxed);
    files_skipped_.store(0U, std::memory_order_relaxed);
    statements_parsed_.store(0U, std::memory_order_relaxed);
    statements_converted_.store(0U, std::memory_order_relaxed);
    statements_skipped_.store(0U, std::memory_order_relaxed);
    statements_failed_.store(0U, std::memory_order_relaxed);
    fallbacks_.store(0U, std::memory_order_relaxed);
    recovery_reparses_.store(0U, std::memory_order_relaxed);
    total_file_duration_ns_.store(0U, std::memory_order_relaxed);
    last_file_duration_ns_.store(0U, std::memory_order_relaxed);
}

}  // namespace sqlport::convert
