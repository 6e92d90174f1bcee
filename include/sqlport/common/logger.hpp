#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace sqlport::common {

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info,
    Warning,
    Error
};

[[nodiscard]] std::string_view log_level_name(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

// Process-wide logger. Lines are written to stderr, and additionally to an append-mode
// file once one is configured. Writes are serialised.
class Logger final {
public:
    using Sink = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    bool set_file(const std::filesystem::path& path);
    void close_file();

    // Replaces stderr output; pass an empty sink to restore it.
    void set_sink(Sink sink);

    void write(LogLevel level, std::string_view component, std::string_view message);

private:
    Logger() = default;

    [[nodiscard]] static std::string format_line(LogLevel level, std::string_view component, std::string_view message);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_{};
    std::ofstream file_{};
    Sink sink_{};
};

void log_debug(std::string_view component, std::string_view message);
void log_info(std::string_view component, std::string_view message);
void log_warning(std::string_view component, std::string_view message);
void log_error(std::string_view component, std::string_view message);

}  // namespace sqlport::common
