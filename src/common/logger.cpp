#include "sqlport/common/logger.hpp"

#include "sqlport/common/timestamp.hpp"

#include <chrono>
#include <cctype>
#include <iostream>
#include <utility>

namespace sqlport::common {
namespace {

std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    auto text = iso_timestamp(tp);
    text[10] = ' ';
    return text;
}

}  // namespace

std::string_view log_level_name(LogLevel level) noexcept
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
    default:
        return "ERROR";
    }
}

std::optional<LogLevel> parse_log_level(std::string_view text)
{
    std::string lowered;
    lowered.reserve(text.size());
    for (unsigned char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }

    if (lowered == "debug") {
        return LogLevel::Debug;
    }
    if (lowered == "info") {
        return LogLevel::Info;
    }
    if (lowered == "warning" || lowered == "warn") {
        return LogLevel::Warning;
    }
    if (lowered == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) noexcept
{
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const noexcept
{
    return level_.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) const noexcept
{
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(this->level());
}

bool Logger::set_file(const std::filesystem::path& path)
{
    std::lock_guard guard(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

void Logger::close_file()
{
    std::lock_guard guard(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::set_sink(Sink sink)
{
    std::lock_guard guard(mutex_);
    sink_ = std::move(sink);
}

std::string Logger::format_line(LogLevel level, std::string_view component, std::string_view message)
{
    std::string line;
    line.reserve(message.size() + component.size() + 48U);
    line.push_back('[');
    line.append(format_timestamp(std::chrono::system_clock::now()));
    line.append("] [");
    line.append(log_level_name(level));
    line.append("] [");
    line.append(component);
    line.append("] ");
    line.append(message);
    return line;
}

void Logger::write(LogLevel level, std::string_view component, std::string_view message)
{
    if (!enabled(level)) {
        return;
    }

    const auto line = format_line(level, component, message);

    std::lock_guard guard(mutex_);
    if (sink_) {
        sink_(level, component, message);
    } else {
        std::cerr << line << '\n';
    }
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
}

void log_debug(std::string_view component, std::string_view message)
{
    Logger::instance().write(LogLevel::Debug, component, message);
}

void log_info(std::string_view component, std::string_view message)
{
    Logger::instance().write(LogLevel::Info, component, message);
}

void log_warning(std::string_view component, std::string_view message)
{
    Logger::instance().write(LogLevel::Warning, component, message);
}

void log_error(std::string_view component, std::string_view message)
{
    Logger::instance().write(LogLevel::Error, component, message);
}

}  // namespace sqlport::common
