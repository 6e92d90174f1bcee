#include "sqlport/common/timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sqlport::common {
namespace {

std::tm to_local_tm(std::chrono::system_clock::time_point tp)
{
    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
#if defined(_WIN32)
    localtime_s(&buffer, &time_value);
#else
    localtime_r(&time_value, &buffer);
#endif
    return buffer;
}

long long millis_part(std::chrono::system_clock::time_point tp)
{
    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp - std::chrono::system_clock::from_time_t(time_value))
            .count());
}

}  // namespace

std::string format_local_time(std::chrono::system_clock::time_point tp, const char* format)
{
    const auto local = to_local_tm(tp);
    std::ostringstream stream;
    stream << std::put_time(&local, format);
    return stream.str();
}

std::string compact_timestamp(std::chrono::system_clock::time_point tp)
{
    return format_local_time(tp, "%Y%m%d_%H%M%S");
}

std::string iso_timestamp(std::chrono::system_clock::time_point tp)
{
    std::ostringstream stream;
    stream << format_local_time(tp, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
           << millis_part(tp);
    return stream.str();
}

}  // namespace sqlport::common
