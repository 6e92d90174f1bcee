#pragma once

#include <chrono>
#include <string>

namespace sqlport::common {

// strftime-style rendering of `tp` in local time.
[[nodiscard]] std::string format_local_time(std::chrono::system_clock::time_point tp, const char* format);

// "YYYYmmdd_HHMMSS", used for run directories and report file names.
[[nodiscard]] std::string compact_timestamp(std::chrono::system_clock::time_point tp);

// "YYYY-mm-ddTHH:MM:SS.mmm"
[[nodiscard]] std::string iso_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace sqlport::common
