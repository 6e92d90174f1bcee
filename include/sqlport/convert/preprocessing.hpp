#pragma once

#include <string>
#include <string_view>

namespace sqlport::convert {

// Drops a leading UTF-8 byte order mark and converts CRLF and lone CR to LF.
[[nodiscard]] std::string normalize_source_text(std::string_view text);

// Removes BEGIN ... END bodies line by line, tracking nesting depth. Lines outside any
// block are kept unchanged.
[[nodiscard]] std::string strip_procedural_blocks(std::string_view text);

}  // namespace sqlport::convert
