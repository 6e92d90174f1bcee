#pragma once

#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlport::dialect {
class Dialect;
}

namespace sqlport::convert {

inline constexpr std::string_view kCleanupFileName = "00_cleanup.sql";

// (object type, object name); the type is upper-cased, the name has quotes removed.
using CreatedObject = std::pair<std::string, std::string>;

// Adds the object created by each converted statement, if any, to `objects`.
void collect_created_objects(const std::vector<std::string>& statements, std::set<CreatedObject>& objects);

// One DROP per object in (type, name) order; tables use the dialect's cascade keyword.
[[nodiscard]] std::string render_cleanup_script(const std::set<CreatedObject>& objects,
                                                const dialect::Dialect& target);

}  // namespace sqlport::convert
