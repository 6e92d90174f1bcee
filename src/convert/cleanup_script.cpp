#include "sqlport/convert/cleanup_script.hpp"

#include "sqlport/dialect/dialect.hpp"
#include "sqlport/parser/sql_text.hpp"

#include <algorithm>
#include <regex>

namespace sqlport::convert {

void collect_created_objects(const std::vector<std::string>& statements, std::set<CreatedObject>& objects)
{
    static const std::regex kCreatePattern(
        R"(^\s*CREATE\s+(?:OR\s+REPLACE\s+)?(TABLE|VIEW|SEQUENCE|PROCEDURE|FUNCTION|PACKAGE|MATERIALIZED\s+VIEW)\s+(?:IF\s+NOT\s+EXISTS\s+)?([\w".]+))",
        std::regex::ECMAScript | std::regex::icase);

    for (const auto& statement : statements) {
        std::size_t start = 0U;
        while (start < statement.size()) {
            auto end = statement.find('\n', start);
            if (end == std::string::npos) {
                end = statement.size();
            }
            const auto line = statement.substr(start, end - start);
            std::smatch match;
            if (std::regex_search(line, match, kCreatePattern)) {
                auto type = parser::collapse_whitespace(parser::uppercase_copy(match[1].str()));
                auto name = match[2].str();
                name.erase(std::remove(name.begin(), name.end(), '"'), name.end());
                objects.emplace(std::move(type), std::move(name));
                break;
            }
            start = end + 1U;
        }
    }
}

std::string render_cleanup_script(const std::set<CreatedObject>& objects, const dialect::Dialect& target)
{
    std::string script;
    for (const auto& [type, name] : objects) {
        if (!script.empty()) {
            script.push_back('\n');
        }
        script += "DROP " + type + " " + name;
        if (type == "TABLE") {
            script += " " + std::string{target.traits().cascade_keyword};
        }
        script.push_back(';');
    }
    if (!script.empty()) {
        script.push_back('\n');
    }
    return script;
}

}  // namespace sqlport::convert
