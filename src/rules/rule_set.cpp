#include "sqlport/rules/rule_set.hpp"

#include "sqlport/parser/sql_text.hpp"

#include <algorithm>

namespace sqlport::rules {
namespace {

std::string without_underscores(std::string text)
{
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
    return text;
}

template <typename Map>
const typename Map::mapped_type* lookup_upper(const Map& map, std::string_view name)
{
    auto key = parser::uppercase_copy(parser::trim_copy(name));
    if (auto it = map.find(key); it != map.end()) {
        return &it->second;
    }
    if (auto it = map.find(without_underscores(std::move(key))); it != map.end()) {
        return &it->second;
    }
    return nullptr;
}

}  // namespace

const std::string* RuleSet::find_type_mapping(std::string_view type_name) const
{
    return lookup_upper(types.type_map, type_name);
}

const DynamicRule* RuleSet::find_dynamic_rule(std::string_view type_name) const
{
    return lookup_upper(types.dynamic_rules, type_name);
}

bool RuleSet::is_paramless(std::string_view target_type) const
{
    return types.paramless_targets.count(parser::uppercase_copy(parser::trim_copy(target_type))) != 0U;
}

bool RuleSet::should_skip(std::string_view sql, std::string* matched) const
{
    if (!behaviors.statement_skipping.enabled) {
        return false;
    }

    const std::string text{sql};
    for (const auto& pattern : behaviors.statement_skipping.patterns) {
        if (std::regex_search(text, pattern.compiled)) {
            if (matched != nullptr) {
                *matched = pattern.pattern;
            }
            return true;
        }
    }
    return false;
}

}  // namespace sqlport::rules
