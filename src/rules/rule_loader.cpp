#include "sqlport/rules/rule_loader.hpp"

#include "sqlport/common/logger.hpp"
#include "sqlport/parser/sql_text.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

namespace sqlport::rules {
namespace {

constexpr std::string_view kComponent = "rules";

std::string lowercase_copy(std::string_view text)
{
    std::string result{parser::trim_copy(text)};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}

void warn_type(std::string_view key, std::string_view expected)
{
    common::log_warning(kComponent,
                        "ignoring rule '" + std::string{key} + "': expected " + std::string{expected});
}

const rapidjson::Value* find_member(const rapidjson::Value& object, const char* key)
{
    if (!object.IsObject()) {
        return nullptr;
    }
    const auto it = object.FindMember(key);
    if (it == object.MemberEnd()) {
        return nullptr;
    }
    return &it->value;
}

// Accepts either `true`/`false` or `{"enabled": bool}`.
bool read_enabled(const rapidjson::Value& value, std::string_view key)
{
    if (value.IsBool()) {
        return value.GetBool();
    }
    if (value.IsObject()) {
        if (const auto* enabled = find_member(value, "enabled")) {
            if (enabled->IsBool()) {
                return enabled->GetBool();
            }
            warn_type(std::string{key} + ".enabled", "a boolean");
        }
        return false;
    }
    warn_type(key, "a boolean or an object");
    return false;
}

std::vector<std::string> read_string_list(const rapidjson::Value& section, const char* key, std::string_view context)
{
    std::vector<std::string> values;
    const auto* member = find_member(section, key);
    if (member == nullptr) {
        return values;
    }
    if (!member->IsArray()) {
        warn_type(std::string{context} + "." + key, "an array of strings");
        return values;
    }
    for (const auto& item : member->GetArray()) {
        if (item.IsString()) {
            values.emplace_back(item.GetString(), item.GetStringLength());
        } else {
            warn_type(std::string{context} + "." + key, "string entries");
        }
    }
    return values;
}

std::optional<std::string> read_string(const rapidjson::Value& section, const char* key, std::string_view context)
{
    const auto* member = find_member(section, key);
    if (member == nullptr || member->IsNull()) {
        return std::nullopt;
    }
    if (!member->IsString()) {
        warn_type(std::string{context} + "." + key, "a string");
        return std::nullopt;
    }
    return std::string{member->GetString(), member->GetStringLength()};
}

std::string without_underscores(std::string text)
{
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
    return text;
}

template <typename Map>
void add_underscore_aliases(Map& map)
{
    std::vector<std::pair<std::string, typename Map::mapped_type>> aliases;
    for (const auto& [key, value] : map) {
        if (key.find('_') == std::string::npos) {
            continue;
        }
        auto alias = without_underscores(key);
        if (map.find(alias) == map.end()) {
            aliases.emplace_back(std::move(alias), value);
        }
    }
    for (auto& [alias, value] : aliases) {
        map.emplace(std::move(alias), std::move(value));
    }
}

void merge_type_map(const rapidjson::Value& section, std::string_view context, std::map<std::string, std::string>& out)
{
    if (!section.IsObject()) {
        warn_type(context, "an object");
        return;
    }
    for (const auto& member : section.GetObject()) {
        const std::string key{member.name.GetString(), member.name.GetStringLength()};
        if (!member.value.IsString()) {
            warn_type(std::string{context} + "." + key, "a string");
            continue;
        }
        out[parser::uppercase_copy(key)] = std::string{member.value.GetString(), member.value.GetStringLength()};
    }
}

DynamicRule parse_dynamic_rule(const rapidjson::Value& value, const std::string& context)
{
    DynamicRule rule{};
    if (const auto* max_size = find_member(value, "max_size")) {
        if (max_size->IsUint64()) {
            rule.max_size = static_cast<std::size_t>(max_size->GetUint64());
        } else {
            warn_type(context + ".max_size", "a non-negative integer");
        }
    }
    rule.overflow_type = read_string(value, "overflow_type", context);
    rule.size_template = read_string(value, "template", context);
    return rule;
}

}  // namespace

BehaviorRules parse_behavior_rules(const rapidjson::Value& document)
{
    BehaviorRules rules{};
    if (!document.IsObject()) {
        return rules;
    }

    if (const auto* section = find_member(document, "virtual_column_conversion")) {
        rules.virtual_column_conversion.enabled = read_enabled(*section, "virtual_column_conversion");
    }

    if (const auto* section = find_member(document, "clause_removal")) {
        rules.clause_removal.enabled = read_enabled(*section, "clause_removal");
        for (auto& clause : read_string_list(*section, "clauses", "clause_removal")) {
            rules.clause_removal.clauses.push_back(parser::uppercase_copy(parser::trim_copy(clause)));
        }
    }

    if (const auto* section = find_member(document, "with_property_removal")) {
        rules.with_property_removal.enabled = read_enabled(*section, "with_property_removal");
        for (auto& property : read_string_list(*section, "properties", "with_property_removal")) {
            rules.with_property_removal.properties.insert(parser::uppercase_copy(parser::trim_copy(property)));
        }
    }

    if (const auto* section = find_member(document, "comment_conversion")) {
        auto& comments = rules.comment_conversion;
        comments.enabled = read_enabled(*section, "comment_conversion");
        comments.target_table_template =
            read_string(*section, "target_table_template", "comment_conversion").value_or(std::string{});
        comments.target_column_template =
            read_string(*section, "target_column_template", "comment_conversion").value_or(std::string{});
    }

    if (const auto* section = find_member(document, "statement_skipping")) {
        auto& skipping = rules.statement_skipping;
        for (auto& pattern : read_string_list(*section, "patterns", "statement_skipping")) {
            try {
                std::regex compiled(pattern, std::regex::ECMAScript | std::regex::icase);
                skipping.patterns.push_back(SkipPattern{std::move(pattern), std::move(compiled)});
            } catch (const std::regex_error& error) {
                common::log_error(kComponent,
                                  "dropping invalid skip pattern '" + pattern + "': " + error.what());
            }
        }
        // Patterns apply unless the section explicitly disables them.
        skipping.enabled = find_member(*section, "enabled") != nullptr ? read_enabled(*section, "statement_skipping")
                                                                     : !skipping.patterns.empty();
    }

    if (const auto* section = find_member(document, "strip_procedural_blocks")) {
        rules.strip_procedural_blocks = read_enabled(*section, "strip_procedural_blocks");
    }

    return rules;
}

TypeRules parse_type_rules(const rapidjson::Value& document, const std::optional<std::string>& target_version)
{
    TypeRules rules{};
    if (!document.IsObject()) {
        return rules;
    }

    if (const auto* defaults = find_member(document, "default")) {
        merge_type_map(*defaults, "default", rules.type_map);
    }

    if (target_version && !target_version->empty()) {
        if (const auto* overrides = find_member(document, "version_overrides")) {
            if (const auto* version = find_member(*overrides, target_version->c_str())) {
                if (const auto* defaults = find_member(*version, "default")) {
                    merge_type_map(*defaults, "version_overrides." + *target_version + ".default", rules.type_map);
                }
            } else {
                common::log_debug(kComponent, "no type overrides for target version " + *target_version);
            }
        }
    }
    add_underscore_aliases(rules.type_map);

    if (const auto* dynamic = find_member(document, "dynamic_rules")) {
        if (dynamic->IsObject()) {
            for (const auto& member : dynamic->GetObject()) {
                const std::string key{member.name.GetString(), member.name.GetStringLength()};
                if (!member.value.IsObject()) {
                    warn_type("dynamic_rules." + key, "an object");
                    continue;
                }
                rules.dynamic_rules[parser::uppercase_copy(key)] = parse_dynamic_rule(member.value, "dynamic_rules." + key);
            }
            add_underscore_aliases(rules.dynamic_rules);
        } else {
            warn_type("dynamic_rules", "an object");
        }
    }

    for (auto& target : read_string_list(document, "paramless_targets", "data_types")) {
        rules.paramless_targets.insert(parser::uppercase_copy(parser::trim_copy(target)));
    }

    if (const auto* aliases = find_member(document, "output_aliases")) {
        if (aliases->IsObject()) {
            for (const auto& member : aliases->GetObject()) {
                const std::string key{member.name.GetString(), member.name.GetStringLength()};
                if (!member.value.IsString()) {
                    warn_type("output_aliases." + key, "a string");
                    continue;
                }
                rules.output_aliases.emplace_back(parser::uppercase_copy(key),
                                                  std::string{member.value.GetString(), member.value.GetStringLength()});
            }
        } else {
            warn_type("output_aliases", "an object");
        }
    }

    return rules;
}

RuleLoader::RuleLoader(Config config)
    : config_{std::move(config)}
{
}

std::filesystem::path RuleLoader::document_path(std::string_view source,
                                                std::string_view target,
                                                std::string_view category,
                                                std::string_view filename) const
{
    return config_.rules_root / (lowercase_copy(source) + "_" + lowercase_copy(target)) / std::string{category}
           / std::string{filename};
}

rapidjson::Document RuleLoader::load_document(std::string_view source,
                                              std::string_view target,
                                              std::string_view category,
                                              std::string_view filename) const
{
    rapidjson::Document document;
    document.SetObject();

    if (config_.rules_root.empty()) {
        common::log_error(kComponent, "rules root is not configured; cannot load " + std::string{filename});
        return document;
    }
    if (parser::trim_copy(source).empty() || parser::trim_copy(target).empty()) {
        common::log_error(kComponent,
                          "source or target dialect is empty; cannot resolve " + std::string{filename});
        return document;
    }

    const auto path = document_path(source, target, category, filename);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        common::log_info(kComponent, "rule file not found (this may be expected): " + path.string());
        return document;
    }

    std::ifstream stream(path);
    if (!stream.is_open()) {
        common::log_error(kComponent, "unable to open rule file: " + path.string());
        return document;
    }

    rapidjson::IStreamWrapper wrapper(stream);
    rapidjson::Document parsed;
    parsed.ParseStream(wrapper);
    if (parsed.HasParseError()) {
        common::log_error(kComponent,
                          "JSON parse error in " + path.string() + " at offset "
                              + std::to_string(parsed.GetErrorOffset()) + ": "
                              + rapidjson::GetParseError_En(parsed.GetParseError()));
        return document;
    }
    if (!parsed.IsObject()) {
        common::log_error(kComponent, "rule file " + path.string() + " does not contain a JSON object");
        return document;
    }

    common::log_debug(kComponent, "loaded rule file " + path.string());
    return parsed;
}

RuleSet RuleLoader::load_rule_set(std::string_view source, std::string_view target) const
{
    RuleSet rules{};

    const auto behaviors = load_document(source, target, kDdlRulesCategory, kBehaviorsFile);
    rules.behaviors = parse_behavior_rules(behaviors);

    const auto types = load_document(source, target, kDdlRulesCategory, kDataTypesFile);
    rules.types = parse_type_rules(types, config_.target_version);

    common::log_info(kComponent,
                     "loaded " + std::to_string(rules.types.type_map.size()) + " type mappings and "
                         + std::to_string(rules.behaviors.statement_skipping.patterns.size())
                         + " skip patterns for " + lowercase_copy(source) + "_" + lowercase_copy(target));
    return rules;
}

}  // namespace sqlport::rules
