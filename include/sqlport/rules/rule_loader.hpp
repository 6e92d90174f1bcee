#pragma once

#include "sqlport/rules/rule_set.hpp"

#include <rapidjson/document.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sqlport::rules {

inline constexpr std::string_view kDdlRulesCategory = "ddl_conversion_rules";
inline constexpr std::string_view kBehaviorsFile = "dialect_behaviors.json";
inline constexpr std::string_view kDataTypesFile = "data_types.json";

// Resolves rule documents under <rules_root>/<source>_<target>/<category>/<file>.
// Missing or unreadable documents never raise; they load as an empty object.
class RuleLoader final {
public:
    struct Config final {
        std::filesystem::path rules_root{};
        std::optional<std::string> target_version{};
    };

    explicit RuleLoader(Config config);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] std::filesystem::path document_path(std::string_view source,
                                                      std::string_view target,
                                                      std::string_view category,
                                                      std::string_view filename) const;

    [[nodiscard]] rapidjson::Document load_document(std::string_view source,
                                                    std::string_view target,
                                                    std::string_view category,
                                                    std::string_view filename) const;

    [[nodiscard]] RuleSet load_rule_set(std::string_view source, std::string_view target) const;

private:
    Config config_;
};

[[nodiscard]] BehaviorRules parse_behavior_rules(const rapidjson::Value& document);
[[nodiscard]] TypeRules parse_type_rules(const rapidjson::Value& document,
                                         const std::optional<std::string>& target_version);

}  // namespace sqlport::rules
