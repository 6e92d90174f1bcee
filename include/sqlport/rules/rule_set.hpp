#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlport::rules {

struct VirtualColumnConversion final {
    bool enabled = false;
};

struct ClauseRemoval final {
    bool enabled = false;
    // Upper-cased clause keywords, e.g. "CLUSTER BY", "PARTITION BY".
    std::vector<std::string> clauses{};
};

struct WithPropertyRemoval final {
    bool enabled = false;
    // Upper-cased property names.
    std::set<std::string> properties{};
};

struct CommentConversion final {
    bool enabled = false;
    std::string target_table_template{};
    std::string target_column_template{};
};

struct SkipPattern final {
    std::string pattern{};
    std::regex compiled{};
};

struct StatementSkipping final {
    bool enabled = false;
    std::vector<SkipPattern> patterns{};
};

struct BehaviorRules final {
    VirtualColumnConversion virtual_column_conversion{};
    ClauseRemoval clause_removal{};
    WithPropertyRemoval with_property_removal{};
    CommentConversion comment_conversion{};
    StatementSkipping statement_skipping{};
    bool strip_procedural_blocks = false;
};

struct DynamicRule final {
    std::size_t max_size = 4000U;
    std::optional<std::string> overflow_type{};
    // Target type with a "{size}" placeholder, e.g. "VARCHAR2({size})".
    std::optional<std::string> size_template{};
};

struct TypeRules final {
    std::map<std::string, std::string> type_map{};
    std::map<std::string, DynamicRule> dynamic_rules{};
    std::set<std::string> paramless_targets{};
    // Applied in order as plain text substitutions.
    std::vector<std::pair<std::string, std::string>> output_aliases{};
};

// Read-only during a run. A default-constructed RuleSet turns every rewrite step off.
struct RuleSet final {
    BehaviorRules behaviors{};
    TypeRules types{};

    [[nodiscard]] const std::string* find_type_mapping(std::string_view type_name) const;
    [[nodiscard]] const DynamicRule* find_dynamic_rule(std::string_view type_name) const;
    [[nodiscard]] bool is_paramless(std::string_view target_type) const;

    // True when `sql` matches any enabled skip pattern; `matched` receives the pattern.
    [[nodiscard]] bool should_skip(std::string_view sql, std::string* matched = nullptr) const;
};

}  // namespace sqlport::rules
