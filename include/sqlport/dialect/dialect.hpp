#pragma once

#include "sqlport/dialect/clause_extension.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sqlport::dialect {

enum class DialectKind : std::uint8_t {
    Snowflake = 0,
    Oracle,
    PostgreSql,
    MySql,
    BigQuery,
    Generic
};

enum class IdentityStyle : std::uint8_t {
    Autoincrement = 0,   // AUTOINCREMENT [START s INCREMENT i]
    AutoIncrementColumn, // AUTO_INCREMENT
    SqlStandard          // GENERATED {ALWAYS | BY DEFAULT} AS IDENTITY [(START WITH s INCREMENT BY i)]
};

struct DialectTraits final {
    std::string_view name{};
    char identifier_quote = '"';
    bool supports_or_replace_table = false;
    bool supports_if_exists = true;
    bool supports_if_not_exists = true;
    IdentityStyle identity_style = IdentityStyle::SqlStandard;
    std::string_view cascade_keyword = "CASCADE";
    std::vector<std::string_view> table_modifiers{};
    std::vector<std::string_view> view_modifiers{};
};

class Dialect final {
public:
    using ExtensionFactory = std::function<std::vector<std::unique_ptr<ClauseExtension>>()>;

    Dialect(DialectKind kind, DialectTraits traits);

    Dialect(const Dialect&) = delete;
    Dialect& operator=(const Dialect&) = delete;

    [[nodiscard]] DialectKind kind() const noexcept { return kind_; }
    [[nodiscard]] const DialectTraits& traits() const noexcept { return traits_; }
    [[nodiscard]] std::string_view name() const noexcept { return traits_.name; }

    [[nodiscard]] bool supports_table_modifier(std::string_view modifier) const;
    [[nodiscard]] bool supports_view_modifier(std::string_view modifier) const;

    // Runs the factory and registers its extensions unless `marker` was already applied
    // to this dialect. Returns true when the extensions were installed by this call.
    bool extend_once(std::string_view marker, const ExtensionFactory& factory);
    [[nodiscard]] bool has_marker(std::string_view marker) const;

    [[nodiscard]] std::vector<const ClauseExtension*> extensions() const;

private:
    DialectKind kind_;
    DialectTraits traits_;
    mutable std::mutex mutex_{};
    std::set<std::string, std::less<>> markers_{};
    std::vector<std::unique_ptr<ClauseExtension>> extensions_{};
};

[[nodiscard]] std::optional<DialectKind> dialect_from_name(std::string_view name);
[[nodiscard]] std::string_view dialect_name(DialectKind kind) noexcept;
[[nodiscard]] Dialect& dialect_for(DialectKind kind);
[[nodiscard]] std::vector<DialectKind> all_dialects();

}  // namespace sqlport::dialect
