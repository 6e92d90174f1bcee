#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sqlport::dialect {
class ClauseExtension;
}

namespace sqlport::parser {

struct Identifier final {
    std::string value{};
    bool quoted = false;
};

struct QualifiedName final {
    std::vector<Identifier> parts{};

    [[nodiscard]] bool empty() const noexcept { return parts.empty(); }
    [[nodiscard]] const Identifier& object() const { return parts.back(); }
};

struct DataType final {
    std::string name{};
    std::vector<std::string> arguments{};
};

enum class ColumnConstraintKind : std::uint8_t {
    NotNull = 0,
    Null,
    PrimaryKey,
    Unique,
    Default,
    Comment,
    Computed,
    Identity,
    Collate,
    References,
    Check
};

enum class ComputedStyle : std::uint8_t {
    Bare = 0,            // AS (expr)
    GeneratedAlways,     // GENERATED ALWAYS AS (expr)
    Virtual,             // GENERATED ALWAYS AS (expr) VIRTUAL
    Stored               // GENERATED ALWAYS AS (expr) STORED
};

struct ColumnConstraint final {
    ColumnConstraintKind kind = ColumnConstraintKind::NotNull;
    std::optional<Identifier> name{};
    // Expression, comment text, collation, reference or check body depending on kind.
    std::string text{};
    ComputedStyle computed_style = ComputedStyle::Bare;
    bool identity_always = false;
    std::optional<std::string> identity_start{};
    std::optional<std::string> identity_increment{};
};

struct ColumnDefinition final {
    Identifier name{};
    std::optional<DataType> type{};
    std::vector<ColumnConstraint> constraints{};
};

struct TableConstraint final {
    std::string text{};
};

enum class TablePropertyKind : std::uint8_t {
    Generic = 0,   // KEY = value
    Flag,          // COPY GRANTS
    Comment,       // COMMENT = '...'
    ClusterBy,     // CLUSTER BY (...)
    PartitionBy,   // PARTITION BY (...)
    Extension      // parsed by a dialect clause extension
};

struct TableProperty final {
    TablePropertyKind kind = TablePropertyKind::Generic;
    std::string name{};
    std::string value{};
    std::vector<Identifier> columns{};
    std::vector<std::pair<std::string, std::string>> entries{};
    const dialect::ClauseExtension* extension = nullptr;
};

struct CreateTableStatement final {
    bool or_replace = false;
    std::vector<std::string> modifiers{};
    bool if_not_exists = false;
    QualifiedName name{};
    std::vector<ColumnDefinition> columns{};
    std::vector<TableConstraint> constraints{};
    std::vector<TableProperty> properties{};
};

struct CreateViewStatement final {
    bool or_replace = false;
    std::vector<std::string> modifiers{};
    bool if_not_exists = false;
    QualifiedName name{};
    std::vector<Identifier> columns{};
    std::string query{};
};

struct DropObjectStatement final {
    std::string object_type{};
    bool if_exists = false;
    QualifiedName name{};
    bool cascade = false;
};

struct OpaqueStatement final {
    std::string text{};
};

}  // namespace sqlport::parser
