#pragma once

#include "sqlport/parser/ast.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sqlport::dialect {

struct ExtensionMatch final {
    std::size_t consumed = 0U;
    parser::TableProperty property{};
};

// A vendor table clause the core CREATE TABLE grammar does not know. The grammar offers
// the unparsed remainder of the statement to each registered extension at every table
// property position; a match consumes a prefix and yields a typed property.
class ClauseExtension {
public:
    virtual ~ClauseExtension() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::optional<ExtensionMatch> parse(std::string_view input) const = 0;
    [[nodiscard]] virtual std::string print(const parser::TableProperty& property) const = 0;
};

}  // namespace sqlport::dialect
