#pragma once

#include "sqlport/convert/conversion_log.hpp"
#include "sqlport/parser/ast.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlport::dialect {
class Dialect;
}

namespace sqlport::rules {
struct RuleSet;
}

namespace sqlport::convert {

class ManualReviewCollector;

inline constexpr std::string_view kErrorMarkerPrefix = "-- ERROR: ";

struct DdlRewriteResult final {
    // The CREATE TABLE text first, followed by any COMMENT statements. No terminators.
    std::vector<std::string> statements{};
    std::vector<ConversionLogEntry> logs{};
    bool failed = false;
};

struct TypeConversion final {
    parser::DataType type{};
    bool changed = false;
};

struct InlineTypeConversion final {
    std::string sql{};
    // "SOURCE -> TARGET" per replaced type, and one message per type that failed to map.
    std::vector<std::string> converted{};
    std::vector<std::string> errors{};
};

// Rewrites one CREATE TABLE for the target dialect. The steps run in a fixed order:
// data types, virtual columns, clause removal, WITH-property removal, comment
// extraction, OR REPLACE removal, rendering, then text-level cleanup.
class DdlRewriter final {
public:
    DdlRewriter(const rules::RuleSet& rules, const dialect::Dialect& target, ManualReviewCollector* review = nullptr);

    [[nodiscard]] DdlRewriteResult rewrite(parser::CreateTableStatement statement,
                                           std::string_view original_text,
                                           std::string_view file,
                                           std::size_t line = 0U) const;

    // Maps one column type through the type map, dynamic sizing rules and the
    // paramless set. Throws std::runtime_error when the mapped target is not a
    // valid type.
    [[nodiscard]] TypeConversion convert_type(const parser::DataType& source, std::vector<std::string>* warnings = nullptr) const;

    // Maps the types named in CAST(... AS type), TRY_CAST and `::type` positions of
    // statements the rewriter does not model. Literals, comments and $$ bodies are left alone.
    [[nodiscard]] InlineTypeConversion convert_inline_types(std::string_view sql) const;

    // Line filtering, output aliases and TIMESTAMP precision reordering.
    [[nodiscard]] std::string post_cleanup(std::string sql) const;

private:
    struct Context;

    void convert_data_types(parser::CreateTableStatement& statement, Context& context) const;
    void convert_virtual_columns(parser::CreateTableStatement& statement, Context& context) const;
    void remove_clauses(parser::CreateTableStatement& statement, Context& context) const;
    void remove_with_properties(parser::CreateTableStatement& statement, Context& context) const;
    void extract_comments(parser::CreateTableStatement& statement, Context& context) const;
    [[nodiscard]] std::vector<std::string> render_comments(Context& context) const;

    const rules::RuleSet& rules_;
    const dialect::Dialect& target_;
    ManualReviewCollector* review_ = nullptr;
};

}  // namespace sqlport::convert
