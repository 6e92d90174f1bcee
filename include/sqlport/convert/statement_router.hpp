#pragma once

#include "sqlport/convert/conversion_log.hpp"
#include "sqlport/convert/ddl_rewriter.hpp"
#include "sqlport/parser/grammar.hpp"

#include <cstdint>
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

enum class RouteKind : std::uint8_t {
    DdlRewrite = 0,
    RecoveredDdlRewrite,
    Fallback
};

struct RoutedStatement final {
    RouteKind route = RouteKind::Fallback;
    std::vector<std::string> statements{};
    std::vector<ConversionLogEntry> logs{};
    bool failed = false;
};

// True for a typed CREATE TABLE, or an opaque statement whose text starts a CREATE TABLE.
[[nodiscard]] bool is_create_table(const parser::ParsedStatement& statement);

// Sends CREATE TABLE statements to the DDL rewriter and re-prints everything else in
// the target dialect.
class StatementRouter final {
public:
    StatementRouter(const rules::RuleSet& rules,
                    const dialect::Dialect& source,
                    const dialect::Dialect& target,
                    ManualReviewCollector* review = nullptr);

    [[nodiscard]] RoutedStatement route(const parser::ParsedStatement& statement, std::string_view file) const;

private:
    [[nodiscard]] RoutedStatement fallback(const parser::ParsedStatement& statement,
                                           std::string_view file,
                                           std::string reason) const;

    const dialect::Dialect& source_;
    const dialect::Dialect& target_;
    ManualReviewCollector* review_ = nullptr;
    DdlRewriter rewriter_;
};

}  // namespace sqlport::convert
