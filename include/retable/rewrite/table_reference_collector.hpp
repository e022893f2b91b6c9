#pragma once

#include "retable/parser/relational/ast.hpp"

#include <cstddef>
#include <vector>

namespace retable::rewrite {

struct TableReferenceSite final {
    parser::relational::TableReference* table = nullptr;
    // CTE names visible where the reference appears, outermost first.
    std::vector<parser::Identifier> visible_ctes{};
    // 0 for the outermost query, incremented per nested statement.
    std::size_t query_depth = 0U;
};

// Finds every table reference of a statement in depth-first source order:
// CTE bodies, then the select list, FROM (joins left to right), WHERE,
// GROUP BY, HAVING, ORDER BY and LIMIT. Subqueries are entered wherever they
// appear. The tree is not modified.
class TableReferenceCollector final {
public:
    [[nodiscard]] std::vector<TableReferenceSite> collect(parser::relational::SelectStatement& statement) const;
};

// True when `table` is a bare name matching one of `visible_ctes`. Names
// compare case-insensitively whether quoted or not, as Spark resolves them.
[[nodiscard]] bool refers_to_cte(const parser::relational::TableReference& table,
                                 const std::vector<parser::Identifier>& visible_ctes) noexcept;

}  // namespace retable::rewrite
