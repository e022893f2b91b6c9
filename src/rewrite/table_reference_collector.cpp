#include "retable/rewrite/table_reference_collector.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

namespace retable::rewrite {
namespace {

using namespace parser::relational;
using parser::Identifier;

using CteScope = std::vector<Identifier>;

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }

    return true;
}

class CollectorWalk final {
public:
    explicit CollectorWalk(std::vector<TableReferenceSite>& sites) noexcept : sites_(sites) {}

    void walk_statement(SelectStatement& statement, const CteScope& outer, std::size_t depth)
    {
        CteScope scope = outer;
        if (statement.with != nullptr) {
            walk_with_clause(*statement.with, scope, depth);
        }

        if (statement.body != nullptr) {
            walk_query(*statement.body, scope, depth);
        }
    }

private:
    // Leaves `scope` holding every CTE of the clause for the main body.
    void walk_with_clause(WithClause& clause, CteScope& scope, std::size_t depth)
    {
        for (auto* cte : clause.expressions) {
            if (cte == nullptr) {
                continue;
            }

            if (clause.recursive) {
                scope.push_back(cte->name);
            }

            if (cte->query != nullptr) {
                walk_statement(*cte->query, scope, depth + 1U);
            }

            if (!clause.recursive) {
                scope.push_back(cte->name);
            }
        }
    }

    void walk_query(QueryExpression& query, const CteScope& scope, std::size_t depth)
    {
        if (query.kind == NodeKind::SetOperation) {
            auto& operation = static_cast<SetOperation&>(query);
            if (operation.left != nullptr) {
                walk_query(*operation.left, scope, depth);
            }
            if (operation.right != nullptr) {
                walk_query(*operation.right, scope, depth);
            }
            return;
        }

        auto& specification = static_cast<QuerySpecification&>(query);
        for (auto* item : specification.select_items) {
            if (item != nullptr) {
                walk_expression(item->expression, scope, depth);
            }
        }

        for (auto* source : specification.from) {
            walk_table_source(source, scope, depth);
        }

        walk_expression(specification.where, scope, depth);
        for (auto* expression : specification.group_by) {
            walk_expression(expression, scope, depth);
        }
        walk_expression(specification.having, scope, depth);
        for (auto* item : specification.order_by) {
            if (item != nullptr) {
                walk_expression(item->expression, scope, depth);
            }
        }

        if (specification.limit != nullptr) {
            walk_expression(specification.limit->row_count, scope, depth);
            walk_expression(specification.limit->offset, scope, depth);
        }
    }

    void walk_table_source(TableSource* source, const CteScope& scope, std::size_t depth)
    {
        if (source == nullptr) {
            return;
        }

        switch (source->kind) {
        case NodeKind::TableReference: {
            TableReferenceSite site{};
            site.table = static_cast<TableReference*>(source);
            site.visible_ctes = scope;
            site.query_depth = depth;
            sites_.push_back(std::move(site));
            break;
        }
        case NodeKind::DerivedTable: {
            auto* derived = static_cast<DerivedTable*>(source);
            if (derived->query != nullptr) {
                walk_statement(*derived->query, scope, depth + 1U);
            }
            break;
        }
        case NodeKind::JoinedTable: {
            auto* join = static_cast<JoinedTable*>(source);
            walk_table_source(join->left, scope, depth);
            walk_table_source(join->right, scope, depth);
            walk_expression(join->condition, scope, depth);
            break;
        }
        case NodeKind::NestedJoin:
            walk_table_source(static_cast<NestedJoin*>(source)->inner, scope, depth);
            break;
        case NodeKind::TableFunction:
            for (auto* argument : static_cast<TableFunction*>(source)->arguments) {
                walk_expression(argument, scope, depth);
            }
            break;
        case NodeKind::InlineTable:
            for (auto& row : static_cast<InlineTable*>(source)->rows) {
                for (auto* value : row) {
                    walk_expression(value, scope, depth);
                }
            }
            break;
        default:
            break;
        }
    }

    void walk_window(WindowSpecification& window, const CteScope& scope, std::size_t depth)
    {
        for (auto* expression : window.partition_by) {
            walk_expression(expression, scope, depth);
        }
        for (auto* item : window.order_by) {
            if (item != nullptr) {
                walk_expression(item->expression, scope, depth);
            }
        }
        if (window.frame) {
            walk_expression(window.frame->start.offset, scope, depth);
            if (window.frame->end) {
                walk_expression(window.frame->end->offset, scope, depth);
            }
        }
    }

    void walk_subquery(SelectStatement* statement, const CteScope& scope, std::size_t depth)
    {
        if (statement != nullptr) {
            walk_statement(*statement, scope, depth + 1U);
        }
    }

    void walk_expression(Expression* expression, const CteScope& scope, std::size_t depth)
    {
        if (expression == nullptr) {
            return;
        }

        switch (expression->kind) {
        case NodeKind::UnaryExpression:
            walk_expression(static_cast<UnaryExpression*>(expression)->operand, scope, depth);
            break;
        case NodeKind::BinaryExpression: {
            auto* binary = static_cast<BinaryExpression*>(expression);
            walk_expression(binary->left, scope, depth);
            walk_expression(binary->right, scope, depth);
            break;
        }
        case NodeKind::FunctionCall: {
            auto* call = static_cast<FunctionCall*>(expression);
            for (auto* argument : call->arguments) {
                walk_expression(argument, scope, depth);
            }
            if (call->window != nullptr) {
                walk_window(*call->window, scope, depth);
            }
            break;
        }
        case NodeKind::InExpression: {
            auto* in = static_cast<InExpression*>(expression);
            walk_expression(in->operand, scope, depth);
            for (auto* value : in->values) {
                walk_expression(value, scope, depth);
            }
            walk_subquery(in->subquery, scope, depth);
            break;
        }
        case NodeKind::BetweenExpression: {
            auto* between = static_cast<BetweenExpression*>(expression);
            walk_expression(between->operand, scope, depth);
            walk_expression(between->lower, scope, depth);
            walk_expression(between->upper, scope, depth);
            break;
        }
        case NodeKind::IsNullExpression:
            walk_expression(static_cast<IsNullExpression*>(expression)->operand, scope, depth);
            break;
        case NodeKind::ExistsExpression:
            walk_subquery(static_cast<ExistsExpression*>(expression)->query, scope, depth);
            break;
        case NodeKind::SubqueryExpression:
            walk_subquery(static_cast<SubqueryExpression*>(expression)->query, scope, depth);
            break;
        case NodeKind::CaseExpression: {
            auto* case_expression = static_cast<CaseExpression*>(expression);
            walk_expression(case_expression->operand, scope, depth);
            for (auto& branch : case_expression->branches) {
                walk_expression(branch.condition, scope, depth);
                walk_expression(branch.result, scope, depth);
            }
            walk_expression(case_expression->else_result, scope, depth);
            break;
        }
        case NodeKind::CastExpression:
            walk_expression(static_cast<CastExpression*>(expression)->operand, scope, depth);
            break;
        case NodeKind::ParenthesizedExpression:
            walk_expression(static_cast<ParenthesizedExpression*>(expression)->inner, scope, depth);
            break;
        default:
            // Column references, literals and stars hold no table references.
            break;
        }
    }

    std::vector<TableReferenceSite>& sites_;
};

}  // namespace

std::vector<TableReferenceSite> TableReferenceCollector::collect(SelectStatement& statement) const
{
    std::vector<TableReferenceSite> sites{};
    CollectorWalk walk{sites};
    walk.walk_statement(statement, CteScope{}, 0U);
    return sites;
}

bool refers_to_cte(const TableReference& table, const std::vector<Identifier>& visible_ctes) noexcept
{
    if (table.catalog || table.database || !table.name) {
        return false;
    }

    const auto& name = *table.name;
    return std::any_of(visible_ctes.begin(), visible_ctes.end(), [&name](const Identifier& cte) {
        return iequals(name.value, cte.value);
    });
}

}  // namespace retable::rewrite
