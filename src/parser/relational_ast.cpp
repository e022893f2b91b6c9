#include "retable/parser/relational/ast.hpp"
#include "retable/parser/identifier_quoting.hpp"

#include <initializer_list>
#include <sstream>
#include <string_view>

namespace retable::parser::relational {

std::string format_table_name(const TableReference& table)
{
    std::ostringstream stream;
    bool first = true;
    for (const auto* part : {&table.catalog, &table.database, &table.name}) {
        if (!part->has_value()) {
            continue;
        }
        if (!first) {
            stream << '.';
        }
        stream << format_identifier(**part);
        first = false;
    }
    return stream.str();
}

std::string_view node_kind_to_string(NodeKind kind) noexcept
{
    switch (kind) {
    case NodeKind::SelectStatement:
        return "SelectStatement";
    case NodeKind::WithClause:
        return "WithClause";
    case NodeKind::CommonTableExpression:
        return "CommonTableExpression";
    case NodeKind::QuerySpecification:
        return "QuerySpecification";
    case NodeKind::SetOperation:
        return "SetOperation";
    case NodeKind::SelectItem:
        return "SelectItem";
    case NodeKind::TableReference:
        return "TableReference";
    case NodeKind::DerivedTable:
        return "DerivedTable";
    case NodeKind::JoinedTable:
        return "JoinedTable";
    case NodeKind::IdentifierExpression:
        return "IdentifierExpression";
    case NodeKind::LiteralExpression:
        return "LiteralExpression";
    case NodeKind::UnaryExpression:
        return "UnaryExpression";
    case NodeKind::BinaryExpression:
        return "BinaryExpression";
    case NodeKind::StarExpression:
        return "StarExpression";
    case NodeKind::FunctionCall:
        return "FunctionCall";
    case NodeKind::InExpression:
        return "InExpression";
    case NodeKind::BetweenExpression:
        return "BetweenExpression";
    case NodeKind::IsNullExpression:
        return "IsNullExpression";
    case NodeKind::ExistsExpression:
        return "ExistsExpression";
    case NodeKind::SubqueryExpression:
        return "SubqueryExpression";
    case NodeKind::CaseExpression:
        return "CaseExpression";
    case NodeKind::CastExpression:
        return "CastExpression";
    case NodeKind::ParenthesizedExpression:
        return "ParenthesizedExpression";
    case NodeKind::OrderByItem:
        return "OrderByItem";
    case NodeKind::LimitClause:
        return "LimitClause";
    case NodeKind::TableFunction:
        return "TableFunction";
    case NodeKind::InlineTable:
        return "InlineTable";
    case NodeKind::NestedJoin:
        return "NestedJoin";
    case NodeKind::WindowSpecification:
        return "WindowSpecification";
    }
    return "Unknown";
}

}  // namespace retable::parser::relational
