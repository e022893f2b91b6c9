#include "retable/parser/sql_renderer.hpp"
#include "retable/parser/identifier_quoting.hpp"
#include "retable/parser/parser_errors.hpp"

#include <iterator>
#include <string_view>

namespace retable::parser {
namespace {

using namespace relational;

class StatementRenderer final {
public:
    explicit StatementRenderer(const RenderOptions& options) noexcept : options_(options) {}

    // The first line carries no indentation; continuation lines are indented
    // to `depth`.
    std::string statement(const SelectStatement& statement, std::size_t depth) const;
    std::string expression(const Expression& expression, std::size_t depth) const;
    std::string subquery(const SelectStatement& statement, std::size_t depth) const;
    std::string window(const WindowSpecification& window, std::size_t depth) const;

    std::string identifier(const Identifier& identifier) const
    {
        return format_identifier(identifier, options_.lowercase_unquoted_identifiers);
    }

    std::string qualified_name(const QualifiedName& name) const
    {
        std::string result{};
        for (const auto& part : name.parts) {
            if (!result.empty()) {
                result.push_back('.');
            }
            result.append(identifier(part));
        }
        return result;
    }

private:
    std::string indent(std::size_t depth) const
    {
        return options_.pretty ? std::string(depth * options_.indent_width, ' ') : std::string{};
    }

    std::string line_break(std::size_t depth) const
    {
        return options_.pretty ? "\n" + indent(depth) : std::string{" "};
    }

    std::string with_clause(const WithClause& with, std::size_t depth) const;
    std::string query(const QueryExpression& query, std::size_t depth) const;
    std::string specification(const QuerySpecification& query, std::size_t depth) const;
    std::string table_source(const TableSource& source, std::size_t depth) const;
    std::string table_reference(const TableReference& table) const;
    std::string table_alias(const std::optional<Identifier>& alias, const std::vector<Identifier>& columns) const;
    std::string frame_bound(const WindowFrameBound& bound, std::size_t depth) const;
    std::string order_item(const OrderByItem& item, std::size_t depth) const;

    std::string expression_list(const std::vector<Expression*>& expressions, std::size_t depth) const;
    std::string identifier_list(const std::vector<Identifier>& identifiers) const;

    const RenderOptions& options_;
};

class ExpressionPrinter final : public ExpressionVisitor {
public:
    ExpressionPrinter(const StatementRenderer& renderer, std::size_t depth) noexcept
        : renderer_(renderer)
        , depth_(depth)
    {
    }

    void visit(const IdentifierExpression& expression) override
    {
        result_ = renderer_.qualified_name(expression.name);
    }

    void visit(const LiteralExpression& expression) override
    {
        switch (expression.tag) {
        case LiteralTag::Null:
            result_ = "NULL";
            break;
        case LiteralTag::Boolean:
            result_ = expression.boolean_value ? "TRUE" : "FALSE";
            break;
        case LiteralTag::Integer:
        case LiteralTag::Decimal:
            result_ = expression.text;
            break;
        case LiteralTag::String:
        default:
            result_ = quote_string(expression.text);
            break;
        }
    }

    void visit(const UnaryExpression& expression) override
    {
        const auto operand = print(expression.operand);
        switch (expression.op) {
        case UnaryOperator::Not:
            result_ = "NOT " + operand;
            break;
        case UnaryOperator::Negate:
            // "--" would start a comment.
            result_ = (!operand.empty() && operand.front() == '-') ? "- " + operand : "-" + operand;
            break;
        case UnaryOperator::Plus:
            result_ = (!operand.empty() && operand.front() == '+') ? "+ " + operand : "+" + operand;
            break;
        }
    }

    void visit(const BinaryExpression& expression) override
    {
        static constexpr std::string_view operators[] = {
            " = ",
            " <> ",
            " < ",
            " <= ",
            " > ",
            " >= ",
            " <=> ",
            " + ",
            " - ",
            " * ",
            " / ",
            " % ",
            " || ",
            " AND ",
            " OR ",
            " LIKE ",
            " NOT LIKE "
        };

        result_ = print(expression.left);
        const auto index = static_cast<std::size_t>(expression.op);
        result_.append(index < std::size(operators) ? operators[index] : std::string_view{" ? "});
        result_.append(print(expression.right));
    }

    void visit(const StarExpression& expression) override
    {
        if (expression.qualifier.empty()) {
            result_ = "*";
            return;
        }

        result_ = renderer_.qualified_name(expression.qualifier);
        result_.append(".*");
    }

    void visit(const FunctionCall& expression) override
    {
        result_ = format_identifier(expression.name);
        result_.push_back('(');
        if (expression.star_argument) {
            result_.push_back('*');
        } else {
            if (expression.distinct) {
                result_.append("DISTINCT ");
            }
            bool first = true;
            for (const auto* argument : expression.arguments) {
                if (!first) {
                    result_.append(", ");
                }
                result_.append(print(argument));
                first = false;
            }
        }
        result_.push_back(')');
        if (expression.window != nullptr) {
            result_.append(" OVER ").append(renderer_.window(*expression.window, depth_));
        }
    }

    void visit(const InExpression& expression) override
    {
        result_ = print(expression.operand);
        result_.append(expression.negated ? " NOT IN " : " IN ");
        if (expression.subquery != nullptr) {
            result_.append(renderer_.subquery(*expression.subquery, depth_));
            return;
        }

        result_.push_back('(');
        bool first = true;
        for (const auto* value : expression.values) {
            if (!first) {
                result_.append(", ");
            }
            result_.append(print(value));
            first = false;
        }
        result_.push_back(')');
    }

    void visit(const BetweenExpression& expression) override
    {
        result_ = print(expression.operand);
        result_.append(expression.negated ? " NOT BETWEEN " : " BETWEEN ");
        result_.append(print(expression.lower));
        result_.append(" AND ");
        result_.append(print(expression.upper));
    }

    void visit(const IsNullExpression& expression) override
    {
        result_ = print(expression.operand);
        result_.append(expression.negated ? " IS NOT NULL" : " IS NULL");
    }

    void visit(const ExistsExpression& expression) override
    {
        result_ = "EXISTS " + subquery(expression.query);
    }

    void visit(const SubqueryExpression& expression) override
    {
        result_ = subquery(expression.query);
    }

    void visit(const CaseExpression& expression) override
    {
        result_ = "CASE";
        if (expression.operand != nullptr) {
            result_.append(" ").append(print(expression.operand));
        }
        for (const auto& branch : expression.branches) {
            result_.append(" WHEN ").append(print(branch.condition));
            result_.append(" THEN ").append(print(branch.result));
        }
        if (expression.else_result != nullptr) {
            result_.append(" ELSE ").append(print(expression.else_result));
        }
        result_.append(" END");
    }

    void visit(const CastExpression& expression) override
    {
        result_ = expression.try_cast ? "TRY_CAST(" : "CAST(";
        result_.append(print(expression.operand)).append(" AS ").append(expression.type_name).append(")");
    }

    void visit(const ParenthesizedExpression& expression) override
    {
        result_ = "(" + print(expression.inner) + ")";
    }

    [[nodiscard]] std::string take() && { return std::move(result_); }

private:
    // Single quoted with backslash escapes, the form Spark reads back.
    static std::string quote_string(const std::string& text)
    {
        std::string quoted{"'"};
        for (std::size_t index = 0U; index < text.size(); ++index) {
            const char ch = text[index];
            switch (ch) {
            case '\'':
                quoted.append("\\'");
                break;
            case '\\':
                // `\%` and `\_` read back unchanged, so LIKE escapes keep their form.
                if (index + 1U < text.size() && (text[index + 1U] == '%' || text[index + 1U] == '_')) {
                    quoted.push_back('\\');
                } else {
                    quoted.append("\\\\");
                }
                break;
            case '\n':
                quoted.append("\\n");
                break;
            case '\t':
                quoted.append("\\t");
                break;
            case '\r':
                quoted.append("\\r");
                break;
            case '\b':
                quoted.append("\\b");
                break;
            case '\0':
                quoted.append("\\0");
                break;
            case '\x1A':
                quoted.append("\\Z");
                break;
            default:
                quoted.push_back(ch);
                break;
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    std::string print(const Expression* expression) const
    {
        if (expression == nullptr) {
            throw RenderError{"expression node is missing an operand"};
        }
        return renderer_.expression(*expression, depth_);
    }

    std::string subquery(const SelectStatement* statement) const
    {
        if (statement == nullptr) {
            throw RenderError{"subquery expression has no query"};
        }
        return renderer_.subquery(*statement, depth_);
    }

    const StatementRenderer& renderer_;
    std::size_t depth_;
    std::string result_{};
};

std::string StatementRenderer::expression(const Expression& expression, std::size_t depth) const
{
    ExpressionPrinter printer{*this, depth};
    expression.accept(printer);
    return std::move(printer).take();
}

std::string StatementRenderer::subquery(const SelectStatement& statement, std::size_t depth) const
{
    if (!options_.pretty) {
        return "(" + this->statement(statement, depth) + ")";
    }
    return "(\n" + indent(depth + 1U) + this->statement(statement, depth + 1U) + "\n" + indent(depth) + ")";
}

std::string StatementRenderer::window(const WindowSpecification& window, std::size_t depth) const
{
    std::string result{"("};
    if (!window.partition_by.empty()) {
        result.append("PARTITION BY ");
        bool first = true;
        for (const auto* expression : window.partition_by) {
            if (!first) {
                result.append(", ");
            }
            result.append(this->expression(*expression, depth));
            first = false;
        }
    }

    if (!window.order_by.empty()) {
        if (result.size() > 1U) {
            result.push_back(' ');
        }
        result.append("ORDER BY ");
        bool first = true;
        for (const auto* item : window.order_by) {
            if (!first) {
                result.append(", ");
            }
            result.append(order_item(*item, depth));
            first = false;
        }
    }

    if (window.frame) {
        if (result.size() > 1U) {
            result.push_back(' ');
        }
        result.append(window.frame->unit == WindowFrame::Unit::Range ? "RANGE " : "ROWS ");
        if (window.frame->end) {
            result.append("BETWEEN ").append(frame_bound(window.frame->start, depth));
            result.append(" AND ").append(frame_bound(*window.frame->end, depth));
        } else {
            result.append(frame_bound(window.frame->start, depth));
        }
    }

    result.push_back(')');
    return result;
}

std::string StatementRenderer::frame_bound(const WindowFrameBound& bound, std::size_t depth) const
{
    switch (bound.kind) {
    case WindowFrameBound::Kind::UnboundedPreceding:
        return "UNBOUNDED PRECEDING";
    case WindowFrameBound::Kind::UnboundedFollowing:
        return "UNBOUNDED FOLLOWING";
    case WindowFrameBound::Kind::CurrentRow:
        return "CURRENT ROW";
    case WindowFrameBound::Kind::Preceding:
    case WindowFrameBound::Kind::Following:
        break;
    }

    if (bound.offset == nullptr) {
        throw RenderError{"window frame bound has no offset"};
    }
    return expression(*bound.offset, depth)
           + (bound.kind == WindowFrameBound::Kind::Preceding ? " PRECEDING" : " FOLLOWING");
}

std::string StatementRenderer::statement(const SelectStatement& statement, std::size_t depth) const
{
    if (statement.body == nullptr) {
        throw RenderError{"statement has no query body"};
    }

    std::string result{};
    if (statement.with != nullptr && !statement.with->expressions.empty()) {
        result = with_clause(*statement.with, depth);
        result.append(line_break(depth));
    }
    result.append(query(*statement.body, depth));
    return result;
}

std::string StatementRenderer::with_clause(const WithClause& with, std::size_t depth) const
{
    std::string result = with.recursive ? "WITH RECURSIVE " : "WITH ";
    bool first = true;
    for (const auto* cte : with.expressions) {
        if (!first) {
            result.append(", ");
        }
        result.append(identifier(cte->name));
        if (!cte->column_names.empty()) {
            result.append(" (").append(identifier_list(cte->column_names)).append(")");
        }
        result.append(" AS ");
        if (cte->query == nullptr) {
            throw RenderError{"common table expression '" + cte->name.value + "' has no query"};
        }
        result.append(subquery(*cte->query, depth));
        first = false;
    }
    return result;
}

std::string StatementRenderer::query(const QueryExpression& query, std::size_t depth) const
{
    if (query.kind == NodeKind::QuerySpecification) {
        return specification(static_cast<const QuerySpecification&>(query), depth);
    }

    const auto& operation = static_cast<const SetOperation&>(query);
    if (operation.left == nullptr || operation.right == nullptr) {
        throw RenderError{"set operation is missing an operand"};
    }

    std::string keyword{};
    switch (operation.op) {
    case SetOperator::Union:
        keyword = "UNION";
        break;
    case SetOperator::Intersect:
        keyword = "INTERSECT";
        break;
    case SetOperator::Except:
        keyword = "EXCEPT";
        break;
    }
    if (operation.all) {
        keyword.append(" ALL");
    }

    return this->query(*operation.left, depth) + line_break(depth) + keyword + line_break(depth)
           + this->query(*operation.right, depth);
}

std::string StatementRenderer::specification(const QuerySpecification& query, std::size_t depth) const
{
    std::string result = query.distinct ? "SELECT DISTINCT" : "SELECT";

    const auto item_break = options_.pretty ? "\n" + indent(depth + 1U) : std::string{" "};
    const auto item_separator = options_.pretty ? ",\n" + indent(depth + 1U) : std::string{", "};
    const auto item_depth = options_.pretty ? depth + 1U : depth;

    bool first = true;
    for (const auto* item : query.select_items) {
        result.append(first ? item_break : item_separator);
        result.append(expression(*item->expression, item_depth));
        if (item->alias) {
            result.append(" AS ").append(identifier(*item->alias));
        }
        first = false;
    }

    if (!query.from.empty()) {
        result.append(line_break(depth)).append("FROM ");
        first = true;
        for (const auto* source : query.from) {
            if (!first) {
                result.append(", ");
            }
            result.append(table_source(*source, depth));
            first = false;
        }
    }

    if (query.where != nullptr) {
        result.append(line_break(depth)).append("WHERE").append(item_break);
        result.append(expression(*query.where, item_depth));
    }

    if (!query.group_by.empty()) {
        result.append(line_break(depth)).append("GROUP BY").append(item_break);
        result.append(expression_list(query.group_by, item_depth));
    }

    if (query.having != nullptr) {
        result.append(line_break(depth)).append("HAVING").append(item_break);
        result.append(expression(*query.having, item_depth));
    }

    if (!query.order_by.empty()) {
        result.append(line_break(depth)).append("ORDER BY").append(item_break);
        first = true;
        for (const auto* item : query.order_by) {
            if (!first) {
                result.append(item_separator);
            }
            result.append(order_item(*item, item_depth));
            first = false;
        }
    }

    if (query.limit != nullptr && query.limit->row_count != nullptr) {
        result.append(line_break(depth)).append("LIMIT ").append(expression(*query.limit->row_count, depth));
        if (query.limit->offset != nullptr) {
            result.append(" OFFSET ").append(expression(*query.limit->offset, depth));
        }
    }

    return result;
}

std::string StatementRenderer::table_source(const TableSource& source, std::size_t depth) const
{
    switch (source.kind) {
    case NodeKind::TableReference:
        return table_reference(static_cast<const TableReference&>(source));
    case NodeKind::DerivedTable: {
        const auto& derived = static_cast<const DerivedTable&>(source);
        if (derived.query == nullptr) {
            throw RenderError{"derived table has no query"};
        }
        return subquery(*derived.query, depth) + table_alias(derived.alias, derived.column_aliases);
    }
    case NodeKind::TableFunction: {
        const auto& function = static_cast<const TableFunction&>(source);
        auto result = format_identifier(function.name);
        result.push_back('(');
        bool first = true;
        for (const auto* argument : function.arguments) {
            if (!first) {
                result.append(", ");
            }
            result.append(expression(*argument, depth));
            first = false;
        }
        result.push_back(')');
        return result + table_alias(function.alias, function.column_aliases);
    }
    case NodeKind::InlineTable: {
        const auto& inline_rows = static_cast<const InlineTable&>(source);
        if (inline_rows.rows.empty()) {
            throw RenderError{"VALUES table has no rows"};
        }
        std::string result = inline_rows.parenthesized ? "(VALUES " : "VALUES ";
        bool first_row = true;
        for (const auto& row : inline_rows.rows) {
            if (!first_row) {
                result.append(", ");
            }
            result.push_back('(');
            bool first = true;
            for (const auto* value : row) {
                if (!first) {
                    result.append(", ");
                }
                result.append(expression(*value, depth));
                first = false;
            }
            result.push_back(')');
            first_row = false;
        }
        if (inline_rows.parenthesized) {
            result.push_back(')');
        }
        return result + table_alias(inline_rows.alias, inline_rows.column_aliases);
    }
    case NodeKind::NestedJoin: {
        const auto& nested = static_cast<const NestedJoin&>(source);
        if (nested.inner == nullptr) {
            throw RenderError{"parenthesised join is empty"};
        }
        return "(" + table_source(*nested.inner, depth) + ")";
    }
    case NodeKind::JoinedTable: {
        const auto& join = static_cast<const JoinedTable&>(source);
        if (join.left == nullptr || join.right == nullptr) {
            throw RenderError{"join is missing a table"};
        }

        std::string_view keyword = "JOIN";
        switch (join.type) {
        case JoinType::Inner:
            keyword = "JOIN";
            break;
        case JoinType::LeftOuter:
            keyword = "LEFT JOIN";
            break;
        case JoinType::RightOuter:
            keyword = "RIGHT JOIN";
            break;
        case JoinType::FullOuter:
            keyword = "FULL OUTER JOIN";
            break;
        case JoinType::Cross:
            keyword = "CROSS JOIN";
            break;
        case JoinType::LeftSemi:
            keyword = "LEFT SEMI JOIN";
            break;
        case JoinType::LeftAnti:
            keyword = "LEFT ANTI JOIN";
            break;
        }

        auto result = table_source(*join.left, depth);
        result.append(line_break(depth)).append(keyword).append(" ");
        result.append(table_source(*join.right, depth));
        if (join.condition != nullptr) {
            result.append(" ON ").append(expression(*join.condition, depth));
        } else if (!join.using_columns.empty()) {
            result.append(" USING (").append(identifier_list(join.using_columns)).append(")");
        }
        return result;
    }
    default:
        break;
    }

    throw RenderError{"unexpected table source node " + std::string{node_kind_to_string(source.kind)}};
}

std::string StatementRenderer::table_reference(const TableReference& table) const
{
    if (!table.name || table.name->value.empty()) {
        throw RenderError{"table reference has no name"};
    }

    std::string result{};
    for (const auto* part : {&table.catalog, &table.database, &table.name}) {
        if (!part->has_value()) {
            continue;
        }
        if (!result.empty()) {
            result.push_back('.');
        }
        result.append(identifier(**part));
    }

    if (table.alias) {
        result.append(" AS ").append(identifier(*table.alias));
    }
    return result;
}

std::string StatementRenderer::table_alias(const std::optional<Identifier>& alias,
                                           const std::vector<Identifier>& columns) const
{
    std::string result{};
    if (alias) {
        result.append(" AS ").append(identifier(*alias));
    }
    if (!columns.empty()) {
        result.append(" (").append(identifier_list(columns)).append(")");
    }
    return result;
}

std::string StatementRenderer::order_item(const OrderByItem& item, std::size_t depth) const
{
    auto result = expression(*item.expression, depth);
    if (item.direction == OrderByItem::Direction::Ascending) {
        result.append(" ASC");
    } else if (item.direction == OrderByItem::Direction::Descending) {
        result.append(" DESC");
    }
    return result;
}

std::string StatementRenderer::expression_list(const std::vector<Expression*>& expressions, std::size_t depth) const
{
    const auto separator = options_.pretty ? ",\n" + indent(depth) : std::string{", "};
    std::string result{};
    bool first = true;
    for (const auto* expression : expressions) {
        if (!first) {
            result.append(separator);
        }
        result.append(this->expression(*expression, depth));
        first = false;
    }
    return result;
}

std::string StatementRenderer::identifier_list(const std::vector<Identifier>& identifiers) const
{
    std::string result{};
    bool first = true;
    for (const auto& entry : identifiers) {
        if (!first) {
            result.append(", ");
        }
        result.append(identifier(entry));
        first = false;
    }
    return result;
}

}  // namespace

std::string render_select(const SelectStatement& statement, const RenderOptions& options)
{
    StatementRenderer renderer{options};
    return renderer.statement(statement, 0U);
}

std::string render_expression(const Expression& expression, const RenderOptions& options)
{
    StatementRenderer renderer{options};
    return renderer.expression(expression, 0U);
}

}  // namespace retable::parser
