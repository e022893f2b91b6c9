#include "retable/parser/grammar.hpp"
#include "retable/parser/relational/ast.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <string>

namespace relational = retable::parser::relational;

namespace {

const relational::QuerySpecification& as_specification(const relational::QueryExpression* query)
{
    REQUIRE(query != nullptr);
    REQUIRE(query->kind == relational::NodeKind::QuerySpecification);
    return static_cast<const relational::QuerySpecification&>(*query);
}

const relational::TableReference& as_table(const relational::TableSource* source)
{
    REQUIRE(source != nullptr);
    REQUIRE(source->kind == relational::NodeKind::TableReference);
    return static_cast<const relational::TableReference&>(*source);
}

}  // namespace

TEST_CASE("parse_select handles basic select", "[parser][select]")
{
    const auto result = retable::parser::parse_select("SELECT name FROM inventory;");
    if (!result.diagnostics.empty()) {
        CAPTURE(result.diagnostics.front().message);
    }
    REQUIRE(result.diagnostics.empty());
    REQUIRE(result.success());
    REQUIRE(result.statement->with == nullptr);

    const auto& query = as_specification(result.statement->body);
    CHECK_FALSE(query.distinct);
    REQUIRE(query.select_items.size() == 1U);

    const auto* item = query.select_items.front();
    REQUIRE(item->expression != nullptr);
    REQUIRE(item->expression->kind == relational::NodeKind::IdentifierExpression);
    const auto& identifier = static_cast<const relational::IdentifierExpression&>(*item->expression);
    REQUIRE(identifier.name.parts.size() == 1U);
    CHECK(identifier.name.parts.front().value == "name");

    REQUIRE(query.from.size() == 1U);
    const auto& table = as_table(query.from.front());
    CHECK_FALSE(table.catalog.has_value());
    CHECK_FALSE(table.database.has_value());
    REQUIRE(table.name.has_value());
    CHECK(table.name->value == "inventory");
    CHECK_FALSE(table.alias.has_value());
    CHECK(query.where == nullptr);
    CHECK(query.order_by.empty());
    CHECK(query.limit == nullptr);
}

TEST_CASE("parse_select splits qualified table names into components", "[parser][select]")
{
    const auto result = retable::parser::parse_select("select * from cat.db.tbl as t, db2.other o, plain");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.select_items.size() == 1U);
    REQUIRE(query.select_items.front()->expression->kind == relational::NodeKind::StarExpression);

    REQUIRE(query.from.size() == 3U);
    const auto& three_part = as_table(query.from[0]);
    CHECK(three_part.catalog->value == "cat");
    CHECK(three_part.database->value == "db");
    CHECK(three_part.name->value == "tbl");
    CHECK(three_part.alias->value == "t");

    const auto& two_part = as_table(query.from[1]);
    CHECK_FALSE(two_part.catalog.has_value());
    CHECK(two_part.database->value == "db2");
    CHECK(two_part.name->value == "other");
    CHECK(two_part.alias->value == "o");

    const auto& bare = as_table(query.from[2]);
    CHECK_FALSE(bare.database.has_value());
    CHECK(bare.name->value == "plain");
}

TEST_CASE("parse_select keeps backtick quoting", "[parser][select]")
{
    const auto result = retable::parser::parse_select("SELECT `a``b` FROM `my-db`.`select`");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    const auto& column = static_cast<const relational::IdentifierExpression&>(*query.select_items.front()->expression);
    CHECK(column.name.parts.front().value == "a`b");
    CHECK(column.name.parts.front().quoted);

    const auto& table = as_table(query.from.front());
    CHECK(table.database->value == "my-db");
    CHECK(table.database->quoted);
    CHECK(table.name->value == "select");
    CHECK(table.name->quoted);
}

TEST_CASE("parse_select handles with clause", "[parser][select]")
{
    const std::string sql =
        "WITH items (item_id) AS (SELECT id FROM db.inventory), recent AS (SELECT item_id FROM items) "
        "SELECT item_id FROM recent;";
    const auto result = retable::parser::parse_select(sql);
    CAPTURE(sql);
    REQUIRE(result.success());

    const auto* with_clause = result.statement->with;
    REQUIRE(with_clause != nullptr);
    CHECK_FALSE(with_clause->recursive);
    REQUIRE(with_clause->expressions.size() == 2U);

    const auto* cte = with_clause->expressions.front();
    CHECK(cte->name.value == "items");
    REQUIRE(cte->column_names.size() == 1U);
    CHECK(cte->column_names.front().value == "item_id");
    REQUIRE(cte->query != nullptr);
    const auto& cte_query = as_specification(cte->query->body);
    CHECK(as_table(cte_query.from.front()).database->value == "db");

    CHECK(with_clause->expressions[1]->name.value == "recent");
    CHECK(with_clause->expressions[1]->column_names.empty());

    const auto& main_query = as_specification(result.statement->body);
    CHECK(as_table(main_query.from.front()).name->value == "recent");
}

TEST_CASE("parse_select recognises recursive with clauses", "[parser][select]")
{
    const auto result =
        retable::parser::parse_select("WITH RECURSIVE r AS (SELECT 1 AS n UNION ALL SELECT n + 1 FROM r) SELECT n FROM r");
    REQUIRE(result.success());
    REQUIRE(result.statement->with != nullptr);
    CHECK(result.statement->with->recursive);
    REQUIRE(result.statement->with->expressions.size() == 1U);
    CHECK(result.statement->with->expressions.front()->query->body->kind == relational::NodeKind::SetOperation);
}

TEST_CASE("parse_select accepts a CTE named recursive", "[parser][select]")
{
    const auto result = retable::parser::parse_select("WITH recursive AS (SELECT 1) SELECT * FROM recursive");
    REQUIRE(result.success());
    REQUIRE(result.statement->with != nullptr);
    CHECK_FALSE(result.statement->with->recursive);
    CHECK(result.statement->with->expressions.front()->name.value == "recursive");
}

TEST_CASE("parse_select builds join trees left to right", "[parser][select][join]")
{
    const auto result = retable::parser::parse_select(
        "SELECT a.x FROM db.a AS a LEFT OUTER JOIN db.b b ON a.id = b.id CROSS JOIN c "
        "LEFT SEMI JOIN d USING (id, k)");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.from.size() == 1U);
    REQUIRE(query.from.front()->kind == relational::NodeKind::JoinedTable);

    const auto& semi = static_cast<const relational::JoinedTable&>(*query.from.front());
    CHECK(semi.type == relational::JoinType::LeftSemi);
    CHECK(semi.condition == nullptr);
    REQUIRE(semi.using_columns.size() == 2U);
    CHECK(semi.using_columns[1].value == "k");
    CHECK(as_table(semi.right).name->value == "d");

    REQUIRE(semi.left->kind == relational::NodeKind::JoinedTable);
    const auto& cross = static_cast<const relational::JoinedTable&>(*semi.left);
    CHECK(cross.type == relational::JoinType::Cross);
    CHECK(as_table(cross.right).name->value == "c");

    REQUIRE(cross.left->kind == relational::NodeKind::JoinedTable);
    const auto& left = static_cast<const relational::JoinedTable&>(*cross.left);
    CHECK(left.type == relational::JoinType::LeftOuter);
    REQUIRE(left.condition != nullptr);
    REQUIRE(left.condition->kind == relational::NodeKind::BinaryExpression);
    CHECK(static_cast<const relational::BinaryExpression&>(*left.condition).op == relational::BinaryOperator::Equal);
    CHECK(as_table(left.left).alias->value == "a");
    CHECK(as_table(left.right).alias->value == "b");
}

TEST_CASE("parse_select parses derived tables", "[parser][select]")
{
    const auto result = retable::parser::parse_select("SELECT * FROM (SELECT id FROM db.t WHERE id > 1) AS sub");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.from.front()->kind == relational::NodeKind::DerivedTable);
    const auto& derived = static_cast<const relational::DerivedTable&>(*query.from.front());
    REQUIRE(derived.query != nullptr);
    REQUIRE(derived.alias.has_value());
    CHECK(derived.alias->value == "sub");
    CHECK(as_specification(derived.query->body).where != nullptr);
}

TEST_CASE("parse_select folds set operations left associatively", "[parser][select]")
{
    const auto result = retable::parser::parse_select("SELECT 1 UNION ALL SELECT 2 EXCEPT SELECT 3");
    REQUIRE(result.success());
    REQUIRE(result.statement->body->kind == relational::NodeKind::SetOperation);

    const auto& except = static_cast<const relational::SetOperation&>(*result.statement->body);
    CHECK(except.op == relational::SetOperator::Except);
    CHECK_FALSE(except.all);
    REQUIRE(except.left->kind == relational::NodeKind::SetOperation);

    const auto& union_all = static_cast<const relational::SetOperation&>(*except.left);
    CHECK(union_all.op == relational::SetOperator::Union);
    CHECK(union_all.all);
}

TEST_CASE("parse_select parses predicate forms", "[parser][select][expression]")
{
    const auto result = retable::parser::parse_select(
        "SELECT * FROM t WHERE a IN (SELECT b FROM db.u) AND c NOT BETWEEN 1 AND 2 OR d NOT LIKE 'x%' "
        "OR e IS NOT NULL");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.where != nullptr);
    REQUIRE(query.where->kind == relational::NodeKind::BinaryExpression);

    const auto& outer_or = static_cast<const relational::BinaryExpression&>(*query.where);
    CHECK(outer_or.op == relational::BinaryOperator::Or);
    REQUIRE(outer_or.right->kind == relational::NodeKind::IsNullExpression);
    CHECK(static_cast<const relational::IsNullExpression&>(*outer_or.right).negated);

    REQUIRE(outer_or.left->kind == relational::NodeKind::BinaryExpression);
    const auto& inner_or = static_cast<const relational::BinaryExpression&>(*outer_or.left);
    CHECK(inner_or.op == relational::BinaryOperator::Or);
    REQUIRE(inner_or.right->kind == relational::NodeKind::BinaryExpression);
    CHECK(static_cast<const relational::BinaryExpression&>(*inner_or.right).op == relational::BinaryOperator::NotLike);

    REQUIRE(inner_or.left->kind == relational::NodeKind::BinaryExpression);
    const auto& conjunction = static_cast<const relational::BinaryExpression&>(*inner_or.left);
    CHECK(conjunction.op == relational::BinaryOperator::And);

    REQUIRE(conjunction.left->kind == relational::NodeKind::InExpression);
    const auto& in = static_cast<const relational::InExpression&>(*conjunction.left);
    CHECK_FALSE(in.negated);
    CHECK(in.values.empty());
    REQUIRE(in.subquery != nullptr);

    REQUIRE(conjunction.right->kind == relational::NodeKind::BetweenExpression);
    CHECK(static_cast<const relational::BetweenExpression&>(*conjunction.right).negated);
}

TEST_CASE("parse_select respects arithmetic precedence", "[parser][select][expression]")
{
    const auto result = retable::parser::parse_select("SELECT a + b * c - d FROM t");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    const auto* expression = query.select_items.front()->expression;
    REQUIRE(expression->kind == relational::NodeKind::BinaryExpression);

    const auto& subtract = static_cast<const relational::BinaryExpression&>(*expression);
    CHECK(subtract.op == relational::BinaryOperator::Subtract);
    REQUIRE(subtract.left->kind == relational::NodeKind::BinaryExpression);

    const auto& add = static_cast<const relational::BinaryExpression&>(*subtract.left);
    CHECK(add.op == relational::BinaryOperator::Add);
    REQUIRE(add.right->kind == relational::NodeKind::BinaryExpression);
    CHECK(static_cast<const relational::BinaryExpression&>(*add.right).op == relational::BinaryOperator::Multiply);
}

TEST_CASE("parse_select parses functions, CASE and CAST", "[parser][select][expression]")
{
    const auto result = retable::parser::parse_select(
        "SELECT COUNT(*), count(DISTINCT x), CASE y WHEN 1 THEN 'one' ELSE 'many' END, CAST(z AS DECIMAL(10, 2)) "
        "FROM t GROUP BY y HAVING COUNT(*) > 1 ORDER BY y DESC, z LIMIT 10 OFFSET 5");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.select_items.size() == 4U);

    REQUIRE(query.select_items[0]->expression->kind == relational::NodeKind::FunctionCall);
    const auto& count_star = static_cast<const relational::FunctionCall&>(*query.select_items[0]->expression);
    CHECK(count_star.star_argument);
    CHECK(count_star.arguments.empty());

    const auto& count_distinct = static_cast<const relational::FunctionCall&>(*query.select_items[1]->expression);
    CHECK(count_distinct.distinct);
    CHECK(count_distinct.arguments.size() == 1U);

    REQUIRE(query.select_items[2]->expression->kind == relational::NodeKind::CaseExpression);
    const auto& case_expression = static_cast<const relational::CaseExpression&>(*query.select_items[2]->expression);
    CHECK(case_expression.operand != nullptr);
    CHECK(case_expression.branches.size() == 1U);
    CHECK(case_expression.else_result != nullptr);

    REQUIRE(query.select_items[3]->expression->kind == relational::NodeKind::CastExpression);
    CHECK(static_cast<const relational::CastExpression&>(*query.select_items[3]->expression).type_name
          == "DECIMAL(10, 2)");

    CHECK(query.group_by.size() == 1U);
    CHECK(query.having != nullptr);
    REQUIRE(query.order_by.size() == 2U);
    CHECK(query.order_by[0]->direction == relational::OrderByItem::Direction::Descending);
    CHECK(query.order_by[1]->direction == relational::OrderByItem::Direction::Unspecified);
    REQUIRE(query.limit != nullptr);
    CHECK(query.limit->row_count != nullptr);
    CHECK(query.limit->offset != nullptr);
}

TEST_CASE("parse_select skips comments", "[parser][select]")
{
    const auto result = retable::parser::parse_select("-- leading\nSELECT /* inline */ x\nFROM db.t -- trailing");
    REQUIRE(result.success());
    const auto& query = as_specification(result.statement->body);
    CHECK(as_table(query.from.front()).database->value == "db");
}

TEST_CASE("parse_select reports missing select list", "[parser][select][diagnostics]")
{
    const auto result = retable::parser::parse_select("SELECT FROM t");
    REQUIRE_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);

    const auto& diagnostic = result.diagnostics.front();
    CAPTURE(diagnostic.message);
    CHECK(diagnostic.severity == retable::parser::ParserSeverity::Error);
    CHECK(diagnostic.message.find("Missing select list") != std::string::npos);
    CHECK(diagnostic.message.find("near 'FROM'") != std::string::npos);
    CHECK(diagnostic.line == 1U);
    CHECK(diagnostic.column == 8U);
    CHECK(diagnostic.offset == 7U);
    CHECK(diagnostic.statement == "SELECT FROM t");
    CHECK_FALSE(diagnostic.remediation_hints.empty());
}

TEST_CASE("parse_select reports truncated input", "[parser][select][diagnostics]")
{
    const auto result = retable::parser::parse_select("SELECT a FROM t WHERE");
    REQUIRE_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);
    CAPTURE(result.diagnostics.front().message);
    CHECK(result.diagnostics.front().message == "Missing expression at end of input");
}

TEST_CASE("parse_select accepts exactly one statement", "[parser][select][diagnostics]")
{
    const auto result = retable::parser::parse_select("SELECT a FROM t; SELECT b FROM u");
    REQUIRE_FALSE(result.success());
    REQUIRE(result.diagnostics.size() == 1U);
    CAPTURE(result.diagnostics.front().message);
    CHECK(result.diagnostics.front().message == "Missing end of statement near 'SELECT'");
}

TEST_CASE("parse_select rejects reserved words as bare identifiers", "[parser][select][diagnostics]")
{
    CHECK_FALSE(retable::parser::parse_select("SELECT * FROM select").success());
    CHECK_FALSE(retable::parser::parse_select("SELECT * FROM db.from").success());
    CHECK(retable::parser::parse_select("SELECT * FROM db.`from`").success());
    CHECK_FALSE(retable::parser::parse_select("INSERT INTO t VALUES (1)").success());
}

TEST_CASE("parse_select parses window specifications", "[parser][select][window]")
{
    const auto result = retable::parser::parse_select(
        "SELECT SUM(x) OVER (PARTITION BY a, b ORDER BY c DESC ROWS BETWEEN UNBOUNDED PRECEDING AND CURRENT ROW), "
        "rank() OVER (), AVG(y) OVER (ORDER BY d RANGE 3 PRECEDING), COUNT(*) over FROM t");
    if (!result.diagnostics.empty()) {
        CAPTURE(result.diagnostics.front().message);
    }
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.select_items.size() == 4U);

    REQUIRE(query.select_items[0]->expression->kind == relational::NodeKind::FunctionCall);
    const auto& sum = static_cast<const relational::FunctionCall&>(*query.select_items[0]->expression);
    REQUIRE(sum.window != nullptr);
    CHECK(sum.window->partition_by.size() == 2U);
    REQUIRE(sum.window->order_by.size() == 1U);
    CHECK(sum.window->order_by.front()->direction == relational::OrderByItem::Direction::Descending);
    REQUIRE(sum.window->frame.has_value());
    CHECK(sum.window->frame->unit == relational::WindowFrame::Unit::Rows);
    CHECK(sum.window->frame->start.kind == relational::WindowFrameBound::Kind::UnboundedPreceding);
    REQUIRE(sum.window->frame->end.has_value());
    CHECK(sum.window->frame->end->kind == relational::WindowFrameBound::Kind::CurrentRow);

    const auto& rank = static_cast<const relational::FunctionCall&>(*query.select_items[1]->expression);
    REQUIRE(rank.window != nullptr);
    CHECK(rank.window->partition_by.empty());
    CHECK(rank.window->order_by.empty());
    CHECK_FALSE(rank.window->frame.has_value());

    const auto& avg = static_cast<const relational::FunctionCall&>(*query.select_items[2]->expression);
    REQUIRE(avg.window != nullptr);
    REQUIRE(avg.window->frame.has_value());
    CHECK(avg.window->frame->unit == relational::WindowFrame::Unit::Range);
    CHECK(avg.window->frame->start.kind == relational::WindowFrameBound::Kind::Preceding);
    CHECK(avg.window->frame->start.offset != nullptr);
    CHECK_FALSE(avg.window->frame->end.has_value());

    // OVER without a window stays an alias.
    const auto& count = static_cast<const relational::FunctionCall&>(*query.select_items[3]->expression);
    CHECK(count.window == nullptr);
    REQUIRE(query.select_items[3]->alias.has_value());
    CHECK(query.select_items[3]->alias->value == "over");
}

TEST_CASE("parse_select decodes both string quote styles", "[parser][select][expression]")
{
    const auto result = retable::parser::parse_select(
        "SELECT \"bob\", 'it\\'s', 'a\\nb', '50\\%', \"say \"\"hi\"\"\", 'x''y' FROM t");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.select_items.size() == 6U);

    const auto text_of = [&query](std::size_t index) {
        const auto* expression = query.select_items[index]->expression;
        REQUIRE(expression->kind == relational::NodeKind::LiteralExpression);
        const auto& literal = static_cast<const relational::LiteralExpression&>(*expression);
        CHECK(literal.tag == relational::LiteralTag::String);
        return literal.text;
    };
    CHECK(text_of(0) == "bob");
    CHECK(text_of(1) == "it's");
    CHECK(text_of(2) == "a\nb");
    CHECK(text_of(3) == "50\\%");
    CHECK(text_of(4) == "say \"hi\"");
    CHECK(text_of(5) == "x'y");
}

TEST_CASE("parse_select keeps complex cast types verbatim", "[parser][select][expression]")
{
    const auto result = retable::parser::parse_select(
        "SELECT TRY_CAST(a AS ARRAY<INT>), CAST(b AS MAP<STRING, STRUCT<id: INT, tags: ARRAY<STRING>>>) FROM t");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.select_items.size() == 2U);

    REQUIRE(query.select_items[0]->expression->kind == relational::NodeKind::CastExpression);
    const auto& try_cast = static_cast<const relational::CastExpression&>(*query.select_items[0]->expression);
    CHECK(try_cast.try_cast);
    CHECK(try_cast.type_name == "ARRAY<INT>");

    REQUIRE(query.select_items[1]->expression->kind == relational::NodeKind::CastExpression);
    const auto& cast = static_cast<const relational::CastExpression&>(*query.select_items[1]->expression);
    CHECK_FALSE(cast.try_cast);
    CHECK(cast.type_name == "MAP<STRING, STRUCT<id: INT, tags: ARRAY<STRING>>>");
}

TEST_CASE("parse_select parses VALUES and table-valued functions", "[parser][select]")
{
    const auto result = retable::parser::parse_select(
        "SELECT * FROM VALUES (1, 'a'), (2, 'b') AS v (id, label), range(0, 10) AS r (n), (VALUES (3)) w");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.from.size() == 3U);

    REQUIRE(query.from[0]->kind == relational::NodeKind::InlineTable);
    const auto& values = static_cast<const relational::InlineTable&>(*query.from[0]);
    CHECK_FALSE(values.parenthesized);
    REQUIRE(values.rows.size() == 2U);
    CHECK(values.rows[1].size() == 2U);
    REQUIRE(values.alias.has_value());
    CHECK(values.alias->value == "v");
    REQUIRE(values.column_aliases.size() == 2U);
    CHECK(values.column_aliases[1].value == "label");

    REQUIRE(query.from[1]->kind == relational::NodeKind::TableFunction);
    const auto& range = static_cast<const relational::TableFunction&>(*query.from[1]);
    CHECK(range.name.value == "range");
    CHECK(range.arguments.size() == 2U);
    REQUIRE(range.alias.has_value());
    CHECK(range.alias->value == "r");
    REQUIRE(range.column_aliases.size() == 1U);
    CHECK(range.column_aliases.front().value == "n");

    REQUIRE(query.from[2]->kind == relational::NodeKind::InlineTable);
    const auto& wrapped = static_cast<const relational::InlineTable&>(*query.from[2]);
    CHECK(wrapped.parenthesized);
    CHECK(wrapped.rows.size() == 1U);
    REQUIRE(wrapped.alias.has_value());
    CHECK(wrapped.alias->value == "w");
}

TEST_CASE("parse_select parses parenthesised join trees", "[parser][select][join]")
{
    const auto result =
        retable::parser::parse_select("SELECT * FROM (db.a JOIN db.b ON a.id = b.id) LEFT JOIN db.c ON TRUE");
    REQUIRE(result.success());

    const auto& query = as_specification(result.statement->body);
    REQUIRE(query.from.size() == 1U);
    REQUIRE(query.from.front()->kind == relational::NodeKind::JoinedTable);

    const auto& outer = static_cast<const relational::JoinedTable&>(*query.from.front());
    CHECK(outer.type == relational::JoinType::LeftOuter);
    CHECK(as_table(outer.right).name->value == "c");
    REQUIRE(outer.left->kind == relational::NodeKind::NestedJoin);

    const auto& nested = static_cast<const relational::NestedJoin&>(*outer.left);
    REQUIRE(nested.inner != nullptr);
    REQUIRE(nested.inner->kind == relational::NodeKind::JoinedTable);
    const auto& inner = static_cast<const relational::JoinedTable&>(*nested.inner);
    CHECK(inner.type == relational::JoinType::Inner);
    CHECK(as_table(inner.left).name->value == "a");
    CHECK(as_table(inner.right).name->value == "b");
}

TEST_CASE("parse_select reports malformed windows, types and nested joins", "[parser][select][diagnostics]")
{
    const auto message_of = [](const std::string& sql) {
        const auto result = retable::parser::parse_select(sql);
        REQUIRE_FALSE(result.success());
        REQUIRE(result.diagnostics.size() == 1U);
        return result.diagnostics.front().message;
    };

    const auto window = message_of("SELECT SUM(x) OVER (PARTITION a) FROM t");
    CAPTURE(window);
    CHECK(window.find("Missing BY") != std::string::npos);

    const auto type = message_of("SELECT CAST(x AS ARRAY<INT)) FROM t");
    CAPTURE(type);
    CHECK(type.find("Missing '>'") != std::string::npos);

    const auto nested = message_of("SELECT * FROM (db.a JOIN db.b ON a.id = b.id");
    CAPTURE(nested);
    CHECK(nested.find("Missing ')'") != std::string::npos);
}
