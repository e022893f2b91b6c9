#include "retable/parser/grammar.hpp"
#include "retable/parser/expression_primitives.hpp"

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace retable::parser {
namespace {

namespace pegtl = tao::pegtl;
namespace parse_tree = tao::pegtl::parse_tree;

using ws = expr::optional_space;

template <char... Chars>
struct keyword : pegtl::seq<pegtl::istring<Chars...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct kw_all : keyword<'A', 'L', 'L'> {
};

struct kw_and : keyword<'A', 'N', 'D'> {
};

struct kw_array : keyword<'A', 'R', 'R', 'A', 'Y'> {
};

struct kw_anti : keyword<'A', 'N', 'T', 'I'> {
};

struct kw_as : keyword<'A', 'S'> {
};

struct kw_asc : keyword<'A', 'S', 'C'> {
};

struct kw_between : keyword<'B', 'E', 'T', 'W', 'E', 'E', 'N'> {
};

struct kw_by : keyword<'B', 'Y'> {
};

struct kw_case : keyword<'C', 'A', 'S', 'E'> {
};

struct kw_cast : keyword<'C', 'A', 'S', 'T'> {
};

struct kw_cross : keyword<'C', 'R', 'O', 'S', 'S'> {
};

struct kw_current : keyword<'C', 'U', 'R', 'R', 'E', 'N', 'T'> {
};

struct kw_desc : keyword<'D', 'E', 'S', 'C'> {
};

struct kw_distinct : keyword<'D', 'I', 'S', 'T', 'I', 'N', 'C', 'T'> {
};

struct kw_else : keyword<'E', 'L', 'S', 'E'> {
};

struct kw_end : keyword<'E', 'N', 'D'> {
};

struct kw_except : keyword<'E', 'X', 'C', 'E', 'P', 'T'> {
};

struct kw_exists : keyword<'E', 'X', 'I', 'S', 'T', 'S'> {
};

struct kw_false : keyword<'F', 'A', 'L', 'S', 'E'> {
};

struct kw_following : keyword<'F', 'O', 'L', 'L', 'O', 'W', 'I', 'N', 'G'> {
};

struct kw_from : keyword<'F', 'R', 'O', 'M'> {
};

struct kw_full : keyword<'F', 'U', 'L', 'L'> {
};

struct kw_group : keyword<'G', 'R', 'O', 'U', 'P'> {
};

struct kw_having : keyword<'H', 'A', 'V', 'I', 'N', 'G'> {
};

struct kw_in : keyword<'I', 'N'> {
};

struct kw_inner : keyword<'I', 'N', 'N', 'E', 'R'> {
};

struct kw_intersect : keyword<'I', 'N', 'T', 'E', 'R', 'S', 'E', 'C', 'T'> {
};

struct kw_is : keyword<'I', 'S'> {
};

struct kw_join : keyword<'J', 'O', 'I', 'N'> {
};

struct kw_left : keyword<'L', 'E', 'F', 'T'> {
};

struct kw_like : keyword<'L', 'I', 'K', 'E'> {
};

struct kw_limit : keyword<'L', 'I', 'M', 'I', 'T'> {
};

struct kw_map : keyword<'M', 'A', 'P'> {
};

struct kw_natural : keyword<'N', 'A', 'T', 'U', 'R', 'A', 'L'> {
};

struct kw_not : keyword<'N', 'O', 'T'> {
};

struct kw_null : keyword<'N', 'U', 'L', 'L'> {
};

struct kw_offset : keyword<'O', 'F', 'F', 'S', 'E', 'T'> {
};

struct kw_on : keyword<'O', 'N'> {
};

struct kw_or : keyword<'O', 'R'> {
};

struct kw_order : keyword<'O', 'R', 'D', 'E', 'R'> {
};

struct kw_outer : keyword<'O', 'U', 'T', 'E', 'R'> {
};

struct kw_over : keyword<'O', 'V', 'E', 'R'> {
};

struct kw_partition : keyword<'P', 'A', 'R', 'T', 'I', 'T', 'I', 'O', 'N'> {
};

struct kw_preceding : keyword<'P', 'R', 'E', 'C', 'E', 'D', 'I', 'N', 'G'> {
};

struct kw_range : keyword<'R', 'A', 'N', 'G', 'E'> {
};

struct kw_recursive : keyword<'R', 'E', 'C', 'U', 'R', 'S', 'I', 'V', 'E'> {
};

struct kw_right : keyword<'R', 'I', 'G', 'H', 'T'> {
};

struct kw_row : keyword<'R', 'O', 'W'> {
};

struct kw_rows : keyword<'R', 'O', 'W', 'S'> {
};

struct kw_select : keyword<'S', 'E', 'L', 'E', 'C', 'T'> {
};

struct kw_semi : keyword<'S', 'E', 'M', 'I'> {
};

struct kw_struct : keyword<'S', 'T', 'R', 'U', 'C', 'T'> {
};

struct kw_then : keyword<'T', 'H', 'E', 'N'> {
};

struct kw_true : keyword<'T', 'R', 'U', 'E'> {
};

struct kw_try_cast : keyword<'T', 'R', 'Y', '_', 'C', 'A', 'S', 'T'> {
};

struct kw_unbounded : keyword<'U', 'N', 'B', 'O', 'U', 'N', 'D', 'E', 'D'> {
};

struct kw_union : keyword<'U', 'N', 'I', 'O', 'N'> {
};

struct kw_using : keyword<'U', 'S', 'I', 'N', 'G'> {
};

struct kw_values : keyword<'V', 'A', 'L', 'U', 'E', 'S'> {
};

struct kw_when : keyword<'W', 'H', 'E', 'N'> {
};

struct kw_where : keyword<'W', 'H', 'E', 'R', 'E'> {
};

struct kw_with : keyword<'W', 'I', 'T', 'H'> {
};

// Kept in sync with kReservedKeywords in identifier_quoting.cpp.
struct reserved_keyword
    : pegtl::sor<kw_all, kw_and, kw_anti, kw_as, kw_asc, kw_between, kw_by, kw_case, kw_cross, kw_desc,
                 kw_distinct, kw_else, kw_end, kw_except, kw_exists, kw_false, kw_from, kw_full, kw_group,
                 kw_having, kw_in, kw_inner, kw_intersect, kw_is, kw_join, kw_left, kw_like, kw_limit,
                 kw_natural, kw_not, kw_null, kw_offset, kw_on, kw_or, kw_order, kw_outer, kw_right,
                 kw_select, kw_semi, kw_then, kw_true, kw_union, kw_using, kw_when, kw_where, kw_with> {
};

struct quoted_identifier : expr::quoted_identifier {
};

struct unquoted_identifier : pegtl::seq<pegtl::not_at<reserved_keyword>, pegtl::identifier> {
};

struct identifier_rule : pegtl::sor<quoted_identifier, unquoted_identifier> {
};

struct dot : pegtl::one<'.'> {
};

struct comma : pegtl::one<','> {
};

struct left_paren : pegtl::one<'('> {
};

struct right_paren : pegtl::one<')'> {
};

struct semicolon : pegtl::one<';'> {
};

struct left_angle : pegtl::one<'<'> {
};

struct right_angle : pegtl::one<'>'> {
};

struct identifier_grammar : pegtl::seq<ws, identifier_rule, ws, pegtl::eof> {
};

struct qualified_name_part : identifier_rule {
};

struct qualified_name_grammar
    : pegtl::seq<ws,
                 qualified_name_part,
                 pegtl::star<ws, dot, ws, qualified_name_part>,
                 ws,
                 pegtl::eof> {
};

// ---------------------------------------------------------------------------
// Expressions

struct expression;
struct unary;
struct not_expression;
struct select_statement_rule;

struct null_literal : kw_null {
};

struct true_literal : kw_true {
};

struct false_literal : kw_false {
};

struct numeric_literal : expr::numeric_literal {
};

struct string_literal : pegtl::sor<expr::string_literal, expr::double_quoted_string> {
};

struct literal : pegtl::sor<null_literal, true_literal, false_literal, numeric_literal, string_literal> {
};

struct column_reference : pegtl::seq<identifier_rule, pegtl::star<ws, dot, ws, identifier_rule>> {
};

struct qualified_star
    : pegtl::seq<identifier_rule, pegtl::star<ws, dot, ws, identifier_rule>, ws, dot, ws, pegtl::one<'*'>> {
};

struct unqualified_star : pegtl::one<'*'> {
};

struct scalar_subquery : pegtl::seq<left_paren, ws, select_statement_rule, ws, right_paren> {
};

struct parenthesized_expression : pegtl::seq<left_paren, ws, expression, ws, pegtl::must<right_paren>> {
};

struct exists_expression
    : pegtl::seq<kw_exists,
                 ws,
                 left_paren,
                 ws,
                 pegtl::must<select_statement_rule>,
                 ws,
                 pegtl::must<right_paren>> {
};

struct case_operand : pegtl::seq<expression> {
};

struct when_clause
    : pegtl::seq<kw_when,
                 ws,
                 pegtl::must<expression>,
                 ws,
                 pegtl::must<kw_then>,
                 ws,
                 pegtl::must<expression>> {
};

struct else_clause : pegtl::seq<kw_else, ws, pegtl::must<expression>> {
};

struct case_expression
    : pegtl::seq<kw_case,
                 ws,
                 pegtl::opt<case_operand, ws>,
                 pegtl::must<when_clause>,
                 pegtl::star<ws, when_clause>,
                 pegtl::opt<ws, else_clause>,
                 ws,
                 pegtl::must<kw_end>> {
};

struct type_name;

struct type_parameters
    : pegtl::seq<left_paren,
                 ws,
                 pegtl::plus<pegtl::digit>,
                 pegtl::star<ws, comma, ws, pegtl::plus<pegtl::digit>>,
                 ws,
                 pegtl::must<right_paren>> {
};

struct primitive_type : pegtl::seq<pegtl::identifier, pegtl::opt<ws, type_parameters>> {
};

struct array_type
    : pegtl::seq<kw_array, ws, left_angle, ws, pegtl::must<type_name>, ws, pegtl::must<right_angle>> {
};

struct map_type
    : pegtl::seq<kw_map,
                 ws,
                 left_angle,
                 ws,
                 pegtl::must<type_name>,
                 ws,
                 pegtl::must<comma>,
                 ws,
                 pegtl::must<type_name>,
                 ws,
                 pegtl::must<right_angle>> {
};

// `name: TYPE` or `name TYPE`.
struct struct_field
    : pegtl::seq<pegtl::sor<expr::quoted_identifier, pegtl::identifier>,
                 ws,
                 pegtl::opt<pegtl::one<':'>, ws>,
                 pegtl::must<type_name>> {
};

struct struct_type
    : pegtl::seq<kw_struct,
                 ws,
                 left_angle,
                 ws,
                 pegtl::opt<struct_field, pegtl::star<ws, comma, ws, pegtl::must<struct_field>>>,
                 ws,
                 pegtl::must<right_angle>> {
};

struct type_name : pegtl::sor<array_type, map_type, struct_type, primitive_type> {
};

struct cast_type_name : type_name {
};

struct try_cast_marker : kw_try_cast {
};

struct cast_expression
    : pegtl::seq<pegtl::sor<try_cast_marker, kw_cast>,
                 ws,
                 left_paren,
                 ws,
                 pegtl::must<expression>,
                 ws,
                 pegtl::must<kw_as>,
                 ws,
                 pegtl::must<cast_type_name>,
                 ws,
                 pegtl::must<right_paren>> {
};

struct function_name : pegtl::seq<identifier_rule> {
};

struct function_star_argument : pegtl::one<'*'> {
};

struct function_distinct : kw_distinct {
};

struct function_arguments
    : pegtl::sor<function_star_argument,
                 pegtl::seq<pegtl::opt<function_distinct, ws>,
                            expression,
                            pegtl::star<ws, comma, ws, pegtl::must<expression>>>> {
};

struct order_by_clause;

struct partition_by_clause
    : pegtl::seq<kw_partition,
                 ws,
                 pegtl::must<kw_by>,
                 ws,
                 pegtl::must<expression>,
                 pegtl::star<ws, comma, ws, pegtl::must<expression>>> {
};

struct frame_rows : kw_rows {
};

struct frame_range : kw_range {
};

struct bound_unbounded_preceding : pegtl::seq<kw_unbounded, ws, kw_preceding> {
};

struct bound_unbounded_following : pegtl::seq<kw_unbounded, ws, kw_following> {
};

struct bound_current_row : pegtl::seq<kw_current, ws, kw_row> {
};

struct additive;

struct bound_preceding : pegtl::seq<additive, ws, kw_preceding> {
};

struct bound_following : pegtl::seq<additive, ws, kw_following> {
};

struct frame_bound
    : pegtl::sor<bound_unbounded_preceding,
                 bound_unbounded_following,
                 bound_current_row,
                 bound_preceding,
                 bound_following> {
};

struct window_frame
    : pegtl::seq<pegtl::sor<frame_rows, frame_range>,
                 ws,
                 pegtl::sor<pegtl::seq<kw_between,
                                       ws,
                                       pegtl::must<frame_bound>,
                                       ws,
                                       pegtl::must<kw_and>,
                                       ws,
                                       pegtl::must<frame_bound>>,
                            pegtl::must<frame_bound>>> {
};

struct window_specification
    : pegtl::seq<left_paren,
                 ws,
                 pegtl::opt<partition_by_clause, ws>,
                 pegtl::opt<order_by_clause, ws>,
                 pegtl::opt<window_frame, ws>,
                 pegtl::must<right_paren>> {
};

// OVER is not reserved; without a following '(' it reads as an alias.
struct over_clause : pegtl::seq<kw_over, ws, window_specification> {
};

struct function_call
    : pegtl::seq<function_name,
                 ws,
                 left_paren,
                 ws,
                 pegtl::opt<function_arguments>,
                 ws,
                 pegtl::must<right_paren>,
                 pegtl::opt<ws, over_clause>> {
};

struct primary
    : pegtl::sor<scalar_subquery,
                 parenthesized_expression,
                 literal,
                 case_expression,
                 exists_expression,
                 cast_expression,
                 function_call,
                 qualified_star,
                 unqualified_star,
                 column_reference> {
};

struct negative_expression : pegtl::seq<pegtl::one<'-'>, ws, unary> {
};

struct positive_expression : pegtl::seq<pegtl::one<'+'>, ws, unary> {
};

struct unary : pegtl::sor<negative_expression, positive_expression, primary> {
};

struct multiplicative_operator : pegtl::one<'*', '/', '%'> {
};

struct multiplicative : pegtl::seq<unary, pegtl::star<ws, multiplicative_operator, ws, pegtl::must<unary>>> {
};

struct additive_operator : pegtl::sor<pegtl::two<'|'>, pegtl::one<'+', '-'>> {
};

struct additive
    : pegtl::seq<multiplicative, pegtl::star<ws, additive_operator, ws, pegtl::must<multiplicative>>> {
};

struct comparison_operator
    : pegtl::sor<pegtl::string<'<', '=', '>'>,
                 pegtl::string<'<', '='>,
                 pegtl::string<'>', '='>,
                 pegtl::string<'<', '>'>,
                 pegtl::string<'!', '='>,
                 pegtl::string<'=', '='>,
                 pegtl::one<'<', '>', '='>> {
};

struct suffix_not : kw_not {
};

struct comparison_suffix : pegtl::seq<comparison_operator, ws, pegtl::must<additive>> {
};

struct is_null_suffix : pegtl::seq<kw_is, ws, pegtl::opt<suffix_not, ws>, pegtl::must<kw_null>> {
};

struct in_value_list : pegtl::seq<expression, pegtl::star<ws, comma, ws, pegtl::must<expression>>> {
};

struct in_operand : pegtl::sor<select_statement_rule, in_value_list> {
};

struct in_suffix
    : pegtl::seq<pegtl::opt<suffix_not, ws>,
                 kw_in,
                 ws,
                 pegtl::must<left_paren>,
                 ws,
                 pegtl::must<in_operand>,
                 ws,
                 pegtl::must<right_paren>> {
};

struct between_suffix
    : pegtl::seq<pegtl::opt<suffix_not, ws>,
                 kw_between,
                 ws,
                 pegtl::must<additive>,
                 ws,
                 pegtl::must<kw_and>,
                 ws,
                 pegtl::must<additive>> {
};

struct like_suffix : pegtl::seq<pegtl::opt<suffix_not, ws>, kw_like, ws, pegtl::must<additive>> {
};

struct predicate_suffix
    : pegtl::sor<is_null_suffix, in_suffix, between_suffix, like_suffix, comparison_suffix> {
};

struct predicate : pegtl::seq<additive, pegtl::opt<ws, predicate_suffix>> {
};

struct negation : pegtl::seq<kw_not, ws, not_expression> {
};

struct not_expression : pegtl::sor<negation, predicate> {
};

struct and_expression
    : pegtl::seq<not_expression, pegtl::star<ws, kw_and, ws, pegtl::must<not_expression>>> {
};

struct expression : pegtl::seq<and_expression, pegtl::star<ws, kw_or, ws, pegtl::must<and_expression>>> {
};

// ---------------------------------------------------------------------------
// Query structure

struct alias_clause : pegtl::seq<pegtl::opt<kw_as, ws>, identifier_rule> {
};

struct select_item : pegtl::seq<expression, pegtl::opt<ws, alias_clause>> {
};

struct select_list : pegtl::seq<select_item, pegtl::star<ws, comma, ws, pegtl::must<select_item>>> {
};

struct distinct_marker : kw_distinct {
};

struct all_marker : kw_all {
};

struct table_name
    : pegtl::seq<identifier_rule,
                 pegtl::opt<ws, dot, ws, identifier_rule, pegtl::opt<ws, dot, ws, identifier_rule>>> {
};

struct base_table : pegtl::seq<table_name, pegtl::opt<ws, alias_clause>> {
};

struct column_name_list;

struct table_alias : pegtl::seq<alias_clause, pegtl::opt<ws, column_name_list>> {
};

struct derived_table
    : pegtl::seq<left_paren,
                 ws,
                 select_statement_rule,
                 ws,
                 pegtl::must<right_paren>,
                 pegtl::opt<ws, table_alias>> {
};

struct values_row
    : pegtl::seq<left_paren,
                 ws,
                 pegtl::must<expression>,
                 pegtl::star<ws, comma, ws, pegtl::must<expression>>,
                 ws,
                 pegtl::must<right_paren>> {
};

// A comma not followed by a row belongs to the FROM list.
struct inline_table_rows : pegtl::seq<kw_values, ws, values_row, pegtl::star<ws, comma, ws, values_row>> {
};

struct inline_table : pegtl::seq<inline_table_rows, pegtl::opt<ws, table_alias>> {
};

struct parenthesized_inline_table
    : pegtl::seq<left_paren, ws, inline_table_rows, ws, pegtl::must<right_paren>, pegtl::opt<ws, table_alias>> {
};

struct table_function
    : pegtl::seq<function_name,
                 ws,
                 left_paren,
                 ws,
                 pegtl::opt<expression, pegtl::star<ws, comma, ws, pegtl::must<expression>>>,
                 ws,
                 pegtl::must<right_paren>,
                 pegtl::opt<ws, table_alias>> {
};

struct table_source;

struct nested_join : pegtl::seq<left_paren, ws, table_source, ws, pegtl::must<right_paren>> {
};

struct table_factor
    : pegtl::sor<parenthesized_inline_table, derived_table, nested_join, inline_table, table_function, base_table> {
};

struct join_inner : kw_inner {
};

struct join_left_semi : pegtl::seq<kw_left, ws, kw_semi> {
};

struct join_left_anti : pegtl::seq<kw_left, ws, kw_anti> {
};

struct join_left : pegtl::seq<kw_left, pegtl::opt<ws, kw_outer>> {
};

struct join_right : pegtl::seq<kw_right, pegtl::opt<ws, kw_outer>> {
};

struct join_full : pegtl::seq<kw_full, pegtl::opt<ws, kw_outer>> {
};

struct join_cross : kw_cross {
};

struct join_type
    : pegtl::sor<join_inner, join_left_semi, join_left_anti, join_left, join_right, join_full, join_cross> {
};

struct column_name_list
    : pegtl::seq<left_paren,
                 ws,
                 identifier_rule,
                 pegtl::star<ws, comma, ws, identifier_rule>,
                 ws,
                 pegtl::must<right_paren>> {
};

struct on_condition : pegtl::seq<kw_on, ws, pegtl::must<expression>> {
};

struct using_condition : pegtl::seq<kw_using, ws, pegtl::must<column_name_list>> {
};

struct join_clause
    : pegtl::seq<pegtl::opt<join_type, ws>,
                 kw_join,
                 ws,
                 pegtl::must<table_factor>,
                 pegtl::opt<ws, pegtl::sor<on_condition, using_condition>>> {
};

struct table_source : pegtl::seq<table_factor, pegtl::star<ws, join_clause>> {
};

struct from_clause
    : pegtl::seq<kw_from, ws, pegtl::must<table_source>, pegtl::star<ws, comma, ws, pegtl::must<table_source>>> {
};

struct where_clause : pegtl::seq<kw_where, ws, pegtl::must<expression>> {
};

struct group_by_clause
    : pegtl::seq<kw_group,
                 ws,
                 pegtl::must<kw_by>,
                 ws,
                 pegtl::must<expression>,
                 pegtl::star<ws, comma, ws, pegtl::must<expression>>> {
};

struct having_clause : pegtl::seq<kw_having, ws, pegtl::must<expression>> {
};

struct order_ascending : kw_asc {
};

struct order_descending : kw_desc {
};

struct order_item : pegtl::seq<expression, pegtl::opt<ws, pegtl::sor<order_ascending, order_descending>>> {
};

struct order_by_clause
    : pegtl::seq<kw_order,
                 ws,
                 pegtl::must<kw_by>,
                 ws,
                 pegtl::must<order_item>,
                 pegtl::star<ws, comma, ws, pegtl::must<order_item>>> {
};

struct limit_clause
    : pegtl::seq<kw_limit, ws, pegtl::must<expression>, pegtl::opt<ws, kw_offset, ws, pegtl::must<expression>>> {
};

struct query_specification
    : pegtl::seq<kw_select,
                 ws,
                 pegtl::opt<pegtl::sor<distinct_marker, all_marker>, ws>,
                 pegtl::must<select_list>,
                 pegtl::opt<ws, from_clause>,
                 pegtl::opt<ws, where_clause>,
                 pegtl::opt<ws, group_by_clause>,
                 pegtl::opt<ws, having_clause>,
                 pegtl::opt<ws, order_by_clause>,
                 pegtl::opt<ws, limit_clause>> {
};

struct set_union : kw_union {
};

struct set_intersect : kw_intersect {
};

struct set_except : kw_except {
};

struct set_all : kw_all {
};

struct set_distinct : kw_distinct {
};

struct set_operator
    : pegtl::seq<pegtl::sor<set_union, set_intersect, set_except>, pegtl::opt<ws, pegtl::sor<set_all, set_distinct>>> {
};

struct query_body
    : pegtl::seq<query_specification, pegtl::star<ws, set_operator, ws, pegtl::must<query_specification>>> {
};

struct cte_name : pegtl::seq<identifier_rule> {
};

struct common_table_expression
    : pegtl::seq<cte_name,
                 ws,
                 pegtl::opt<column_name_list, ws>,
                 pegtl::must<kw_as>,
                 ws,
                 pegtl::must<left_paren>,
                 ws,
                 pegtl::must<select_statement_rule>,
                 ws,
                 pegtl::must<right_paren>> {
};

// RECURSIVE is not reserved, so `WITH recursive AS (...)` names a CTE.
struct recursive_marker : pegtl::seq<kw_recursive, pegtl::not_at<ws, pegtl::sor<kw_as, left_paren>>> {
};

struct with_clause
    : pegtl::seq<kw_with,
                 ws,
                 pegtl::opt<recursive_marker, ws>,
                 pegtl::must<common_table_expression>,
                 pegtl::star<ws, comma, ws, pegtl::must<common_table_expression>>> {
};

struct select_statement_rule : pegtl::seq<pegtl::opt<with_clause, ws>, query_body> {
};

struct select_statement_grammar
    : pegtl::seq<ws,
                 pegtl::must<select_statement_rule>,
                 ws,
                 pegtl::opt<semicolon, ws>,
                 pegtl::must<pegtl::eof>> {
};

template <typename Rule>
using select_selector = parse_tree::selector<
    Rule,
    parse_tree::store_content::on<quoted_identifier,
                                  unquoted_identifier,
                                  numeric_literal,
                                  string_literal,
                                  comparison_operator,
                                  additive_operator,
                                  multiplicative_operator,
                                  cast_type_name>,
    parse_tree::remove_content::on<null_literal,
                                   true_literal,
                                   false_literal,
                                   column_reference,
                                   qualified_star,
                                   unqualified_star,
                                   scalar_subquery,
                                   parenthesized_expression,
                                   exists_expression,
                                   case_operand,
                                   when_clause,
                                   else_clause,
                                   case_expression,
                                   try_cast_marker,
                                   cast_expression,
                                   partition_by_clause,
                                   frame_rows,
                                   frame_range,
                                   bound_unbounded_preceding,
                                   bound_unbounded_following,
                                   bound_current_row,
                                   bound_preceding,
                                   bound_following,
                                   window_frame,
                                   window_specification,
                                   function_name,
                                   function_star_argument,
                                   function_distinct,
                                   function_call,
                                   negative_expression,
                                   positive_expression,
                                   suffix_not,
                                   comparison_suffix,
                                   is_null_suffix,
                                   in_suffix,
                                   between_suffix,
                                   like_suffix,
                                   negation,
                                   alias_clause,
                                   select_item,
                                   distinct_marker,
                                   all_marker,
                                   table_name,
                                   base_table,
                                   derived_table,
                                   values_row,
                                   inline_table,
                                   parenthesized_inline_table,
                                   table_function,
                                   nested_join,
                                   join_inner,
                                   join_left_semi,
                                   join_left_anti,
                                   join_left,
                                   join_right,
                                   join_full,
                                   join_cross,
                                   column_name_list,
                                   on_condition,
                                   using_condition,
                                   join_clause,
                                   table_source,
                                   from_clause,
                                   where_clause,
                                   group_by_clause,
                                   having_clause,
                                   order_ascending,
                                   order_descending,
                                   order_item,
                                   order_by_clause,
                                   limit_clause,
                                   query_specification,
                                   set_union,
                                   set_intersect,
                                   set_except,
                                   set_all,
                                   set_distinct,
                                   set_operator,
                                   cte_name,
                                   common_table_expression,
                                   recursive_marker,
                                   with_clause,
                                   select_statement_rule>,
    parse_tree::fold_one::on<expression, and_expression, predicate, additive, multiplicative, query_body>>;

// ---------------------------------------------------------------------------
// Error reporting

template <typename Rule>
constexpr std::string_view rule_description() noexcept
{
    return "valid SQL";
}

template <>
constexpr std::string_view rule_description<select_statement_rule>() noexcept
{
    return "SELECT or WITH";
}

template <>
constexpr std::string_view rule_description<pegtl::eof>() noexcept
{
    return "end of statement";
}

template <>
constexpr std::string_view rule_description<select_list>() noexcept
{
    return "select list";
}

template <>
constexpr std::string_view rule_description<select_item>() noexcept
{
    return "select item";
}

template <>
constexpr std::string_view rule_description<table_source>() noexcept
{
    return "table reference";
}

template <>
constexpr std::string_view rule_description<table_factor>() noexcept
{
    return "table reference";
}

template <>
constexpr std::string_view rule_description<expression>() noexcept
{
    return "expression";
}

template <>
constexpr std::string_view rule_description<and_expression>() noexcept
{
    return "expression";
}

template <>
constexpr std::string_view rule_description<not_expression>() noexcept
{
    return "expression";
}

template <>
constexpr std::string_view rule_description<additive>() noexcept
{
    return "operand";
}

template <>
constexpr std::string_view rule_description<multiplicative>() noexcept
{
    return "operand";
}

template <>
constexpr std::string_view rule_description<unary>() noexcept
{
    return "operand";
}

template <>
constexpr std::string_view rule_description<left_paren>() noexcept
{
    return "'('";
}

template <>
constexpr std::string_view rule_description<right_paren>() noexcept
{
    return "')'";
}

template <>
constexpr std::string_view rule_description<kw_as>() noexcept
{
    return "AS";
}

template <>
constexpr std::string_view rule_description<kw_by>() noexcept
{
    return "BY";
}

template <>
constexpr std::string_view rule_description<kw_and>() noexcept
{
    return "AND";
}

template <>
constexpr std::string_view rule_description<kw_null>() noexcept
{
    return "NULL";
}

template <>
constexpr std::string_view rule_description<kw_then>() noexcept
{
    return "THEN";
}

template <>
constexpr std::string_view rule_description<kw_end>() noexcept
{
    return "END";
}

template <>
constexpr std::string_view rule_description<when_clause>() noexcept
{
    return "WHEN";
}

template <>
constexpr std::string_view rule_description<cast_type_name>() noexcept
{
    return "type name";
}

template <>
constexpr std::string_view rule_description<type_name>() noexcept
{
    return "type name";
}

template <>
constexpr std::string_view rule_description<struct_field>() noexcept
{
    return "struct field";
}

template <>
constexpr std::string_view rule_description<right_angle>() noexcept
{
    return "'>'";
}

template <>
constexpr std::string_view rule_description<comma>() noexcept
{
    return "','";
}

template <>
constexpr std::string_view rule_description<frame_bound>() noexcept
{
    return "window frame bound";
}

template <>
constexpr std::string_view rule_description<column_name_list>() noexcept
{
    return "column list";
}

template <>
constexpr std::string_view rule_description<in_operand>() noexcept
{
    return "value list or subquery";
}

template <>
constexpr std::string_view rule_description<order_item>() noexcept
{
    return "order expression";
}

template <>
constexpr std::string_view rule_description<query_specification>() noexcept
{
    return "SELECT";
}

template <>
constexpr std::string_view rule_description<common_table_expression>() noexcept
{
    return "common table expression";
}

template <typename Rule>
struct select_control : pegtl::normal<Rule> {
    template <typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...)
    {
        throw pegtl::parse_error("expected " + std::string{rule_description<Rule>()}, in);
    }
};

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1)};
}

std::string format_parse_message(std::string_view message)
{
    constexpr std::string_view expected_prefix = "expected ";
    if (message.rfind(expected_prefix, 0) == 0U && message.size() > expected_prefix.size()) {
        auto detail = message.substr(expected_prefix.size());
        if (!detail.empty() && detail.front() == '\'' && detail.back() == '\'' && detail.size() > 2) {
            detail = detail.substr(1, detail.size() - 2);
        }
        return "Missing " + std::string{detail};
    }
    return std::string{message};
}

std::string_view extract_token(std::string_view input, std::size_t offset)
{
    if (input.empty()) {
        return {};
    }

    offset = std::min(offset, input.size() - 1U);

    auto is_separator = [](char ch) {
        const auto unsigned_ch = static_cast<unsigned char>(ch);
        return std::isspace(unsigned_ch) != 0 || ch == ';' || ch == ',' || ch == '(' || ch == ')';
    };

    std::size_t begin = offset;
    while (begin > 0U && !is_separator(input[begin - 1U])) {
        --begin;
    }

    std::size_t end = offset;
    while (end < input.size() && !is_separator(input[end])) {
        ++end;
    }

    return input.substr(begin, end - begin);
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = format_parse_message(error.message());
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);
        diagnostic.offset = static_cast<std::size_t>(position.byte);

        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (!source.empty() && byte_index < source.size()) {
            const auto token = trim_copy(extract_token(source, byte_index));
            if (!token.empty()) {
                diagnostic.message += " near '" + token + "'";
            }
        } else if (byte_index >= source.size()) {
            diagnostic.message += " at end of input";
        }
    }

    return diagnostic;
}

ParserDiagnostic make_mismatch_diagnostic(std::string_view grammar_name, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = "input did not match " + std::string{grammar_name} + " grammar";
    diagnostic.line = 1U;
    diagnostic.column = 1U;
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Review the SQL syntax near the reported token."};
    return diagnostic;
}

void append_escaped_char(std::string& result, char ch)
{
    switch (ch) {
    case 'n':
        result.push_back('\n');
        break;
    case 't':
        result.push_back('\t');
        break;
    case 'r':
        result.push_back('\r');
        break;
    case 'b':
        result.push_back('\b');
        break;
    case '0':
        result.push_back('\0');
        break;
    case 'Z':
        result.push_back('\x1A');
        break;
    case '%':
    case '_':
        // LIKE wildcards stay escaped.
        result.push_back('\\');
        result.push_back(ch);
        break;
    default:
        result.push_back(ch);
        break;
    }
}

std::string unescape_string_literal(std::string_view text)
{
    std::string result{};
    if (text.size() < 2U || (text.front() != '\'' && text.front() != '"') || text.back() != text.front()) {
        result.assign(text.begin(), text.end());
        return result;
    }

    const char quote = text.front();
    const auto last = text.size() - 1U;
    for (std::size_t index = 1U; index < last; ++index) {
        const char ch = text[index];
        if (ch == '\\' && index + 1U < last) {
            append_escaped_char(result, text[++index]);
        } else if (ch == quote && index + 1U < last && text[index + 1U] == quote) {
            result.push_back(quote);
            ++index;
        } else {
            result.push_back(ch);
        }
    }
    return result;
}

Identifier identifier_from_text(std::string_view text)
{
    Identifier identifier{};
    if (text.size() >= 2U && text.front() == '`' && text.back() == '`') {
        identifier.quoted = true;
        for (std::size_t index = 1U; index + 1U < text.size(); ++index) {
            const char ch = text[index];
            identifier.value.push_back(ch);
            if (ch == '`' && index + 1U < text.size() - 1U && text[index + 1U] == '`') {
                ++index;
            }
        }
        return identifier;
    }

    identifier.value.assign(text.begin(), text.end());
    return identifier;
}

template <typename Rule>
struct identifier_action : pegtl::nothing<Rule> {
};

template <>
struct identifier_action<identifier_rule> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, Identifier& identifier)
    {
        identifier = identifier_from_text(in.string_view());
    }
};

template <typename Rule>
struct qualified_name_action : pegtl::nothing<Rule> {
};

template <>
struct qualified_name_action<qualified_name_part> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, QualifiedName& name)
    {
        name.parts.push_back(identifier_from_text(in.string_view()));
    }
};

// ---------------------------------------------------------------------------
// Parse tree to relational AST

using ParseNode = parse_tree::node;

class SelectTreeBuilder final {
public:
    explicit SelectTreeBuilder(relational::AstArena& arena) noexcept : arena_(arena) {}

    relational::SelectStatement& build_statement(const ParseNode& node)
    {
        expect(node.is_type<select_statement_rule>(), node);
        auto& statement = arena_.make<relational::SelectStatement>();
        for (const auto& child : node.children) {
            if (child->is_type<with_clause>()) {
                statement.with = &build_with_clause(*child);
            } else {
                statement.body = &build_query_body(*child);
            }
        }
        return statement;
    }

private:
    [[noreturn]] static void unexpected(const ParseNode& node)
    {
        throw std::logic_error{"unexpected parse node '" + std::string{node.type} + "'"};
    }

    static void expect(bool condition, const ParseNode& node)
    {
        if (!condition) {
            unexpected(node);
        }
    }

    static const ParseNode& child_at(const ParseNode& node, std::size_t index)
    {
        if (index >= node.children.size()) {
            unexpected(node);
        }
        return *node.children[index];
    }

    template <typename Rule>
    static bool has_child(const ParseNode& node)
    {
        return std::any_of(node.children.begin(), node.children.end(), [](const auto& child) {
            return child->template is_type<Rule>();
        });
    }

    static Identifier build_identifier(const ParseNode& node)
    {
        expect(node.is_type<quoted_identifier>() || node.is_type<unquoted_identifier>(), node);
        return identifier_from_text(node.string_view());
    }

    static std::vector<Identifier> build_identifier_list(const ParseNode& node)
    {
        std::vector<Identifier> identifiers{};
        identifiers.reserve(node.children.size());
        for (const auto& child : node.children) {
            identifiers.push_back(build_identifier(*child));
        }
        return identifiers;
    }

    static QualifiedName build_qualified_name(const ParseNode& node)
    {
        QualifiedName name{};
        name.parts = build_identifier_list(node);
        return name;
    }

    relational::WithClause& build_with_clause(const ParseNode& node)
    {
        auto& clause = arena_.make<relational::WithClause>();
        for (const auto& child : node.children) {
            if (child->is_type<recursive_marker>()) {
                clause.recursive = true;
                continue;
            }

            expect(child->is_type<common_table_expression>(), *child);
            auto& cte = arena_.make<relational::CommonTableExpression>();
            for (const auto& part : child->children) {
                if (part->is_type<cte_name>()) {
                    cte.name = build_identifier(child_at(*part, 0U));
                } else if (part->is_type<column_name_list>()) {
                    cte.column_names = build_identifier_list(*part);
                } else {
                    cte.query = &build_statement(*part);
                }
            }
            clause.expressions.push_back(&cte);
        }
        return clause;
    }

    relational::QueryExpression& build_query_body(const ParseNode& node)
    {
        if (node.is_type<query_specification>()) {
            return build_query_specification(node);
        }

        expect(node.is_type<query_body>(), node);
        relational::QueryExpression* left = &build_query_specification(child_at(node, 0U));
        for (std::size_t index = 1U; index + 1U < node.children.size(); index += 2U) {
            const auto& op_node = child_at(node, index);
            auto& operation = arena_.make<relational::SetOperation>();
            if (has_child<set_intersect>(op_node)) {
                operation.op = relational::SetOperator::Intersect;
            } else if (has_child<set_except>(op_node)) {
                operation.op = relational::SetOperator::Except;
            } else {
                operation.op = relational::SetOperator::Union;
            }
            operation.all = has_child<set_all>(op_node);
            operation.left = left;
            operation.right = &build_query_specification(child_at(node, index + 1U));
            left = &operation;
        }
        return *left;
    }

    relational::QuerySpecification& build_query_specification(const ParseNode& node)
    {
        expect(node.is_type<query_specification>(), node);
        auto& query = arena_.make<relational::QuerySpecification>();
        for (const auto& child : node.children) {
            if (child->is_type<distinct_marker>()) {
                query.distinct = true;
            } else if (child->is_type<all_marker>()) {
                continue;
            } else if (child->is_type<select_item>()) {
                query.select_items.push_back(&build_select_item(*child));
            } else if (child->is_type<from_clause>()) {
                for (const auto& source : child->children) {
                    query.from.push_back(&build_table_source(*source));
                }
            } else if (child->is_type<where_clause>()) {
                query.where = &build_expression(child_at(*child, 0U));
            } else if (child->is_type<group_by_clause>()) {
                for (const auto& expression : child->children) {
                    query.group_by.push_back(&build_expression(*expression));
                }
            } else if (child->is_type<having_clause>()) {
                query.having = &build_expression(child_at(*child, 0U));
            } else if (child->is_type<order_by_clause>()) {
                for (const auto& item : child->children) {
                    query.order_by.push_back(&build_order_item(*item));
                }
            } else if (child->is_type<limit_clause>()) {
                auto& limit = arena_.make<relational::LimitClause>();
                limit.row_count = &build_expression(child_at(*child, 0U));
                if (child->children.size() > 1U) {
                    limit.offset = &build_expression(child_at(*child, 1U));
                }
                query.limit = &limit;
            } else {
                unexpected(*child);
            }
        }
        return query;
    }

    relational::SelectItem& build_select_item(const ParseNode& node)
    {
        auto& item = arena_.make<relational::SelectItem>();
        item.expression = &build_expression(child_at(node, 0U));
        if (node.children.size() > 1U) {
            item.alias = build_alias(child_at(node, 1U));
        }
        return item;
    }

    relational::OrderByItem& build_order_item(const ParseNode& node)
    {
        expect(node.is_type<order_item>(), node);
        auto& item = arena_.make<relational::OrderByItem>();
        item.expression = &build_expression(child_at(node, 0U));
        if (has_child<order_descending>(node)) {
            item.direction = relational::OrderByItem::Direction::Descending;
        } else if (has_child<order_ascending>(node)) {
            item.direction = relational::OrderByItem::Direction::Ascending;
        }
        return item;
    }

    static Identifier build_alias(const ParseNode& node)
    {
        expect(node.is_type<alias_clause>(), node);
        return build_identifier(child_at(node, 0U));
    }

    relational::TableSource& build_table_source(const ParseNode& node)
    {
        expect(node.is_type<table_source>(), node);
        relational::TableSource* current = &build_table_factor(child_at(node, 0U));
        for (std::size_t index = 1U; index < node.children.size(); ++index) {
            const auto& join_node = child_at(node, index);
            expect(join_node.is_type<join_clause>(), join_node);

            auto& join = arena_.make<relational::JoinedTable>();
            join.left = current;
            for (const auto& part : join_node.children) {
                if (part->is_type<join_inner>()) {
                    join.type = relational::JoinType::Inner;
                } else if (part->is_type<join_left>()) {
                    join.type = relational::JoinType::LeftOuter;
                } else if (part->is_type<join_right>()) {
                    join.type = relational::JoinType::RightOuter;
                } else if (part->is_type<join_full>()) {
                    join.type = relational::JoinType::FullOuter;
                } else if (part->is_type<join_cross>()) {
                    join.type = relational::JoinType::Cross;
                } else if (part->is_type<join_left_semi>()) {
                    join.type = relational::JoinType::LeftSemi;
                } else if (part->is_type<join_left_anti>()) {
                    join.type = relational::JoinType::LeftAnti;
                } else if (part->is_type<on_condition>()) {
                    join.condition = &build_expression(child_at(*part, 0U));
                } else if (part->is_type<using_condition>()) {
                    join.using_columns = build_identifier_list(child_at(*part, 0U));
                } else {
                    join.right = &build_table_factor(*part);
                }
            }
            current = &join;
        }
        return *current;
    }

    // Reads the trailing `[AS] alias [(columns)]` children of a table factor.
    static void build_table_alias(const ParseNode& node,
                                  std::optional<Identifier>& alias,
                                  std::vector<Identifier>& column_aliases)
    {
        for (const auto& child : node.children) {
            if (child->is_type<alias_clause>()) {
                alias = build_alias(*child);
            } else if (child->is_type<column_name_list>()) {
                column_aliases = build_identifier_list(*child);
            }
        }
    }

    std::vector<relational::Expression*> build_expression_list(const ParseNode& node)
    {
        std::vector<relational::Expression*> expressions{};
        expressions.reserve(node.children.size());
        for (const auto& child : node.children) {
            expressions.push_back(&build_expression(*child));
        }
        return expressions;
    }

    relational::TableSource& build_table_factor(const ParseNode& node)
    {
        if (node.is_type<derived_table>()) {
            auto& derived = arena_.make<relational::DerivedTable>();
            derived.query = &build_statement(child_at(node, 0U));
            build_table_alias(node, derived.alias, derived.column_aliases);
            return derived;
        }

        if (node.is_type<inline_table>() || node.is_type<parenthesized_inline_table>()) {
            auto& inline_rows = arena_.make<relational::InlineTable>();
            inline_rows.parenthesized = node.is_type<parenthesized_inline_table>();
            for (const auto& child : node.children) {
                if (child->is_type<values_row>()) {
                    inline_rows.rows.push_back(build_expression_list(*child));
                }
            }
            build_table_alias(node, inline_rows.alias, inline_rows.column_aliases);
            return inline_rows;
        }

        if (node.is_type<table_function>()) {
            auto& function = arena_.make<relational::TableFunction>();
            function.name = build_identifier(child_at(child_at(node, 0U), 0U));
            for (std::size_t index = 1U; index < node.children.size(); ++index) {
                const auto& child = child_at(node, index);
                if (!child.is_type<alias_clause>() && !child.is_type<column_name_list>()) {
                    function.arguments.push_back(&build_expression(child));
                }
            }
            build_table_alias(node, function.alias, function.column_aliases);
            return function;
        }

        if (node.is_type<nested_join>()) {
            auto& nested = arena_.make<relational::NestedJoin>();
            nested.inner = &build_table_source(child_at(node, 0U));
            return nested;
        }

        expect(node.is_type<base_table>(), node);
        auto& table = arena_.make<relational::TableReference>();
        const auto& name_node = child_at(node, 0U);
        auto parts = build_identifier_list(name_node);
        switch (parts.size()) {
        case 3U:
            table.catalog = std::move(parts[0]);
            table.database = std::move(parts[1]);
            table.name = std::move(parts[2]);
            break;
        case 2U:
            table.database = std::move(parts[0]);
            table.name = std::move(parts[1]);
            break;
        case 1U:
            table.name = std::move(parts[0]);
            break;
        default:
            unexpected(name_node);
        }
        if (node.children.size() > 1U) {
            table.alias = build_alias(child_at(node, 1U));
        }
        return table;
    }

    relational::Expression& build_binary_chain(const ParseNode& node, relational::BinaryOperator op)
    {
        relational::Expression* left = &build_expression(child_at(node, 0U));
        for (std::size_t index = 1U; index < node.children.size(); ++index) {
            auto& binary = arena_.make<relational::BinaryExpression>();
            binary.op = op;
            binary.left = left;
            binary.right = &build_expression(child_at(node, index));
            left = &binary;
        }
        return *left;
    }

    static relational::BinaryOperator arithmetic_operator(const ParseNode& node)
    {
        const auto text = node.string_view();
        if (text == "+") {
            return relational::BinaryOperator::Add;
        }
        if (text == "-") {
            return relational::BinaryOperator::Subtract;
        }
        if (text == "*") {
            return relational::BinaryOperator::Multiply;
        }
        if (text == "/") {
            return relational::BinaryOperator::Divide;
        }
        if (text == "%") {
            return relational::BinaryOperator::Modulo;
        }
        if (text == "||") {
            return relational::BinaryOperator::Concat;
        }
        unexpected(node);
    }

    static relational::BinaryOperator comparison(const ParseNode& node)
    {
        const auto text = node.string_view();
        if (text == "=" || text == "==") {
            return relational::BinaryOperator::Equal;
        }
        if (text == "<>" || text == "!=") {
            return relational::BinaryOperator::NotEqual;
        }
        if (text == "<") {
            return relational::BinaryOperator::Less;
        }
        if (text == "<=") {
            return relational::BinaryOperator::LessOrEqual;
        }
        if (text == ">") {
            return relational::BinaryOperator::Greater;
        }
        if (text == ">=") {
            return relational::BinaryOperator::GreaterOrEqual;
        }
        if (text == "<=>") {
            return relational::BinaryOperator::NullSafeEqual;
        }
        unexpected(node);
    }

    relational::Expression& build_arithmetic_chain(const ParseNode& node)
    {
        relational::Expression* left = &build_expression(child_at(node, 0U));
        for (std::size_t index = 1U; index + 1U < node.children.size(); index += 2U) {
            auto& binary = arena_.make<relational::BinaryExpression>();
            binary.op = arithmetic_operator(child_at(node, index));
            binary.left = left;
            binary.right = &build_expression(child_at(node, index + 1U));
            left = &binary;
        }
        return *left;
    }

    relational::Expression& build_predicate(const ParseNode& node)
    {
        auto& operand = build_expression(child_at(node, 0U));
        const auto& suffix = child_at(node, 1U);
        const bool negated = has_child<suffix_not>(suffix);

        if (suffix.is_type<comparison_suffix>()) {
            auto& binary = arena_.make<relational::BinaryExpression>();
            binary.op = comparison(child_at(suffix, 0U));
            binary.left = &operand;
            binary.right = &build_expression(child_at(suffix, 1U));
            return binary;
        }

        if (suffix.is_type<is_null_suffix>()) {
            auto& is_null = arena_.make<relational::IsNullExpression>();
            is_null.operand = &operand;
            is_null.negated = negated;
            return is_null;
        }

        if (suffix.is_type<like_suffix>()) {
            auto& like = arena_.make<relational::BinaryExpression>();
            like.op = negated ? relational::BinaryOperator::NotLike : relational::BinaryOperator::Like;
            like.left = &operand;
            like.right = &build_expression(child_at(suffix, suffix.children.size() - 1U));
            return like;
        }

        const std::size_t first = negated ? 1U : 0U;
        if (suffix.is_type<between_suffix>()) {
            auto& between = arena_.make<relational::BetweenExpression>();
            between.operand = &operand;
            between.negated = negated;
            between.lower = &build_expression(child_at(suffix, first));
            between.upper = &build_expression(child_at(suffix, first + 1U));
            return between;
        }

        expect(suffix.is_type<in_suffix>(), suffix);
        auto& in = arena_.make<relational::InExpression>();
        in.operand = &operand;
        in.negated = negated;
        for (std::size_t index = first; index < suffix.children.size(); ++index) {
            const auto& value = child_at(suffix, index);
            if (value.is_type<select_statement_rule>()) {
                in.subquery = &build_statement(value);
            } else {
                in.values.push_back(&build_expression(value));
            }
        }
        return in;
    }

    relational::Expression& build_case(const ParseNode& node)
    {
        auto& expression = arena_.make<relational::CaseExpression>();
        for (const auto& child : node.children) {
            if (child->is_type<case_operand>()) {
                expression.operand = &build_expression(child_at(*child, 0U));
            } else if (child->is_type<when_clause>()) {
                relational::CaseExpression::WhenClause branch{};
                branch.condition = &build_expression(child_at(*child, 0U));
                branch.result = &build_expression(child_at(*child, 1U));
                expression.branches.push_back(branch);
            } else if (child->is_type<else_clause>()) {
                expression.else_result = &build_expression(child_at(*child, 0U));
            } else {
                unexpected(*child);
            }
        }
        return expression;
    }

    relational::Expression& build_function_call(const ParseNode& node)
    {
        auto& call = arena_.make<relational::FunctionCall>();
        call.name = build_identifier(child_at(child_at(node, 0U), 0U));
        for (std::size_t index = 1U; index < node.children.size(); ++index) {
            const auto& argument = child_at(node, index);
            if (argument.is_type<function_star_argument>()) {
                call.star_argument = true;
            } else if (argument.is_type<function_distinct>()) {
                call.distinct = true;
            } else if (argument.is_type<window_specification>()) {
                call.window = &build_window(argument);
            } else {
                call.arguments.push_back(&build_expression(argument));
            }
        }
        return call;
    }

    relational::WindowFrameBound build_frame_bound(const ParseNode& node)
    {
        using Kind = relational::WindowFrameBound::Kind;

        relational::WindowFrameBound bound{};
        if (node.is_type<bound_unbounded_preceding>()) {
            bound.kind = Kind::UnboundedPreceding;
        } else if (node.is_type<bound_unbounded_following>()) {
            bound.kind = Kind::UnboundedFollowing;
        } else if (node.is_type<bound_current_row>()) {
            bound.kind = Kind::CurrentRow;
        } else if (node.is_type<bound_preceding>()) {
            bound.kind = Kind::Preceding;
            bound.offset = &build_expression(child_at(node, 0U));
        } else {
            expect(node.is_type<bound_following>(), node);
            bound.kind = Kind::Following;
            bound.offset = &build_expression(child_at(node, 0U));
        }
        return bound;
    }

    relational::WindowSpecification& build_window(const ParseNode& node)
    {
        auto& window = arena_.make<relational::WindowSpecification>();
        for (const auto& child : node.children) {
            if (child->is_type<partition_by_clause>()) {
                window.partition_by = build_expression_list(*child);
            } else if (child->is_type<order_by_clause>()) {
                for (const auto& item : child->children) {
                    window.order_by.push_back(&build_order_item(*item));
                }
            } else {
                expect(child->is_type<window_frame>(), *child);
                relational::WindowFrame frame{};
                const auto& unit = child_at(*child, 0U);
                frame.unit = unit.is_type<frame_range>() ? relational::WindowFrame::Unit::Range
                                                         : relational::WindowFrame::Unit::Rows;
                frame.start = build_frame_bound(child_at(*child, 1U));
                if (child->children.size() > 2U) {
                    frame.end = build_frame_bound(child_at(*child, 2U));
                }
                window.frame = frame;
            }
        }
        return window;
    }

    relational::Expression& build_literal(const ParseNode& node)
    {
        auto& literal = arena_.make<relational::LiteralExpression>();
        if (node.is_type<null_literal>()) {
            literal.tag = relational::LiteralTag::Null;
            literal.text = "NULL";
        } else if (node.is_type<true_literal>() || node.is_type<false_literal>()) {
            literal.tag = relational::LiteralTag::Boolean;
            literal.boolean_value = node.is_type<true_literal>();
            literal.text = literal.boolean_value ? "TRUE" : "FALSE";
        } else if (node.is_type<numeric_literal>()) {
            literal.text = node.string();
            literal.tag = literal.text.find_first_of(".eE") != std::string::npos ? relational::LiteralTag::Decimal
                                                                                 : relational::LiteralTag::Integer;
        } else {
            expect(node.is_type<string_literal>(), node);
            literal.tag = relational::LiteralTag::String;
            literal.text = unescape_string_literal(node.string_view());
        }
        return literal;
    }

    relational::Expression& build_expression(const ParseNode& node)
    {
        if (node.is_type<expression>()) {
            return build_binary_chain(node, relational::BinaryOperator::Or);
        }
        if (node.is_type<and_expression>()) {
            return build_binary_chain(node, relational::BinaryOperator::And);
        }
        if (node.is_type<additive>() || node.is_type<multiplicative>()) {
            return build_arithmetic_chain(node);
        }
        if (node.is_type<predicate>()) {
            return build_predicate(node);
        }
        if (node.is_type<negation>() || node.is_type<negative_expression>() || node.is_type<positive_expression>()) {
            auto& unary_expression = arena_.make<relational::UnaryExpression>();
            if (node.is_type<negation>()) {
                unary_expression.op = relational::UnaryOperator::Not;
            } else if (node.is_type<negative_expression>()) {
                unary_expression.op = relational::UnaryOperator::Negate;
            } else {
                unary_expression.op = relational::UnaryOperator::Plus;
            }
            unary_expression.operand = &build_expression(child_at(node, 0U));
            return unary_expression;
        }
        if (node.is_type<column_reference>()) {
            auto& identifier = arena_.make<relational::IdentifierExpression>();
            identifier.name = build_qualified_name(node);
            return identifier;
        }
        if (node.is_type<qualified_star>() || node.is_type<unqualified_star>()) {
            auto& star = arena_.make<relational::StarExpression>();
            star.qualifier = build_qualified_name(node);
            return star;
        }
        if (node.is_type<scalar_subquery>()) {
            auto& subquery = arena_.make<relational::SubqueryExpression>();
            subquery.query = &build_statement(child_at(node, 0U));
            return subquery;
        }
        if (node.is_type<exists_expression>()) {
            auto& exists = arena_.make<relational::ExistsExpression>();
            exists.query = &build_statement(child_at(node, 0U));
            return exists;
        }
        if (node.is_type<parenthesized_expression>()) {
            auto& nested = arena_.make<relational::ParenthesizedExpression>();
            nested.inner = &build_expression(child_at(node, 0U));
            return nested;
        }
        if (node.is_type<case_expression>()) {
            return build_case(node);
        }
        if (node.is_type<cast_expression>()) {
            auto& cast = arena_.make<relational::CastExpression>();
            cast.try_cast = has_child<try_cast_marker>(node);
            const std::size_t first = cast.try_cast ? 1U : 0U;
            cast.operand = &build_expression(child_at(node, first));
            cast.type_name = child_at(node, first + 1U).string();
            return cast;
        }
        if (node.is_type<function_call>()) {
            return build_function_call(node);
        }
        return build_literal(node);
    }

    relational::AstArena& arena_;
};

}  // namespace

ParseResult<Identifier> parse_identifier(std::string_view input)
{
    ParseResult<Identifier> result{};
    pegtl::memory_input in(input, "identifier");
    Identifier identifier{};

    try {
        const auto parsed = pegtl::parse<identifier_grammar, identifier_action>(in, identifier);
        if (parsed) {
            result.ast = std::move(identifier);
        } else {
            result.diagnostics.push_back(make_mismatch_diagnostic("identifier", input));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
    }

    return result;
}

ParseResult<QualifiedName> parse_qualified_name(std::string_view input)
{
    ParseResult<QualifiedName> result{};
    pegtl::memory_input in(input, "qualified_name");
    QualifiedName name{};

    try {
        const auto parsed = pegtl::parse<qualified_name_grammar, qualified_name_action>(in, name);
        if (parsed) {
            result.ast = std::move(name);
        } else {
            result.diagnostics.push_back(make_mismatch_diagnostic("qualified name", input));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
    }

    return result;
}

SelectParseResult parse_select(std::string_view input)
{
    SelectParseResult result{};
    pegtl::memory_input in(input, "select_statement");

    try {
        const auto root = parse_tree::parse<select_statement_grammar, select_selector, pegtl::nothing, select_control>(in);
        if (root && root->children.size() == 1U) {
            SelectTreeBuilder builder{result.arena};
            result.statement = &builder.build_statement(*root->children.front());
        } else {
            result.diagnostics.push_back(make_mismatch_diagnostic("SELECT", input));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
        result.statement = nullptr;
        result.arena.reset();
    }

    return result;
}

}  // namespace retable::parser
