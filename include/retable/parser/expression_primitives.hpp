#pragma once

#include <tao/pegtl.hpp>

namespace retable::parser::expr {

namespace pegtl = tao::pegtl;

struct line_comment : pegtl::seq<pegtl::two<'-'>, pegtl::until<pegtl::eolf>> {
};

struct block_comment : pegtl::seq<pegtl::string<'/', '*'>, pegtl::until<pegtl::string<'*', '/'>>> {
};

struct optional_space : pegtl::star<pegtl::sor<pegtl::space, line_comment, block_comment>> {
};

// Backslash escapes apply inside both single and double quoted strings.
struct escaped_char : pegtl::seq<pegtl::one<'\\'>, pegtl::any> {
};

template <char Quote>
struct quoted_string_char
    : pegtl::sor<escaped_char, pegtl::seq<pegtl::one<Quote>, pegtl::one<Quote>>, pegtl::not_one<Quote>> {
};

struct string_literal : pegtl::seq<pegtl::one<'\''>, pegtl::star<quoted_string_char<'\''>>, pegtl::one<'\''>> {
};

struct double_quoted_string : pegtl::seq<pegtl::one<'"'>, pegtl::star<quoted_string_char<'"'>>, pegtl::one<'"'>> {
};

struct quoted_identifier_char : pegtl::sor<pegtl::seq<pegtl::one<'`'>, pegtl::one<'`'>>, pegtl::not_one<'`'>> {
};

struct quoted_identifier : pegtl::seq<pegtl::one<'`'>, pegtl::star<quoted_identifier_char>, pegtl::one<'`'>> {
};

struct fractional_part : pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>> {
};

struct exponent_part
    : pegtl::seq<pegtl::one<'e', 'E'>, pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>> {
};

// Unsigned; a leading sign is parsed as a unary operator.
struct numeric_literal
    : pegtl::seq<pegtl::sor<pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<fractional_part>>, fractional_part>,
                 pegtl::opt<exponent_part>,
                 pegtl::not_at<pegtl::identifier_other>> {
};

}  // namespace retable::parser::expr
