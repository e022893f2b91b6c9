#include "retable/parser/identifier_quoting.hpp"

#include <catch2/catch_test_macros.hpp>

using retable::parser::Identifier;

TEST_CASE("is_reserved_keyword ignores case", "[parser][quoting]")
{
    CHECK(retable::parser::is_reserved_keyword("select"));
    CHECK(retable::parser::is_reserved_keyword("FROM"));
    CHECK(retable::parser::is_reserved_keyword("Union"));
    CHECK_FALSE(retable::parser::is_reserved_keyword("table"));
    CHECK_FALSE(retable::parser::is_reserved_keyword("name"));
    CHECK_FALSE(retable::parser::is_reserved_keyword("recursive"));
    CHECK_FALSE(retable::parser::is_reserved_keyword("selected"));
}

TEST_CASE("requires_quotes detects names the grammar cannot read bare", "[parser][quoting]")
{
    CHECK_FALSE(retable::parser::requires_quotes("inventory"));
    CHECK_FALSE(retable::parser::requires_quotes("new_db"));
    CHECK_FALSE(retable::parser::requires_quotes("_tmp2"));

    CHECK(retable::parser::requires_quotes(""));
    CHECK(retable::parser::requires_quotes("my-db"));
    CHECK(retable::parser::requires_quotes("with space"));
    CHECK(retable::parser::requires_quotes("2024_sales"));
    CHECK(retable::parser::requires_quotes("order"));
}

TEST_CASE("quote_identifier doubles embedded backticks", "[parser][quoting]")
{
    CHECK(retable::parser::quote_identifier("plain") == "`plain`");
    CHECK(retable::parser::quote_identifier("a`b") == "`a``b`");
    CHECK(retable::parser::quote_identifier("") == "``");
}

TEST_CASE("format_identifier preserves the source spelling", "[parser][quoting]")
{
    Identifier bare{};
    bare.value = "MixedCase";
    CHECK(retable::parser::format_identifier(bare) == "MixedCase");
    CHECK(retable::parser::format_identifier(bare, true) == "mixedcase");

    Identifier quoted{};
    quoted.value = "Mixed-Case";
    quoted.quoted = true;
    CHECK(retable::parser::format_identifier(quoted) == "`Mixed-Case`");
    CHECK(retable::parser::format_identifier(quoted, true) == "`Mixed-Case`");
}
