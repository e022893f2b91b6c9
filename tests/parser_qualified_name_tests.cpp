#include "retable/parser/grammar.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("parse_identifier accepts bare and quoted names", "[parser][identifier]")
{
    const auto bare = retable::parser::parse_identifier("  analytics_v2 ");
    REQUIRE(bare.success());
    CHECK(bare.ast->value == "analytics_v2");
    CHECK_FALSE(bare.ast->quoted);

    const auto quoted = retable::parser::parse_identifier("`my``db`");
    REQUIRE(quoted.success());
    CHECK(quoted.ast->value == "my`db");
    CHECK(quoted.ast->quoted);
}

TEST_CASE("parse_identifier rejects reserved words and paths", "[parser][identifier]")
{
    const auto reserved = retable::parser::parse_identifier("select");
    CHECK_FALSE(reserved.success());
    REQUIRE_FALSE(reserved.diagnostics.empty());
    CHECK(reserved.diagnostics.front().severity == retable::parser::ParserSeverity::Error);

    CHECK_FALSE(retable::parser::parse_identifier("db.table").success());
    CHECK_FALSE(retable::parser::parse_identifier("").success());
}

TEST_CASE("parse_qualified_name splits dotted paths", "[parser][identifier]")
{
    const auto result = retable::parser::parse_qualified_name("spark_catalog . `my-db`.events");
    REQUIRE(result.success());
    REQUIRE(result.ast->parts.size() == 3U);
    CHECK(result.ast->parts[0].value == "spark_catalog");
    CHECK(result.ast->parts[1].value == "my-db");
    CHECK(result.ast->parts[1].quoted);
    CHECK(result.ast->parts[2].value == "events");
}

TEST_CASE("parse_qualified_name reports malformed paths", "[parser][identifier]")
{
    CHECK_FALSE(retable::parser::parse_qualified_name("db.").success());
    CHECK_FALSE(retable::parser::parse_qualified_name(".table").success());
    CHECK_FALSE(retable::parser::parse_qualified_name("db..table").success());
    CHECK_FALSE(retable::parser::parse_qualified_name("db.from").success());
}
