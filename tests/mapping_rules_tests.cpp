#include "retable/rewrite/mapping_rules.hpp"
#include "retable/rewrite/table_identifier_rewriter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using retable::rewrite::ComponentDecision;
using retable::rewrite::MappingRules;
using retable::rewrite::TableComponents;

namespace {

TableComponents components(std::optional<std::string> catalog,
                           std::optional<std::string> database,
                           std::optional<std::string> name)
{
    TableComponents result{};
    result.catalog = std::move(catalog);
    result.database = std::move(database);
    result.name = std::move(name);
    return result;
}

}  // namespace

TEST_CASE("MappingRules renames databases case-insensitively", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.map_database("db", "new_db");

    const auto decision = rules.decide(components(std::nullopt, "DB", "table"));
    CHECK(decision.catalog.is_keep());
    CHECK(decision.database == ComponentDecision::set_to("new_db"));
    CHECK(decision.name.is_keep());

    const auto other = rules.decide(components(std::nullopt, "sales", "table"));
    CHECK(other.database.is_keep());
}

TEST_CASE("MappingRules renames catalogs", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.map_catalog("spark_catalog", "lake");

    const auto decision = rules.decide(components("spark_catalog", "db", "t"));
    CHECK(decision.catalog == ComponentDecision::set_to("lake"));
    CHECK(decision.database.is_keep());

    CHECK(rules.decide(components(std::nullopt, "db", "t")).catalog.is_keep());
}

TEST_CASE("MappingRules adds a default catalog to two part names", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.set_default_catalog("spark_catalog");

    CHECK(rules.decide(components(std::nullopt, "db", "t")).catalog == ComponentDecision::set_to("spark_catalog"));
    CHECK(rules.decide(components("other", "db", "t")).catalog.is_keep());
    CHECK(rules.decide(components(std::nullopt, std::nullopt, "t")).catalog.is_keep());
}

TEST_CASE("MappingRules drops catalogs", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.drop_catalog();

    CHECK(rules.decide(components("spark_catalog", "db", "t")).catalog.is_clear());
    CHECK(rules.decide(components(std::nullopt, "db", "t")).catalog.is_keep());
}

TEST_CASE("MappingRules prefixes databases after renames", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.prefix_database("tmp_").map_database("db", "staging");

    CHECK(rules.decide(components(std::nullopt, "db", "t")).database == ComponentDecision::set_to("tmp_staging"));
    CHECK(rules.decide(components(std::nullopt, "sales", "t")).database == ComponentDecision::set_to("tmp_sales"));
    CHECK(rules.decide(components(std::nullopt, std::nullopt, "t")).database.is_keep());
}

TEST_CASE("MappingRules table rules replace trailing levels", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.map_table("db.orders", "archive.orders_2023").map_table("events", "events_v2");

    const auto decision = rules.decide(components("spark_catalog", "db", "orders"));
    CHECK(decision.catalog.is_keep());
    CHECK(decision.database == ComponentDecision::set_to("archive"));
    CHECK(decision.name == ComponentDecision::set_to("orders_2023"));

    const auto bare = rules.decide(components(std::nullopt, "db", "events"));
    CHECK(bare.database.is_keep());
    CHECK(bare.name == ComponentDecision::set_to("events_v2"));

    CHECK(rules.decide(components(std::nullopt, "other", "orders")).name.is_keep());
}

TEST_CASE("MappingRules applies the first matching table rule only", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.map_table("db.t", "db.first").map_table("t", "second");

    CHECK(rules.decide(components(std::nullopt, "db", "t")).name == ComponentDecision::set_to("first"));
    CHECK(rules.decide(components(std::nullopt, "x", "t")).name == ComponentDecision::set_to("second"));
}

TEST_CASE("MappingRules applies table rules before database renames", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.map_database("landing", "curated").map_table("raw.t", "landing.t");

    CHECK(rules.decide(components(std::nullopt, "raw", "t")).database == ComponentDecision::set_to("curated"));
}

TEST_CASE("MappingRules accepts quoted rule text", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.map_database("`my-db`", "`new db`");

    CHECK(rules.decide(components(std::nullopt, "my-db", "t")).database == ComponentDecision::set_to("new db"));
}

TEST_CASE("MappingRules rejects malformed rule text", "[rewrite][mapping]")
{
    MappingRules rules{};
    CHECK_THROWS_AS(rules.map_database("select", "x"), std::invalid_argument);
    CHECK_THROWS_AS(rules.map_database("a.b", "x"), std::invalid_argument);
    CHECK_THROWS_AS(rules.map_catalog("``", "x"), std::invalid_argument);
    CHECK_THROWS_AS(rules.map_table("a.b.c.d", "x"), std::invalid_argument);
    CHECK_THROWS_AS(rules.map_table("a.``", "x"), std::invalid_argument);
    CHECK_THROWS_AS(rules.set_default_catalog(""), std::invalid_argument);
    CHECK_THROWS_AS(rules.prefix_database(""), std::invalid_argument);
    CHECK(rules.empty());
}

TEST_CASE("MappingRules drives the rewriter", "[rewrite][mapping]")
{
    MappingRules rules{};
    rules.map_database("db", "new_db").set_default_catalog("spark_catalog");

    const retable::rewrite::TableIdentifierRewriter rewriter{rules.to_function()};
    CHECK(rewriter.rewrite("SELECT * FROM db.table JOIN other.t ON TRUE")
          == "SELECT * FROM spark_catalog.new_db.table JOIN spark_catalog.other.t ON TRUE");
}
