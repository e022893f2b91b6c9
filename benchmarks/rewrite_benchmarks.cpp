#include "retable/rewrite/mapping_rules.hpp"
#include "retable/rewrite/table_identifier_rewriter.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string_view>
#include <system_error>

namespace
{

using Clock = std::chrono::steady_clock;

struct Scenario final {
    std::string_view name;
    std::string_view sql;
};

constexpr std::string_view single_table_query = "SELECT * FROM analytics.events";

constexpr std::string_view reporting_query = R"(WITH recent AS (
    SELECT e.visitor_id, COUNT(*) AS hits
    FROM analytics.events e
    JOIN analytics.sessions s ON s.visitor_id = e.visitor_id
    WHERE e.created_at > '2024-01-01'
    GROUP BY e.visitor_id
)
SELECT r.visitor_id, r.hits, v.country
FROM recent r
LEFT JOIN crm.visitors v ON v.id = r.visitor_id
WHERE r.visitor_id IN (SELECT visitor_id FROM crm.allow_list)
  AND NOT EXISTS (SELECT 1 FROM crm.block_list b WHERE b.id = r.visitor_id)
ORDER BY r.hits DESC
LIMIT 100
)";

constexpr std::string_view union_query = R"(SELECT id FROM warehouse.sales.orders_2023
UNION ALL
SELECT id FROM warehouse.sales.orders_2024
UNION ALL
SELECT id FROM (SELECT id FROM staging.orders WHERE id > 10) pending
)";

constexpr std::string_view window_query = R"(SELECT v.id, SUM(v.amount) OVER (PARTITION BY v.region ORDER BY v.day ROWS BETWEEN 6 PRECEDING AND CURRENT ROW)
FROM (warehouse.sales.daily v JOIN analytics.regions r ON r.id = v.region)
CROSS JOIN VALUES (1), (2) AS k (n)
WHERE v.note <> "n/a"
)";

constexpr std::array scenarios{
    Scenario{"single_table", single_table_query},
    Scenario{"reporting", reporting_query},
    Scenario{"union", union_query},
    Scenario{"window", window_query},
};

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: retable_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }

    return default_iterations;
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t references = 0U;
    std::size_t rewritten = 0U;
    std::size_t failures = 0U;
    std::size_t output_bytes = 0U;
    Clock::duration elapsed{};
};

BenchmarkSummary run_scenario(const Scenario& scenario,
                              const retable::rewrite::TableIdentifierRewriter& rewriter,
                              std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        try {
            const auto result = rewriter.rewrite_with_report(scenario.sql);
            summary.references += result.report.references_visited;
            summary.rewritten += result.report.references_rewritten;
            summary.output_bytes += result.sql.size();
        } catch (const std::system_error& error) {
            // Parse, rewrite and render failures all derive from system_error.
            std::cerr << scenario.name << ": " << error.what() << "\n";
            ++summary.failures;
        }
    }
    const auto stop = Clock::now();
    summary.elapsed = stop - start;

    return summary;
}

void report_summary(const Scenario& scenario, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto statements_per_second = seconds > 0.0 ? static_cast<double>(summary.iterations) / seconds : 0.0;
    const auto references_per_statement = summary.iterations > 0U
                                              ? static_cast<double>(summary.references) / summary.iterations
                                              : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << scenario.name << "\n";
    std::cout << "  Statements: " << summary.iterations << "\n";
    std::cout << "  References/statement: " << references_per_statement << "\n";
    std::cout << "  Rewritten/statement: "
              << (summary.iterations > 0U ? static_cast<double>(summary.rewritten) / summary.iterations : 0.0)
              << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Statements/s: " << statements_per_second << "\n";
    std::cout << "  Output bytes: " << summary.output_bytes << "\n";
    if (summary.failures > 0U) {
        std::cout << "  Failures: " << summary.failures << "\n";
    }
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 1000U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);

    retable::rewrite::MappingRules rules{};
    rules.map_database("analytics", "analytics_v2").map_catalog("warehouse", "lake").set_default_catalog("spark_catalog");

    const retable::rewrite::TableIdentifierRewriter rewriter{rules.to_function()};
    std::size_t failures = 0U;
    for (const auto& scenario : scenarios) {
        auto summary = run_scenario(scenario, rewriter, iterations);
        report_summary(scenario, summary);
        failures += summary.failures;
    }

    return failures == 0U ? EXIT_SUCCESS : EXIT_FAILURE;
}
