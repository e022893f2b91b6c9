#include "retable/rewrite/table_identifier_rewriter.hpp"
#include "retable/parser/grammar.hpp"
#include "retable/parser/identifier_quoting.hpp"
#include "retable/rewrite/rewrite_errors.hpp"
#include "retable/rewrite/table_reference_collector.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>

namespace retable::rewrite {
namespace {

using parser::Identifier;
using parser::relational::SelectStatement;
using parser::relational::TableReference;

std::optional<std::string> value_of(const std::optional<Identifier>& identifier)
{
    if (!identifier) {
        return std::nullopt;
    }
    return identifier->value;
}

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point start)
{
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<std::uint64_t>(duration_ns.count());
}

std::optional<Identifier> resolve_component(const std::optional<Identifier>& original,
                                            const ComponentDecision& decision,
                                            std::string_view level,
                                            const TableReference& table)
{
    switch (decision.action()) {
    case ComponentDecision::Action::Keep:
        return original;
    case ComponentDecision::Action::Clear:
        return std::nullopt;
    case ComponentDecision::Action::SetTo:
        break;
    }

    const auto& value = decision.value();
    if (value.empty()) {
        throw RewriteError{RewriteErrc::InvalidQualification,
                           "replacement for '" + parser::relational::format_table_name(table) + "' sets an empty "
                               + std::string{level}};
    }

    if (original && original->value == value) {
        return original;
    }

    Identifier replacement{};
    replacement.value = value;
    replacement.quoted = (original && original->quoted) || parser::requires_quotes(value);
    return replacement;
}

bool same_identifier(const std::optional<Identifier>& lhs, const std::optional<Identifier>& rhs) noexcept
{
    if (lhs.has_value() != rhs.has_value()) {
        return false;
    }
    return !lhs || (lhs->value == rhs->value && lhs->quoted == rhs->quoted);
}

// Returns true when the reference changed.
bool apply_decision(TableReference& table, const ReplacementDecision& decision)
{
    auto catalog = resolve_component(table.catalog, decision.catalog, "catalog", table);
    auto database = resolve_component(table.database, decision.database, "database", table);
    auto name = resolve_component(table.name, decision.name, "table name", table);

    if (!name) {
        throw RewriteError{RewriteErrc::InvalidQualification,
                           "replacement for '" + parser::relational::format_table_name(table)
                               + "' removes the table name"};
    }

    if (catalog && !database) {
        throw RewriteError{RewriteErrc::InvalidQualification,
                           "replacement for '" + parser::relational::format_table_name(table)
                               + "' leaves a catalog without a database"};
    }

    const bool changed = !same_identifier(table.catalog, catalog) || !same_identifier(table.database, database)
                         || !same_identifier(table.name, name);

    table.catalog = std::move(catalog);
    table.database = std::move(database);
    table.name = std::move(name);
    return changed;
}

}  // namespace

std::string_view reference_outcome_to_string(ReferenceOutcome outcome) noexcept
{
    switch (outcome) {
    case ReferenceOutcome::Rewritten:
        return "rewritten";
    case ReferenceOutcome::Unchanged:
        return "unchanged";
    case ReferenceOutcome::SkippedUnqualified:
        return "skipped_unqualified";
    case ReferenceOutcome::SkippedCte:
        return "skipped_cte";
    }
    return "unknown";
}

TableComponents components_of(const TableReference& table)
{
    TableComponents components{};
    components.catalog = value_of(table.catalog);
    components.database = value_of(table.database);
    components.name = value_of(table.name);
    return components;
}

TableIdentifierRewriter::TableIdentifierRewriter(Config config)
    : config_(std::move(config))
{
    if (!config_.replacement) {
        throw std::invalid_argument{"TableIdentifierRewriter requires a replacement function"};
    }
}

TableIdentifierRewriter::TableIdentifierRewriter(ReplacementFunction replacement)
    : TableIdentifierRewriter(Config{std::move(replacement)})
{
}

std::string TableIdentifierRewriter::rewrite(std::string_view sql) const
{
    return rewrite_with_report(sql).sql;
}

RewriteResult TableIdentifierRewriter::rewrite_with_report(std::string_view sql) const
{
    auto* telemetry = config_.telemetry;
    if (telemetry != nullptr) {
        telemetry->record_statement_attempt();
    }

    const auto start = std::chrono::steady_clock::now();
    auto parsed = parser::parse_select(sql);
    if (!parsed.success()) {
        if (telemetry != nullptr) {
            telemetry->record_parse_failure();
            telemetry->record_statement_result(false, elapsed_ns(start), 0U, 0U, 0U);
        }

        parser::ParserDiagnostic diagnostic{};
        if (!parsed.diagnostics.empty()) {
            diagnostic = std::move(parsed.diagnostics.front());
        } else {
            diagnostic.message = "input did not parse as a SELECT statement";
        }
        throw ParseError{std::move(diagnostic)};
    }

    RewriteResult result{};
    try {
        result.report = apply(*parsed.statement);
        result.sql = parser::render_select(*parsed.statement, config_.render);
    } catch (...) {
        if (telemetry != nullptr) {
            telemetry->record_statement_result(false, elapsed_ns(start), 0U, 0U, 0U);
        }
        throw;
    }

    result.report.duration_ns = elapsed_ns(start);
    if (telemetry != nullptr) {
        telemetry->record_statement_result(true,
                                           result.report.duration_ns,
                                           result.report.references_visited,
                                           result.report.references_skipped,
                                           result.report.references_rewritten);
    }
    return result;
}

RewriteReport TableIdentifierRewriter::rewrite_statement(SelectStatement& statement) const
{
    auto* telemetry = config_.telemetry;
    if (telemetry != nullptr) {
        telemetry->record_statement_attempt();
    }

    const auto start = std::chrono::steady_clock::now();
    RewriteReport report{};
    try {
        report = apply(statement);
    } catch (...) {
        if (telemetry != nullptr) {
            telemetry->record_statement_result(false, elapsed_ns(start), 0U, 0U, 0U);
        }
        throw;
    }

    report.duration_ns = elapsed_ns(start);
    if (telemetry != nullptr) {
        telemetry->record_statement_result(true,
                                           report.duration_ns,
                                           report.references_visited,
                                           report.references_skipped,
                                           report.references_rewritten);
    }
    return report;
}

RewriteReport TableIdentifierRewriter::apply(SelectStatement& statement) const
{
    const TableReferenceCollector collector{};
    const auto sites = collector.collect(statement);

    RewriteReport report{};
    report.traces.reserve(sites.size());

    for (const auto& site : sites) {
        auto& table = *site.table;
        ++report.references_visited;

        RewriteTrace trace{};
        trace.original = components_of(table);
        trace.query_depth = site.query_depth;

        const bool qualified = table.database.has_value() && table.name.has_value();
        bool skipped = false;
        if (!qualified) {
            if (!config_.include_unqualified || !table.name) {
                trace.outcome = ReferenceOutcome::SkippedUnqualified;
                skipped = true;
            } else if (refers_to_cte(table, site.visible_ctes)) {
                trace.outcome = ReferenceOutcome::SkippedCte;
                skipped = true;
            }
        }

        if (skipped) {
            ++report.references_skipped;
        } else {
            trace.decision = config_.replacement(trace.original);
            if (apply_decision(table, trace.decision)) {
                trace.outcome = ReferenceOutcome::Rewritten;
                ++report.references_rewritten;
            } else {
                trace.outcome = ReferenceOutcome::Unchanged;
            }
        }

        trace.result = components_of(table);
        if (config_.trace_logger) {
            config_.trace_logger(trace);
        }
        report.traces.push_back(std::move(trace));
    }

    return report;
}

}  // namespace retable::rewrite
