#include "retable/rewrite/rewrite_telemetry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace retable::rewrite {
namespace {

RewriteTelemetrySnapshot& accumulate(RewriteTelemetrySnapshot& target, const RewriteTelemetrySnapshot& source)
{
    target.statements_attempted += source.statements_attempted;
    target.statements_succeeded += source.statements_succeeded;
    target.statements_failed += source.statements_failed;
    target.parse_failures += source.parse_failures;
    target.references_visited += source.references_visited;
    target.references_skipped += source.references_skipped;
    target.references_rewritten += source.references_rewritten;
    target.total_rewrite_duration_ns += source.total_rewrite_duration_ns;
    target.last_rewrite_duration_ns = std::max(target.last_rewrite_duration_ns, source.last_rewrite_duration_ns);
    return target;
}

}  // namespace

void RewriteTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void RewriteTelemetry::record_statement_attempt() noexcept
{
    add_relaxed(statements_attempted_, 1U);
}

void RewriteTelemetry::record_parse_failure() noexcept
{
    add_relaxed(parse_failures_, 1U);
}

void RewriteTelemetry::record_statement_result(bool success,
                                               std::uint64_t rewrite_duration_ns,
                                               std::size_t references_visited,
                                               std::size_t references_skipped,
                                               std::size_t references_rewritten) noexcept
{
    add_relaxed(success ? statements_succeeded_ : statements_failed_, 1U);
    add_relaxed(references_visited_, static_cast<std::uint64_t>(references_visited));
    add_relaxed(references_skipped_, static_cast<std::uint64_t>(references_skipped));
    add_relaxed(references_rewritten_, static_cast<std::uint64_t>(references_rewritten));
    add_relaxed(total_rewrite_duration_ns_, rewrite_duration_ns);
    last_rewrite_duration_ns_.store(rewrite_duration_ns, std::memory_order_relaxed);
}

RewriteTelemetrySnapshot RewriteTelemetry::snapshot() const noexcept
{
    RewriteTelemetrySnapshot snapshot{};
    snapshot.statements_attempted = statements_attempted_.load(std::memory_order_relaxed);
    snapshot.statements_succeeded = statements_succeeded_.load(std::memory_order_relaxed);
    snapshot.statements_failed = statements_failed_.load(std::memory_order_relaxed);
    snapshot.parse_failures = parse_failures_.load(std::memory_order_relaxed);
    snapshot.references_visited = references_visited_.load(std::memory_order_relaxed);
    snapshot.references_skipped = references_skipped_.load(std::memory_order_relaxed);
    snapshot.references_rewritten = references_rewritten_.load(std::memory_order_relaxed);
    snapshot.total_rewrite_duration_ns = total_rewrite_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_rewrite_duration_ns = last_rewrite_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void RewriteTelemetry::reset() noexcept
{
    statements_attempted_.store(0U, std::memory_order_relaxed);
    statements_succeeded_.store(0U, std::memory_order_relaxed);
    statements_failed_.store(0U, std::memory_order_relaxed);
    parse_failures_.store(0U, std::memory_order_relaxed);
    references_visited_.store(0U, std::memory_order_relaxed);
    references_skipped_.store(0U, std::memory_order_relaxed);
    references_rewritten_.store(0U, std::memory_order_relaxed);
    total_rewrite_duration_ns_.store(0U, std::memory_order_relaxed);
    last_rewrite_duration_ns_.store(0U, std::memory_order_relaxed);
}

void RewriteTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }

    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void RewriteTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

RewriteTelemetrySnapshot RewriteTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    RewriteTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        accumulate(total, sampler());
    }
    return total;
}

void RewriteTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    for (const auto& [identifier, sampler] : entries) {
        visitor(identifier, sampler());
    }
}

}  // namespace retable::rewrite
