#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace retable::rewrite {

struct RewriteTelemetrySnapshot final {
    std::uint64_t statements_attempted = 0U;
    std::uint64_t statements_succeeded = 0U;
    std::uint64_t statements_failed = 0U;
    std::uint64_t parse_failures = 0U;
    std::uint64_t references_visited = 0U;
    std::uint64_t references_skipped = 0U;
    std::uint64_t references_rewritten = 0U;
    std::uint64_t total_rewrite_duration_ns = 0U;
    std::uint64_t last_rewrite_duration_ns = 0U;
};

class RewriteTelemetry final {
public:
    void record_statement_attempt() noexcept;
    void record_parse_failure() noexcept;
    void record_statement_result(bool success,
                                 std::uint64_t rewrite_duration_ns,
                                 std::size_t references_visited,
                                 std::size_t references_skipped,
                                 std::size_t references_rewritten) noexcept;

    [[nodiscard]] RewriteTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;

    std::atomic<std::uint64_t> statements_attempted_{0U};
    std::atomic<std::uint64_t> statements_succeeded_{0U};
    std::atomic<std::uint64_t> statements_failed_{0U};
    std::atomic<std::uint64_t> parse_failures_{0U};
    std::atomic<std::uint64_t> references_visited_{0U};
    std::atomic<std::uint64_t> references_skipped_{0U};
    std::atomic<std::uint64_t> references_rewritten_{0U};
    std::atomic<std::uint64_t> total_rewrite_duration_ns_{0U};
    std::atomic<std::uint64_t> last_rewrite_duration_ns_{0U};
};

class RewriteTelemetryRegistry final {
public:
    using Sampler = std::function<RewriteTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const RewriteTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] RewriteTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Sampler> samplers_{};
};

}  // namespace retable::rewrite
