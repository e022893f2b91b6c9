#pragma once

#include "retable/parser/relational/ast.hpp"
#include "retable/parser/sql_renderer.hpp"
#include "retable/rewrite/replacement.hpp"
#include "retable/rewrite/rewrite_telemetry.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace retable::rewrite {

enum class ReferenceOutcome : std::uint8_t {
    Rewritten = 0,
    Unchanged,
    SkippedUnqualified,
    SkippedCte
};

[[nodiscard]] std::string_view reference_outcome_to_string(ReferenceOutcome outcome) noexcept;

// One record per table reference reached by a pass.
struct RewriteTrace final {
    TableComponents original{};
    // Default (all Keep) for skipped references.
    ReplacementDecision decision{};
    TableComponents result{};
    ReferenceOutcome outcome = ReferenceOutcome::Unchanged;
    std::size_t query_depth = 0U;
};

struct RewriteReport final {
    std::size_t references_visited = 0U;
    std::size_t references_skipped = 0U;
    std::size_t references_rewritten = 0U;
    std::uint64_t duration_ns = 0U;
    std::vector<RewriteTrace> traces{};
};

struct RewriteResult final {
    std::string sql{};
    RewriteReport report{};
};

[[nodiscard]] TableComponents components_of(const parser::relational::TableReference& table);

class TableIdentifierRewriter final {
public:
    using TraceLogger = std::function<void(const RewriteTrace&)>;

    struct Config final {
        ReplacementFunction replacement{};
        // Also offer bare table names (never CTE names) to the replacement.
        bool include_unqualified = false;
        parser::RenderOptions render{};
        RewriteTelemetry* telemetry = nullptr;
        TraceLogger trace_logger{};
    };

    explicit TableIdentifierRewriter(Config config);
    explicit TableIdentifierRewriter(ReplacementFunction replacement);

    // Parses one statement, rewrites its table references and renders it.
    // Throws ParseError for unparseable input and RewriteError when a decision
    // would produce an invalid qualification. Exceptions thrown by the
    // replacement function propagate unchanged.
    [[nodiscard]] std::string rewrite(std::string_view sql) const;
    [[nodiscard]] RewriteResult rewrite_with_report(std::string_view sql) const;

    // Rewrites `statement` in place. References already processed keep their
    // new value when a later one throws.
    RewriteReport rewrite_statement(parser::relational::SelectStatement& statement) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    RewriteReport apply(parser::relational::SelectStatement& statement) const;

    Config config_;
};

}  // namespace retable::rewrite
