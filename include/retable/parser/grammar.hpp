#pragma once

#include "retable/parser/ast.hpp"
#include "retable/parser/relational/ast.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retable::parser {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::size_t offset = 0U;
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

template <typename T>
struct ParseResult final {
    std::optional<T> ast{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return ast.has_value(); }
};

ParseResult<Identifier> parse_identifier(std::string_view input);

// Dot separated identifier path such as `catalog.db.table`; parts may be
// backtick quoted.
ParseResult<QualifiedName> parse_qualified_name(std::string_view input);

struct SelectParseResult final {
    relational::AstArena arena{};
    relational::SelectStatement* statement = nullptr;
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return statement != nullptr; }
};

// Parses exactly one read query (optionally prefixed by a WITH clause and
// terminated by a semicolon).
SelectParseResult parse_select(std::string_view input);

}  // namespace retable::parser
