#pragma once

#include "retable/parser/ast.hpp"

#include <string>
#include <string_view>

namespace retable::parser {

inline constexpr char kIdentifierQuote = '`';

// Case-insensitive check against the keywords the grammar refuses as
// unquoted identifiers.
[[nodiscard]] bool is_reserved_keyword(std::string_view text) noexcept;

// True when `text` cannot be written as a bare identifier.
[[nodiscard]] bool requires_quotes(std::string_view text) noexcept;

[[nodiscard]] std::string quote_identifier(std::string_view text);

// Writes the identifier the way it was parsed: backticks when quoted, verbatim
// otherwise.
[[nodiscard]] std::string format_identifier(const Identifier& identifier, bool lowercase_unquoted = false);

}  // namespace retable::parser
