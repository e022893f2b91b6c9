#pragma once

#include "retable/parser/relational/ast.hpp"

#include <cstddef>
#include <string>

namespace retable::parser {

struct RenderOptions final {
    // Clause per line with nested queries indented; single line otherwise.
    bool pretty = false;
    std::size_t indent_width = 2U;
    bool lowercase_unquoted_identifiers = false;
};

// Serialises a statement back to SQL. Keywords are upper-cased, aliases are
// written with AS and comments from the source are not preserved. Quoted
// identifiers keep their backticks.
//
// Throws RenderError for a table reference without a name.
[[nodiscard]] std::string render_select(const relational::SelectStatement& statement,
                                        const RenderOptions& options = {});

[[nodiscard]] std::string render_expression(const relational::Expression& expression,
                                            const RenderOptions& options = {});

}  // namespace retable::parser
