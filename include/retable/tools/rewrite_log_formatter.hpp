#pragma once

#include "retable/parser/grammar.hpp"
#include "retable/rewrite/table_identifier_rewriter.hpp"

#include <string>

namespace retable::tools {

// One JSON object per line, for the CLI's --log-json output.
std::string format_rewrite_log_json(const retable::rewrite::RewriteReport& report);
std::string format_parse_failure_log_json(const retable::parser::ParserDiagnostic& diagnostic);

}  // namespace retable::tools
