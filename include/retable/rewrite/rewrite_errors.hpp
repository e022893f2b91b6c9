#pragma once

#include "retable/parser/grammar.hpp"

#include <string>
#include <system_error>

namespace retable::rewrite {

enum class RewriteErrc {
    Success = 0,
    ParseFailed,
    InvalidQualification
};

const std::error_category& rewrite_error_category() noexcept;
std::error_code make_error_code(RewriteErrc value) noexcept;

// Raised when the input cannot be parsed; the diagnostic keeps the position
// and offending token reported by the grammar.
class ParseError final : public std::system_error {
public:
    explicit ParseError(parser::ParserDiagnostic diagnostic);

    [[nodiscard]] const parser::ParserDiagnostic& diagnostic() const noexcept { return diagnostic_; }

private:
    parser::ParserDiagnostic diagnostic_;
};

class RewriteError final : public std::system_error {
public:
    RewriteError(RewriteErrc code, const std::string& what);
};

}  // namespace retable::rewrite

namespace std {

template <>
struct is_error_code_enum<retable::rewrite::RewriteErrc> : true_type {
};

}  // namespace std
