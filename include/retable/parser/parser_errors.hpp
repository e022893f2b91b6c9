#pragma once

#include <string>
#include <system_error>

namespace retable::parser {

enum class ParserErrc {
    Success = 0,
    RenderFailed
};

const std::error_category& parser_error_category() noexcept;
std::error_code make_error_code(ParserErrc value) noexcept;

// Raised by the renderer for a tree it cannot serialise, such as a table
// reference without a name.
class RenderError final : public std::system_error {
public:
    explicit RenderError(const std::string& what);
};

}  // namespace retable::parser

namespace std {

template <>
struct is_error_code_enum<retable::parser::ParserErrc> : true_type {
};

}  // namespace std
