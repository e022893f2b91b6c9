#include "retable/parser/parser_errors.hpp"

namespace retable::parser {

namespace {

class ParserErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "retable.parser";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ParserErrc>(condition)) {
        case ParserErrc::Success:
            return "success";
        case ParserErrc::RenderFailed:
            return "failed to render SQL";
        default:
            return "unknown parser error";
        }
    }
};

const ParserErrorCategory kCategory{};

}  // namespace

const std::error_category& parser_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ParserErrc value) noexcept
{
    return {static_cast<int>(value), parser_error_category()};
}

RenderError::RenderError(const std::string& what)
    : std::system_error(make_error_code(ParserErrc::RenderFailed), what)
{
}

}  // namespace retable::parser
