#include "retable/rewrite/rewrite_errors.hpp"

#include <utility>

namespace retable::rewrite {

namespace {

class RewriteErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "retable.rewrite";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<RewriteErrc>(condition)) {
        case RewriteErrc::Success:
            return "success";
        case RewriteErrc::ParseFailed:
            return "failed to parse SQL";
        case RewriteErrc::InvalidQualification:
            return "invalid table qualification";
        default:
            return "unknown rewrite error";
        }
    }
};

const RewriteErrorCategory kCategory{};

std::string describe_diagnostic(const parser::ParserDiagnostic& diagnostic)
{
    std::string text = diagnostic.message;
    if (diagnostic.line != 0U) {
        text += " (line " + std::to_string(diagnostic.line) + ", column " + std::to_string(diagnostic.column) + ")";
    }
    return text;
}

}  // namespace

const std::error_category& rewrite_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(RewriteErrc value) noexcept
{
    return {static_cast<int>(value), rewrite_error_category()};
}

ParseError::ParseError(parser::ParserDiagnostic diagnostic)
    : std::system_error(make_error_code(RewriteErrc::ParseFailed), describe_diagnostic(diagnostic))
    , diagnostic_(std::move(diagnostic))
{
}

RewriteError::RewriteError(RewriteErrc code, const std::string& what)
    : std::system_error(make_error_code(code), what)
{
}

}  // namespace retable::rewrite
