#include "retable/parser/identifier_quoting.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace retable::parser {
namespace {

// Kept in sync with reserved_keyword in grammar.cpp.
constexpr std::array<std::string_view, 46> kReservedKeywords{
    "ALL",     "AND",     "AS",      "ASC",       "BETWEEN", "BY",     "CASE",   "CROSS",
    "DESC",    "DISTINCT", "ELSE",   "END",       "EXCEPT",  "EXISTS", "FALSE",  "FROM",
    "FULL",    "GROUP",   "HAVING",  "IN",        "INNER",   "INTERSECT", "IS",  "JOIN",
    "LEFT",    "LIKE",    "LIMIT",   "NATURAL",   "NOT",     "NULL",   "OFFSET", "ON",
    "OR",      "ORDER",   "OUTER",   "RIGHT",     "SELECT",  "THEN",   "TRUE",   "UNION",
    "USING",   "WHEN",    "WHERE",   "WITH",      "ANTI",    "SEMI"};

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::toupper(left) != std::toupper(right)) {
            return false;
        }
    }

    return true;
}

}  // namespace

bool is_reserved_keyword(std::string_view text) noexcept
{
    return std::any_of(kReservedKeywords.begin(), kReservedKeywords.end(), [text](std::string_view keyword) {
        return iequals(keyword, text);
    });
}

bool requires_quotes(std::string_view text) noexcept
{
    if (text.empty()) {
        return true;
    }

    if (std::isdigit(static_cast<unsigned char>(text.front())) != 0) {
        return true;
    }

    for (const char ch : text) {
        const auto unsigned_ch = static_cast<unsigned char>(ch);
        if (std::isalnum(unsigned_ch) == 0 && ch != '_') {
            return true;
        }
    }

    return is_reserved_keyword(text);
}

std::string quote_identifier(std::string_view text)
{
    std::string result;
    result.reserve(text.size() + 2U);
    result.push_back(kIdentifierQuote);
    for (const char ch : text) {
        if (ch == kIdentifierQuote) {
            result.push_back(kIdentifierQuote);
        }
        result.push_back(ch);
    }
    result.push_back(kIdentifierQuote);
    return result;
}

std::string format_identifier(const Identifier& identifier, bool lowercase_unquoted)
{
    if (identifier.quoted) {
        return quote_identifier(identifier.value);
    }

    if (!lowercase_unquoted) {
        return identifier.value;
    }

    std::string result;
    result.reserve(identifier.value.size());
    for (unsigned char ch : identifier.value) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

}  // namespace retable::parser
