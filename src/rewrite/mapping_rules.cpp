#include "retable/rewrite/mapping_rules.hpp"
#include "retable/parser/grammar.hpp"

#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace retable::rewrite {
namespace {

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }

    return true;
}

std::string rule_error(std::string_view rule, std::string_view text, const std::vector<parser::ParserDiagnostic>& diagnostics)
{
    std::string message = std::string{rule} + ": invalid name '" + std::string{text} + "'";
    if (!diagnostics.empty()) {
        message += " (" + diagnostics.front().message + ")";
    }
    return message;
}

std::string parse_single_identifier(std::string_view rule, std::string_view text)
{
    auto parsed = parser::parse_identifier(text);
    if (!parsed.success()) {
        throw std::invalid_argument{rule_error(rule, text, parsed.diagnostics)};
    }
    if (parsed.ast->value.empty()) {
        throw std::invalid_argument{std::string{rule} + ": name must not be empty"};
    }
    return std::move(parsed.ast->value);
}

std::vector<parser::Identifier> parse_table_path(std::string_view rule, std::string_view text)
{
    auto parsed = parser::parse_qualified_name(text);
    if (!parsed.success()) {
        throw std::invalid_argument{rule_error(rule, text, parsed.diagnostics)};
    }

    auto parts = std::move(parsed.ast->parts);
    if (parts.empty() || parts.size() > 3U) {
        throw std::invalid_argument{std::string{rule} + ": '" + std::string{text}
                                    + "' must name one to three levels"};
    }
    for (const auto& part : parts) {
        if (part.value.empty()) {
            throw std::invalid_argument{std::string{rule} + ": '" + std::string{text} + "' has an empty part"};
        }
    }
    return parts;
}

// Working copy as catalog, database, name.
using Levels = std::array<std::optional<std::string>, 3U>;

bool matches_tail(const Levels& levels, const std::vector<parser::Identifier>& pattern)
{
    const auto offset = levels.size() - pattern.size();
    for (std::size_t index = 0; index < pattern.size(); ++index) {
        const auto& level = levels[offset + index];
        if (!level || !iequals(*level, pattern[index].value)) {
            return false;
        }
    }
    return true;
}

ComponentDecision decide_level(const std::optional<std::string>& original, const std::optional<std::string>& target)
{
    if (original == target) {
        return ComponentDecision::keep();
    }
    if (!target) {
        return ComponentDecision::clear();
    }
    return ComponentDecision::set_to(*target);
}

}  // namespace

MappingRules& MappingRules::map_catalog(std::string_view from, std::string_view to)
{
    RenameRule rule{};
    rule.from = parse_single_identifier("map_catalog", from);
    rule.to = parse_single_identifier("map_catalog", to);
    catalog_rules_.push_back(std::move(rule));
    return *this;
}

MappingRules& MappingRules::map_database(std::string_view from, std::string_view to)
{
    RenameRule rule{};
    rule.from = parse_single_identifier("map_database", from);
    rule.to = parse_single_identifier("map_database", to);
    database_rules_.push_back(std::move(rule));
    return *this;
}

MappingRules& MappingRules::map_table(std::string_view from, std::string_view to)
{
    TableRule rule{};
    rule.from = parse_table_path("map_table", from);
    rule.to = parse_table_path("map_table", to);
    table_rules_.push_back(std::move(rule));
    return *this;
}

MappingRules& MappingRules::set_default_catalog(std::string_view catalog)
{
    default_catalog_ = parse_single_identifier("set_default_catalog", catalog);
    return *this;
}

MappingRules& MappingRules::drop_catalog()
{
    drop_catalog_ = true;
    return *this;
}

MappingRules& MappingRules::prefix_database(std::string_view prefix)
{
    if (prefix.empty()) {
        throw std::invalid_argument{"prefix_database: prefix must not be empty"};
    }
    database_prefix_ = std::string{prefix};
    return *this;
}

ReplacementDecision MappingRules::decide(const TableComponents& components) const
{
    Levels levels{components.catalog, components.database, components.name};

    for (const auto& rule : table_rules_) {
        if (!matches_tail(levels, rule.from)) {
            continue;
        }
        const auto offset = levels.size() - rule.to.size();
        for (std::size_t index = 0; index < rule.to.size(); ++index) {
            levels[offset + index] = rule.to[index].value;
        }
        break;
    }

    auto& catalog = levels[0];
    auto& database = levels[1];

    if (catalog) {
        for (const auto& rule : catalog_rules_) {
            if (iequals(*catalog, rule.from)) {
                catalog = rule.to;
                break;
            }
        }
    }

    if (database) {
        for (const auto& rule : database_rules_) {
            if (iequals(*database, rule.from)) {
                database = rule.to;
                break;
            }
        }
    }

    if (default_catalog_ && !catalog && database) {
        catalog = default_catalog_;
    }

    if (drop_catalog_) {
        catalog.reset();
    }

    if (!database_prefix_.empty() && database) {
        database = database_prefix_ + *database;
    }

    ReplacementDecision decision{};
    decision.catalog = decide_level(components.catalog, levels[0]);
    decision.database = decide_level(components.database, levels[1]);
    decision.name = decide_level(components.name, levels[2]);
    return decision;
}

ReplacementFunction MappingRules::to_function() const
{
    return [rules = *this](const TableComponents& components) { return rules.decide(components); };
}

bool MappingRules::empty() const noexcept
{
    return table_rules_.empty() && catalog_rules_.empty() && database_rules_.empty() && !default_catalog_
           && !drop_catalog_ && database_prefix_.empty();
}

}  // namespace retable::rewrite
