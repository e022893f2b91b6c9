#pragma once

#include "retable/parser/ast.hpp"
#include "retable/rewrite/replacement.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retable::rewrite {

// Declarative table renames. Rules apply in a fixed order regardless of the
// order they were added: the first matching table rule, catalog renames,
// database renames, the default catalog, catalog removal and finally the
// database prefix. Names compare case-insensitively.
//
// Rule text is parsed as identifiers, so quoted parts such as `my-db`.t are
// accepted. Malformed text throws std::invalid_argument.
class MappingRules final {
public:
    MappingRules& map_catalog(std::string_view from, std::string_view to);
    MappingRules& map_database(std::string_view from, std::string_view to);
    // `from` and `to` hold one to three parts; `to` replaces the trailing
    // levels it names.
    MappingRules& map_table(std::string_view from, std::string_view to);
    // Added to references that have a database but no catalog.
    MappingRules& set_default_catalog(std::string_view catalog);
    MappingRules& drop_catalog();
    MappingRules& prefix_database(std::string_view prefix);

    [[nodiscard]] ReplacementDecision decide(const TableComponents& components) const;
    [[nodiscard]] ReplacementFunction to_function() const;

    [[nodiscard]] bool empty() const noexcept;

private:
    struct RenameRule final {
        std::string from{};
        std::string to{};
    };

    struct TableRule final {
        std::vector<parser::Identifier> from{};
        std::vector<parser::Identifier> to{};
    };

    std::vector<TableRule> table_rules_{};
    std::vector<RenameRule> catalog_rules_{};
    std::vector<RenameRule> database_rules_{};
    std::optional<std::string> default_catalog_{};
    bool drop_catalog_ = false;
    std::string database_prefix_{};
};

}  // namespace retable::rewrite
