#include "retable/tools/retable_command.hpp"

#include "retable/rewrite/mapping_rules.hpp"
#include "retable/rewrite/rewrite_errors.hpp"
#include "retable/rewrite/table_identifier_rewriter.hpp"
#include "retable/tools/rewrite_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace retable::tools {
namespace {

struct CliOptions final {
    std::string sql{};
    bool sql_given = false;
    std::string file{};
    std::vector<std::string> catalog_mappings{};
    std::vector<std::string> database_mappings{};
    std::vector<std::string> table_mappings{};
    std::string default_catalog{};
    bool drop_catalog = false;
    std::string database_prefix{};
    bool include_unqualified = false;
    bool pretty = false;
    bool lowercase_identifiers = false;
    bool log_json = false;
};

std::pair<std::string, std::string> split_mapping(std::string_view option, const std::string& text)
{
    const auto separator = text.find('=');
    if (separator == std::string::npos || separator == 0U || separator + 1U == text.size()) {
        throw std::invalid_argument{std::string{option} + " expects FROM=TO, got '" + text + "'"};
    }
    return {text.substr(0, separator), text.substr(separator + 1U)};
}

rewrite::MappingRules build_rules(const CliOptions& options)
{
    rewrite::MappingRules rules{};
    for (const auto& mapping : options.table_mappings) {
        const auto [from, to] = split_mapping("--map-table", mapping);
        rules.map_table(from, to);
    }
    for (const auto& mapping : options.catalog_mappings) {
        const auto [from, to] = split_mapping("--map-catalog", mapping);
        rules.map_catalog(from, to);
    }
    for (const auto& mapping : options.database_mappings) {
        const auto [from, to] = split_mapping("--map-database", mapping);
        rules.map_database(from, to);
    }
    if (!options.default_catalog.empty()) {
        rules.set_default_catalog(options.default_catalog);
    }
    if (options.drop_catalog) {
        rules.drop_catalog();
    }
    if (!options.database_prefix.empty()) {
        rules.prefix_database(options.database_prefix);
    }
    return rules;
}

std::string read_input(const CliOptions& options, std::istream& in)
{
    if (options.sql_given) {
        if (options.sql.empty()) {
            throw std::invalid_argument{"--sql needs a non-empty query"};
        }
        return options.sql;
    }

    if (!options.file.empty()) {
        std::ifstream stream{options.file};
        if (!stream) {
            throw std::invalid_argument{"unable to open '" + options.file + "'"};
        }
        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

void print_diagnostic(const parser::ParserDiagnostic& diagnostic, std::ostream& err)
{
    err << "error: " << diagnostic.message;
    if (diagnostic.line != 0U) {
        err << " (line " << diagnostic.line << ", column " << diagnostic.column << ")";
    }
    err << '\n';
    for (const auto& hint : diagnostic.remediation_hints) {
        err << "  hint: " << hint << '\n';
    }
}

}  // namespace

int run_retable_command(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err)
{
    CLI::App app{"Rewrite table identifiers in a SQL query", "retable"};

    CliOptions options{};
    auto* sql_option = app.add_option("--sql", options.sql, "SQL text to rewrite");
    auto* file_option = app.add_option("-f,--file", options.file, "Read the SQL from a file")
                            ->check(CLI::ExistingFile);
    sql_option->excludes(file_option);
    app.add_option("--map-catalog", options.catalog_mappings, "Rename a catalog (FROM=TO)");
    app.add_option("--map-database", options.database_mappings, "Rename a database (FROM=TO)");
    app.add_option("--map-table", options.table_mappings, "Rename a table (DB.TABLE=DB2.TABLE2)");
    app.add_option("--default-catalog", options.default_catalog, "Catalog added to references without one");
    app.add_flag("--drop-catalog", options.drop_catalog, "Remove catalog qualification");
    app.add_option("--database-prefix", options.database_prefix, "Prefix prepended to every database");
    app.add_flag("--include-unqualified", options.include_unqualified, "Also rewrite bare table names");
    app.add_flag("--pretty", options.pretty, "Write one clause per line");
    app.add_flag("--lowercase-identifiers", options.lowercase_identifiers, "Lower-case unquoted identifiers");
    app.add_flag("--log-json", options.log_json, "Log a JSON rewrite report to stderr");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error, out, err) == 0 ? kExitSuccess : kExitUsageError;
    }
    options.sql_given = sql_option->count() > 0U;

    rewrite::TableIdentifierRewriter::Config config{};
    std::string input;
    try {
        auto rules = build_rules(options);
        if (rules.empty() && !options.log_json) {
            err << "warning: no mapping rules given; table names are only normalised\n";
        }
        config.replacement = rules.to_function();
        input = read_input(options, in);
    } catch (const std::invalid_argument& error) {
        err << "error: " << error.what() << '\n';
        return kExitUsageError;
    }

    config.include_unqualified = options.include_unqualified;
    config.render.pretty = options.pretty;
    config.render.lowercase_unquoted_identifiers = options.lowercase_identifiers;

    try {
        const rewrite::TableIdentifierRewriter rewriter{std::move(config)};
        const auto result = rewriter.rewrite_with_report(input);
        out << result.sql << '\n';
        if (options.log_json) {
            err << format_rewrite_log_json(result.report) << '\n';
        }
    } catch (const rewrite::ParseError& error) {
        if (options.log_json) {
            err << format_parse_failure_log_json(error.diagnostic()) << '\n';
        } else {
            print_diagnostic(error.diagnostic(), err);
        }
        return kExitParseError;
    } catch (const std::system_error& error) {
        err << "error: " << error.what() << '\n';
        return kExitParseError;
    }

    return kExitSuccess;
}

}  // namespace retable::tools
