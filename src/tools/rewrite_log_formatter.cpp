#include "retable/tools/rewrite_log_formatter.hpp"

#include <optional>
#include <string_view>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

[[nodiscard]] std::string parser_severity_to_string(retable::parser::ParserSeverity severity)
{
    switch (severity) {
    case retable::parser::ParserSeverity::Info:
        return "info";
    case retable::parser::ParserSeverity::Warning:
        return "warning";
    case retable::parser::ParserSeverity::Error:
    default:
        return "error";
    }
}

class JsonObjectWriter final {
public:
    explicit JsonObjectWriter(std::string& out) : out_(out) { out_.push_back('{'); }

    void field(const char* name)
    {
        if (!first_) {
            out_.push_back(',');
        }
        first_ = false;
        out_.push_back('"');
        out_.append(name);
        out_.push_back('"');
        out_.push_back(':');
    }

    void string_field(const char* name, std::string_view value)
    {
        field(name);
        append_json_string(out_, value);
    }

    void optional_string_field(const char* name, const std::optional<std::string>& value)
    {
        field(name);
        if (value) {
            append_json_string(out_, *value);
        } else {
            out_.append("null");
        }
    }

    template <typename Number>
    void number_field(const char* name, Number value)
    {
        field(name);
        out_.append(std::to_string(value));
    }

    void bool_field(const char* name, bool value)
    {
        field(name);
        out_.append(value ? "true" : "false");
    }

    void close() { out_.push_back('}'); }

private:
    std::string& out_;
    bool first_ = true;
};

void append_components(std::string& json, const retable::rewrite::TableComponents& components)
{
    JsonObjectWriter writer{json};
    writer.optional_string_field("catalog", components.catalog);
    writer.optional_string_field("database", components.database);
    writer.optional_string_field("name", components.name);
    writer.close();
}

}  // namespace

namespace retable::tools {

std::string format_rewrite_log_json(const retable::rewrite::RewriteReport& report)
{
    std::string json;
    json.reserve(256U + report.traces.size() * 160U);

    JsonObjectWriter writer{json};
    writer.bool_field("success", true);
    writer.number_field("duration_ns", report.duration_ns);
    writer.number_field("references_visited", report.references_visited);
    writer.number_field("references_skipped", report.references_skipped);
    writer.number_field("references_rewritten", report.references_rewritten);

    writer.field("references");
    json.push_back('[');
    for (std::size_t i = 0; i < report.traces.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& trace = report.traces[i];
        JsonObjectWriter entry{json};
        entry.string_field("outcome", retable::rewrite::reference_outcome_to_string(trace.outcome));
        entry.number_field("query_depth", trace.query_depth);
        entry.field("original");
        append_components(json, trace.original);
        entry.field("result");
        append_components(json, trace.result);
        entry.close();
    }
    json.push_back(']');

    writer.close();
    return json;
}

std::string format_parse_failure_log_json(const retable::parser::ParserDiagnostic& diagnostic)
{
    std::string json;
    json.reserve(256U);

    JsonObjectWriter writer{json};
    writer.bool_field("success", false);
    writer.field("diagnostic");

    JsonObjectWriter detail{json};
    detail.string_field("severity", parser_severity_to_string(diagnostic.severity));
    detail.string_field("message", diagnostic.message);
    detail.number_field("line", diagnostic.line);
    detail.number_field("column", diagnostic.column);
    detail.string_field("statement", diagnostic.statement);
    detail.field("remediation_hints");
    json.push_back('[');
    for (std::size_t hint_index = 0; hint_index < diagnostic.remediation_hints.size(); ++hint_index) {
        if (hint_index > 0U) {
            json.push_back(',');
        }
        append_json_string(json, diagnostic.remediation_hints[hint_index]);
    }
    json.push_back(']');
    detail.close();

    writer.close();
    return json;
}

}  // namespace retable::tools
