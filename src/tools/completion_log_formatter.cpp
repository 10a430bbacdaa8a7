#include "sqlsense/tools/completion_log_formatter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    constexpr char kHex[] = "0123456789ABCDEF";
    out.push_back('"');
    for (const unsigned char ch : text) {
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

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

class JsonObject final {
public:
    JsonObject() { json_.push_back('{'); }

    void string_field(const char* name, std::string_view value)
    {
        key(name);
        append_json_string(json_, value);
    }

    template <typename Number>
    void number_field(const char* name, Number value)
    {
        key(name);
        json_.append(std::to_string(value));
    }

    void timestamp_field(const char* name, std::chrono::system_clock::time_point tp)
    {
        const auto text = format_timestamp_iso(tp);
        key(name);
        if (text.empty()) {
            json_.append("null");
        } else {
            append_json_string(json_, text);
        }
    }

    void string_array_field(const char* name, const std::vector<std::string>& values)
    {
        key(name);
        json_.push_back('[');
        for (std::size_t i = 0U; i < values.size(); ++i) {
            if (i > 0U) {
                json_.push_back(',');
            }
            append_json_string(json_, values[i]);
        }
        json_.push_back(']');
    }

    void raw_field(const char* name, std::string_view json)
    {
        key(name);
        json_.append(json);
    }

    [[nodiscard]] std::string finish()
    {
        json_.push_back('}');
        return std::move(json_);
    }

private:
    void key(const char* name)
    {
        if (!first_) {
            json_.push_back(',');
        }
        first_ = false;
        append_json_string(json_, name);
        json_.push_back(':');
    }

    std::string json_{};
    bool first_ = true;
};

[[nodiscard]] std::string_view catalog_severity_to_string(sqlsense::catalog::DiagnosticSeverity severity) noexcept
{
    switch (severity) {
    case sqlsense::catalog::DiagnosticSeverity::Info:
        return "info";
    case sqlsense::catalog::DiagnosticSeverity::Warning:
        return "warning";
    case sqlsense::catalog::DiagnosticSeverity::Error:
    default:
        return "error";
    }
}

[[nodiscard]] std::string_view context_severity_to_string(sqlsense::parser::ContextSeverity severity) noexcept
{
    return severity == sqlsense::parser::ContextSeverity::Info ? "info" : "warning";
}

}  // namespace

namespace sqlsense::tools {

std::string format_completion_log_json(const sqlsense::shell::CompletionMetrics& metrics)
{
    JsonObject object;
    object.string_field("event", "completion");
    object.string_field("correlation_id", metrics.correlation_id);
    object.string_field("mode", metrics.smart ? "smart" : "dumb");
    object.string_field("text", metrics.text);
    object.number_field("cursor", metrics.cursor);
    object.string_field("word", metrics.word);
    object.string_array_field("suggestions", metrics.suggestion_kinds);
    object.number_field("completion_count", metrics.completions.size());
    object.string_array_field("completions", metrics.completions);
    object.number_field("duration_ms", metrics.duration_ms);
    object.timestamp_field("started_at", metrics.started_at);
    object.timestamp_field("finished_at", metrics.finished_at);

    std::string diagnostics{"["};
    for (std::size_t i = 0U; i < metrics.diagnostics.size(); ++i) {
        if (i > 0U) {
            diagnostics.push_back(',');
        }
        const auto& diagnostic = metrics.diagnostics[i];
        JsonObject entry;
        entry.string_field("severity", context_severity_to_string(diagnostic.severity));
        entry.string_field("message", diagnostic.message);
        entry.number_field("offset", diagnostic.offset);
        diagnostics.append(entry.finish());
    }
    diagnostics.push_back(']');
    object.raw_field("diagnostics", diagnostics);

    return object.finish();
}

std::string format_catalog_diagnostic_json(const sqlsense::catalog::CatalogDiagnostic& diagnostic)
{
    JsonObject object;
    object.string_field("event", "catalog");
    object.string_field("severity", catalog_severity_to_string(diagnostic.severity));
    object.string_field("message", diagnostic.message);
    if (diagnostic.error) {
        object.string_field("error", diagnostic.error.message());
        object.string_field("category", diagnostic.error.category().name());
    } else {
        object.raw_field("error", "null");
    }
    object.string_field("schema", diagnostic.schema);
    object.string_field("relation", diagnostic.relation);
    object.timestamp_field("logged_at", std::chrono::system_clock::now());
    return object.finish();
}

std::string format_loader_diagnostic_json(const sqlsense::shell::LoaderDiagnostic& diagnostic)
{
    JsonObject object;
    object.string_field("event", "metadata_loader");
    object.number_field("line", diagnostic.line);
    object.string_field("message", diagnostic.message);
    object.string_field("text", diagnostic.text);
    object.timestamp_field("logged_at", std::chrono::system_clock::now());
    return object.finish();
}

}  // namespace sqlsense::tools
