#include "sqlsense/shell/metadata_loader.hpp"

#include "sqlsense/catalog/identifier_normalizer.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <istream>
#include <iterator>
#include <utility>

using sqlsense::catalog::MetadataCatalog;
using sqlsense::catalog::MetadataRow;
using sqlsense::catalog::ObjectKind;
using sqlsense::catalog::VocabularyKind;

namespace sqlsense::shell {

namespace {

struct DirectiveInfo final {
    std::string_view keyword;
    MetadataDirective directive;
    std::size_t min_arguments;
    std::size_t max_arguments;
};

constexpr std::size_t kUnbounded = static_cast<std::size_t>(-1);

constexpr std::array<DirectiveInfo, 11> kDirectives{{
    {"database", MetadataDirective::Database, 1U, 1U},
    {"schema", MetadataDirective::Schema, 1U, 1U},
    {"use", MetadataDirective::Use, 1U, 1U},
    {"table", MetadataDirective::Table, 2U, 2U},
    {"view", MetadataDirective::View, 2U, 2U},
    {"column", MetadataDirective::Column, 3U, 3U},
    {"view_column", MetadataDirective::ViewColumn, 3U, 3U},
    {"function", MetadataDirective::Function, 2U, 2U},
    {"user", MetadataDirective::User, 1U, 1U},
    {"show", MetadataDirective::Show, 1U, kUnbounded},
    {"change", MetadataDirective::Change, 1U, kUnbounded},
}};

[[nodiscard]] const DirectiveInfo& directive_info(MetadataDirective directive) noexcept
{
    return kDirectives[static_cast<std::size_t>(directive)];
}

[[nodiscard]] std::string trim(std::string_view text)
{
    std::size_t begin = 0U;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return std::string{text.substr(begin, end - begin)};
}

[[nodiscard]] bool is_comment(std::string_view line) noexcept
{
    return line.starts_with('#') || line.starts_with("--");
}

// Splits on whitespace; a double quoted run stays one field, quotes included.
[[nodiscard]] std::optional<std::vector<std::string>> split_fields(std::string_view line)
{
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    bool in_field = false;

    for (const char ch : line) {
        if (quoted) {
            current.push_back(ch);
            if (ch == '"') {
                quoted = false;
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            if (in_field) {
                fields.push_back(std::move(current));
                current.clear();
                in_field = false;
            }
            continue;
        }
        if (ch == '"') {
            quoted = true;
        }
        current.push_back(ch);
        in_field = true;
    }

    if (quoted) {
        return std::nullopt;
    }
    if (in_field) {
        fields.push_back(std::move(current));
    }
    return fields;
}

[[nodiscard]] std::string join(const std::vector<std::string>& parts)
{
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined.append(part);
    }
    return joined;
}

// Rows grouped per canonical schema, schemas kept in first-seen order.
struct SchemaRows final {
    std::string schema{};
    std::vector<MetadataRow> rows{};
};

void append_row(std::vector<SchemaRows>& groups, std::string_view schema, MetadataRow row)
{
    const auto key = catalog::canonical_name(schema);
    for (auto& group : groups) {
        if (group.schema == key) {
            group.rows.push_back(std::move(row));
            return;
        }
    }
    groups.push_back(SchemaRows{key, {std::move(row)}});
}

[[nodiscard]] ObjectKind relation_kind(MetadataDirective directive) noexcept
{
    return (directive == MetadataDirective::View || directive == MetadataDirective::ViewColumn) ? ObjectKind::View
                                                                                                : ObjectKind::Table;
}

class ScriptApplier final {
public:
    ScriptApplier(const MetadataScript& script, MetadataCatalog& catalog) : script_{script}, catalog_{catalog}
    {
        summary_.entries = script.entries.size();
        summary_.read_failed = script.read_failed;
        summary_.diagnostics = script.diagnostics;
    }

    LoadSummary run()
    {
        apply_vocabulary();
        apply_schemas();
        apply_use();
        apply_relations(MetadataDirective::Table);
        apply_relations(MetadataDirective::View);
        apply_columns(MetadataDirective::Column);
        apply_columns(MetadataDirective::ViewColumn);
        apply_functions();
        return std::move(summary_);
    }

private:
    void skip(const MetadataEntry& entry, std::string message)
    {
        ++summary_.skipped;
        summary_.diagnostics.push_back(LoaderDiagnostic{entry.line, std::move(message), describe(entry)});
    }

    [[nodiscard]] static std::string describe(const MetadataEntry& entry)
    {
        std::string text{metadata_directive_to_string(entry.directive)};
        for (const auto& argument : entry.arguments) {
            text.push_back(' ');
            text.append(argument);
        }
        return text;
    }

    void apply_vocabulary()
    {
        constexpr std::array<std::pair<MetadataDirective, VocabularyKind>, 4> kinds{{
            {MetadataDirective::Database, VocabularyKind::Databases},
            {MetadataDirective::User, VocabularyKind::Users},
            {MetadataDirective::Show, VocabularyKind::ShowItems},
            {MetadataDirective::Change, VocabularyKind::ChangeItems},
        }};

        for (const auto& [directive, kind] : kinds) {
            std::vector<std::string> items;
            for (const auto& entry : script_.entries) {
                if (entry.directive == directive) {
                    items.push_back(join(entry.arguments));
                }
            }
            if (!items.empty()) {
                catalog_.extend_vocabulary(kind, items);
                summary_.applied += items.size();
            }
        }
    }

    void apply_schemas()
    {
        std::vector<std::string> names;
        for (const auto& entry : script_.entries) {
            if (entry.directive == MetadataDirective::Schema) {
                names.push_back(entry.arguments.front());
            }
        }
        if (names.empty()) {
            return;
        }
        const auto result = catalog_.extend_schemas(names);
        summary_.applied += result.applied;
        summary_.skipped += result.skipped;
    }

    void apply_use()
    {
        const MetadataEntry* last = nullptr;
        for (const auto& entry : script_.entries) {
            if (entry.directive == MetadataDirective::Use) {
                last = &entry;
            }
        }
        if (last != nullptr) {
            catalog_.set_current_database(last->arguments.front());
            ++summary_.applied;
        }
    }

    void apply_relations(MetadataDirective directive)
    {
        const auto kind = relation_kind(directive);
        std::vector<SchemaRows> groups;
        for (const auto& entry : script_.entries) {
            if (entry.directive != directive) {
                continue;
            }
            if (!catalog_.has_schema(kind, entry.arguments[0])) {
                skip(entry, "unknown schema '" + entry.arguments[0] + "'");
                continue;
            }
            append_row(groups, entry.arguments[0], MetadataRow{entry.arguments[1]});
        }

        for (auto& group : groups) {
            const auto result = catalog_.extend_relations(catalog::rows_from(std::move(group.rows)), kind, group.schema);
            summary_.applied += result.applied;
            summary_.skipped += result.skipped;
        }
    }

    void apply_columns(MetadataDirective directive)
    {
        const auto kind = relation_kind(directive);
        std::vector<SchemaRows> groups;
        for (const auto& entry : script_.entries) {
            if (entry.directive != directive) {
                continue;
            }
            const auto lookup = catalog_.lookup_columns(kind, entry.arguments[0], entry.arguments[1]);
            if (!lookup.found()) {
                skip(entry, lookup.error.message() + " for column '" + entry.arguments[2] + "'");
                continue;
            }
            append_row(groups, entry.arguments[0], MetadataRow{entry.arguments[1], entry.arguments[2]});
        }

        for (auto& group : groups) {
            const auto result = catalog_.extend_columns(catalog::rows_from(std::move(group.rows)), kind, group.schema);
            summary_.applied += result.applied;
            summary_.skipped += result.skipped;
        }
    }

    void apply_functions()
    {
        std::vector<SchemaRows> groups;
        for (const auto& entry : script_.entries) {
            if (entry.directive != MetadataDirective::Function) {
                continue;
            }
            if (!catalog_.has_schema(ObjectKind::Function, entry.arguments[0])) {
                skip(entry, "unknown schema '" + entry.arguments[0] + "'");
                continue;
            }
            append_row(groups, entry.arguments[0], MetadataRow{entry.arguments[1]});
        }

        for (auto& group : groups) {
            const auto result = catalog_.extend_functions(catalog::rows_from(std::move(group.rows)), group.schema);
            summary_.applied += result.applied;
            summary_.skipped += result.skipped;
        }
    }

    const MetadataScript& script_;
    MetadataCatalog& catalog_;
    LoadSummary summary_{};
};

}  // namespace

std::optional<MetadataDirective> metadata_directive_from_string(std::string_view keyword)
{
    const auto lowered = catalog::lowercase_copy(keyword);
    for (const auto& info : kDirectives) {
        if (info.keyword == lowered) {
            return info.directive;
        }
    }
    return std::nullopt;
}

std::string_view metadata_directive_to_string(MetadataDirective directive) noexcept
{
    return directive_info(directive).keyword;
}

MetadataScript parse_metadata_script(std::istream& input)
{
    MetadataScript script{};
    std::string line;
    std::size_t line_number = 0U;

    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        const auto trimmed = trim(line);
        if (trimmed.empty() || is_comment(trimmed)) {
            continue;
        }

        auto fields = split_fields(trimmed);
        if (!fields) {
            script.diagnostics.push_back(LoaderDiagnostic{line_number, "unterminated quoted identifier", trimmed});
            continue;
        }

        const auto directive = metadata_directive_from_string(fields->front());
        if (!directive) {
            script.diagnostics.push_back(
                LoaderDiagnostic{line_number, "unknown directive '" + fields->front() + "'", trimmed});
            continue;
        }

        const auto& info = directive_info(*directive);
        const auto argument_count = fields->size() - 1U;
        if (argument_count < info.min_arguments || argument_count > info.max_arguments) {
            std::string message{"'"};
            message.append(info.keyword);
            message.append("' expects ");
            message.append(std::to_string(info.min_arguments));
            if (info.max_arguments == kUnbounded) {
                message.append(" or more");
            }
            message.append(info.min_arguments == 1U && info.max_arguments == 1U ? " argument" : " arguments");
            script.diagnostics.push_back(LoaderDiagnostic{line_number, std::move(message), trimmed});
            continue;
        }

        MetadataEntry entry{};
        entry.directive = *directive;
        entry.arguments.assign(std::next(fields->begin()), fields->end());
        entry.line = line_number;
        script.entries.push_back(std::move(entry));
    }

    if (input.bad()) {
        script.read_failed = true;
        script.diagnostics.push_back(LoaderDiagnostic{line_number, "I/O error while reading metadata script", {}});
    } else if (input.fail() && !input.eof()) {
        script.read_failed = true;
        script.diagnostics.push_back(LoaderDiagnostic{line_number, "failed to read metadata script to completion", {}});
    }

    return script;
}

LoadSummary apply_metadata_script(const MetadataScript& script, MetadataCatalog& catalog)
{
    return ScriptApplier{script, catalog}.run();
}

LoadSummary load_metadata(std::istream& input, MetadataCatalog& catalog)
{
    const auto script = parse_metadata_script(input);
    return apply_metadata_script(script, catalog);
}

LoadSummary load_metadata_file(const std::filesystem::path& path, MetadataCatalog& catalog)
{
    std::ifstream stream{path};
    if (!stream) {
        LoadSummary summary{};
        summary.read_failed = true;
        summary.diagnostics.push_back(LoaderDiagnostic{0U, "unable to open metadata script", path.string()});
        return summary;
    }
    return load_metadata(stream, catalog);
}

}  // namespace sqlsense::shell
