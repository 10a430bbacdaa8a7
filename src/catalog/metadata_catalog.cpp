#include "sqlsense/catalog/metadata_catalog.hpp"

#include <exception>
#include <utility>

namespace sqlsense::catalog {

namespace {

constexpr std::size_t kRelationField = 0U;
constexpr std::size_t kColumnField = 1U;

std::string describe_enumeration_failure(std::string_view operation, std::string_view schema, const char* what)
{
    std::string message{"error enumerating "};
    message.append(operation);
    if (!schema.empty()) {
        message.append(" for schema ");
        message.append(schema);
    }
    message.append(": ");
    message.append(what);
    return message;
}

}  // namespace

RowSource rows_from(std::vector<MetadataRow> rows)
{
    return [rows = std::move(rows)](const RowCallback& callback) {
        for (const auto& row : rows) {
            callback(row);
        }
    };
}

std::string_view object_kind_to_string(ObjectKind kind) noexcept
{
    switch (kind) {
    case ObjectKind::Table:
        return "tables";
    case ObjectKind::View:
        return "views";
    case ObjectKind::Function:
        return "functions";
    default:
        return "unknown";
    }
}

MetadataCatalog::MetadataCatalog()
    : MetadataCatalog(Config{})
{
}

MetadataCatalog::MetadataCatalog(Config config)
    : config_{std::move(config)}
{
    reserved_words_ = derive_reserved_words(config_.vocabulary.keywords);
    vocabulary_list(VocabularyKind::Keywords) = config_.vocabulary.keywords;
    vocabulary_list(VocabularyKind::SpecialCommands) = config_.vocabulary.special_commands;
    reset();
}

void MetadataCatalog::reset()
{
    vocabulary_list(VocabularyKind::ShowItems).clear();
    vocabulary_list(VocabularyKind::ChangeItems).clear();
    vocabulary_list(VocabularyKind::Users).clear();
    vocabulary_list(VocabularyKind::Databases).clear();
    current_database_.clear();

    for (auto& schemas : objects_) {
        schemas.clear();
    }

    const auto& keywords = vocabulary_list(VocabularyKind::Keywords);
    all_completions_.clear();
    all_completions_.insert(keywords.begin(), keywords.end());
    all_completions_.insert(config_.vocabulary.functions.begin(), config_.vocabulary.functions.end());
    ++generation_;
}

void MetadataCatalog::set_current_database(std::string_view name)
{
    current_database_ = canonical_name(name);
}

std::string MetadataCatalog::resolve_schema(std::optional<std::string_view> schema) const
{
    if (schema && !schema->empty()) {
        return canonical_name(*schema);
    }
    return current_database_;
}

ExtensionResult MetadataCatalog::extend_schemas(std::span<const std::string> names)
{
    ExtensionResult result{};
    for (const auto& name : names) {
        ++result.rows_received;
        if (name.empty()) {
            ++result.skipped;
            report(DiagnosticSeverity::Warning, make_error_code(CatalogErrc::MalformedRow), "ignoring empty schema name");
            continue;
        }

        const auto schema = canonical_name(name);
        for (auto& schemas : objects_) {
            schemas.try_emplace(schema);
        }
        all_completions_.insert(name);
        ++result.applied;
    }
    return result;
}

ExtensionResult MetadataCatalog::extend_relations(const RowSource& source, ObjectKind kind, std::string_view schema)
{
    ExtensionResult result{};
    const auto schema_key = canonical_name(schema);
    const auto collected = collect_rows(source, object_kind_to_string(kind), schema_key);
    const auto rows = usable_rows(collected, result);

    auto& schemas = objects(kind);
    for (const auto& row : rows) {
        if (row.size() <= kRelationField || row[kRelationField].empty()) {
            ++result.skipped;
            report(DiagnosticSeverity::Warning, make_error_code(CatalogErrc::MalformedRow),
                   "relation row without a name", schema_key);
            continue;
        }

        const auto key = relation_key(row[kRelationField]);
        auto schema_it = schemas.find(schema_key);
        if (schema_it == schemas.end()) {
            ++result.skipped;
            if (!result.error) {
                result.error = make_error_code(CatalogErrc::SchemaNotFound);
            }
            report(DiagnosticSeverity::Error, make_error_code(CatalogErrc::SchemaNotFound),
                   std::string{object_kind_to_string(kind)} + " entry listed in unrecognized schema", schema_key,
                   key);
        } else {
            schema_it->second.insert_or_assign(key, ColumnList{std::string{kWildcardColumn}});
            ++result.applied;
        }
        all_completions_.insert(key);
    }
    return result;
}

ExtensionResult MetadataCatalog::extend_columns(const RowSource& source, ObjectKind kind, std::string_view schema)
{
    ExtensionResult result{};
    const auto schema_key = canonical_name(schema);
    const auto collected = collect_rows(source, "columns", schema_key);
    const auto rows = usable_rows(collected, result);

    auto& schemas = objects(kind);
    for (const auto& row : rows) {
        if (row.size() <= kColumnField || row[kRelationField].empty() || row[kColumnField].empty()) {
            ++result.skipped;
            report(DiagnosticSeverity::Warning, make_error_code(CatalogErrc::MalformedRow),
                   "column row requires a relation and a column name", schema_key);
            continue;
        }

        auto schema_it = schemas.find(schema_key);
        if (schema_it == schemas.end()) {
            throw std::system_error(make_error_code(CatalogErrc::SchemaNotFound),
                                    "columns extended for unregistered schema " + schema_key);
        }

        const auto relation_key = this->relation_key(row[kRelationField]);
        auto relation_it = schema_it->second.find(relation_key);
        if (relation_it == schema_it->second.end()) {
            throw std::system_error(make_error_code(CatalogErrc::RelationNotFound),
                                    "columns extended before relation " + schema_key + "." + relation_key);
        }

        auto column = escape_name(row[kColumnField]);
        all_completions_.insert(column);
        relation_it->second.push_back(std::move(column));
        ++result.applied;
    }
    return result;
}

ExtensionResult MetadataCatalog::extend_functions(const RowSource& source, std::string_view schema)
{
    ExtensionResult result{};
    const auto schema_key = canonical_name(schema);
    const auto collected = collect_rows(source, "functions", schema_key);
    const auto rows = usable_rows(collected, result);

    auto& schemas = objects(ObjectKind::Function);
    for (const auto& row : rows) {
        if (row.empty() || row.front().empty()) {
            ++result.skipped;
            report(DiagnosticSeverity::Warning, make_error_code(CatalogErrc::MalformedRow),
                   "function row without a name", schema_key);
            continue;
        }

        const auto name = canonical_name(escape_name(row.front()));
        auto schema_it = schemas.find(schema_key);
        if (schema_it == schemas.end()) {
            ++result.skipped;
            if (!result.error) {
                result.error = make_error_code(CatalogErrc::SchemaNotFound);
            }
            report(DiagnosticSeverity::Error, make_error_code(CatalogErrc::SchemaNotFound),
                   "function listed in unrecognized schema", schema_key, name);
        } else {
            schema_it->second.try_emplace(name);
            ++result.applied;
        }
        all_completions_.insert(name);
    }
    return result;
}

void MetadataCatalog::extend_vocabulary(VocabularyKind kind, std::span<const std::string> items)
{
    auto& list = vocabulary_list(kind);
    list.insert(list.end(), items.begin(), items.end());

    if (kind == VocabularyKind::SpecialCommands) {
        return;
    }

    all_completions_.insert(items.begin(), items.end());
    if (kind == VocabularyKind::Keywords) {
        const auto added = derive_reserved_words({items.begin(), items.end()});
        reserved_words_.insert(added.begin(), added.end());
    }
}

bool MetadataCatalog::has_schema(ObjectKind kind, std::string_view schema) const
{
    const auto& schemas = objects(kind);
    return schemas.find(canonical_name(schema)) != schemas.end();
}

std::vector<std::string> MetadataCatalog::schema_names(ObjectKind kind) const
{
    std::vector<std::string> names;
    const auto& schemas = objects(kind);
    names.reserve(schemas.size());
    for (const auto& [name, _] : schemas) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string> MetadataCatalog::object_names(ObjectKind kind, std::string_view schema) const
{
    std::vector<std::string> names;
    const auto& schemas = objects(kind);
    const auto schema_it = schemas.find(canonical_name(schema));
    if (schema_it == schemas.end()) {
        return names;
    }

    names.reserve(schema_it->second.size());
    for (const auto& [name, _] : schema_it->second) {
        names.push_back(name);
    }
    return names;
}

ColumnLookup MetadataCatalog::lookup_columns(ObjectKind kind, std::string_view schema, std::string_view relation) const
{
    ColumnLookup lookup{};
    const auto& schemas = objects(kind);
    const auto schema_it = schemas.find(canonical_name(schema));
    if (schema_it == schemas.end()) {
        lookup.error = make_error_code(CatalogErrc::SchemaNotFound);
        return lookup;
    }

    const auto relation_it = schema_it->second.find(relation_key(relation));
    if (relation_it == schema_it->second.end()) {
        lookup.error = make_error_code(CatalogErrc::RelationNotFound);
        return lookup;
    }

    lookup.columns = relation_it->second;
    return lookup;
}

const std::vector<std::string>& MetadataCatalog::vocabulary(VocabularyKind kind) const noexcept
{
    return vocabularies_[static_cast<std::size_t>(kind)];
}

std::string MetadataCatalog::escape_name(std::string_view name) const
{
    return catalog::escape_name(name, reserved_words_, config_.quote_special_names);
}

std::string MetadataCatalog::relation_key(std::string_view name) const
{
    return canonical_name(escape_name(name));
}

MetadataCatalog::CollectedRows MetadataCatalog::collect_rows(const RowSource& source,
                                                             std::string_view operation,
                                                             std::string_view schema) const
{
    CollectedRows collected{};
    if (!source) {
        return collected;
    }

    try {
        source([&collected](std::span<const std::string> row) {
            collected.rows.emplace_back(row.begin(), row.end());
        });
    } catch (const std::exception& error) {
        collected.failed = true;
        collected.message = describe_enumeration_failure(operation, schema, error.what());
        report(DiagnosticSeverity::Error, make_error_code(CatalogErrc::EnumerationFailed), collected.message, schema);
    } catch (...) {
        collected.failed = true;
        collected.message = describe_enumeration_failure(operation, schema, "unknown enumeration failure");
        report(DiagnosticSeverity::Error, make_error_code(CatalogErrc::EnumerationFailed), collected.message, schema);
    }
    return collected;
}

std::span<const MetadataRow> MetadataCatalog::usable_rows(const CollectedRows& collected, ExtensionResult& result) const
{
    result.rows_received = collected.rows.size();
    if (!collected.failed) {
        return collected.rows;
    }

    result.enumeration_failed = true;
    result.error = make_error_code(CatalogErrc::EnumerationFailed);
    result.failure_message = collected.message;
    if (config_.failure_policy == EnumerationFailurePolicy::KeepReceived) {
        return collected.rows;
    }
    return {};
}

void MetadataCatalog::report(DiagnosticSeverity severity,
                             std::error_code error,
                             std::string message,
                             std::string_view schema,
                             std::string_view relation) const
{
    if (!config_.diagnostic_sink) {
        return;
    }

    CatalogDiagnostic diagnostic{};
    diagnostic.severity = severity;
    diagnostic.error = error;
    diagnostic.message = std::move(message);
    diagnostic.schema = std::string{schema};
    diagnostic.relation = std::string{relation};
    config_.diagnostic_sink(diagnostic);
}

MetadataCatalog::SchemaMap& MetadataCatalog::objects(ObjectKind kind) noexcept
{
    return objects_[static_cast<std::size_t>(kind)];
}

const MetadataCatalog::SchemaMap& MetadataCatalog::objects(ObjectKind kind) const noexcept
{
    return objects_[static_cast<std::size_t>(kind)];
}

std::vector<std::string>& MetadataCatalog::vocabulary_list(VocabularyKind kind) noexcept
{
    return vocabularies_[static_cast<std::size_t>(kind)];
}

}  // namespace sqlsense::catalog
