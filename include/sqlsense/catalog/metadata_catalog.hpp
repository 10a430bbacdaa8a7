#pragma once

#include "sqlsense/catalog/catalog_errors.hpp"
#include "sqlsense/catalog/completion_vocabulary.hpp"
#include "sqlsense/catalog/identifier_normalizer.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace sqlsense::catalog {

enum class ObjectKind : std::uint8_t {
    Table = 0,
    View,
    Function,
    Count
};

enum class VocabularyKind : std::uint8_t {
    ShowItems = 0,
    ChangeItems,
    Users,
    Databases,
    Keywords,
    SpecialCommands,
    Count
};

enum class EnumerationFailurePolicy : std::uint8_t {
    DiscardBatch = 0,
    KeepReceived
};

enum class DiagnosticSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct CatalogDiagnostic final {
    DiagnosticSeverity severity = DiagnosticSeverity::Warning;
    std::error_code error{};
    std::string message{};
    std::string schema{};
    std::string relation{};
};

inline constexpr std::string_view kWildcardColumn = "*";

using MetadataRow = std::vector<std::string>;
using RowCallback = std::function<void(std::span<const std::string> row)>;

// A lazily driven enumeration, typically the cursor of a discovery query.
// The source pushes each row into the callback and may throw part way through.
using RowSource = std::function<void(const RowCallback& callback)>;

[[nodiscard]] RowSource rows_from(std::vector<MetadataRow> rows);

struct ExtensionResult final {
    std::size_t rows_received = 0U;
    std::size_t applied = 0U;
    std::size_t skipped = 0U;
    bool enumeration_failed = false;
    std::error_code error{};
    std::string failure_message{};

    [[nodiscard]] bool complete() const noexcept { return !enumeration_failed && skipped == 0U; }
};

struct ColumnLookup final {
    std::error_code error{};
    std::span<const std::string> columns{};

    [[nodiscard]] bool found() const noexcept { return !error; }
};

[[nodiscard]] std::string_view object_kind_to_string(ObjectKind kind) noexcept;

class MetadataCatalog final {
public:
    using DiagnosticSink = std::function<void(const CatalogDiagnostic&)>;

    struct Config final {
        CompletionVocabulary vocabulary = make_default_vocabulary();
        EnumerationFailurePolicy failure_policy = EnumerationFailurePolicy::DiscardBatch;
        bool quote_special_names = false;
        DiagnosticSink diagnostic_sink{};
    };

    MetadataCatalog();
    explicit MetadataCatalog(Config config);

    void reset();

    void set_current_database(std::string_view name);
    [[nodiscard]] const std::string& current_database() const noexcept { return current_database_; }

    // Explicit schema when given, otherwise the current database; always canonical.
    [[nodiscard]] std::string resolve_schema(std::optional<std::string_view> schema) const;

    ExtensionResult extend_schemas(std::span<const std::string> names);
    ExtensionResult extend_relations(const RowSource& source, ObjectKind kind, std::string_view schema);
    ExtensionResult extend_columns(const RowSource& source, ObjectKind kind, std::string_view schema);
    ExtensionResult extend_functions(const RowSource& source, std::string_view schema);
    void extend_vocabulary(VocabularyKind kind, std::span<const std::string> items);

    [[nodiscard]] bool has_schema(ObjectKind kind, std::string_view schema) const;
    [[nodiscard]] std::vector<std::string> schema_names(ObjectKind kind) const;
    [[nodiscard]] std::vector<std::string> object_names(ObjectKind kind, std::string_view schema) const;
    [[nodiscard]] ColumnLookup lookup_columns(ObjectKind kind, std::string_view schema, std::string_view relation) const;

    [[nodiscard]] const std::vector<std::string>& vocabulary(VocabularyKind kind) const noexcept;
    [[nodiscard]] const std::vector<std::string>& functions() const noexcept { return config_.vocabulary.functions; }
    [[nodiscard]] const std::vector<std::string>& table_formats() const noexcept { return config_.vocabulary.table_formats; }
    [[nodiscard]] const std::set<std::string>& all_completions() const noexcept { return all_completions_; }
    [[nodiscard]] const ReservedWordSet& reserved_words() const noexcept { return reserved_words_; }
    [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }

    [[nodiscard]] std::string escape_name(std::string_view name) const;
    // Key a relation name is stored and looked up under: escaped when quoting is on, then canonical.
    [[nodiscard]] std::string relation_key(std::string_view name) const;

private:
    using ColumnList = std::vector<std::string>;
    using RelationMap = std::map<std::string, ColumnList, std::less<>>;
    using SchemaMap = std::map<std::string, RelationMap, std::less<>>;

    static constexpr std::size_t object_kind_count = static_cast<std::size_t>(ObjectKind::Count);
    static constexpr std::size_t vocabulary_kind_count = static_cast<std::size_t>(VocabularyKind::Count);

    struct CollectedRows final {
        std::vector<MetadataRow> rows{};
        bool failed = false;
        std::string message{};
    };

    [[nodiscard]] CollectedRows collect_rows(const RowSource& source, std::string_view operation, std::string_view schema) const;
    [[nodiscard]] std::span<const MetadataRow> usable_rows(const CollectedRows& collected, ExtensionResult& result) const;

    void report(DiagnosticSeverity severity,
                std::error_code error,
                std::string message,
                std::string_view schema = {},
                std::string_view relation = {}) const;

    [[nodiscard]] SchemaMap& objects(ObjectKind kind) noexcept;
    [[nodiscard]] const SchemaMap& objects(ObjectKind kind) const noexcept;
    [[nodiscard]] std::vector<std::string>& vocabulary_list(VocabularyKind kind) noexcept;

    Config config_{};
    ReservedWordSet reserved_words_{};
    std::array<SchemaMap, object_kind_count> objects_{};
    std::array<std::vector<std::string>, vocabulary_kind_count> vocabularies_{};
    std::set<std::string> all_completions_{};
    std::string current_database_{};
    std::uint64_t generation_ = 0U;
};

}  // namespace sqlsense::catalog
