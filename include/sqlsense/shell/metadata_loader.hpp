#pragma once

#include "sqlsense/catalog/metadata_catalog.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsense::shell {

enum class MetadataDirective : std::uint8_t {
    Database = 0,
    Schema,
    Use,
    Table,
    View,
    Column,
    ViewColumn,
    Function,
    User,
    Show,
    Change
};

[[nodiscard]] std::optional<MetadataDirective> metadata_directive_from_string(std::string_view keyword);
[[nodiscard]] std::string_view metadata_directive_to_string(MetadataDirective directive) noexcept;

struct MetadataEntry final {
    MetadataDirective directive = MetadataDirective::Database;
    std::vector<std::string> arguments{};
    std::size_t line = 0U;
};

struct LoaderDiagnostic final {
    std::size_t line = 0U;
    std::string message{};
    std::string text{};
};

struct MetadataScript final {
    std::vector<MetadataEntry> entries{};
    std::vector<LoaderDiagnostic> diagnostics{};
    bool read_failed = false;
};

struct LoadSummary final {
    std::size_t entries = 0U;
    std::size_t applied = 0U;
    std::size_t skipped = 0U;
    std::vector<LoaderDiagnostic> diagnostics{};
    bool read_failed = false;

    [[nodiscard]] bool success() const noexcept { return !read_failed && diagnostics.empty(); }
};

// Line oriented format, one directive per line, '#' and "--" start comments:
//   database NAME | user NAME | show ITEM... | change ITEM...
//   schema NAME | use NAME
//   table SCHEMA NAME | view SCHEMA NAME | function SCHEMA NAME
//   column SCHEMA TABLE COLUMN | view_column SCHEMA VIEW COLUMN
[[nodiscard]] MetadataScript parse_metadata_script(std::istream& input);

// Applies a parsed script in dependency order: vocabulary, schemas, current
// database, relations, columns, functions. Entries that reference an unknown
// schema or relation are reported and skipped.
LoadSummary apply_metadata_script(const MetadataScript& script, catalog::MetadataCatalog& catalog);

LoadSummary load_metadata(std::istream& input, catalog::MetadataCatalog& catalog);
LoadSummary load_metadata_file(const std::filesystem::path& path, catalog::MetadataCatalog& catalog);

}  // namespace sqlsense::shell
