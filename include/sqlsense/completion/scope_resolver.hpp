#pragma once

#include "sqlsense/catalog/metadata_catalog.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sqlsense::completion {

struct TableReference final {
    std::optional<std::string> schema{};
    std::string name{};
    std::optional<std::string> alias{};

    bool operator==(const TableReference&) const = default;
};

// Resolves the columns visible through a list of in-scope table references.
class ScopeResolver final {
public:
    explicit ScopeResolver(const catalog::MetadataCatalog& catalog) noexcept;

    // Concatenates each reference's columns in reference order, keeping duplicates.
    // With unique_across_tables only names seen at least twice survive, once each,
    // and the wildcard placeholder is dropped.
    [[nodiscard]] std::vector<std::string> resolve(std::span<const TableReference> tables,
                                                   bool unique_across_tables = false) const;

    [[nodiscard]] catalog::ColumnLookup lookup(const TableReference& table) const;

private:
    const catalog::MetadataCatalog& catalog_;
};

}  // namespace sqlsense::completion
