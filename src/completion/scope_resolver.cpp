#include "sqlsense/completion/scope_resolver.hpp"

#include <string_view>
#include <unordered_map>

namespace sqlsense::completion {

namespace {

std::vector<std::string> keep_shared_columns(const std::vector<std::string>& columns)
{
    std::unordered_map<std::string_view, std::size_t> counts;
    for (const auto& column : columns) {
        ++counts[column];
    }

    std::vector<std::string> shared;
    for (const auto& column : columns) {
        if (column == catalog::kWildcardColumn) {
            continue;
        }
        auto& count = counts[column];
        if (count > 1U) {
            shared.push_back(column);
            count = 0U;
        }
    }
    return shared;
}

}  // namespace

ScopeResolver::ScopeResolver(const catalog::MetadataCatalog& catalog) noexcept
    : catalog_{catalog}
{
}

catalog::ColumnLookup ScopeResolver::lookup(const TableReference& table) const
{
    // Schema names are never escaped, only relation names.
    std::optional<std::string_view> explicit_schema;
    if (table.schema) {
        explicit_schema = *table.schema;
    }
    const auto schema = catalog_.resolve_schema(explicit_schema);

    // Tables and views never share a name, so a table hit ends the search.
    auto found = catalog_.lookup_columns(catalog::ObjectKind::Table, schema, table.name);
    if (found.found()) {
        return found;
    }

    const auto unescaped = catalog::unescape_name(table.name);
    if (unescaped != table.name) {
        found = catalog_.lookup_columns(catalog::ObjectKind::Table, schema, unescaped);
        if (found.found()) {
            return found;
        }
    }

    return catalog_.lookup_columns(catalog::ObjectKind::View, schema, table.name);
}

std::vector<std::string> ScopeResolver::resolve(std::span<const TableReference> tables, bool unique_across_tables) const
{
    std::vector<std::string> columns;
    for (const auto& table : tables) {
        const auto found = lookup(table);
        if (!found.found()) {
            continue;
        }
        columns.insert(columns.end(), found.columns.begin(), found.columns.end());
    }

    if (unique_across_tables) {
        return keep_shared_columns(columns);
    }
    return columns;
}

}  // namespace sqlsense::completion
