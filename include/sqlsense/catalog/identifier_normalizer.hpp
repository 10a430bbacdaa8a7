#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

namespace sqlsense::catalog {

using ReservedWordSet = std::unordered_set<std::string>;

[[nodiscard]] std::string uppercase_copy(std::string_view text);
[[nodiscard]] std::string lowercase_copy(std::string_view text);

// Canonical catalog key: schema, database and relation names are stored uppercased.
[[nodiscard]] std::string canonical_name(std::string_view name);

// Strips one pair of surrounding double quotes, if present.
[[nodiscard]] std::string unescape_name(std::string_view name);

[[nodiscard]] bool is_plain_identifier(std::string_view name) noexcept;

// Identity unless quote_special_names is set; then names that are not plain
// identifiers or that collide with a reserved word come back double quoted.
[[nodiscard]] std::string escape_name(std::string_view name,
                                      const ReservedWordSet& reserved_words,
                                      bool quote_special_names);

}  // namespace sqlsense::catalog
