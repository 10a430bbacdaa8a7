#pragma once

#include "sqlsense/completion/scope_resolver.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqlsense::completion {

enum class SuggestionKind : std::uint8_t {
    Unrecognized = 0,
    Column,
    Function,
    Table,
    View,
    Alias,
    Database,
    Schema,
    Keyword,
    Show,
    Change,
    User,
    Special,
    FavoriteQuery,
    TableFormat,
    Count
};

struct UnrecognizedSuggestion final {
    std::string kind{};
};

struct ColumnSuggestion final {
    std::vector<TableReference> tables{};
    // JOIN ... USING (...): only columns present in more than one relation.
    bool drop_unique = false;
};

struct FunctionSuggestion final {
    std::optional<std::string> schema{};
};

struct TableSuggestion final {
    std::optional<std::string> schema{};
};

struct ViewSuggestion final {
    std::optional<std::string> schema{};
};

struct AliasSuggestion final {
    std::vector<std::string> aliases{};
};

struct DatabaseSuggestion final {
};

struct SchemaSuggestion final {
};

struct KeywordSuggestion final {
};

struct ShowSuggestion final {
};

struct ChangeSuggestion final {
};

struct UserSuggestion final {
};

struct SpecialSuggestion final {
};

struct FavoriteQuerySuggestion final {
};

struct TableFormatSuggestion final {
};

// Alternative order matches SuggestionKind.
using SuggestionRequest = std::variant<UnrecognizedSuggestion,
                                       ColumnSuggestion,
                                       FunctionSuggestion,
                                       TableSuggestion,
                                       ViewSuggestion,
                                       AliasSuggestion,
                                       DatabaseSuggestion,
                                       SchemaSuggestion,
                                       KeywordSuggestion,
                                       ShowSuggestion,
                                       ChangeSuggestion,
                                       UserSuggestion,
                                       SpecialSuggestion,
                                       FavoriteQuerySuggestion,
                                       TableFormatSuggestion>;

static_assert(std::variant_size_v<SuggestionRequest> == static_cast<std::size_t>(SuggestionKind::Count));

[[nodiscard]] SuggestionKind suggestion_kind(const SuggestionRequest& request) noexcept;
[[nodiscard]] std::string_view suggestion_kind_to_string(SuggestionKind kind) noexcept;
[[nodiscard]] SuggestionKind suggestion_kind_from_string(std::string_view name) noexcept;

// Builds a request without payload for the given kind name, e.g. "keyword" or "table_format".
// Unknown names produce an UnrecognizedSuggestion carrying the name.
[[nodiscard]] SuggestionRequest make_suggestion(std::string_view kind_name);

}  // namespace sqlsense::completion
