#include "sqlsense/completion/suggestion.hpp"

#include <array>

namespace sqlsense::completion {

namespace {

constexpr std::array<std::string_view, static_cast<std::size_t>(SuggestionKind::Count)> kKindNames{
    "unrecognized", "column", "function", "table",   "view",          "alias",       "database", "schema",
    "keyword",      "show",   "change",   "user",    "special",       "favoritequery", "table_format"};

}  // namespace

SuggestionKind suggestion_kind(const SuggestionRequest& request) noexcept
{
    return static_cast<SuggestionKind>(request.index());
}

std::string_view suggestion_kind_to_string(SuggestionKind kind) noexcept
{
    const auto index = static_cast<std::size_t>(kind);
    if (index >= kKindNames.size()) {
        return kKindNames.front();
    }
    return kKindNames[index];
}

SuggestionKind suggestion_kind_from_string(std::string_view name) noexcept
{
    for (std::size_t index = 1U; index < kKindNames.size(); ++index) {
        if (kKindNames[index] == name) {
            return static_cast<SuggestionKind>(index);
        }
    }
    return SuggestionKind::Unrecognized;
}

SuggestionRequest make_suggestion(std::string_view kind_name)
{
    switch (suggestion_kind_from_string(kind_name)) {
    case SuggestionKind::Column:
        return ColumnSuggestion{};
    case SuggestionKind::Function:
        return FunctionSuggestion{};
    case SuggestionKind::Table:
        return TableSuggestion{};
    case SuggestionKind::View:
        return ViewSuggestion{};
    case SuggestionKind::Alias:
        return AliasSuggestion{};
    case SuggestionKind::Database:
        return DatabaseSuggestion{};
    case SuggestionKind::Schema:
        return SchemaSuggestion{};
    case SuggestionKind::Keyword:
        return KeywordSuggestion{};
    case SuggestionKind::Show:
        return ShowSuggestion{};
    case SuggestionKind::Change:
        return ChangeSuggestion{};
    case SuggestionKind::User:
        return UserSuggestion{};
    case SuggestionKind::Special:
        return SpecialSuggestion{};
    case SuggestionKind::FavoriteQuery:
        return FavoriteQuerySuggestion{};
    case SuggestionKind::TableFormat:
        return TableFormatSuggestion{};
    case SuggestionKind::Unrecognized:
    default:
        return UnrecognizedSuggestion{std::string{kind_name}};
    }
}

}  // namespace sqlsense::completion
