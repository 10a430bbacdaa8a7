#include "sqlsense/completion/suggestion.hpp"

#include <catch2/catch_test_macros.hpp>

#include <variant>

using namespace sqlsense::completion;

TEST_CASE("suggestion kinds round-trip through their names")
{
    for (std::size_t index = 1U; index < static_cast<std::size_t>(SuggestionKind::Count); ++index) {
        const auto kind = static_cast<SuggestionKind>(index);
        const auto name = suggestion_kind_to_string(kind);
        CHECK(suggestion_kind_from_string(name) == kind);
        CHECK(suggestion_kind(make_suggestion(name)) == kind);
    }

    CHECK(suggestion_kind_to_string(SuggestionKind::FavoriteQuery) == "favoritequery");
    CHECK(suggestion_kind_to_string(SuggestionKind::TableFormat) == "table_format");
}

TEST_CASE("unknown kind names become unrecognized requests")
{
    CHECK(suggestion_kind_from_string("sequence") == SuggestionKind::Unrecognized);
    CHECK(suggestion_kind_from_string("unrecognized") == SuggestionKind::Unrecognized);

    const auto request = make_suggestion("sequence");
    REQUIRE(std::holds_alternative<UnrecognizedSuggestion>(request));
    CHECK(std::get<UnrecognizedSuggestion>(request).kind == "sequence");
}

TEST_CASE("suggestion_kind follows the variant alternative")
{
    CHECK(suggestion_kind(ColumnSuggestion{}) == SuggestionKind::Column);
    CHECK(suggestion_kind(FunctionSuggestion{std::string{"HR"}}) == SuggestionKind::Function);
    CHECK(suggestion_kind(AliasSuggestion{{"e", "d"}}) == SuggestionKind::Alias);
    CHECK(suggestion_kind(TableFormatSuggestion{}) == SuggestionKind::TableFormat);
}
