#pragma once

#include "sqlsense/catalog/metadata_catalog.hpp"
#include "sqlsense/completion/completion_telemetry.hpp"
#include "sqlsense/completion/match_ranker.hpp"
#include "sqlsense/completion/scope_resolver.hpp"
#include "sqlsense/completion/suggestion.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsense::completion {

struct CompletionInput final {
    std::string text{};
    std::size_t cursor = 0U;

    [[nodiscard]] std::string_view text_before_cursor() const noexcept;
    // Whitespace delimited word ending at the cursor; empty after whitespace.
    [[nodiscard]] std::string word_before_cursor() const;
};

[[nodiscard]] CompletionInput make_input(std::string text);

class CompletionEngine final {
public:
    using FavoriteQueryProvider = std::function<std::vector<std::string>()>;
    using SuggestionClassifier =
        std::function<std::vector<SuggestionRequest>(std::string_view text, std::string_view text_before_cursor)>;

    struct Config final {
        bool smart_completion = true;
        WordBoundary boundary = WordBoundary::MostPunctuations;
        SuggestionClassifier classifier{};
        FavoriteQueryProvider favorite_queries{};
        CompletionTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier{};
    };

    explicit CompletionEngine(const catalog::MetadataCatalog& catalog);
    CompletionEngine(const catalog::MetadataCatalog& catalog, Config config);
    ~CompletionEngine();

    CompletionEngine(const CompletionEngine&) = delete;
    CompletionEngine& operator=(const CompletionEngine&) = delete;
    CompletionEngine(CompletionEngine&&) = delete;
    CompletionEngine& operator=(CompletionEngine&&) = delete;

    // Classifies the input (when smart completion is on) and dispatches the resulting requests.
    [[nodiscard]] std::vector<Completion> complete(const CompletionInput& input,
                                                   std::optional<bool> smart_completion = std::nullopt);

    // Concatenates per-request results in request order; no re-ranking across kinds.
    [[nodiscard]] std::vector<Completion> dispatch(std::span<const SuggestionRequest> requests,
                                                   std::string_view word_before_cursor);

    // Prefix matching against every identifier the catalog knows about.
    [[nodiscard]] std::vector<Completion> complete_without_context(std::string_view word_before_cursor);

    void set_smart_completion(bool enabled) noexcept { config_.smart_completion = enabled; }
    [[nodiscard]] bool smart_completion() const noexcept { return config_.smart_completion; }

    [[nodiscard]] const CompletionTelemetry& telemetry() const noexcept { return telemetry_; }

private:
    [[nodiscard]] std::vector<Completion> handle(const UnrecognizedSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const ColumnSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const FunctionSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const TableSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const ViewSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const AliasSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const DatabaseSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const SchemaSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const KeywordSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const ShowSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const ChangeSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const UserSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const SpecialSuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const FavoriteQuerySuggestion& request, std::string_view word);
    [[nodiscard]] std::vector<Completion> handle(const TableFormatSuggestion& request, std::string_view word);

    [[nodiscard]] std::vector<Completion> rank(std::string_view word,
                                               std::vector<std::string> candidates,
                                               MatchOptions options);
    [[nodiscard]] std::vector<Completion> rank_schema_objects(std::string_view word,
                                                              const std::optional<std::string>& schema,
                                                              catalog::ObjectKind kind);

    const catalog::MetadataCatalog& catalog_;
    Config config_{};
    ScopeResolver resolver_;
    MatchRanker ranker_;
    CompletionTelemetry telemetry_{};
    CompletionTelemetryRegistry* registry_ = nullptr;
    std::string registry_identifier_{};
};

}  // namespace sqlsense::completion
