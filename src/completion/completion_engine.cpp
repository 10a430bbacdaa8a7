#include "sqlsense/completion/completion_engine.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>
#include <variant>

namespace sqlsense::completion {

namespace {

using Clock = std::chrono::steady_clock;

constexpr MatchOptions kFuzzy{false, true};
constexpr MatchOptions kPrefixOnly{true, false};

std::uint64_t elapsed_ns(Clock::time_point started)
{
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started).count());
}

void append(std::vector<Completion>& target, std::vector<Completion>&& source)
{
    target.insert(target.end(), std::make_move_iterator(source.begin()), std::make_move_iterator(source.end()));
}

}  // namespace

std::string_view CompletionInput::text_before_cursor() const noexcept
{
    std::string_view view{text};
    return view.substr(0U, std::min(cursor, view.size()));
}

std::string CompletionInput::word_before_cursor() const
{
    return last_word(text_before_cursor(), WordBoundary::AllPunctuations);
}

CompletionInput make_input(std::string text)
{
    CompletionInput input{};
    input.cursor = text.size();
    input.text = std::move(text);
    return input;
}

CompletionEngine::CompletionEngine(const catalog::MetadataCatalog& catalog)
    : CompletionEngine(catalog, Config{})
{
}

CompletionEngine::CompletionEngine(const catalog::MetadataCatalog& catalog, Config config)
    : catalog_{catalog}
    , config_{std::move(config)}
    , resolver_{catalog}
    , ranker_{config_.boundary}
{
    if (config_.telemetry_registry && !config_.telemetry_identifier.empty()) {
        registry_ = config_.telemetry_registry;
        registry_identifier_ = config_.telemetry_identifier;
        registry_->register_sampler(registry_identifier_, [this] { return telemetry_.snapshot(); });
    }
}

CompletionEngine::~CompletionEngine()
{
    if (registry_) {
        registry_->unregister_sampler(registry_identifier_);
    }
}

std::vector<Completion> CompletionEngine::complete(const CompletionInput& input, std::optional<bool> smart_completion)
{
    const auto started = Clock::now();
    const auto smart = smart_completion.value_or(config_.smart_completion);
    telemetry_.record_request(smart);

    const auto word = input.word_before_cursor();
    std::vector<Completion> completions;
    if (!smart || !config_.classifier) {
        completions = complete_without_context(word);
    } else {
        const auto requests = config_.classifier(input.text, input.text_before_cursor());
        completions = dispatch(requests, word);
    }

    telemetry_.record_duration(elapsed_ns(started));
    return completions;
}

std::vector<Completion> CompletionEngine::dispatch(std::span<const SuggestionRequest> requests,
                                                   std::string_view word_before_cursor)
{
    std::vector<Completion> completions;
    for (const auto& request : requests) {
        telemetry_.record_suggestion(suggestion_kind(request) != SuggestionKind::Unrecognized);
        append(completions, std::visit([&](const auto& suggestion) { return handle(suggestion, word_before_cursor); },
                                       request));
    }
    return completions;
}

std::vector<Completion> CompletionEngine::complete_without_context(std::string_view word_before_cursor)
{
    const auto& known = catalog_.all_completions();
    return rank(word_before_cursor, {known.begin(), known.end()}, kPrefixOnly);
}

std::vector<Completion> CompletionEngine::handle(const UnrecognizedSuggestion&, std::string_view)
{
    return {};
}

std::vector<Completion> CompletionEngine::handle(const ColumnSuggestion& request, std::string_view word)
{
    return rank(word, resolver_.resolve(request.tables, request.drop_unique), kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const FunctionSuggestion& request, std::string_view word)
{
    auto completions = rank_schema_objects(word, request.schema, catalog::ObjectKind::Function);

    // A qualifier most likely names a table or alias (u.), so built-ins are offered only unqualified.
    if (!request.schema || request.schema->empty()) {
        append(completions, rank(word, catalog_.functions(), kPrefixOnly));
    }
    return completions;
}

std::vector<Completion> CompletionEngine::handle(const TableSuggestion& request, std::string_view word)
{
    return rank_schema_objects(word, request.schema, catalog::ObjectKind::Table);
}

std::vector<Completion> CompletionEngine::handle(const ViewSuggestion& request, std::string_view word)
{
    return rank_schema_objects(word, request.schema, catalog::ObjectKind::View);
}

std::vector<Completion> CompletionEngine::handle(const AliasSuggestion& request, std::string_view word)
{
    return rank(word, request.aliases, kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const DatabaseSuggestion&, std::string_view word)
{
    return rank(word, catalog_.vocabulary(catalog::VocabularyKind::Databases), kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const SchemaSuggestion&, std::string_view word)
{
    return rank(word, catalog_.vocabulary(catalog::VocabularyKind::Databases), kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const KeywordSuggestion&, std::string_view word)
{
    return rank(word, catalog_.vocabulary(catalog::VocabularyKind::Keywords), kPrefixOnly);
}

std::vector<Completion> CompletionEngine::handle(const ShowSuggestion&, std::string_view word)
{
    return rank(word, catalog_.vocabulary(catalog::VocabularyKind::ShowItems), kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const ChangeSuggestion&, std::string_view word)
{
    return rank(word, catalog_.vocabulary(catalog::VocabularyKind::ChangeItems), kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const UserSuggestion&, std::string_view word)
{
    return rank(word, catalog_.vocabulary(catalog::VocabularyKind::Users), kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const SpecialSuggestion&, std::string_view word)
{
    return rank(word, catalog_.vocabulary(catalog::VocabularyKind::SpecialCommands), kPrefixOnly);
}

std::vector<Completion> CompletionEngine::handle(const FavoriteQuerySuggestion&, std::string_view word)
{
    if (!config_.favorite_queries) {
        return {};
    }
    return rank(word, config_.favorite_queries(), kFuzzy);
}

std::vector<Completion> CompletionEngine::handle(const TableFormatSuggestion&, std::string_view word)
{
    return rank(word, catalog_.table_formats(), kPrefixOnly);
}

std::vector<Completion> CompletionEngine::rank(std::string_view word,
                                               std::vector<std::string> candidates,
                                               MatchOptions options)
{
    const auto considered = candidates.size();
    auto completions = ranker_.rank(word, std::move(candidates), options);
    telemetry_.record_ranking(considered, completions.size());
    return completions;
}

std::vector<Completion> CompletionEngine::rank_schema_objects(std::string_view word,
                                                              const std::optional<std::string>& schema,
                                                              catalog::ObjectKind kind)
{
    std::optional<std::string_view> explicit_schema;
    if (schema) {
        explicit_schema = *schema;
    }
    return rank(word, catalog_.object_names(kind, catalog_.resolve_schema(explicit_schema)), kFuzzy);
}

}  // namespace sqlsense::completion
