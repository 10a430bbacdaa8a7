#include "sqlsense/parser/context_classifier.hpp"

#include "sqlsense/catalog/completion_vocabulary.hpp"

#include <array>
#include <algorithm>
#include <utility>

namespace sqlsense::parser {

namespace {

using completion::AliasSuggestion;
using completion::ColumnSuggestion;
using completion::DatabaseSuggestion;
using completion::FavoriteQuerySuggestion;
using completion::FunctionSuggestion;
using completion::KeywordSuggestion;
using completion::SchemaSuggestion;
using completion::SpecialSuggestion;
using completion::SuggestionRequest;
using completion::TableFormatSuggestion;
using completion::TableReference;
using completion::TableSuggestion;
using completion::ViewSuggestion;

constexpr std::array<std::string_view, 13U> kColumnKeywords{
    "SELECT", "WHERE", "HAVING", "DISTINCT", "SET", "AND", "OR", "NOT", "CASE", "WHEN", "THEN", "ELSE", "BY"};

constexpr std::array<std::string_view, 7U> kRelationKeywords{
    "FROM", "JOIN", "INTO", "UPDATE", "TABLE", "TRUNCATE", "DESCRIBE"};

constexpr std::array<std::string_view, 3U> kDatabaseKeywords{"USE", "DATABASE", "SCHEMA"};

constexpr std::array<std::string_view, 4U> kTableListKeywords{"FROM", "JOIN", "UPDATE", "INTO"};

// Clause words that terminate a table list even when the dialect does not reserve them.
constexpr std::array<std::string_view, 22U> kClauseWords{
    "AS",    "ON",    "USING", "WHERE", "JOIN",  "LEFT",   "RIGHT", "INNER",  "OUTER",     "FULL",  "CROSS",
    "NATURAL", "SET", "VALUES", "GROUP", "ORDER", "HAVING", "UNION", "MINUS", "INTERSECT", "LIMIT", "SELECT"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& words, std::string_view word)
{
    return std::find(words.begin(), words.end(), word) != words.end();
}

bool is_significant(const SqlToken& token) noexcept
{
    return token.kind != TokenKind::Whitespace && token.kind != TokenKind::Comment;
}

bool is_name(const SqlToken& token) noexcept
{
    return token.kind == TokenKind::Word || token.kind == TokenKind::QuotedIdentifier;
}

bool is_partial_word(const SqlToken& token) noexcept
{
    return token.kind == TokenKind::Word || token.kind == TokenKind::QuotedIdentifier
        || token.kind == TokenKind::BackslashCommand || token.kind == TokenKind::Number;
}

bool iequals(std::string_view left, std::string_view right)
{
    return catalog::uppercase_copy(left) == catalog::uppercase_copy(right);
}

std::vector<SqlToken> significant_tokens(std::vector<SqlToken> tokens)
{
    std::vector<SqlToken> significant;
    significant.reserve(tokens.size());
    for (auto& token : tokens) {
        if (is_significant(token)) {
            significant.push_back(std::move(token));
        }
    }
    return significant;
}

// Index of the first token after the last statement separator located before limit.
std::size_t statement_start(const std::vector<SqlToken>& tokens, std::size_t limit)
{
    std::size_t start = 0U;
    for (std::size_t index = 0U; index < tokens.size() && tokens[index].offset < limit; ++index) {
        if (tokens[index].is(';')) {
            start = index + 1U;
        }
    }
    return start;
}

std::vector<SuggestionRequest> column_and_function(const std::vector<TableReference>& tables)
{
    std::vector<SuggestionRequest> suggestions;
    suggestions.emplace_back(ColumnSuggestion{tables, false});
    suggestions.emplace_back(FunctionSuggestion{});
    return suggestions;
}

std::vector<SuggestionRequest> relations()
{
    std::vector<SuggestionRequest> suggestions;
    suggestions.emplace_back(SchemaSuggestion{});
    suggestions.emplace_back(TableSuggestion{});
    suggestions.emplace_back(ViewSuggestion{});
    return suggestions;
}

std::vector<SuggestionRequest> single(SuggestionRequest request)
{
    std::vector<SuggestionRequest> suggestions;
    suggestions.push_back(std::move(request));
    return suggestions;
}

std::vector<std::string> alias_names(const std::vector<TableReference>& tables)
{
    std::vector<std::string> aliases;
    aliases.reserve(tables.size());
    for (const auto& table : tables) {
        aliases.push_back(table.alias.value_or(table.name));
    }
    return aliases;
}

std::vector<SuggestionRequest> backslash_suggestions(std::string_view command)
{
    if (command == "\\T") {
        return single(TableFormatSuggestion{});
    }
    if (command == "\\f" || command == "\\fd") {
        return single(FavoriteQuerySuggestion{});
    }
    if (command == "\\use" || command == "\\u") {
        return single(DatabaseSuggestion{});
    }
    if (command == "\\dt") {
        return relations();
    }
    return {};
}

std::vector<SuggestionRequest> qualified_suggestions(std::string_view qualifier, const std::vector<TableReference>& tables)
{
    std::vector<TableReference> matching;
    for (const auto& table : tables) {
        const auto alias_matches = table.alias && iequals(*table.alias, qualifier);
        const auto name_matches = iequals(catalog::unescape_name(table.name), catalog::unescape_name(qualifier));
        if (alias_matches || name_matches) {
            matching.push_back(table);
        }
    }

    const auto schema = catalog::unescape_name(qualifier);
    std::vector<SuggestionRequest> suggestions;
    if (!matching.empty()) {
        suggestions.emplace_back(ColumnSuggestion{std::move(matching), false});
    }
    suggestions.emplace_back(TableSuggestion{schema});
    suggestions.emplace_back(ViewSuggestion{schema});
    suggestions.emplace_back(FunctionSuggestion{schema});
    return suggestions;
}

}  // namespace

ContextClassifier::ContextClassifier()
    : ContextClassifier(Config{catalog::derive_reserved_words(catalog::make_default_keywords())})
{
}

ContextClassifier::ContextClassifier(Config config)
    : config_{std::move(config)}
{
}

bool ContextClassifier::is_reserved(std::string_view word) const
{
    const auto upper = catalog::uppercase_copy(word);
    return contains(kClauseWords, upper) || config_.reserved_words.contains(upper);
}

std::vector<TableReference> ContextClassifier::extract_tables(std::span<const SqlToken> statement) const
{
    std::vector<TableReference> tables;
    std::size_t index = 0U;
    while (index < statement.size()) {
        const auto& token = statement[index++];
        if (token.kind != TokenKind::Word || !contains(kTableListKeywords, catalog::uppercase_copy(token.text))) {
            continue;
        }

        const bool allow_list = iequals(token.text, "FROM");
        while (index < statement.size()) {
            const auto& head = statement[index];
            if (!is_name(head) || (head.kind == TokenKind::Word && is_reserved(head.text))) {
                break;
            }

            TableReference reference{};
            reference.name = head.text;
            ++index;
            if (index + 1U < statement.size() && statement[index].is('.') && is_name(statement[index + 1U])) {
                reference.schema = catalog::unescape_name(reference.name);
                reference.name = statement[index + 1U].text;
                index += 2U;
            }

            if (index < statement.size() && statement[index].kind == TokenKind::Word && iequals(statement[index].text, "AS")) {
                ++index;
            }
            if (index < statement.size() && is_name(statement[index])
                && !(statement[index].kind == TokenKind::Word && is_reserved(statement[index].text))) {
                reference.alias = catalog::unescape_name(statement[index].text);
                ++index;
            }
            tables.push_back(std::move(reference));

            if (!allow_list || index >= statement.size() || !statement[index].is(',')) {
                break;
            }
            ++index;
        }
    }
    return tables;
}

ContextClassification ContextClassifier::classify(std::string_view text, std::string_view text_before_cursor) const
{
    ContextClassification result{};
    const auto cursor = text_before_cursor.size();

    auto full = tokenize_sql(text);
    auto before = tokenize_sql(text_before_cursor);
    if (!full.complete || !before.complete) {
        result.diagnostics.push_back({ContextSeverity::Warning, "unable to tokenize statement", cursor});
        result.suggestions = single(KeywordSuggestion{});
        return result;
    }

    const auto all_tokens = significant_tokens(std::move(full.tokens));
    const auto first = statement_start(all_tokens, cursor);
    auto last = first;
    while (last < all_tokens.size() && !(all_tokens[last].is(';') && all_tokens[last].offset >= cursor)) {
        ++last;
    }
    result.tables = extract_tables(std::span<const SqlToken>{all_tokens}.subspan(first, last - first));

    auto context = significant_tokens(std::move(before.tokens));
    context.erase(context.begin(), context.begin() + static_cast<std::ptrdiff_t>(statement_start(context, cursor)));

    if (!context.empty() && context.back().end() == cursor && is_partial_word(context.back())) {
        result.current_word = context.back().text;
        context.pop_back();
    }

    if (context.empty()) {
        if (!result.current_word.empty() && result.current_word.front() == '\\') {
            result.suggestions = single(SpecialSuggestion{});
        } else {
            result.suggestions.emplace_back(KeywordSuggestion{});
            result.suggestions.emplace_back(SpecialSuggestion{});
        }
        return result;
    }

    if (context.front().kind == TokenKind::BackslashCommand) {
        result.suggestions = backslash_suggestions(context.front().text);
        return result;
    }

    const auto& previous = context.back();
    if (previous.is('.') && context.size() >= 2U && is_name(context[context.size() - 2U])) {
        result.suggestions = qualified_suggestions(context[context.size() - 2U].text, result.tables);
        return result;
    }

    if (previous.kind == TokenKind::Word) {
        const auto keyword = catalog::uppercase_copy(previous.text);
        const auto statement_verb = catalog::uppercase_copy(context.front().text);
        if (keyword == "ON") {
            result.suggestions.emplace_back(AliasSuggestion{alias_names(result.tables)});
            result.suggestions.emplace_back(ColumnSuggestion{result.tables, false});
        } else if (contains(kColumnKeywords, keyword)) {
            result.suggestions = column_and_function(result.tables);
            result.suggestions.emplace_back(KeywordSuggestion{});
        } else if (contains(kRelationKeywords, keyword) || (keyword == "DESC" && context.size() == 1U)) {
            result.suggestions = relations();
        } else if (contains(kDatabaseKeywords, keyword)) {
            result.suggestions = single(DatabaseSuggestion{});
        } else if (keyword == "SHOW") {
            result.suggestions = single(completion::ShowSuggestion{});
        } else if (keyword == "CHANGE") {
            result.suggestions = single(completion::ChangeSuggestion{});
        } else if (keyword == "USER" || (keyword == "TO" && statement_verb == "GRANT")) {
            result.suggestions = single(completion::UserSuggestion{});
        } else if (keyword != "AS") {
            result.suggestions = single(KeywordSuggestion{});
        }
        return result;
    }

    if (previous.is('(')) {
        if (context.size() >= 2U && context[context.size() - 2U].kind == TokenKind::Word
            && iequals(context[context.size() - 2U].text, "USING")) {
            result.suggestions = single(ColumnSuggestion{result.tables, true});
        } else {
            result.suggestions = column_and_function(result.tables);
            result.suggestions.emplace_back(KeywordSuggestion{});
        }
        return result;
    }

    if (previous.is(',')) {
        std::int32_t depth = 0;
        for (auto index = context.size(); index-- > 0U;) {
            const auto& token = context[index];
            if (token.is(')')) {
                ++depth;
            } else if (token.is('(')) {
                if (depth == 0) {
                    const bool using_list = index > 0U && context[index - 1U].kind == TokenKind::Word
                                         && iequals(context[index - 1U].text, "USING");
                    result.suggestions = using_list ? single(ColumnSuggestion{result.tables, true})
                                                    : column_and_function(result.tables);
                    return result;
                }
                --depth;
            } else if (depth == 0 && token.kind == TokenKind::Word) {
                const auto keyword = catalog::uppercase_copy(token.text);
                if (keyword == "FROM") {
                    result.suggestions = relations();
                    return result;
                }
                if (contains(kColumnKeywords, keyword)) {
                    break;
                }
            }
        }
        result.suggestions = column_and_function(result.tables);
        return result;
    }

    if (previous.kind == TokenKind::Operator) {
        result.suggestions = column_and_function(result.tables);
        return result;
    }

    result.suggestions = single(KeywordSuggestion{});
    return result;
}

}  // namespace sqlsense::parser
