#include "sqlsense/completion/match_ranker.hpp"

#include "sqlsense/catalog/identifier_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace sqlsense::completion {

namespace {

bool is_space(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool is_word_character(char ch) noexcept
{
    const auto value = static_cast<unsigned char>(ch);
    // Bytes of multi-byte UTF-8 sequences count as word characters.
    return value >= 0x80U || value == '_' || std::isalnum(value) != 0;
}

bool ends_word(char ch, WordBoundary boundary) noexcept
{
    switch (boundary) {
    case WordBoundary::AlphanumUnderscore:
        return !is_word_character(ch);
    case WordBoundary::MostPunctuations:
        return is_space(ch) || ch == '.' || ch == '(' || ch == ')' || ch == ':' || ch == ',';
    case WordBoundary::ManyPunctuations:
        return is_space(ch) || ch == '(' || ch == ')' || ch == ':' || ch == ',';
    case WordBoundary::AllPunctuations:
    default:
        return is_space(ch);
    }
}

struct ScoredCandidate final {
    MatchSpan span{};
    std::size_t order = 0U;
};

}  // namespace

std::int32_t code_point_count(std::string_view text) noexcept
{
    std::int32_t count = 0;
    for (const unsigned char ch : text) {
        if ((ch & 0xC0U) != 0x80U) {
            ++count;
        }
    }
    return count;
}

std::string last_word(std::string_view text, WordBoundary boundary)
{
    if (text.empty() || is_space(text.back())) {
        return {};
    }

    auto start = text.size();
    while (start > 0U && !ends_word(text[start - 1U], boundary)) {
        --start;
    }
    return std::string{text.substr(start)};
}

std::optional<MatchSpan> fuzzy_match(std::string_view token, std::string_view candidate) noexcept
{
    if (token.empty()) {
        return MatchSpan{0U, 0U};
    }

    for (auto start = candidate.find(token.front()); start != std::string_view::npos;
         start = candidate.find(token.front(), start + 1U)) {
        auto position = start + 1U;
        std::size_t matched = 1U;
        while (matched < token.size() && position < candidate.size()) {
            const char ch = candidate[position];
            if (ch == token[matched]) {
                ++matched;
            } else if (ch == '\n') {
                break;
            }
            ++position;
        }

        if (matched == token.size()) {
            return MatchSpan{position - start, start};
        }
    }
    return std::nullopt;
}

std::optional<MatchSpan> substring_match(std::string_view token, std::string_view candidate, bool start_only) noexcept
{
    if (start_only) {
        if (candidate.substr(0U, token.size()) == token) {
            return MatchSpan{token.size(), 0U};
        }
        return std::nullopt;
    }

    const auto position = candidate.find(token);
    if (position == std::string_view::npos) {
        return std::nullopt;
    }
    return MatchSpan{token.size(), position};
}

MatchRanker::MatchRanker(WordBoundary boundary) noexcept
    : boundary_{boundary}
{
}

std::vector<Completion> MatchRanker::rank(std::string_view text,
                                          std::vector<std::string> candidates,
                                          MatchOptions options) const
{
    const auto token = catalog::lowercase_copy(last_word(text, boundary_));

    std::sort(candidates.begin(), candidates.end());

    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());
    for (std::size_t index = 0U; index < candidates.size(); ++index) {
        const auto lowered = catalog::lowercase_copy(candidates[index]);
        const auto span = options.fuzzy ? fuzzy_match(token, lowered)
                                        : substring_match(token, lowered, options.start_only);
        if (span) {
            scored.push_back(ScoredCandidate{*span, index});
        }
    }

    std::stable_sort(scored.begin(), scored.end(), [](const ScoredCandidate& left, const ScoredCandidate& right) {
        return left.span < right.span;
    });

    const auto start_position = -code_point_count(token);
    std::vector<Completion> completions;
    completions.reserve(scored.size());
    for (const auto& entry : scored) {
        completions.push_back(Completion{std::move(candidates[entry.order]), start_position});
    }
    return completions;
}

}  // namespace sqlsense::completion
