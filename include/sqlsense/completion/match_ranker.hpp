#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsense::completion {

// Characters that end the word before the cursor, from narrowest to widest word.
enum class WordBoundary : std::uint8_t {
    AlphanumUnderscore = 0,  // anything but [A-Za-z0-9_]
    MostPunctuations,        // whitespace . ( ) : ,
    ManyPunctuations,        // whitespace ( ) : ,
    AllPunctuations          // whitespace only
};

struct Completion final {
    std::string text{};
    // Non-positive; the caller replaces the last -start_position characters (UTF-8 code points) of its input.
    std::int32_t start_position = 0;

    bool operator==(const Completion&) const = default;
};

struct MatchOptions final {
    bool start_only = false;
    bool fuzzy = true;
};

struct MatchSpan final {
    std::size_t length = 0U;
    std::size_t start = 0U;

    auto operator<=>(const MatchSpan&) const = default;
};

// Counts UTF-8 code points; continuation bytes are not counted.
[[nodiscard]] std::int32_t code_point_count(std::string_view text) noexcept;

[[nodiscard]] std::string last_word(std::string_view text, WordBoundary boundary = WordBoundary::AlphanumUnderscore);

// Earliest, shortest span of candidate holding token as a subsequence. Gaps never
// cross a line break. Both arguments are expected in lowercase.
[[nodiscard]] std::optional<MatchSpan> fuzzy_match(std::string_view token, std::string_view candidate) noexcept;

// Substring match scored by the token length; with start_only the token must be a prefix.
[[nodiscard]] std::optional<MatchSpan> substring_match(std::string_view token,
                                                       std::string_view candidate,
                                                       bool start_only) noexcept;

class MatchRanker final {
public:
    explicit MatchRanker(WordBoundary boundary = WordBoundary::MostPunctuations) noexcept;

    // Orders matching candidates by (span length, span start, candidate text).
    [[nodiscard]] std::vector<Completion> rank(std::string_view text,
                                               std::vector<std::string> candidates,
                                               MatchOptions options = {}) const;

    [[nodiscard]] WordBoundary boundary() const noexcept { return boundary_; }

private:
    WordBoundary boundary_ = WordBoundary::MostPunctuations;
};

}  // namespace sqlsense::completion
