#include "sqlsense/completion/match_ranker.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

using namespace sqlsense::completion;

namespace {

std::vector<std::string> texts(const std::vector<Completion>& completions)
{
    std::vector<std::string> result;
    result.reserve(completions.size());
    for (const auto& completion : completions) {
        result.push_back(completion.text);
    }
    return result;
}

bool is_subsequence(std::string_view token, std::string_view candidate)
{
    std::size_t matched = 0U;
    for (const char ch : candidate) {
        if (matched < token.size() && ch == token[matched]) {
            ++matched;
        }
    }
    return matched == token.size();
}

}  // namespace

TEST_CASE("last_word honours each boundary flavour")
{
    CHECK(last_word("SELECT * FROM hr.emp") == "emp");
    CHECK(last_word("SELECT * FROM hr.emp", WordBoundary::MostPunctuations) == "emp");
    CHECK(last_word("SELECT * FROM hr.emp", WordBoundary::ManyPunctuations) == "hr.emp");
    CHECK(last_word("SELECT * FROM hr.emp", WordBoundary::AllPunctuations) == "hr.emp");
    CHECK(last_word("SELECT count(fir", WordBoundary::MostPunctuations) == "fir");
    CHECK(last_word("SELECT a$b", WordBoundary::AlphanumUnderscore) == "b");
    CHECK(last_word("SELECT a$b", WordBoundary::MostPunctuations) == "a$b");
    CHECK(last_word("SELECT ") == "");
    CHECK(last_word("") == "");
    CHECK(last_word("abc") == "abc");
}

TEST_CASE("fuzzy_match finds the earliest start and the shortest span from it")
{
    const auto span = fuzzy_match("fn", "first_name");
    REQUIRE(span);
    CHECK(span->start == 0U);
    CHECK(span->length == 7U);

    const auto later = fuzzy_match("nm", "first_name");
    REQUIRE(later);
    CHECK(later->start == 6U);
    CHECK(later->length == 3U);

    CHECK_FALSE(fuzzy_match("xyz", "first_name"));
    CHECK(fuzzy_match("", "anything") == MatchSpan{0U, 0U});
}

TEST_CASE("fuzzy gaps never cross a line break")
{
    CHECK_FALSE(fuzzy_match("ab", "a\nb"));
    const auto retry = fuzzy_match("ab", "a\nab");
    REQUIRE(retry);
    CHECK(retry->start == 2U);
    CHECK(retry->length == 2U);
}

TEST_CASE("substring_match scores by token length and position")
{
    CHECK(substring_match("name", "first_name", false) == MatchSpan{4U, 6U});
    CHECK_FALSE(substring_match("name", "first_name", true));
    CHECK(substring_match("fir", "first_name", true) == MatchSpan{3U, 0U});
}

TEST_CASE("rank orders fuzzy matches by span, then start, then text")
{
    const MatchRanker ranker;
    const std::vector<std::string> candidates{"LAST_NAME", "FIRST_NAME", "EMPLOYEE_ID", "NAME"};

    const auto completions = ranker.rank("SELECT nam", candidates);
    CHECK(texts(completions) == std::vector<std::string>{"NAME", "LAST_NAME", "FIRST_NAME"});
    for (const auto& completion : completions) {
        CHECK(completion.start_position == -3);
    }
}

TEST_CASE("rank prefers exact prefixes for the current word")
{
    const MatchRanker ranker;
    const std::vector<std::string> columns{"EMPLOYEE_ID", "FIRST_NAME", "LAST_NAME"};

    const auto completions = ranker.rank("SELECT fir", columns);
    REQUIRE_FALSE(completions.empty());
    CHECK(completions.front() == Completion{"FIRST_NAME", -3});
}

TEST_CASE("prefix mode with start_only only returns candidates beginning with the token")
{
    const MatchRanker ranker;
    const std::vector<std::string> keywords{"SELECT", "SET", "INSERT INTO", "SESSION", "ASC"};

    const auto completions = ranker.rank("se", keywords, MatchOptions{true, false});
    CHECK(texts(completions) == std::vector<std::string>{"SELECT", "SESSION", "SET"});
    for (const auto& completion : completions) {
        CHECK(completion.text.rfind("SE", 0U) == 0U);
        CHECK(completion.start_position == -2);
    }

    const auto anywhere = ranker.rank("se", keywords, MatchOptions{false, false});
    CHECK(texts(anywhere) == std::vector<std::string>{"SELECT", "SESSION", "SET", "INSERT INTO"});
}

TEST_CASE("fuzzy results always contain the token as a subsequence")
{
    const MatchRanker ranker;
    const std::vector<std::string> candidates{"DEPARTMENTS", "EMPLOYEES", "JOB_HISTORY", "JOBS", "LOCATIONS",
                                              "REGIONS",     "COUNTRIES", "EMP_DETAILS_VIEW"};

    for (const std::string token : {"emp", "jh", "ons", "s", "dv"}) {
        const auto completions = ranker.rank(token, candidates);
        for (const auto& completion : completions) {
            std::string lowered = completion.text;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
                return static_cast<char>(std::tolower(ch));
            });
            CHECK(is_subsequence(token, lowered));
        }
    }
}

TEST_CASE("ranking is deterministic for identical inputs")
{
    const MatchRanker ranker;
    const std::vector<std::string> candidates{"b_col", "a_col", "col", "c_col", "ccol", "xcxoxl"};

    const auto first = ranker.rank("col", candidates);
    const auto second = ranker.rank("col", candidates);
    CHECK(first == second);

    auto reversed = candidates;
    std::reverse(reversed.begin(), reversed.end());
    CHECK(ranker.rank("col", reversed) == first);
    CHECK(texts(first) == std::vector<std::string>{"col", "a_col", "b_col", "ccol", "c_col", "xcxoxl"});
}

TEST_CASE("an empty word matches every candidate in sorted order")
{
    const MatchRanker ranker;
    const auto completions = ranker.rank("SELECT ", {"beta", "alpha"});
    REQUIRE(completions.size() == 2U);
    CHECK(completions[0] == Completion{"alpha", 0});
    CHECK(completions[1] == Completion{"beta", 0});
}

TEST_CASE("completion offsets count code points rather than bytes")
{
    CHECK(code_point_count("caf\xC3\xA9") == 4);
    CHECK(code_point_count("") == 0);

    const MatchRanker ranker;
    const auto completions = ranker.rank("SELECT * FROM \xC3\xA9t", {"\xC3\xA9t\xC3\xA9", "employees"});
    REQUIRE(completions.size() == 1U);
    CHECK(completions.front() == Completion{"\xC3\xA9t\xC3\xA9", -2});
}
