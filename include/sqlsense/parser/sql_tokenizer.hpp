#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsense::parser {

enum class TokenKind : std::uint8_t {
    Word = 0,
    QuotedIdentifier,
    StringLiteral,
    Number,
    BackslashCommand,
    Operator,
    Punctuation,
    Whitespace,
    Comment,
    Other
};

struct SqlToken final {
    TokenKind kind = TokenKind::Other;
    std::string text{};
    std::size_t offset = 0U;

    [[nodiscard]] std::size_t end() const noexcept { return offset + text.size(); }
    [[nodiscard]] bool is(char punctuation) const noexcept
    {
        return kind == TokenKind::Punctuation && text.size() == 1U && text.front() == punctuation;
    }
};

struct TokenizeResult final {
    std::vector<SqlToken> tokens{};
    bool complete = false;
};

// Splits SQL text into tokens, tolerating unterminated strings, quoted identifiers
// and block comments at the end of the input.
[[nodiscard]] TokenizeResult tokenize_sql(std::string_view input);

}  // namespace sqlsense::parser
