#include "sqlsense/parser/sql_tokenizer.hpp"

#include <tao/pegtl.hpp>

namespace sqlsense::parser {

namespace {

namespace pegtl = tao::pegtl;

struct line_comment : pegtl::seq<pegtl::two<'-'>, pegtl::until<pegtl::eolf>> {
};

struct block_comment : pegtl::seq<pegtl::string<'/', '*'>, pegtl::until<pegtl::sor<pegtl::string<'*', '/'>, pegtl::eof>>> {
};

struct whitespace : pegtl::plus<pegtl::space> {
};

struct string_literal_char : pegtl::sor<pegtl::two<'\''>, pegtl::not_one<'\''>> {
};

struct string_literal : pegtl::seq<pegtl::one<'\''>, pegtl::star<string_literal_char>, pegtl::opt<pegtl::one<'\''>>> {
};

struct quoted_identifier : pegtl::seq<pegtl::one<'"'>, pegtl::star<pegtl::not_one<'"'>>, pegtl::opt<pegtl::one<'"'>>> {
};

struct number : pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<pegtl::one<'.'>, pegtl::star<pegtl::digit>>> {
};

struct backslash_command : pegtl::seq<pegtl::one<'\\'>, pegtl::star<pegtl::not_one<' ', '\t', '\r', '\n', ';'>>> {
};

struct word_head : pegtl::ranges<'a', 'z', 'A', 'Z', '_'> {
};

struct word_tail : pegtl::sor<pegtl::alnum, pegtl::one<'_', '$', '#'>> {
};

struct word : pegtl::seq<word_head, pegtl::star<word_tail>> {
};

struct operator_token : pegtl::sor<pegtl::string<'<', '='>,
                                   pegtl::string<'>', '='>,
                                   pegtl::string<'<', '>'>,
                                   pegtl::string<'!', '='>,
                                   pegtl::string<'|', '|'>,
                                   pegtl::one<'=', '<', '>', '+', '-', '*', '/', '%'>> {
};

struct punctuation : pegtl::one<'(', ')', ',', ';', '.'> {
};

struct other : pegtl::any {
};

struct token : pegtl::sor<line_comment,
                          block_comment,
                          whitespace,
                          string_literal,
                          quoted_identifier,
                          number,
                          backslash_command,
                          word,
                          operator_token,
                          punctuation,
                          other> {
};

struct grammar : pegtl::seq<pegtl::star<token>, pegtl::eof> {
};

template <typename Rule>
struct action : pegtl::nothing<Rule> {
};

template <TokenKind Kind>
struct emit_token {
    template <typename ActionInput>
    static void apply(const ActionInput& in, std::vector<SqlToken>& tokens)
    {
        SqlToken token{};
        token.kind = Kind;
        token.text = in.string();
        token.offset = in.position().byte;
        tokens.push_back(std::move(token));
    }
};

template <>
struct action<line_comment> : emit_token<TokenKind::Comment> {
};

template <>
struct action<block_comment> : emit_token<TokenKind::Comment> {
};

template <>
struct action<whitespace> : emit_token<TokenKind::Whitespace> {
};

template <>
struct action<string_literal> : emit_token<TokenKind::StringLiteral> {
};

template <>
struct action<quoted_identifier> : emit_token<TokenKind::QuotedIdentifier> {
};

template <>
struct action<number> : emit_token<TokenKind::Number> {
};

template <>
struct action<backslash_command> : emit_token<TokenKind::BackslashCommand> {
};

template <>
struct action<word> : emit_token<TokenKind::Word> {
};

template <>
struct action<operator_token> : emit_token<TokenKind::Operator> {
};

template <>
struct action<punctuation> : emit_token<TokenKind::Punctuation> {
};

template <>
struct action<other> : emit_token<TokenKind::Other> {
};

}  // namespace

TokenizeResult tokenize_sql(std::string_view input)
{
    TokenizeResult result{};
    pegtl::memory_input in(input.data(), input.size(), "sql");
    result.complete = pegtl::parse<grammar, action>(in, result.tokens);
    return result;
}

}  // namespace sqlsense::parser
