#ifndef REDEX_LEXER_HPP
#define REDEX_LEXER_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace redex
{

enum class token_kind
{
    lparen,
    rparen,
    dot,
    // both "\" and "λ" lex to this
    lambda,
    identifier,
    end_of_input,
};

struct token
{
    token_kind m_kind;
    // source text of the token, "\" for either abstraction marker
    std::string m_text;
    // byte offset into the input
    size_t m_position;
};

struct lexer_options
{
    // reject characters outside the grammar instead of skipping them
    bool m_strict = false;
};

class lex_error : public std::runtime_error
{
  public:
    lex_error(const std::string& a_message, size_t a_position);

    size_t position() const;

  private:
    size_t m_position;
};

// human readable name of a token kind, used in error messages
std::string describe(token_kind a_kind);

// splits a_text into tokens, always terminated by an end_of_input token.
// throws lex_error if a_text holds no tokens, or in strict mode on the first
// character that is neither whitespace nor part of the grammar.
std::vector<token> tokenize(const std::string& a_text,
                            const lexer_options& a_options = lexer_options());

} // namespace redex

#endif
