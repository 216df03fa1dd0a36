#ifndef REDEX_PARSER_HPP
#define REDEX_PARSER_HPP

#include "lexer.hpp"
#include "term.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace redex
{

class parse_error : public std::runtime_error
{
  public:
    parse_error(size_t a_position, std::string a_expected, std::string a_found);

    // byte offset of the offending token
    size_t position() const;
    const std::string& expected() const;
    const std::string& found() const;

  private:
    size_t m_position;
    std::string m_expected;
    std::string m_found;
};

// Recursive-descent parser over a token sequence:
//
//   term        := application
//   application := atom (atom)*              (left-associative)
//   atom        := VAR | '(' term ')' | LAMBDA VAR '.' term
//
// A lambda body is a full term, so it extends as far right as possible.
class parser
{
  public:
    // a_tokens must end with an end_of_input token, as tokenize produces
    explicit parser(std::vector<token> a_tokens);

    // parses the whole sequence, throws parse_error on malformed input or
    // trailing tokens
    std::unique_ptr<term> parse();

  private:
    std::unique_ptr<term> parse_term();
    std::unique_ptr<term> parse_application();
    std::unique_ptr<term> parse_atom();
    std::unique_ptr<term> parse_lambda();

    const token& peek() const;
    const token& advance();
    const token& expect(token_kind a_kind, const std::string& a_expected);
    bool starts_atom(const token& a_token) const;

    [[noreturn]] void fail(const std::string& a_expected) const;

    std::vector<token> m_tokens;
    size_t m_index;
};

std::unique_ptr<term> parse_tokens(std::vector<token> a_tokens);

// throws lex_error or parse_error
std::unique_ptr<term> parse(const std::string& a_text,
                            const lexer_options& a_options = lexer_options());

} // namespace redex

#endif
