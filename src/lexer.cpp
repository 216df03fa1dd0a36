#include "../include/redex/lexer.hpp"

namespace redex
{

namespace
{

// UTF-8 encoding of U+03BB
const char LAMBDA_GLYPH[] = "\xCE\xBB";

bool is_letter(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool is_whitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
           c == '\f';
}

} // namespace

lex_error::lex_error(const std::string& a_message, size_t a_position)
    : std::runtime_error(a_message), m_position(a_position)
{
}

size_t lex_error::position() const
{
    return m_position;
}

std::string describe(token_kind a_kind)
{
    switch(a_kind)
    {
    case token_kind::lparen:
        return "'('";
    case token_kind::rparen:
        return "')'";
    case token_kind::dot:
        return "'.'";
    case token_kind::lambda:
        return "abstraction marker";
    case token_kind::identifier:
        return "identifier";
    case token_kind::end_of_input:
        return "end of input";
    }
    return "unknown token";
}

std::vector<token> tokenize(const std::string& a_text,
                            const lexer_options& a_options)
{
    std::vector<token> l_tokens;
    size_t i = 0;

    while(i < a_text.size())
    {
        const char c = a_text[i];

        if(is_whitespace(c))
        {
            ++i;
            continue;
        }

        if(c == '(')
        {
            l_tokens.push_back({token_kind::lparen, "(", i});
            ++i;
            continue;
        }

        if(c == ')')
        {
            l_tokens.push_back({token_kind::rparen, ")", i});
            ++i;
            continue;
        }

        if(c == '.')
        {
            l_tokens.push_back({token_kind::dot, ".", i});
            ++i;
            continue;
        }

        if(c == '\\')
        {
            l_tokens.push_back({token_kind::lambda, "\\", i});
            ++i;
            continue;
        }

        if(a_text.compare(i, sizeof(LAMBDA_GLYPH) - 1, LAMBDA_GLYPH) == 0)
        {
            l_tokens.push_back({token_kind::lambda, "\\", i});
            i += sizeof(LAMBDA_GLYPH) - 1;
            continue;
        }

        if(is_letter(c))
        {
            const size_t l_begin = i;
            while(i < a_text.size() &&
                  (is_letter(a_text[i]) || is_digit(a_text[i])))
                ++i;
            l_tokens.push_back({token_kind::identifier,
                                a_text.substr(l_begin, i - l_begin), l_begin});
            continue;
        }

        if(a_options.m_strict)
            throw lex_error("unexpected character '" + std::string(1, c) +
                                "' at position " + std::to_string(i),
                            i);

        // lenient mode drops anything outside the grammar
        ++i;
    }

    if(l_tokens.empty())
        throw lex_error("empty expression", 0);

    l_tokens.push_back({token_kind::end_of_input, "", a_text.size()});
    return l_tokens;
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"

using namespace redex;

namespace
{

std::vector<token_kind> kinds_of(const std::vector<token>& a_tokens)
{
    std::vector<token_kind> l_kinds;
    for(const auto& l_token : a_tokens)
        l_kinds.push_back(l_token.m_kind);
    return l_kinds;
}

} // namespace

void test_tokenize_basic()
{
    // (\x.x) y
    {
        auto l_tokens = tokenize("(\\x.x) y");
        std::vector<token_kind> l_expected{
            token_kind::lparen,     token_kind::lambda, token_kind::identifier,
            token_kind::dot,        token_kind::identifier,
            token_kind::rparen,     token_kind::identifier,
            token_kind::end_of_input};
        assert(kinds_of(l_tokens) == l_expected);

        // positions are byte offsets
        assert(l_tokens[0].m_position == 0);
        assert(l_tokens[1].m_position == 1);
        assert(l_tokens[6].m_position == 7);
        assert(l_tokens[6].m_text == "y");
        assert(l_tokens[7].m_position == 8);
    }

    // identifiers are maximal runs, digits allowed after the first letter
    {
        auto l_tokens = tokenize("foo x1 bar");
        assert(l_tokens.size() == 4);
        assert(l_tokens[0].m_text == "foo");
        assert(l_tokens[1].m_text == "x1");
        assert(l_tokens[2].m_text == "bar");
        assert(l_tokens[2].m_position == 7);
    }

    // whitespace of every kind is discarded
    {
        auto l_tokens = tokenize(" \t x \n\r y ");
        assert(l_tokens.size() == 3);
        assert(l_tokens[0].m_text == "x");
        assert(l_tokens[1].m_text == "y");
    }
}

void test_tokenize_lambda_glyph()
{
    // the glyph and the backslash both normalize to the same token
    auto l_unicode = tokenize("λx.x");
    auto l_ascii = tokenize("\\x.x");
    assert(kinds_of(l_unicode) == kinds_of(l_ascii));
    assert(l_unicode[0].m_kind == token_kind::lambda);
    assert(l_unicode[0].m_text == "\\");

    // the glyph is two bytes wide
    assert(l_unicode[1].m_position == 2);
}

void test_tokenize_lenient()
{
    // unknown characters vanish silently
    auto l_tokens = tokenize("x + y; 3");
    assert(l_tokens.size() == 3);
    assert(l_tokens[0].m_text == "x");
    assert(l_tokens[1].m_text == "y");
    assert(l_tokens[1].m_position == 4);
}

void test_tokenize_strict()
{
    lexer_options l_options;
    l_options.m_strict = true;

    // grammar characters still pass
    assert(tokenize("(\\x.x) y", l_options).size() == 8);

    // anything else is an error at its offset
    bool l_threw = false;
    try
    {
        tokenize("x + y", l_options);
    }
    catch(const lex_error& l_error)
    {
        l_threw = true;
        assert(l_error.position() == 2);
    }
    assert(l_threw);
}

void test_tokenize_empty()
{
    const char* l_inputs[] = {"", "   ", "\t\n", "+-*"};

    for(const char* l_input : l_inputs)
    {
        bool l_threw = false;
        try
        {
            tokenize(l_input);
        }
        catch(const lex_error& l_error)
        {
            l_threw = true;
            assert(l_error.position() == 0);
        }
        assert(l_threw);
    }
}

void test_describe()
{
    assert(describe(token_kind::rparen) == "')'");
    assert(describe(token_kind::end_of_input) == "end of input");
    assert(describe(token_kind::identifier) == "identifier");
}

void lexer_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_tokenize_basic);
    TEST(test_tokenize_lambda_glyph);
    TEST(test_tokenize_lenient);
    TEST(test_tokenize_strict);
    TEST(test_tokenize_empty);
    TEST(test_describe);
}

#endif
