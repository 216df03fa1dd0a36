#include "../include/redex/parser.hpp"

namespace redex
{

namespace
{

std::string render_found(const token& a_token)
{
    if(a_token.m_kind == token_kind::end_of_input)
        return "end of input";
    return "'" + a_token.m_text + "'";
}

} // namespace

parse_error::parse_error(size_t a_position, std::string a_expected,
                         std::string a_found)
    : std::runtime_error("expected " + a_expected + " but found " + a_found +
                         " at position " + std::to_string(a_position)),
      m_position(a_position), m_expected(std::move(a_expected)),
      m_found(std::move(a_found))
{
}

size_t parse_error::position() const
{
    return m_position;
}

const std::string& parse_error::expected() const
{
    return m_expected;
}

const std::string& parse_error::found() const
{
    return m_found;
}

parser::parser(std::vector<token> a_tokens)
    : m_tokens(std::move(a_tokens)), m_index(0)
{
    if(m_tokens.empty() || m_tokens.back().m_kind != token_kind::end_of_input)
        throw std::invalid_argument(
            "parser: token sequence must end with end_of_input");
}

std::unique_ptr<term> parser::parse()
{
    m_index = 0;
    auto l_result = parse_term();

    // everything up to end of input must be consumed
    if(peek().m_kind != token_kind::end_of_input)
        fail(describe(token_kind::end_of_input));

    return l_result;
}

std::unique_ptr<term> parser::parse_term()
{
    return parse_application();
}

std::unique_ptr<term> parser::parse_application()
{
    auto l_result = parse_atom();

    // fold to the left: f x y is (f x) y
    while(starts_atom(peek()))
        l_result = a(std::move(l_result), parse_atom());

    return l_result;
}

std::unique_ptr<term> parser::parse_atom()
{
    const token& l_token = peek();

    switch(l_token.m_kind)
    {
    case token_kind::identifier:
        return v(advance().m_text);
    case token_kind::lparen:
    {
        advance();
        auto l_inner = parse_term();
        expect(token_kind::rparen, describe(token_kind::rparen));
        return l_inner;
    }
    case token_kind::lambda:
        return parse_lambda();
    default:
        fail("variable, '(' or abstraction");
    }
}

std::unique_ptr<term> parser::parse_lambda()
{
    expect(token_kind::lambda, describe(token_kind::lambda));
    std::string l_param =
        expect(token_kind::identifier, "parameter name").m_text;
    expect(token_kind::dot, "'.' after abstraction parameter");

    // the body is a full term, not an atom
    return f(std::move(l_param), parse_term());
}

const token& parser::peek() const
{
    return m_tokens[m_index];
}

const token& parser::advance()
{
    const token& l_token = m_tokens[m_index];

    // end_of_input is sticky
    if(l_token.m_kind != token_kind::end_of_input)
        ++m_index;

    return l_token;
}

const token& parser::expect(token_kind a_kind, const std::string& a_expected)
{
    if(peek().m_kind != a_kind)
        fail(a_expected);

    return advance();
}

bool parser::starts_atom(const token& a_token) const
{
    return a_token.m_kind == token_kind::identifier ||
           a_token.m_kind == token_kind::lparen ||
           a_token.m_kind == token_kind::lambda;
}

void parser::fail(const std::string& a_expected) const
{
    throw parse_error(peek().m_position, a_expected, render_found(peek()));
}

std::unique_ptr<term> parse_tokens(std::vector<token> a_tokens)
{
    parser l_parser(std::move(a_tokens));
    return l_parser.parse();
}

std::unique_ptr<term> parse(const std::string& a_text,
                            const lexer_options& a_options)
{
    return parse_tokens(tokenize(a_text, a_options));
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"

using namespace redex;

namespace
{

// runs a_input through the parser and returns the error it raised
parse_error expect_parse_error(const std::string& a_input)
{
    try
    {
        parse(a_input);
    }
    catch(const parse_error& l_error)
    {
        return l_error;
    }
    assert(false && "input was expected to fail parsing");
    return parse_error(0, "", "");
}

} // namespace

void test_parse_atoms()
{
    // single variable
    assert(parse("x")->equals(v("x")));

    // parentheses leave no trace in the tree
    assert(parse("((x))")->equals(v("x")));

    // abstraction
    assert(parse("\\x.x")->equals(f("x", v("x"))));
    assert(parse("λx.x")->equals(f("x", v("x"))));
}

void test_parse_application_associativity()
{
    // f x y is (f x) y
    assert(parse("f x y")->equals(a(a(v("f"), v("x")), v("y"))));

    // parentheses override it
    assert(parse("f (x y)")->equals(a(v("f"), a(v("x"), v("y")))));

    // (\x.x) y
    assert(parse("(\\x.x) y")->equals(a(f("x", v("x")), v("y"))));

    // (\x.\y.x) a b
    assert(parse("(\\x.\\y.x) a b")
               ->equals(a(a(f("x", f("y", v("x"))), v("a")), v("b"))));
}

void test_parse_lambda_extent()
{
    // \x.\y.x y is \x.(\y.(x y))
    assert(parse("\\x.\\y.x y")->equals(f("x", f("y", a(v("x"), v("y"))))));

    // a lambda in argument position swallows the rest of the application
    assert(parse("f \\x.x y")->equals(a(v("f"), f("x", a(v("x"), v("y"))))));

    // a closing paren ends the body
    assert(parse("(\\x.x) (\\y.y) z")
               ->equals(a(a(f("x", v("x")), f("y", v("y"))), v("z"))));

    // church addition
    auto l_plus = parse("\\m.\\n.\\f.\\x.m f (n f x)");
    auto l_expected =
        f("m", f("n", f("f", f("x", a(a(v("m"), v("f")),
                                      a(a(v("n"), v("f")), v("x")))))));
    assert(l_plus->equals(l_expected));
}

void test_parse_errors()
{
    // missing closing paren
    {
        auto l_error = expect_parse_error("(\\x.x");
        assert(l_error.position() == 5);
        assert(l_error.expected() == "')'");
        assert(l_error.found() == "end of input");
    }

    // missing dot after the parameter
    {
        auto l_error = expect_parse_error("\\x x");
        assert(l_error.position() == 3);
        assert(l_error.expected() == "'.' after abstraction parameter");
        assert(l_error.found() == "'x'");
    }

    // dangling abstraction marker
    {
        auto l_error = expect_parse_error("\\");
        assert(l_error.position() == 1);
        assert(l_error.expected() == "parameter name");
    }

    // empty body
    {
        auto l_error = expect_parse_error("\\x.");
        assert(l_error.position() == 3);
        assert(l_error.found() == "end of input");
    }

    // unconsumed trailing tokens
    {
        auto l_error = expect_parse_error("x)");
        assert(l_error.position() == 1);
        assert(l_error.expected() == "end of input");
        assert(l_error.found() == "')'");
    }

    // a stray dot
    {
        auto l_error = expect_parse_error(". x");
        assert(l_error.position() == 0);
        assert(l_error.found() == "'.'");
    }

    // the message carries all three parts
    {
        auto l_error = expect_parse_error("()");
        std::string l_message = l_error.what();
        assert(l_message.find("found ')'") != std::string::npos);
        assert(l_message.find("position 1") != std::string::npos);
    }
}

void test_parse_lex_errors_propagate()
{
    bool l_threw = false;
    try
    {
        parse("   ");
    }
    catch(const lex_error&)
    {
        l_threw = true;
    }
    assert(l_threw);

    // strict mode reaches the lexer
    lexer_options l_options;
    l_options.m_strict = true;
    l_threw = false;
    try
    {
        parse("x # y", l_options);
    }
    catch(const lex_error& l_error)
    {
        l_threw = true;
        assert(l_error.position() == 2);
    }
    assert(l_threw);
}

void test_parse_print_round_trip()
{
    const char* l_inputs[] = {
        "x",
        "\\x.x",
        "f x y",
        "f (x y)",
        "(\\x.x x) (\\x.x x)",
        "\\f.(\\x.f (x x)) (\\x.f (x x))",
        "\\m.\\n.\\f.\\x.m f (n f x)",
        "a (\\b.b) c",
        "(\\x.\\y.x) (\\z.z) w1",
    };

    for(const char* l_input : l_inputs)
    {
        auto l_parsed = parse(l_input);
        const std::string l_printed = to_string(*l_parsed);

        // canonical form already, so printing is the identity
        assert(l_printed == l_input);

        // and re-parsing yields the same tree
        assert(parse(l_printed)->equals(l_parsed));
    }

    // redundant parentheses and the unicode glyph are normalized away
    {
        auto l_parsed = parse("((λx.(x)) ((y)))");
        assert(to_string(*l_parsed) == "(\\x.x) y");
        assert(parse(to_string(*l_parsed))->equals(l_parsed));
    }
}

void test_parser_requires_end_token()
{
    bool l_threw = false;
    try
    {
        parser l_parser(std::vector<token>{{token_kind::identifier, "x", 0}});
    }
    catch(const std::invalid_argument&)
    {
        l_threw = true;
    }
    assert(l_threw);

    // parse_tokens accepts a hand-built sequence
    std::vector<token> l_tokens{{token_kind::identifier, "f", 0},
                                {token_kind::identifier, "x", 2},
                                {token_kind::end_of_input, "", 3}};
    assert(parse_tokens(l_tokens)->equals(a(v("f"), v("x"))));
}

void parser_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_parse_atoms);
    TEST(test_parse_application_associativity);
    TEST(test_parse_lambda_extent);
    TEST(test_parse_errors);
    TEST(test_parse_lex_errors_propagate);
    TEST(test_parse_print_round_trip);
    TEST(test_parser_requires_end_token);
}

#endif
