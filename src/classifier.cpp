#include "../include/redex/classifier.hpp"

#include "../include/redex/parser.hpp"
#include "../include/redex/substitute.hpp"

#include <algorithm>

namespace redex
{

namespace
{

std::string strip_whitespace(std::string a_text)
{
    a_text.erase(std::remove_if(a_text.begin(), a_text.end(),
                                [](char c) { return c == ' ' || c == '\t'; }),
                 a_text.end());
    return a_text;
}

combinator make_combinator(std::string a_name, std::string a_source)
{
    std::unique_ptr<term> l_term = parse(a_source);
    return {std::move(a_name), std::move(a_source), std::move(l_term)};
}

std::vector<combinator> build_table()
{
    std::vector<combinator> l_table;
    l_table.push_back(make_combinator("I (Identity)", "\\x.x"));
    l_table.push_back(make_combinator("K (Constant)", "\\x.\\y.x"));
    l_table.push_back(make_combinator("KI (False)", "\\x.\\y.y"));
    l_table.push_back(make_combinator("S (Substitution)", "\\x.\\y.\\z.x z (y z)"));
    l_table.push_back(make_combinator("B (Composition)", "\\f.\\g.\\x.f (g x)"));
    l_table.push_back(make_combinator("C (Flip)", "\\f.\\x.\\y.f y x"));
    l_table.push_back(make_combinator("W (Duplication)", "\\f.\\x.f x x"));
    l_table.push_back(
        make_combinator("Y (Fixed-point)", "\\f.(\\x.f (x x)) (\\x.f (x x))"));

    // church numerals: n applications of f to x
    std::string l_applied = "x";
    for(int n = 0; n <= 5; ++n)
    {
        l_table.push_back(make_combinator("Church " + std::to_string(n),
                                          "\\f.\\x." + l_applied));
        l_applied = n == 0 ? "f x" : "f (" + l_applied + ")";
    }

    return l_table;
}

} // namespace

const std::vector<combinator>& known_combinators()
{
    static const std::vector<combinator> s_table = build_table();
    return s_table;
}

std::optional<std::string> classify(const std::unique_ptr<term>& a_term,
                                    match_mode a_mode)
{
    const std::string l_printed = strip_whitespace(to_string(*a_term));

    for(const auto& l_entry : known_combinators())
    {
        if(strip_whitespace(l_entry.m_source) == l_printed)
            return l_entry.m_name;
    }

    if(a_mode == match_mode::syntactic)
        return std::nullopt;

    for(const auto& l_entry : known_combinators())
    {
        if(alpha_equivalent(l_entry.m_term, a_term))
            return l_entry.m_name;
    }

    return std::nullopt;
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"

using namespace redex;

void test_known_combinators()
{
    const auto& l_table = known_combinators();
    assert(l_table.size() == 8 + 6);

    // every source is already canonical
    for(const auto& l_entry : l_table)
        assert(to_string(*l_entry.m_term) == l_entry.m_source);

    // numerals are built by repeated application
    assert(l_table[8].m_source == "\\f.\\x.x");
    assert(l_table[9].m_source == "\\f.\\x.f x");
    assert(l_table[10].m_source == "\\f.\\x.f (f x)");
    assert(l_table[13].m_source == "\\f.\\x.f (f (f (f (f x))))");
}

void test_classify_syntactic()
{
    assert(classify(parse("\\x.x")) == std::string("I (Identity)"));
    assert(classify(parse("\\x.\\y.x")) == std::string("K (Constant)"));
    assert(classify(parse("\\f.(\\x.f (x x)) (\\x.f (x x))")) ==
           std::string("Y (Fixed-point)"));
    assert(classify(parse("\\f.\\x.x")) == std::string("Church 0"));
    assert(classify(parse("\\f.\\x.f (f (f x))")) == std::string("Church 3"));

    // incidental whitespace in the input does not matter
    assert(classify(parse("  \\x .  \\y . \\z . x z ( y z ) ")) ==
           std::string("S (Substitution)"));

    // syntactic matching misses alpha-variants
    assert(!classify(parse("\\a.a")));
    assert(!classify(parse("\\g.\\y.g (g (g y))")));

    // open and unknown terms
    assert(!classify(parse("x")));
    assert(!classify(parse("\\x.y")));
}

void test_classify_alpha()
{
    assert(classify(parse("\\a.a"), match_mode::alpha) ==
           std::string("I (Identity)"));
    assert(classify(parse("\\g.\\y.g (g (g y))"), match_mode::alpha) ==
           std::string("Church 3"));

    // exact matches win over earlier alpha matches
    assert(classify(parse("\\f.\\x.x"), match_mode::alpha) ==
           std::string("Church 0"));
    assert(classify(parse("\\a.\\b.b"), match_mode::alpha) ==
           std::string("KI (False)"));

    // still no match for open terms
    assert(!classify(parse("\\x.y"), match_mode::alpha));
}

void classifier_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_known_combinators);
    TEST(test_classify_syntactic);
    TEST(test_classify_alpha);
}

#endif
