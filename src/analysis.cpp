#include "../include/redex/analysis.hpp"

#include <algorithm>
#include <stdexcept>

namespace redex
{

namespace
{

// counts abstractions and measures depth in one walk
void measure(const term* a_term, size_t a_level, size_t& a_lambda_count,
             size_t& a_depth)
{
    a_depth = std::max(a_depth, a_level);

    if(dynamic_cast<const var*>(a_term))
        return;

    if(const func* l_func = dynamic_cast<const func*>(a_term))
    {
        ++a_lambda_count;
        measure(l_func->m_body.get(), a_level + 1, a_lambda_count, a_depth);
        return;
    }

    if(const app* l_app = dynamic_cast<const app*>(a_term))
    {
        measure(l_app->m_lhs.get(), a_level + 1, a_lambda_count, a_depth);
        measure(l_app->m_rhs.get(), a_level + 1, a_lambda_count, a_depth);
        return;
    }

    throw std::runtime_error("analyze: invalid term type");
}

} // namespace

std::string to_string(term_kind a_kind)
{
    switch(a_kind)
    {
    case term_kind::variable:
        return "variable";
    case term_kind::closed_lambda:
        return "closed_lambda";
    case term_kind::open_lambda:
        return "open_lambda";
    case term_kind::application:
        return "application";
    }
    return "unknown";
}

term_analysis analyze(const std::unique_ptr<term>& a_term)
{
    term_analysis l_result;

    const std::set<std::string> l_free = free_variables(*a_term);
    const std::set<std::string> l_bound = bound_variables(*a_term);
    l_result.m_free_variables.assign(l_free.begin(), l_free.end());
    l_result.m_bound_variables.assign(l_bound.begin(), l_bound.end());
    l_result.m_is_closed = l_free.empty();

    if(dynamic_cast<const var*>(a_term.get()))
        l_result.m_kind = term_kind::variable;
    else if(dynamic_cast<const func*>(a_term.get()))
        l_result.m_kind = l_result.m_is_closed ? term_kind::closed_lambda
                                               : term_kind::open_lambda;
    else
        l_result.m_kind = term_kind::application;

    measure(a_term.get(), 1, l_result.m_lambda_count, l_result.m_depth);
    l_result.m_size = a_term->m_size;
    l_result.m_complexity = to_string(*a_term).size();

    return l_result;
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"

using namespace redex;

void test_analyze_variable()
{
    auto l_analysis = analyze(v("x"));
    assert(l_analysis.m_kind == term_kind::variable);
    assert(l_analysis.m_free_variables == std::vector<std::string>{"x"});
    assert(l_analysis.m_bound_variables.empty());
    assert(!l_analysis.m_is_closed);
    assert(l_analysis.m_lambda_count == 0);
    assert(l_analysis.m_size == 1);
    assert(l_analysis.m_depth == 1);
    assert(l_analysis.m_complexity == 1);
}

void test_analyze_lambda()
{
    // church two: \f.\x.f (f x)
    {
        auto l_analysis =
            analyze(f("f", f("x", a(v("f"), a(v("f"), v("x"))))));
        assert(l_analysis.m_kind == term_kind::closed_lambda);
        assert(l_analysis.m_is_closed);
        assert(l_analysis.m_lambda_count == 2);
        assert(l_analysis.m_size == 7);
        // \f -> \x -> app -> app -> f
        assert(l_analysis.m_depth == 5);
        assert(l_analysis.m_bound_variables ==
               (std::vector<std::string>{"f", "x"}));
        assert(l_analysis.m_complexity ==
               std::string("\\f.\\x.f (f x)").size());
    }

    // open abstraction
    {
        auto l_analysis = analyze(f("x", a(v("y"), v("x"))));
        assert(l_analysis.m_kind == term_kind::open_lambda);
        assert(l_analysis.m_free_variables == std::vector<std::string>{"y"});
    }
}

void test_analyze_application()
{
    auto l_analysis = analyze(a(f("x", v("x")), f("y", f("z", v("w")))));
    assert(l_analysis.m_kind == term_kind::application);
    assert(l_analysis.m_lambda_count == 3);
    assert(l_analysis.m_free_variables == std::vector<std::string>{"w"});
    assert(l_analysis.m_bound_variables ==
           (std::vector<std::string>{"x", "y", "z"}));
    assert(to_string(l_analysis.m_kind) == "application");
}

void analysis_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_analyze_variable);
    TEST(test_analyze_lambda);
    TEST(test_analyze_application);
}

#endif
