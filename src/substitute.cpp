#include "../include/redex/substitute.hpp"

#include <stdexcept>
#include <vector>

namespace redex
{

std::string fresh_name(const std::set<std::string>& a_avoid)
{
    for(char c = 'a'; c <= 'z'; ++c)
    {
        std::string l_candidate(1, c);
        if(a_avoid.count(l_candidate) == 0)
            return l_candidate;
    }

    for(size_t i = 0;; ++i)
    {
        std::string l_candidate = "x" + std::to_string(i);
        if(a_avoid.count(l_candidate) == 0)
            return l_candidate;
    }
}

namespace
{

// a_replacement_free is the free-variable set of a_replacement, computed
// once per substitution since the replacement never changes while recursing.
std::unique_ptr<term>
substitute_impl(const std::unique_ptr<term>& a_term,
                const std::string& a_variable,
                const std::unique_ptr<term>& a_replacement,
                const std::set<std::string>& a_replacement_free)
{
    if(const var* l_var = dynamic_cast<const var*>(a_term.get()))
    {
        if(l_var->m_name == a_variable)
            return a_replacement->clone();

        return a_term->clone();
    }

    if(const func* l_func = dynamic_cast<const func*>(a_term.get()))
    {
        // the parameter shadows a_variable, nothing below refers to it
        if(l_func->m_param == a_variable)
            return a_term->clone();

        if(a_replacement_free.count(l_func->m_param) == 0)
        {
            return f(l_func->m_param,
                     substitute_impl(l_func->m_body, a_variable,
                                     a_replacement, a_replacement_free));
        }

        // the parameter would capture a free variable of the replacement,
        // so rename it first
        std::set<std::string> l_avoid = free_variables(*l_func->m_body);
        l_avoid.insert(a_replacement_free.begin(), a_replacement_free.end());
        l_avoid.insert(a_variable);
        l_func->m_body->collect_bound(l_avoid);

        const std::string l_fresh = fresh_name(l_avoid);

        // l_fresh is bound nowhere in the body, so this rename never
        // triggers a nested rename
        const std::unique_ptr<term> l_fresh_var = v(l_fresh);
        const std::unique_ptr<term> l_renamed_body =
            substitute_impl(l_func->m_body, l_func->m_param, l_fresh_var,
                            std::set<std::string>{l_fresh});

        return f(l_fresh, substitute_impl(l_renamed_body, a_variable,
                                          a_replacement, a_replacement_free));
    }

    if(const app* l_app = dynamic_cast<const app*>(a_term.get()))
    {
        return a(substitute_impl(l_app->m_lhs, a_variable, a_replacement,
                                 a_replacement_free),
                 substitute_impl(l_app->m_rhs, a_variable, a_replacement,
                                 a_replacement_free));
    }

    // if we get here, error
    throw std::runtime_error("substitute: invalid term type");
}

// position of the innermost binder of a_name, counted from the innermost
// binder outward, or -1 if a_name is free
long binder_depth(const std::vector<std::string>& a_binders,
                  const std::string& a_name)
{
    for(size_t i = a_binders.size(); i > 0; --i)
    {
        if(a_binders[i - 1] == a_name)
            return static_cast<long>(a_binders.size() - i);
    }
    return -1;
}

bool alpha_equivalent_impl(const term* a_lhs, const term* a_rhs,
                           std::vector<std::string>& a_lhs_binders,
                           std::vector<std::string>& a_rhs_binders)
{
    if(const var* l_lhs = dynamic_cast<const var*>(a_lhs))
    {
        const var* l_rhs = dynamic_cast<const var*>(a_rhs);
        if(!l_rhs)
            return false;

        const long l_lhs_depth = binder_depth(a_lhs_binders, l_lhs->m_name);
        const long l_rhs_depth = binder_depth(a_rhs_binders, l_rhs->m_name);

        if(l_lhs_depth < 0 && l_rhs_depth < 0)
            return l_lhs->m_name == l_rhs->m_name;

        return l_lhs_depth == l_rhs_depth;
    }

    if(const func* l_lhs = dynamic_cast<const func*>(a_lhs))
    {
        const func* l_rhs = dynamic_cast<const func*>(a_rhs);
        if(!l_rhs)
            return false;

        a_lhs_binders.push_back(l_lhs->m_param);
        a_rhs_binders.push_back(l_rhs->m_param);
        const bool l_result =
            alpha_equivalent_impl(l_lhs->m_body.get(), l_rhs->m_body.get(),
                                  a_lhs_binders, a_rhs_binders);
        a_lhs_binders.pop_back();
        a_rhs_binders.pop_back();
        return l_result;
    }

    if(const app* l_lhs = dynamic_cast<const app*>(a_lhs))
    {
        const app* l_rhs = dynamic_cast<const app*>(a_rhs);
        if(!l_rhs)
            return false;

        return alpha_equivalent_impl(l_lhs->m_lhs.get(), l_rhs->m_lhs.get(),
                                     a_lhs_binders, a_rhs_binders) &&
               alpha_equivalent_impl(l_lhs->m_rhs.get(), l_rhs->m_rhs.get(),
                                     a_lhs_binders, a_rhs_binders);
    }

    throw std::runtime_error("alpha_equivalent: invalid term type");
}

} // namespace

std::unique_ptr<term> substitute(const std::unique_ptr<term>& a_term,
                                 const std::string& a_variable,
                                 const std::unique_ptr<term>& a_replacement)
{
    return substitute_impl(a_term, a_variable, a_replacement,
                           free_variables(*a_replacement));
}

std::unique_ptr<term> rename_bound(const std::unique_ptr<term>& a_lambda,
                                   const std::string& a_new_param)
{
    const func* l_func = dynamic_cast<const func*>(a_lambda.get());

    if(!l_func)
        throw std::invalid_argument("rename_bound: not an abstraction");

    if(l_func->m_param == a_new_param)
        return a_lambda->clone();

    if(free_variables(*l_func->m_body).count(a_new_param) != 0)
        throw std::invalid_argument("rename_bound: '" + a_new_param +
                                    "' is free in the body");

    // substitute renames any inner binder of a_new_param out of the way
    return f(a_new_param,
             substitute(l_func->m_body, l_func->m_param, v(a_new_param)));
}

bool alpha_equivalent(const std::unique_ptr<term>& a_lhs,
                      const std::unique_ptr<term>& a_rhs)
{
    std::vector<std::string> l_lhs_binders;
    std::vector<std::string> l_rhs_binders;
    return alpha_equivalent_impl(a_lhs.get(), a_rhs.get(), l_lhs_binders,
                                 l_rhs_binders);
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"
#include <vector>

using namespace redex;

void test_fresh_name()
{
    // empty avoid-set
    assert(fresh_name({}) == "a");

    // skips taken letters in order
    assert(fresh_name({"a", "b", "d"}) == "c");

    // falls back to numbered names once every letter is taken
    {
        std::set<std::string> l_avoid;
        for(char c = 'a'; c <= 'z'; ++c)
            l_avoid.insert(std::string(1, c));
        assert(fresh_name(l_avoid) == "x0");

        l_avoid.insert("x0");
        l_avoid.insert("x1");
        assert(fresh_name(l_avoid) == "x2");
    }

    // deterministic
    assert(fresh_name({"a", "q"}) == fresh_name({"q", "a"}));
}

void test_var_substitute()
{
    // matching variable is replaced
    {
        auto l_result = substitute(v("x"), "x", f("y", v("y")));
        assert(l_result->equals(f("y", v("y"))));
    }

    // other variables are copied
    {
        auto l_result = substitute(v("z"), "x", v("y"));
        assert(l_result->equals(v("z")));
    }
}

void test_app_substitute()
{
    // both sides
    auto l_term = a(a(v("x"), v("z")), v("x"));
    auto l_result = substitute(l_term, "x", v("w"));
    assert(l_result->equals(a(a(v("w"), v("z")), v("w"))));

    // the input is left untouched
    assert(l_term->equals(a(a(v("x"), v("z")), v("x"))));
}

void test_func_substitute()
{
    // shadowed parameter: unchanged
    {
        auto l_term = f("x", a(v("x"), v("y")));
        auto l_result = substitute(l_term, "x", v("z"));
        assert(l_result->equals(l_term));
    }

    // parameter not free in the replacement: direct substitution
    {
        auto l_term = f("y", a(v("x"), v("y")));
        auto l_result = substitute(l_term, "x", v("z"));
        assert(l_result->equals(f("y", a(v("z"), v("y")))));
    }

    // capture: (\y.x)[x := y] must not become \y.y
    {
        auto l_term = f("y", v("x"));
        auto l_result = substitute(l_term, "x", v("y"));

        // avoid = {x} u {y} u {x} u {} so the fresh name is "a"
        assert(l_result->equals(f("a", v("y"))));
        assert(free_variables(*l_result) == std::set<std::string>{"y"});
    }

    // capture with the parameter also used in the body
    {
        auto l_term = f("y", a(v("x"), v("y")));
        auto l_result = substitute(l_term, "x", a(v("f"), v("y")));
        assert(to_string(*l_result) == "\\a.f y a");
    }

    // the fresh name avoids names bound deeper in the body
    {
        // (\y.\a.x y a)[x := y]
        auto l_term = f("y", f("a", a(a(v("x"), v("y")), v("a"))));
        auto l_result = substitute(l_term, "x", v("y"));
        assert(to_string(*l_result) == "\\b.\\a.y b a");
    }

    // renaming inside nested binders
    {
        // (\y.\z.x y z)[x := y z]
        auto l_term = f("y", f("z", a(a(v("x"), v("y")), v("z"))));
        auto l_result = substitute(l_term, "x", a(v("y"), v("z")));
        assert(to_string(*l_result) == "\\a.\\b.y z a b");
        assert(free_variables(*l_result) ==
               (std::set<std::string>{"y", "z"}));
    }
}

void test_substitute_never_captures()
{
    // for every case where the variable occurs free, the free variables of
    // the result are exactly (FV(M) - {x}) u FV(N)
    std::vector<std::unique_ptr<term>> l_bodies;
    l_bodies.push_back(f("y", v("x")));
    l_bodies.push_back(f("y", f("z", a(a(v("x"), v("y")), v("z")))));
    l_bodies.push_back(a(f("a", a(v("x"), v("a"))), f("x", v("x"))));
    l_bodies.push_back(f("b", f("a", a(v("x"), f("y", a(v("y"), v("b")))))));
    l_bodies.push_back(f("z", a(f("y", a(v("x"), v("z"))), v("x"))));

    std::vector<std::unique_ptr<term>> l_replacements;
    l_replacements.push_back(v("y"));
    l_replacements.push_back(a(v("y"), v("z")));
    l_replacements.push_back(f("q", a(v("a"), v("b"))));
    l_replacements.push_back(a(v("z"), f("y", v("y"))));

    for(const auto& l_body : l_bodies)
    {
        for(const auto& l_replacement : l_replacements)
        {
            auto l_result = substitute(l_body, "x", l_replacement);

            std::set<std::string> l_expected = free_variables(*l_body);
            l_expected.erase("x");
            const std::set<std::string> l_replacement_free =
                free_variables(*l_replacement);
            l_expected.insert(l_replacement_free.begin(),
                              l_replacement_free.end());

            assert(free_variables(*l_result) == l_expected);
        }
    }
}

void test_rename_bound()
{
    // plain rename
    {
        auto l_result = rename_bound(f("x", a(v("x"), v("y"))), "z");
        assert(l_result->equals(f("z", a(v("z"), v("y")))));
    }

    // renaming to the same name is a copy
    {
        auto l_term = f("x", v("x"));
        assert(rename_bound(l_term, "x")->equals(l_term));
    }

    // the new name occurs free: rejected
    {
        bool l_threw = false;
        try
        {
            rename_bound(f("x", a(v("x"), v("y"))), "y");
        }
        catch(const std::invalid_argument&)
        {
            l_threw = true;
        }
        assert(l_threw);
    }

    // not an abstraction
    {
        bool l_threw = false;
        try
        {
            rename_bound(v("x"), "y");
        }
        catch(const std::invalid_argument&)
        {
            l_threw = true;
        }
        assert(l_threw);
    }

    // an inner binder of the new name moves out of the way
    {
        // \x.\y.x y renamed to y
        auto l_result = rename_bound(f("x", f("y", a(v("x"), v("y")))), "y");
        assert(alpha_equivalent(l_result, f("x", f("y", a(v("x"), v("y"))))));
        assert(dynamic_cast<func*>(l_result.get())->m_param == "y");
    }
}

void test_alpha_equivalent()
{
    assert(alpha_equivalent(f("x", v("x")), f("a", v("a"))));
    assert(alpha_equivalent(f("x", f("y", v("x"))), f("y", f("x", v("y")))));

    // K is not K*
    assert(!alpha_equivalent(f("x", f("y", v("x"))), f("x", f("y", v("y")))));

    // free variables must agree by name
    assert(alpha_equivalent(a(v("f"), v("x")), a(v("f"), v("x"))));
    assert(!alpha_equivalent(f("x", v("y")), f("x", v("z"))));

    // a bound occurrence never matches a free one
    assert(!alpha_equivalent(f("x", v("x")), f("y", v("x"))));

    // shadowing resolves to the innermost binder
    assert(alpha_equivalent(f("x", f("x", v("x"))), f("a", f("b", v("b")))));
    assert(!alpha_equivalent(f("x", f("x", v("x"))), f("a", f("b", v("a")))));

    // kinds must match
    assert(!alpha_equivalent(v("x"), f("x", v("x"))));
}

void substitute_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_fresh_name);

    TEST(test_var_substitute);
    TEST(test_app_substitute);
    TEST(test_func_substitute);
    TEST(test_substitute_never_captures);

    TEST(test_rename_bound);
    TEST(test_alpha_equivalent);
}

#endif
