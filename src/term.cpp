#include "../include/redex/term.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace redex
{

// EQUALS METHODS

bool var::equals(const std::unique_ptr<term>& a_other) const
{
    const var* l_casted = dynamic_cast<const var*>(a_other.get());

    if(!l_casted)
        return false;

    return m_name == l_casted->m_name;
}

bool func::equals(const std::unique_ptr<term>& a_other) const
{
    const func* l_casted = dynamic_cast<const func*>(a_other.get());

    if(!l_casted)
        return false;

    return m_param == l_casted->m_param && m_body->equals(l_casted->m_body);
}

bool app::equals(const std::unique_ptr<term>& a_other) const
{
    const app* l_casted = dynamic_cast<const app*>(a_other.get());

    if(!l_casted)
        return false;

    return m_lhs->equals(l_casted->m_lhs) && m_rhs->equals(l_casted->m_rhs);
}

// PRINT METHODS

void var::print(std::ostream& a_ostream, const print_options&) const
{
    a_ostream << m_name;
}

void func::print(std::ostream& a_ostream, const print_options& a_options) const
{
    // the body extends as far right as possible, so it never needs parens
    a_ostream << (a_options.m_unicode_lambda ? "λ" : "\\") << m_param << ".";
    m_body->print(a_ostream, a_options);
}

void app::print(std::ostream& a_ostream, const print_options& a_options) const
{
    // application is left-associative: only a lambda in function position
    // needs parens, while any compound argument does.
    const bool l_wrap_lhs = dynamic_cast<const func*>(m_lhs.get()) != nullptr;
    const bool l_wrap_rhs = dynamic_cast<const var*>(m_rhs.get()) == nullptr;

    if(l_wrap_lhs)
        a_ostream << "(";
    m_lhs->print(a_ostream, a_options);
    if(l_wrap_lhs)
        a_ostream << ")";

    a_ostream << " ";

    if(l_wrap_rhs)
        a_ostream << "(";
    m_rhs->print(a_ostream, a_options);
    if(l_wrap_rhs)
        a_ostream << ")";
}

// CLONE METHODS

std::unique_ptr<term> var::clone() const
{
    return v(m_name);
}

std::unique_ptr<term> func::clone() const
{
    return f(m_param, m_body->clone());
}

std::unique_ptr<term> app::clone() const
{
    return a(m_lhs->clone(), m_rhs->clone());
}

// FREE VARIABLE METHODS

void var::collect_free(std::set<std::string>& a_free,
                       std::vector<std::string>& a_binders) const
{
    if(std::find(a_binders.begin(), a_binders.end(), m_name) ==
       a_binders.end())
        a_free.insert(m_name);
}

void func::collect_free(std::set<std::string>& a_free,
                        std::vector<std::string>& a_binders) const
{
    a_binders.push_back(m_param);
    m_body->collect_free(a_free, a_binders);
    a_binders.pop_back();
}

void app::collect_free(std::set<std::string>& a_free,
                       std::vector<std::string>& a_binders) const
{
    m_lhs->collect_free(a_free, a_binders);
    m_rhs->collect_free(a_free, a_binders);
}

// BOUND VARIABLE METHODS

void var::collect_bound(std::set<std::string>&) const
{
}

void func::collect_bound(std::set<std::string>& a_bound) const
{
    a_bound.insert(m_param);
    m_body->collect_bound(a_bound);
}

void app::collect_bound(std::set<std::string>& a_bound) const
{
    m_lhs->collect_bound(a_bound);
    m_rhs->collect_bound(a_bound);
}

// CONSTRUCTORS

term::term(size_t a_size) : m_size(a_size)
{
}

var::var(std::string a_name) : term(1), m_name(std::move(a_name))
{
}

func::func(std::string a_param, std::unique_ptr<term>&& a_body)
    : term(1 + a_body->m_size), m_param(std::move(a_param)),
      m_body(std::move(a_body))
{
}

app::app(std::unique_ptr<term>&& a_lhs, std::unique_ptr<term>&& a_rhs)
    : term(1 + a_lhs->m_size + a_rhs->m_size), m_lhs(std::move(a_lhs)),
      m_rhs(std::move(a_rhs))
{
}

// FACTORY FUNCTIONS

std::unique_ptr<term> v(std::string a_name)
{
    if(!is_identifier(a_name))
        throw std::invalid_argument("v: invalid variable name '" + a_name +
                                    "'");

    return std::unique_ptr<term>(new var(std::move(a_name)));
}

std::unique_ptr<term> f(std::string a_param, std::unique_ptr<term>&& a_body)
{
    if(!is_identifier(a_param))
        throw std::invalid_argument("f: invalid parameter name '" + a_param +
                                    "'");
    if(!a_body)
        throw std::invalid_argument("f: abstraction without a body");

    return std::unique_ptr<term>(new func(std::move(a_param), std::move(a_body)));
}

std::unique_ptr<term> a(std::unique_ptr<term>&& a_lhs,
                        std::unique_ptr<term>&& a_rhs)
{
    if(!a_lhs || !a_rhs)
        throw std::invalid_argument("a: application with a missing side");

    return std::unique_ptr<term>(new app(std::move(a_lhs), std::move(a_rhs)));
}

bool is_identifier(const std::string& a_name)
{
    auto l_is_letter = [](char c)
    { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); };
    auto l_is_digit = [](char c) { return c >= '0' && c <= '9'; };

    if(a_name.empty() || !l_is_letter(a_name.front()))
        return false;

    return std::all_of(a_name.begin() + 1, a_name.end(),
                       [&](char c) { return l_is_letter(c) || l_is_digit(c); });
}

std::ostream& operator<<(std::ostream& a_ostream, const term& a_term)
{
    a_term.print(a_ostream, print_options());
    return a_ostream;
}

std::string to_string(const term& a_term, const print_options& a_options)
{
    std::ostringstream l_ss;
    a_term.print(l_ss, a_options);
    return l_ss.str();
}

// DERIVED PROPERTIES

std::set<std::string> free_variables(const term& a_term)
{
    std::set<std::string> l_free;
    std::vector<std::string> l_binders;
    a_term.collect_free(l_free, l_binders);
    return l_free;
}

std::set<std::string> bound_variables(const term& a_term)
{
    std::set<std::string> l_bound;
    a_term.collect_bound(l_bound);
    return l_bound;
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"
#include <iostream>
#include <list>

using namespace redex;

void test_var_constructor()
{
    // single letter
    {
        auto l_var = v("x");
        const var* l_var_casted = dynamic_cast<var*>(l_var.get());
        assert(l_var_casted != nullptr);
        assert(l_var_casted->m_name == "x");
        assert(l_var->m_size == 1);
    }

    // alphanumeric name
    {
        auto l_var = v("x12");
        const var* l_var_casted = dynamic_cast<var*>(l_var.get());
        assert(l_var_casted != nullptr);
        assert(l_var_casted->m_name == "x12");
    }

    // names that are not identifiers are rejected
    {
        bool l_threw = false;
        try
        {
            v("");
        }
        catch(const std::invalid_argument&)
        {
            l_threw = true;
        }
        assert(l_threw);

        l_threw = false;
        try
        {
            v("1x");
        }
        catch(const std::invalid_argument&)
        {
            l_threw = true;
        }
        assert(l_threw);
    }
}

void test_func_constructor()
{
    // identity
    {
        auto l_func = f("x", v("x"));
        assert(l_func->m_size == 2);
        const func* l_func_casted = dynamic_cast<func*>(l_func.get());
        assert(l_func_casted != nullptr);
        assert(l_func_casted->m_param == "x");
        const var* l_body = dynamic_cast<var*>(l_func_casted->m_body.get());
        assert(l_body != nullptr);
        assert(l_body->m_name == "x");
    }

    // missing body
    {
        bool l_threw = false;
        try
        {
            f("x", nullptr);
        }
        catch(const std::invalid_argument&)
        {
            l_threw = true;
        }
        assert(l_threw);
    }
}

void test_app_constructor()
{
    auto l_app = a(v("f"), v("x"));
    assert(l_app->m_size == 3);
    const app* l_app_casted = dynamic_cast<app*>(l_app.get());
    assert(l_app_casted != nullptr);

    const var* l_lhs = dynamic_cast<var*>(l_app_casted->m_lhs.get());
    const var* l_rhs = dynamic_cast<var*>(l_app_casted->m_rhs.get());
    assert(l_lhs != nullptr && l_lhs->m_name == "f");
    assert(l_rhs != nullptr && l_rhs->m_name == "x");

    // size accumulates over nested nodes
    auto l_nested = a(f("x", a(v("x"), v("x"))), f("y", v("y")));
    assert(l_nested->m_size == 1 + 4 + 2);
}

void test_equals()
{
    // same name
    assert(v("x")->equals(v("x")));
    assert(!v("x")->equals(v("y")));

    // equality is syntactic, so alpha-variants differ
    assert(f("x", v("x"))->equals(f("x", v("x"))));
    assert(!f("x", v("x"))->equals(f("y", v("y"))));

    // different kinds never compare equal
    assert(!v("x")->equals(f("x", v("x"))));
    assert(!f("x", v("x"))->equals(a(v("x"), v("x"))));
    assert(!a(v("x"), v("x"))->equals(v("x")));

    // applications compare both sides
    assert(a(v("f"), v("x"))->equals(a(v("f"), v("x"))));
    assert(!a(v("f"), v("x"))->equals(a(v("x"), v("f"))));
}

void test_clone()
{
    auto l_term = f("f", f("x", a(v("f"), a(v("f"), v("x")))));
    auto l_cloned = l_term->clone();

    assert(l_term->equals(l_cloned));
    assert(l_term.get() != l_cloned.get());
    assert(l_term->m_size == l_cloned->m_size);

    // the copy is deep
    const func* l_outer = dynamic_cast<func*>(l_term.get());
    const func* l_outer_clone = dynamic_cast<func*>(l_cloned.get());
    assert(l_outer->m_body.get() != l_outer_clone->m_body.get());
}

void test_print()
{
    // variables and abstractions
    assert(to_string(*v("x")) == "x");
    assert(to_string(*f("x", v("x"))) == "\\x.x");
    assert(to_string(*f("x", f("y", v("x")))) == "\\x.\\y.x");

    // left-associative application needs no parens on the left
    assert(to_string(*a(a(v("f"), v("x")), v("y"))) == "f x y");

    // a nested application as argument does
    assert(to_string(*a(v("f"), a(v("x"), v("y")))) == "f (x y)");

    // a lambda in function position is wrapped, as is a lambda argument
    assert(to_string(*a(f("x", v("x")), v("y"))) == "(\\x.x) y");
    assert(to_string(*a(v("g"), f("x", v("x")))) == "g (\\x.x)");

    // the body of a lambda is never wrapped
    assert(to_string(*f("x", a(v("x"), v("x")))) == "\\x.x x");

    // church three
    assert(to_string(*f("f", f("x", a(v("f"), a(v("f"), a(v("f"), v("x"))))))) ==
           "\\f.\\x.f (f (f x))");

    // unicode glyph
    {
        print_options l_options;
        l_options.m_unicode_lambda = true;
        assert(to_string(*f("x", v("x")), l_options) == "λx.x");
    }

    // stream operator uses the default options
    {
        std::ostringstream l_ss;
        l_ss << *a(f("x", v("x")), v("y"));
        assert(l_ss.str() == "(\\x.x) y");
    }
}

void test_free_variables()
{
    // a lone variable is free
    assert(free_variables(*v("x")) == std::set<std::string>{"x"});

    // the parameter is not free in its body
    assert(free_variables(*f("x", v("x"))).empty());
    assert(free_variables(*f("x", a(v("x"), v("y")))) ==
           std::set<std::string>{"y"});

    // an occurrence outside the binder stays free
    assert(free_variables(*a(f("x", v("x")), v("x"))) ==
           std::set<std::string>{"x"});

    // shadowing
    assert(free_variables(*f("x", f("x", v("x")))).empty());
    assert(free_variables(*a(v("z"), f("y", a(v("y"), v("w"))))) ==
           (std::set<std::string>{"w", "z"}));
}

void test_bound_variables()
{
    assert(bound_variables(*v("x")).empty());

    // unreferenced parameters still count
    assert(bound_variables(*f("x", v("y"))) == std::set<std::string>{"x"});

    assert(bound_variables(*a(f("x", v("x")), f("y", f("z", v("z"))))) ==
           (std::set<std::string>{"x", "y", "z"}));
}

void construct_program_test()
{
    // no helpers: a copy of main
    {
        std::list<definition> l_helpers;
        auto l_main = a(v("f"), v("x"));
        auto l_program =
            construct_program(l_helpers.begin(), l_helpers.end(), l_main);
        assert(l_program->equals(l_main));
    }

    // two helpers, the first outermost
    {
        std::list<definition> l_helpers;
        l_helpers.push_back({"id", f("x", v("x"))});
        l_helpers.push_back({"k", f("x", f("y", v("x")))});

        auto l_main = a(a(v("k"), v("id")), v("z"));
        auto l_program =
            construct_program(l_helpers.begin(), l_helpers.end(), l_main);

        auto l_expected =
            a(f("id", a(f("k", l_main->clone()), f("x", f("y", v("x"))))),
              f("x", v("x")));
        assert(l_program->equals(l_expected));
        assert(to_string(*l_program) ==
               "(\\id.(\\k.k id z) (\\x.\\y.x)) (\\x.x)");
    }
}

void term_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_var_constructor);
    TEST(test_func_constructor);
    TEST(test_app_constructor);

    TEST(test_equals);
    TEST(test_clone);
    TEST(test_print);

    TEST(test_free_variables);
    TEST(test_bound_variables);

    TEST(construct_program_test);
}

#endif
