#include "../include/redex/reducer.hpp"

#include "../include/redex/log.hpp"
#include "../include/redex/substitute.hpp"

#include <stdexcept>

namespace redex
{

namespace
{

// leftmost-outermost search. a_under_lambdas enters abstraction bodies,
// a_into_arguments enters the argument side of applications.
const app* locate_outermost(const term* a_term, bool a_under_lambdas,
                            bool a_into_arguments,
                            std::vector<path_step>& a_path)
{
    if(dynamic_cast<const var*>(a_term))
        return nullptr;

    if(const func* l_func = dynamic_cast<const func*>(a_term))
    {
        if(!a_under_lambdas)
            return nullptr;

        a_path.push_back(path_step::body);
        if(const app* l_found = locate_outermost(
               l_func->m_body.get(), a_under_lambdas, a_into_arguments, a_path))
            return l_found;
        a_path.pop_back();
        return nullptr;
    }

    if(const app* l_app = dynamic_cast<const app*>(a_term))
    {
        // the outer application wins over anything nested inside it
        if(dynamic_cast<const func*>(l_app->m_lhs.get()))
            return l_app;

        a_path.push_back(path_step::function);
        if(const app* l_found = locate_outermost(
               l_app->m_lhs.get(), a_under_lambdas, a_into_arguments, a_path))
            return l_found;
        a_path.pop_back();

        if(!a_into_arguments)
            return nullptr;

        a_path.push_back(path_step::argument);
        if(const app* l_found = locate_outermost(
               l_app->m_rhs.get(), a_under_lambdas, a_into_arguments, a_path))
            return l_found;
        a_path.pop_back();
        return nullptr;
    }

    throw std::runtime_error("find_redex: invalid term type");
}

// leftmost-innermost search: children are searched before the node itself
const app* locate_innermost(const term* a_term, bool a_under_lambdas,
                            std::vector<path_step>& a_path)
{
    if(dynamic_cast<const var*>(a_term))
        return nullptr;

    if(const func* l_func = dynamic_cast<const func*>(a_term))
    {
        if(!a_under_lambdas)
            return nullptr;

        a_path.push_back(path_step::body);
        if(const app* l_found =
               locate_innermost(l_func->m_body.get(), a_under_lambdas, a_path))
            return l_found;
        a_path.pop_back();
        return nullptr;
    }

    if(const app* l_app = dynamic_cast<const app*>(a_term))
    {
        a_path.push_back(path_step::function);
        if(const app* l_found =
               locate_innermost(l_app->m_lhs.get(), a_under_lambdas, a_path))
            return l_found;
        a_path.pop_back();

        a_path.push_back(path_step::argument);
        if(const app* l_found =
               locate_innermost(l_app->m_rhs.get(), a_under_lambdas, a_path))
            return l_found;
        a_path.pop_back();

        if(dynamic_cast<const func*>(l_app->m_lhs.get()))
            return l_app;

        return nullptr;
    }

    throw std::runtime_error("find_redex: invalid term type");
}

const app* locate(const term* a_term, strategy a_strategy,
                  std::vector<path_step>& a_path)
{
    switch(a_strategy)
    {
    case strategy::normal_order:
        return locate_outermost(a_term, true, true, a_path);
    case strategy::applicative_order:
        return locate_innermost(a_term, true, a_path);
    case strategy::call_by_name:
        return locate_outermost(a_term, false, false, a_path);
    case strategy::call_by_value:
        return locate_innermost(a_term, false, a_path);
    }
    throw std::invalid_argument("find_redex: unknown strategy");
}

// rebuilds a_term with the redex at the end of a_path beta-contracted.
// everything off the path is copied unchanged.
std::unique_ptr<term> contract_at(const std::unique_ptr<term>& a_term,
                                  const std::vector<path_step>& a_path,
                                  size_t a_index)
{
    if(a_index == a_path.size())
    {
        const app* l_app = dynamic_cast<const app*>(a_term.get());
        const func* l_func =
            l_app ? dynamic_cast<const func*>(l_app->m_lhs.get()) : nullptr;

        if(!l_func)
            throw std::runtime_error("step: path does not end at a redex");

        return substitute(l_func->m_body, l_func->m_param, l_app->m_rhs);
    }

    switch(a_path[a_index])
    {
    case path_step::function:
    case path_step::argument:
    {
        const app* l_app = dynamic_cast<const app*>(a_term.get());
        if(!l_app)
            break;

        if(a_path[a_index] == path_step::function)
            return a(contract_at(l_app->m_lhs, a_path, a_index + 1),
                     l_app->m_rhs->clone());

        return a(l_app->m_lhs->clone(),
                 contract_at(l_app->m_rhs, a_path, a_index + 1));
    }
    case path_step::body:
    {
        const func* l_func = dynamic_cast<const func*>(a_term.get());
        if(!l_func)
            break;

        return f(l_func->m_param, contract_at(l_func->m_body, a_path, a_index + 1));
    }
    }

    throw std::runtime_error("step: path does not match the term");
}

std::vector<std::string> sorted(const std::set<std::string>& a_names)
{
    return std::vector<std::string>(a_names.begin(), a_names.end());
}

trace_entry make_entry(uint32_t a_step, const std::unique_ptr<term>& a_term,
                       const print_options& a_print,
                       std::optional<redex_description> a_redex)
{
    trace_entry l_entry;
    l_entry.m_step = a_step;
    l_entry.m_term = to_string(*a_term, a_print);
    l_entry.m_action = a_redex ? "beta_reduction" : "initial";
    l_entry.m_redex = std::move(a_redex);
    l_entry.m_free_variables = sorted(free_variables(*a_term));
    l_entry.m_bound_variables = sorted(bound_variables(*a_term));
    return l_entry;
}

// the last three snapshots are textually identical
bool stagnated(const std::vector<trace_entry>& a_trace)
{
    const size_t n = a_trace.size();
    return n >= 3 && a_trace[n - 1].m_term == a_trace[n - 2].m_term &&
           a_trace[n - 2].m_term == a_trace[n - 3].m_term;
}

} // namespace

std::string to_string(strategy a_strategy)
{
    switch(a_strategy)
    {
    case strategy::normal_order:
        return "normal_order";
    case strategy::applicative_order:
        return "applicative_order";
    case strategy::call_by_name:
        return "call_by_name";
    case strategy::call_by_value:
        return "call_by_value";
    }
    return "unknown";
}

strategy parse_strategy(const std::string& a_name)
{
    if(a_name == "normal_order" || a_name == "normal")
        return strategy::normal_order;
    if(a_name == "applicative_order" || a_name == "applicative")
        return strategy::applicative_order;
    if(a_name == "call_by_name" || a_name == "name")
        return strategy::call_by_name;
    if(a_name == "call_by_value" || a_name == "value")
        return strategy::call_by_value;

    throw std::invalid_argument("unknown strategy '" + a_name + "'");
}

std::string to_string(path_step a_step)
{
    switch(a_step)
    {
    case path_step::function:
        return "function";
    case path_step::argument:
        return "argument";
    case path_step::body:
        return "body";
    }
    return "unknown";
}

std::optional<redex_description> find_redex(const std::unique_ptr<term>& a_term,
                                            strategy a_strategy)
{
    redex_description l_redex;
    const app* l_app = locate(a_term.get(), a_strategy, l_redex.m_path);

    if(!l_app)
        return std::nullopt;

    const func* l_func = dynamic_cast<const func*>(l_app->m_lhs.get());
    l_redex.m_lambda = to_string(*l_func);
    l_redex.m_parameter = l_func->m_param;
    l_redex.m_body = to_string(*l_func->m_body);
    l_redex.m_argument = to_string(*l_app->m_rhs);
    return l_redex;
}

bool step(const std::unique_ptr<term>& a_term, strategy a_strategy,
          std::unique_ptr<term>& a_result, redex_description& a_redex)
{
    std::optional<redex_description> l_redex = find_redex(a_term, a_strategy);

    if(!l_redex)
        return false;

    a_result = contract_at(a_term, l_redex->m_path, 0);
    a_redex = std::move(*l_redex);
    return true;
}

reduction_result reduce(const std::unique_ptr<term>& a_term,
                        const reduce_options& a_options)
{
    reduction_result l_result;
    l_result.m_strategy = a_options.m_strategy;
    l_result.m_original_term = to_string(*a_term, a_options.m_print);
    l_result.m_trace.push_back(
        make_entry(0, a_term, a_options.m_print, std::nullopt));

    std::unique_ptr<term> l_current = a_term->clone();

    while(l_result.m_steps_taken < a_options.m_max_steps)
    {
        std::unique_ptr<term> l_next;
        redex_description l_redex;

        if(!step(l_current, a_options.m_strategy, l_next, l_redex))
            break;

        ++l_result.m_steps_taken;
        l_current = std::move(l_next);
        l_result.m_trace.push_back(make_entry(l_result.m_steps_taken, l_current,
                                              a_options.m_print,
                                              std::move(l_redex)));

        REDEX_LOG(debug) << "step " << l_result.m_steps_taken << ": "
                         << l_result.m_trace.back().m_term;

        if(stagnated(l_result.m_trace))
        {
            l_result.m_stagnated = true;
            REDEX_LOG(warn) << "term unchanged for three snapshots, likely "
                               "non-terminating; stopping at step "
                            << l_result.m_steps_taken;
            break;
        }
    }

    l_result.m_is_normal_form =
        !find_redex(l_current, a_options.m_strategy).has_value();
    l_result.m_max_steps_reached =
        !l_result.m_is_normal_form &&
        (l_result.m_stagnated ||
         l_result.m_steps_taken >= a_options.m_max_steps);
    l_result.m_final_term = to_string(*l_current, a_options.m_print);
    l_result.m_combinator = classify(l_current, a_options.m_match_mode);
    l_result.m_analysis = analyze(l_current);
    l_result.m_final = std::move(l_current);

    return l_result;
}

reduction_result reduce(const std::unique_ptr<term>& a_term,
                        strategy a_strategy, uint32_t a_max_steps)
{
    reduce_options l_options;
    l_options.m_strategy = a_strategy;
    l_options.m_max_steps = a_max_steps;
    return reduce(a_term, l_options);
}

} // namespace redex

#ifdef UNIT_TEST

#include "../include/redex/parser.hpp"
#include "../testing/test_utils.hpp"
#include <iostream>
#include <list>
#include <sstream>

using namespace redex;

void test_strategy_names()
{
    assert(parse_strategy("normal") == strategy::normal_order);
    assert(parse_strategy("applicative_order") == strategy::applicative_order);
    assert(parse_strategy("name") == strategy::call_by_name);
    assert(parse_strategy("call_by_value") == strategy::call_by_value);

    // names round trip
    for(strategy l_strategy :
        {strategy::normal_order, strategy::applicative_order,
         strategy::call_by_name, strategy::call_by_value})
        assert(parse_strategy(to_string(l_strategy)) == l_strategy);

    bool l_threw = false;
    try
    {
        parse_strategy("lazy");
    }
    catch(const std::invalid_argument&)
    {
        l_threw = true;
    }
    assert(l_threw);
}

void test_find_redex()
{
    // a variable has none
    assert(!find_redex(v("x"), strategy::normal_order));

    // root redex has an empty path
    {
        auto l_redex = find_redex(parse("(\\x.x) y"), strategy::normal_order);
        assert(l_redex);
        assert(l_redex->m_path.empty());
        assert(l_redex->m_lambda == "\\x.x");
        assert(l_redex->m_parameter == "x");
        assert(l_redex->m_body == "x");
        assert(l_redex->m_argument == "y");
    }

    // (\x.\y.x) a b: the redex is in function position
    {
        auto l_redex =
            find_redex(parse("(\\x.\\y.x) a b"), strategy::normal_order);
        assert(l_redex);
        assert(l_redex->m_path == std::vector<path_step>{path_step::function});
        assert(l_redex->m_argument == "a");
    }

    // an application inside an unapplied abstraction is not a redex
    assert(!find_redex(parse("\\x.x x"), strategy::normal_order));
}

void test_find_redex_strategies()
{
    // outer redex with a redex in its argument
    auto l_term = parse("(\\x.z) ((\\y.y) w)");

    // outermost picks the root
    assert(find_redex(l_term, strategy::normal_order)->m_path.empty());
    assert(find_redex(l_term, strategy::call_by_name)->m_path.empty());

    // innermost picks the argument first
    assert(find_redex(l_term, strategy::applicative_order)->m_path ==
           std::vector<path_step>{path_step::argument});
    assert(find_redex(l_term, strategy::call_by_value)->m_path ==
           std::vector<path_step>{path_step::argument});

    // redexes under an abstraction
    {
        auto l_under = parse("\\x.(\\y.y) x");
        assert(find_redex(l_under, strategy::normal_order)->m_path ==
               std::vector<path_step>{path_step::body});
        assert(find_redex(l_under, strategy::applicative_order));
        assert(!find_redex(l_under, strategy::call_by_name));
        assert(!find_redex(l_under, strategy::call_by_value));
    }

    // redexes inside the argument of a stuck application
    {
        auto l_stuck = parse("f ((\\x.x) y)");
        assert(find_redex(l_stuck, strategy::normal_order));
        assert(find_redex(l_stuck, strategy::call_by_value));
        assert(!find_redex(l_stuck, strategy::call_by_name));
    }

    // innermost reaches into the function body before contracting the root
    {
        auto l_nested = parse("(\\x.(\\y.y) x) z");
        assert(find_redex(l_nested, strategy::normal_order)->m_path.empty());
        assert(find_redex(l_nested, strategy::applicative_order)->m_path ==
               (std::vector<path_step>{path_step::function, path_step::body}));
        assert(find_redex(l_nested, strategy::call_by_value)->m_path.empty());
    }
}

void test_step()
{
    // normal form: outputs untouched
    {
        auto l_term = parse("\\x.x x");
        std::unique_ptr<term> l_result;
        redex_description l_redex;
        assert(!step(l_term, strategy::normal_order, l_result, l_redex));
        assert(l_result == nullptr);
    }

    // one contraction, the input survives
    {
        auto l_term = parse("(\\x.\\y.x) a b");
        std::unique_ptr<term> l_result;
        redex_description l_redex;
        assert(step(l_term, strategy::normal_order, l_result, l_redex));
        assert(to_string(*l_result) == "(\\y.a) b");
        assert(to_string(*l_term) == "(\\x.\\y.x) a b");
        assert(l_redex.m_parameter == "x");
    }

    // contraction deep in the tree rebuilds the spine
    {
        auto l_term = parse("\\f.g ((\\x.x) f) h");
        std::unique_ptr<term> l_result;
        redex_description l_redex;
        assert(step(l_term, strategy::normal_order, l_result, l_redex));
        assert(to_string(*l_result) == "\\f.g f h");
        assert(l_redex.m_path ==
               (std::vector<path_step>{path_step::body, path_step::function,
                                       path_step::argument}));
    }

    // contraction avoids capture
    {
        auto l_term = parse("(\\x.\\y.x) y");
        std::unique_ptr<term> l_result;
        redex_description l_redex;
        assert(step(l_term, strategy::normal_order, l_result, l_redex));
        assert(to_string(*l_result) == "\\a.y");
    }
}

void test_reduce_identity()
{
    auto l_result = reduce(parse("(\\x.x) y"), strategy::normal_order, 10);
    assert(l_result.m_original_term == "(\\x.x) y");
    assert(l_result.m_final_term == "y");
    assert(l_result.m_steps_taken == 1);
    assert(l_result.m_is_normal_form);
    assert(!l_result.m_max_steps_reached);
    assert(!l_result.m_stagnated);
    assert(l_result.m_strategy == strategy::normal_order);

    assert(l_result.m_trace.size() == 2);
    assert(l_result.m_trace[0].m_step == 0);
    assert(l_result.m_trace[0].m_action == "initial");
    assert(!l_result.m_trace[0].m_redex);
    assert(l_result.m_trace[0].m_free_variables ==
           std::vector<std::string>{"y"});
    assert(l_result.m_trace[0].m_bound_variables ==
           std::vector<std::string>{"x"});
    assert(l_result.m_trace[1].m_step == 1);
    assert(l_result.m_trace[1].m_term == "y");
    assert(l_result.m_trace[1].m_action == "beta_reduction");
    assert(l_result.m_trace[1].m_redex->m_lambda == "\\x.x");

    assert(l_result.m_final->equals(v("y")));
    assert(!l_result.m_combinator);
    assert(l_result.m_analysis.m_kind == term_kind::variable);
}

void test_reduce_constant()
{
    auto l_result = reduce(parse("(\\x.\\y.x) a b"), strategy::normal_order, 10);
    assert(l_result.m_final_term == "a");
    assert(l_result.m_steps_taken == 2);
    assert(l_result.m_is_normal_form);
    assert(l_result.m_trace.size() == 3);
    assert(l_result.m_trace[1].m_term == "(\\y.a) b");
}

void test_reduce_normal_form_input()
{
    auto l_result = reduce(parse("\\x.x x"), strategy::normal_order, 10);
    assert(l_result.m_is_normal_form);
    assert(l_result.m_steps_taken == 0);
    assert(!l_result.m_max_steps_reached);
    assert(l_result.m_final_term == "\\x.x x");
    assert(l_result.m_trace.size() == 1);
    assert(l_result.m_combinator == std::nullopt);
}

void test_reduce_omega_stagnates()
{
    std::ostringstream l_sink;
    set_log_stream(l_sink);
    set_log_level(log_level::warn);

    auto l_result =
        reduce(parse("(\\x.x x) (\\x.x x)"), strategy::normal_order, 10);

    assert(!l_result.m_is_normal_form);
    assert(l_result.m_max_steps_reached);
    assert(l_result.m_stagnated);

    // the guard fires as soon as three identical snapshots exist
    assert(l_result.m_steps_taken == 2);
    assert(l_result.m_trace.size() == 3);
    assert(l_result.m_final_term == "(\\x.x x) (\\x.x x)");

    // and says so
    assert(l_sink.str().find("non-terminating") != std::string::npos);

    set_log_stream(std::clog);
}

void test_reduce_church_addition()
{
    const std::string l_plus = "(\\m.\\n.\\f.\\x.m f (n f x))";
    const std::string l_one = "(\\f.\\x.f x)";
    const std::string l_two = "(\\f.\\x.f (f x))";
    auto l_term = parse(l_plus + " " + l_one + " " + l_two);
    auto l_three = parse("\\f.\\x.f (f (f x))");

    // normal order
    {
        auto l_result = reduce(l_term, strategy::normal_order, 100);
        assert(l_result.m_is_normal_form);
        assert(alpha_equivalent(l_result.m_final, l_three));
        assert(l_result.m_final_term == "\\f.\\x.f (f (f x))");
        assert(l_result.m_steps_taken == 6);
        assert(l_result.m_combinator == std::string("Church 3"));
        assert(l_result.m_analysis.m_kind == term_kind::closed_lambda);
    }

    // applicative order ends in the same normal form
    {
        auto l_result = reduce(l_term, strategy::applicative_order, 100);
        assert(l_result.m_is_normal_form);
        assert(alpha_equivalent(l_result.m_final, l_three));
    }
}

void test_reduce_capture_in_trace()
{
    // \y.x under [x := y] must be renamed, so the result keeps y free
    auto l_result =
        reduce(parse("(\\x.\\y.x y) y"), strategy::normal_order, 10);
    assert(l_result.m_is_normal_form);
    assert(l_result.m_final_term == "\\a.y a");
    assert(l_result.m_analysis.m_free_variables ==
           std::vector<std::string>{"y"});
}

void test_reduce_strategies_differ()
{
    // (\x.z) applied to omega: only the outermost strategies discard the
    // divergent argument
    auto l_term = parse("(\\x.z) ((\\x.x x) (\\x.x x))");

    std::ostringstream l_sink;
    set_log_stream(l_sink);

    {
        auto l_result = reduce(l_term, strategy::normal_order, 20);
        assert(l_result.m_final_term == "z");
        assert(l_result.m_steps_taken == 1);
    }

    {
        auto l_result = reduce(l_term, strategy::call_by_name, 20);
        assert(l_result.m_final_term == "z");
        assert(l_result.m_is_normal_form);
    }

    {
        auto l_result = reduce(l_term, strategy::applicative_order, 20);
        assert(!l_result.m_is_normal_form);
        assert(l_result.m_stagnated);
        assert(l_result.m_max_steps_reached);
    }

    {
        auto l_result = reduce(l_term, strategy::call_by_value, 20);
        assert(!l_result.m_is_normal_form);
        assert(l_result.m_stagnated);
    }

    set_log_stream(std::clog);

    // call-by-name stops at weak head normal form
    {
        auto l_result = reduce(parse("\\x.(\\y.y) x"), strategy::call_by_name, 20);
        assert(l_result.m_is_normal_form);
        assert(l_result.m_steps_taken == 0);

        auto l_normal = reduce(parse("\\x.(\\y.y) x"), strategy::normal_order, 20);
        assert(l_normal.m_final_term == "\\x.x");
    }
}

void test_reduce_bounded()
{
    // grows every step, so the stagnation guard never fires
    auto l_term = parse("(\\x.x x x) (\\x.x x x)");

    for(uint32_t l_bound : {0u, 1u, 7u, 25u})
    {
        auto l_result = reduce(l_term, strategy::normal_order, l_bound);
        assert(l_result.m_steps_taken == l_bound);
        assert(l_result.m_trace.size() == l_bound + 1);
        assert(l_result.m_max_steps_reached);
        assert(!l_result.m_stagnated);
        assert(!l_result.m_is_normal_form);
    }

    // reaching a normal form on the very last allowed step is not a cutoff
    {
        auto l_result = reduce(parse("(\\x.x) y"), strategy::normal_order, 1);
        assert(l_result.m_is_normal_form);
        assert(!l_result.m_max_steps_reached);
    }
}

void test_reduce_idempotent()
{
    const char* l_inputs[] = {
        "(\\x.x) y",
        "(\\x.\\y.x) a b",
        "(\\x.\\y.x y) y",
        "(\\f.\\x.f (f x)) (\\f.\\x.f (f x))",
    };

    for(strategy l_strategy :
        {strategy::normal_order, strategy::applicative_order,
         strategy::call_by_name, strategy::call_by_value})
    {
        for(const char* l_input : l_inputs)
        {
            auto l_first = reduce(parse(l_input), l_strategy, 200);
            if(!l_first.m_is_normal_form)
                continue;

            auto l_second =
                reduce(parse(l_first.m_final_term), l_strategy, 200);
            assert(l_second.m_steps_taken == 0);
            assert(l_second.m_final_term == l_first.m_final_term);
        }
    }
}

void test_reduce_options()
{
    reduce_options l_options;
    l_options.m_match_mode = match_mode::alpha;
    l_options.m_print.m_unicode_lambda = true;

    auto l_result = reduce(parse("(\\y.\\a.a) z"), l_options);
    assert(l_result.m_final_term == "λa.a");
    assert(l_result.m_original_term == "(λy.λa.a) z");
    assert(l_result.m_trace[0].m_term == "(λy.λa.a) z");
    assert(l_result.m_combinator == std::string("I (Identity)"));
}

void generic_use_case_test()
{
    // church booleans bound through construct_program
    std::list<definition> l_helpers;
    l_helpers.push_back({"true", parse("\\t.\\f.t")});
    l_helpers.push_back({"false", parse("\\t.\\f.f")});
    l_helpers.push_back({"not", parse("\\p.p false true")});
    l_helpers.push_back({"and", parse("\\p.\\q.p q p")});

    auto l_run = [&l_helpers](const std::string& a_main)
    {
        auto l_program =
            construct_program(l_helpers.begin(), l_helpers.end(), parse(a_main));
        return reduce(l_program, strategy::normal_order, 200);
    };

    // selection
    {
        auto l_result = l_run("true yes no");
        std::cout << "true yes no: " << l_result.m_final_term << std::endl;
        assert(l_result.m_final_term == "yes");
    }

    {
        auto l_result = l_run("false yes no");
        std::cout << "false yes no: " << l_result.m_final_term << std::endl;
        assert(l_result.m_final_term == "no");
    }

    // later helpers see earlier ones
    {
        auto l_result = l_run("not true yes no");
        std::cout << "not true yes no: " << l_result.m_final_term << std::endl;
        assert(l_result.m_final_term == "no");
    }

    {
        auto l_result = l_run("and true (not false) yes no");
        std::cout << "and true (not false) yes no: " << l_result.m_final_term
                  << std::endl;
        assert(l_result.m_final_term == "yes");
    }

    // S K K a -> a
    {
        l_helpers.push_back({"S", parse("\\x.\\y.\\z.x z (y z)")});
        l_helpers.push_back({"K", parse("\\x.\\y.x")});
        auto l_result = l_run("S K K a");
        std::cout << "S K K a: " << l_result.m_final_term << std::endl;
        assert(l_result.m_final_term == "a");
    }
}

void reducer_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_strategy_names);
    TEST(test_find_redex);
    TEST(test_find_redex_strategies);
    TEST(test_step);

    TEST(test_reduce_identity);
    TEST(test_reduce_constant);
    TEST(test_reduce_normal_form_input);
    TEST(test_reduce_omega_stagnates);
    TEST(test_reduce_church_addition);
    TEST(test_reduce_capture_in_trace);
    TEST(test_reduce_strategies_differ);
    TEST(test_reduce_bounded);
    TEST(test_reduce_idempotent);
    TEST(test_reduce_options);

    TEST(generic_use_case_test);
}

#endif
