#include "../include/redex/engine.hpp"

#include "../include/redex/log.hpp"
#include "../include/redex/parser.hpp"

#include <stdexcept>

namespace redex
{

namespace
{

std::string trim(const std::string& a_text)
{
    const size_t l_begin = a_text.find_first_not_of(" \t");
    if(l_begin == std::string::npos)
        return "";
    const size_t l_end = a_text.find_last_not_of(" \t");
    return a_text.substr(l_begin, l_end - l_begin + 1);
}

std::string join(const std::vector<std::string>& a_names)
{
    if(a_names.empty())
        return "-";

    std::string l_result;
    for(const auto& l_name : a_names)
    {
        if(!l_result.empty())
            l_result += ", ";
        l_result += l_name;
    }
    return l_result;
}

const char* yes_no(bool a_value)
{
    return a_value ? "yes" : "no";
}

} // namespace

std::pair<std::string, std::string>
parse_definition(const std::string& a_text)
{
    const size_t l_equals = a_text.find('=');

    if(l_equals == std::string::npos)
        throw std::invalid_argument("definition '" + a_text +
                                    "' is not of the form NAME=TERM");

    std::string l_name = trim(a_text.substr(0, l_equals));
    if(!is_identifier(l_name))
        throw std::invalid_argument("definition name '" + l_name +
                                    "' is not an identifier");

    return {l_name, a_text.substr(l_equals + 1)};
}

engine::engine(engine_config a_config) : m_config(std::move(a_config))
{
    for(const auto& l_definition : m_config.m_definitions)
    {
        if(!is_identifier(l_definition.first))
            throw std::invalid_argument("definition name '" +
                                        l_definition.first +
                                        "' is not an identifier");

        m_definitions.push_back(
            {l_definition.first,
             redex::parse(l_definition.second, m_config.m_lexer)});
    }
}

const engine_config& engine::config() const
{
    return m_config;
}

std::unique_ptr<term> engine::parse(const std::string& a_text) const
{
    try
    {
        return redex::parse(a_text, m_config.m_lexer);
    }
    catch(const lex_error& l_error)
    {
        REDEX_LOG(info) << "rejected '" << a_text << "': " << l_error.what();
        throw;
    }
    catch(const parse_error& l_error)
    {
        REDEX_LOG(info) << "rejected '" << a_text << "': " << l_error.what();
        throw;
    }
}

reduction_result engine::reduce(const std::unique_ptr<term>& a_term) const
{
    reduce_options l_options;
    l_options.m_strategy = m_config.m_strategy;
    l_options.m_max_steps = m_config.m_max_steps;
    l_options.m_match_mode = m_config.m_match_mode;
    l_options.m_print = m_config.m_print;

    if(m_definitions.empty())
        return redex::reduce(a_term, l_options);

    return redex::reduce(construct_program(m_definitions.begin(),
                                           m_definitions.end(), a_term),
                         l_options);
}

reduction_result engine::run(const std::string& a_text) const
{
    return reduce(parse(a_text));
}

void print_result(std::ostream& a_ostream, const reduction_result& a_result,
                  bool a_with_trace)
{
    if(a_with_trace)
    {
        for(const auto& l_entry : a_result.m_trace)
        {
            a_ostream << "  " << l_entry.m_step << "\t" << l_entry.m_term;
            if(l_entry.m_redex)
                a_ostream << "\t[" << l_entry.m_redex->m_parameter
                          << " := " << l_entry.m_redex->m_argument << "]";
            a_ostream << "\n";
        }
    }

    a_ostream << "original:   " << a_result.m_original_term << "\n"
              << "final:      " << a_result.m_final_term << "\n"
              << "strategy:   " << to_string(a_result.m_strategy) << "\n"
              << "steps:      " << a_result.m_steps_taken << "\n"
              << "normal:     " << yes_no(a_result.m_is_normal_form) << "\n"
              << "cut off:    " << yes_no(a_result.m_max_steps_reached)
              << (a_result.m_stagnated ? " (stagnated)" : "") << "\n"
              << "combinator: "
              << (a_result.m_combinator ? *a_result.m_combinator : "-") << "\n"
              << "kind:       " << to_string(a_result.m_analysis.m_kind)
              << ", free: " << join(a_result.m_analysis.m_free_variables)
              << "\n";
}

} // namespace redex

#ifdef UNIT_TEST

#include "../testing/test_utils.hpp"
#include <sstream>

using namespace redex;

void test_parse_definition()
{
    auto l_definition = parse_definition("id=\\x.x");
    assert(l_definition.first == "id");
    assert(l_definition.second == "\\x.x");

    // whitespace around the name is dropped
    assert(parse_definition(" two = \\f.\\x.f (f x)").first == "two");

    const char* l_bad[] = {"noequals", "=\\x.x", "1x=y"};
    for(const char* l_text : l_bad)
    {
        bool l_threw = false;
        try
        {
            parse_definition(l_text);
        }
        catch(const std::invalid_argument&)
        {
            l_threw = true;
        }
        assert(l_threw);
    }
}

void test_engine_run()
{
    engine l_engine{engine_config()};

    auto l_result = l_engine.run("(\\x.\\y.x) a b");
    assert(l_result.m_final_term == "a");
    assert(l_result.m_steps_taken == 2);
    assert(l_engine.config().m_max_steps == 100);

    // errors surface unchanged
    bool l_threw = false;
    try
    {
        l_engine.run("(\\x.x");
    }
    catch(const parse_error& l_error)
    {
        l_threw = true;
        assert(l_error.position() == 5);
    }
    assert(l_threw);
}

void test_engine_config()
{
    engine_config l_config;
    l_config.m_strategy = strategy::applicative_order;
    l_config.m_max_steps = 3;
    l_config.m_lexer.m_strict = true;
    l_config.m_match_mode = match_mode::alpha;
    engine l_engine(l_config);

    // the step bound applies
    auto l_bounded = l_engine.run("(\\x.x x x) (\\x.x x x)");
    assert(l_bounded.m_steps_taken == 3);
    assert(l_bounded.m_max_steps_reached);
    assert(l_bounded.m_strategy == strategy::applicative_order);

    // alpha matching applies
    assert(l_engine.run("(\\q.q) (\\b.b)").m_combinator ==
           std::string("I (Identity)"));

    // strict lexing applies
    bool l_threw = false;
    try
    {
        l_engine.run("x ; y");
    }
    catch(const lex_error&)
    {
        l_threw = true;
    }
    assert(l_threw);
}

void test_engine_definitions()
{
    engine_config l_config;
    l_config.m_definitions.push_back({"one", "\\f.\\x.f x"});
    l_config.m_definitions.push_back({"succ", "\\n.\\f.\\x.f (n f x)"});
    engine l_engine(l_config);

    auto l_result = l_engine.run("succ (succ one)");
    assert(l_result.m_is_normal_form);
    assert(l_result.m_combinator == std::string("Church 3"));

    // a malformed definition is rejected up front
    engine_config l_bad;
    l_bad.m_definitions.push_back({"broken", "(\\x."});
    bool l_threw = false;
    try
    {
        engine l_engine_bad(l_bad);
    }
    catch(const parse_error&)
    {
        l_threw = true;
    }
    assert(l_threw);
}

void test_print_result()
{
    engine l_engine{engine_config()};
    auto l_result = l_engine.run("(\\y.y) (\\x.x)");

    std::ostringstream l_ss;
    print_result(l_ss, l_result, true);
    const std::string l_report = l_ss.str();

    assert(l_report.find("  0\t(\\y.y) (\\x.x)\n") != std::string::npos);
    assert(l_report.find("  1\t\\x.x\t[y := \\x.x]\n") != std::string::npos);
    assert(l_report.find("final:      \\x.x\n") != std::string::npos);
    assert(l_report.find("combinator: I (Identity)\n") != std::string::npos);
    assert(l_report.find("kind:       closed_lambda, free: -\n") !=
           std::string::npos);

    // no trace lines without the flag
    std::ostringstream l_short;
    print_result(l_short, l_result, false);
    assert(l_short.str().find("\t") == std::string::npos);
}

void engine_test_main()
{
    constexpr bool ENABLE_DEBUG_LOGS = true;

    TEST(test_parse_definition);
    TEST(test_engine_run);
    TEST(test_engine_config);
    TEST(test_engine_definitions);
    TEST(test_print_result);
}

#endif
