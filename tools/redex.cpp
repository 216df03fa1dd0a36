#include "../include/redex/engine.hpp"
#include "../include/redex/lexer.hpp"
#include "../include/redex/log.hpp"
#include "../include/redex/parser.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace redex;

namespace
{

const char* const USAGE =
    "usage: redex [options] [expression...]\n"
    "reads one expression per line from stdin when none are given\n"
    "\n"
    "  --strategy NAME     normal_order, applicative_order, call_by_name or\n"
    "                      call_by_value (default normal_order)\n"
    "  --max-steps N       step bound (default 100)\n"
    "  --strict            reject unknown characters instead of skipping them\n"
    "  --alpha-match       recognise combinators up to bound variable names\n"
    "  --unicode           print abstractions with the lambda glyph\n"
    "  --define NAME=TERM  bind NAME around every expression, repeatable\n"
    "  --trace             print every intermediate term\n"
    "  --verbose           log each step to stderr\n"
    "  --quiet             suppress all logging\n";

struct cli_options
{
    engine_config m_config;
    bool m_trace = false;
    std::vector<std::string> m_expressions;
};

// throws std::invalid_argument on a malformed command line
cli_options parse_arguments(int argc, char** argv)
{
    cli_options l_options;

    for(int i = 1; i < argc; ++i)
    {
        const std::string l_arg = argv[i];

        auto l_value = [&]() -> std::string
        {
            if(i + 1 >= argc)
                throw std::invalid_argument(l_arg + " expects a value");
            return argv[++i];
        };

        if(l_arg == "--strategy")
            l_options.m_config.m_strategy = parse_strategy(l_value());
        else if(l_arg == "--max-steps")
        {
            const std::string l_text = l_value();
            size_t l_used = 0;
            unsigned long l_steps = 0;
            try
            {
                l_steps = std::stoul(l_text, &l_used);
            }
            catch(const std::logic_error&)
            {
                l_used = 0;
            }
            if(l_text.empty() || l_used != l_text.size() ||
               l_text[0] == '-' || l_steps > UINT32_MAX)
                throw std::invalid_argument("--max-steps expects a count, got '" +
                                            l_text + "'");
            l_options.m_config.m_max_steps = static_cast<uint32_t>(l_steps);
        }
        else if(l_arg == "--strict")
            l_options.m_config.m_lexer.m_strict = true;
        else if(l_arg == "--alpha-match")
            l_options.m_config.m_match_mode = match_mode::alpha;
        else if(l_arg == "--unicode")
            l_options.m_config.m_print.m_unicode_lambda = true;
        else if(l_arg == "--define")
            l_options.m_config.m_definitions.push_back(
                parse_definition(l_value()));
        else if(l_arg == "--trace")
            l_options.m_trace = true;
        else if(l_arg == "--verbose")
            set_log_level(log_level::debug);
        else if(l_arg == "--quiet")
            set_log_level(log_level::off);
        else if(l_arg.size() > 2 && l_arg.compare(0, 2, "--") == 0)
            throw std::invalid_argument("unknown option " + l_arg);
        else
            l_options.m_expressions.push_back(l_arg);
    }

    return l_options;
}

void print_error(const std::string& a_input, const char* a_message,
                 size_t a_position)
{
    std::cerr << "error: " << a_message << "\n"
              << a_input << "\n"
              << std::string(a_position, ' ') << "^\n";
}

// returns false if a_input was rejected
bool evaluate(const engine& a_engine, const std::string& a_input,
              bool a_trace)
{
    try
    {
        print_result(std::cout, a_engine.run(a_input), a_trace);
        std::cout << std::endl;
        return true;
    }
    catch(const lex_error& l_error)
    {
        print_error(a_input, l_error.what(), l_error.position());
    }
    catch(const parse_error& l_error)
    {
        print_error(a_input, l_error.what(), l_error.position());
    }
    return false;
}

} // namespace

int main(int argc, char** argv)
{
    cli_options l_options;
    try
    {
        l_options = parse_arguments(argc, argv);
    }
    catch(const std::invalid_argument& l_error)
    {
        std::cerr << "redex: " << l_error.what() << "\n\n" << USAGE;
        return 2;
    }

    std::unique_ptr<engine> l_engine;
    try
    {
        l_engine.reset(new engine(l_options.m_config));
    }
    catch(const std::runtime_error& l_error)
    {
        // lex_error and parse_error from a definition body
        std::cerr << "redex: bad definition: " << l_error.what() << "\n";
        return 2;
    }
    catch(const std::invalid_argument& l_error)
    {
        std::cerr << "redex: bad definition: " << l_error.what() << "\n";
        return 2;
    }

    bool l_failed = false;

    if(!l_options.m_expressions.empty())
    {
        for(const auto& l_expression : l_options.m_expressions)
            l_failed |= !evaluate(*l_engine, l_expression, l_options.m_trace);
    }
    else
    {
        std::string l_line;
        while(std::getline(std::cin, l_line))
        {
            if(l_line.find_first_not_of(" \t\r") == std::string::npos)
                continue;
            l_failed |= !evaluate(*l_engine, l_line, l_options.m_trace);
        }
    }

    return l_failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
