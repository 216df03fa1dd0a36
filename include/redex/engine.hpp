#ifndef REDEX_ENGINE_HPP
#define REDEX_ENGINE_HPP

#include "classifier.hpp"
#include "lexer.hpp"
#include "reducer.hpp"
#include "term.hpp"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace redex
{

struct engine_config
{
    strategy m_strategy = strategy::normal_order;
    uint32_t m_max_steps = 100;
    lexer_options m_lexer;
    match_mode m_match_mode = match_mode::syntactic;
    print_options m_print;
    // (name, source) pairs bound around every input, earliest outermost
    std::vector<std::pair<std::string, std::string>> m_definitions;
};

// splits "NAME=TERM" into its parts.
// throws std::invalid_argument if there is no '=' or NAME is not an identifier.
std::pair<std::string, std::string>
parse_definition(const std::string& a_text);

// Parses and reduces expressions under one configuration. Holds no state
// besides the parsed definitions, so one engine may serve concurrent callers.
class engine
{
  public:
    // parses the configured definitions, throws lex_error or parse_error if
    // one is malformed and std::invalid_argument if a name is not valid
    explicit engine(engine_config a_config);

    const engine_config& config() const;

    // throws lex_error or parse_error
    std::unique_ptr<term> parse(const std::string& a_text) const;

    // binds the definitions around a_term and reduces the result
    reduction_result reduce(const std::unique_ptr<term>& a_term) const;

    // parse followed by reduce
    reduction_result run(const std::string& a_text) const;

  private:
    engine_config m_config;
    std::vector<definition> m_definitions;
};

// human readable report of a result, with one line per trace entry if
// a_with_trace is set
void print_result(std::ostream& a_ostream, const reduction_result& a_result,
                  bool a_with_trace = false);

} // namespace redex

#endif
