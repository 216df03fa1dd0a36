#ifndef REDEX_REDUCER_HPP
#define REDEX_REDUCER_HPP

#include "analysis.hpp"
#include "classifier.hpp"
#include "term.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace redex
{

enum class strategy
{
    // leftmost-outermost, reduces under abstractions
    normal_order,
    // leftmost-innermost, reduces under abstractions
    applicative_order,
    // leftmost-outermost, never inside an abstraction or an argument
    call_by_name,
    // leftmost-innermost, never inside an abstraction
    call_by_value,
};

std::string to_string(strategy a_strategy);

// accepts the snake_case names above as well as the short forms
// "normal", "applicative", "name" and "value".
// throws std::invalid_argument on anything else.
strategy parse_strategy(const std::string& a_name);

// one move from a node to a child
enum class path_step
{
    function,
    argument,
    body,
};

std::string to_string(path_step a_step);

struct redex_description
{
    // moves from the root to the redex
    std::vector<path_step> m_path;
    // printed forms of the parts of (\parameter.body) argument
    std::string m_lambda;
    std::string m_parameter;
    std::string m_body;
    std::string m_argument;
};

// locates the redex a_strategy would contract next, if any
std::optional<redex_description> find_redex(const std::unique_ptr<term>& a_term,
                                            strategy a_strategy);

// attempts to find and contract the redex chosen by a_strategy.
// on success stores the new term in a_result and the contracted redex in
// a_redex, and returns true. returns false in normal form, leaving both
// outputs untouched. a_term itself is never modified.
bool step(const std::unique_ptr<term>& a_term, strategy a_strategy,
          std::unique_ptr<term>& a_result, redex_description& a_redex);

struct trace_entry
{
    uint32_t m_step;
    std::string m_term;
    // "initial" or "beta_reduction"
    std::string m_action;
    // absent for the initial entry
    std::optional<redex_description> m_redex;
    std::vector<std::string> m_free_variables;
    std::vector<std::string> m_bound_variables;
};

struct reduce_options
{
    strategy m_strategy = strategy::normal_order;
    uint32_t m_max_steps = 100;
    match_mode m_match_mode = match_mode::syntactic;
    print_options m_print;
};

struct reduction_result
{
    std::string m_original_term;
    std::string m_final_term;
    // true iff no redex remains under the strategy
    bool m_is_normal_form = false;
    uint32_t m_steps_taken = 0;
    // true iff the step bound or the stagnation guard, not a normal form,
    // ended the run
    bool m_max_steps_reached = false;
    // true iff the last three snapshots were identical
    bool m_stagnated = false;
    strategy m_strategy = strategy::normal_order;
    std::optional<std::string> m_combinator;
    term_analysis m_analysis;
    std::vector<trace_entry> m_trace;
    std::unique_ptr<term> m_final;
};

// reduces a_term step by step until it reaches a normal form, the step bound
// is exhausted, or three consecutive snapshots are identical. never throws on
// divergence: an unfinished run is reported through the result flags.
reduction_result reduce(const std::unique_ptr<term>& a_term,
                        const reduce_options& a_options);

reduction_result reduce(const std::unique_ptr<term>& a_term,
                        strategy a_strategy, uint32_t a_max_steps);

} // namespace redex

#endif
