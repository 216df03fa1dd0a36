#ifndef REDEX_ANALYSIS_HPP
#define REDEX_ANALYSIS_HPP

#include "term.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace redex
{

enum class term_kind
{
    variable,
    closed_lambda,
    open_lambda,
    application,
};

std::string to_string(term_kind a_kind);

// structural metrics of a term, computed on demand
struct term_analysis
{
    term_kind m_kind = term_kind::variable;
    // sorted
    std::vector<std::string> m_free_variables;
    std::vector<std::string> m_bound_variables;
    size_t m_lambda_count = 0;
    // node count
    size_t m_size = 0;
    // longest root-to-leaf path, a lone variable has depth 1
    size_t m_depth = 0;
    bool m_is_closed = true;
    // length of the canonical print
    size_t m_complexity = 0;
};

term_analysis analyze(const std::unique_ptr<term>& a_term);

} // namespace redex

#endif
