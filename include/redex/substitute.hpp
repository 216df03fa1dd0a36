#ifndef REDEX_SUBSTITUTE_HPP
#define REDEX_SUBSTITUTE_HPP

#include "term.hpp"

#include <memory>
#include <set>
#include <string>

namespace redex
{

// picks the first name not in a_avoid: single letters a..z, then x0, x1, ...
// deterministic for a given avoid-set.
std::string fresh_name(const std::set<std::string>& a_avoid);

// returns a new term equal to a_term with every free occurrence of
// a_variable replaced by a_replacement.
//
// an abstraction whose parameter occurs free in a_replacement is
// alpha-renamed first, so no free variable of a_replacement is ever captured.
// the fresh parameter avoids the free variables of the body and of
// a_replacement, a_variable itself, and every name bound inside the body.
std::unique_ptr<term> substitute(const std::unique_ptr<term>& a_term,
                                 const std::string& a_variable,
                                 const std::unique_ptr<term>& a_replacement);

// alpha-converts a single abstraction to use a_new_param.
// throws std::invalid_argument if a_lambda is not an abstraction or if
// a_new_param occurs free in its body (renaming would capture it).
std::unique_ptr<term> rename_bound(const std::unique_ptr<term>& a_lambda,
                                   const std::string& a_new_param);

// structural equality up to consistent renaming of bound variables.
// free variables must match by name.
bool alpha_equivalent(const std::unique_ptr<term>& a_lhs,
                      const std::unique_ptr<term>& a_rhs);

} // namespace redex

#endif
