#ifndef REDEX_CLASSIFIER_HPP
#define REDEX_CLASSIFIER_HPP

#include "term.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace redex
{

enum class match_mode
{
    // equality of the canonical print, whitespace ignored
    syntactic,
    // equality up to renaming of bound variables
    alpha,
};

struct combinator
{
    std::string m_name;
    // canonical print of the closed form
    std::string m_source;
    std::unique_ptr<term> m_term;
};

// the fixed table: I, K, KI, S, B, C, W, Y and Church numerals 0 to 5
const std::vector<combinator>& known_combinators();

// name of the first table entry matching a_term, if any.
// in alpha mode an exact syntactic match still wins over an alpha match, so
// \f.\x.x is "Church 0" while \a.\b.b is "KI (False)".
std::optional<std::string> classify(const std::unique_ptr<term>& a_term,
                                    match_mode a_mode = match_mode::syntactic);

} // namespace redex

#endif
