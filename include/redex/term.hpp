#ifndef REDEX_TERM_HPP
#define REDEX_TERM_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace redex
{

struct print_options
{
    // print abstractions with the λ glyph instead of a backslash
    bool m_unicode_lambda = false;
};

// Terms are immutable once built. Every rewrite in this library builds a new
// tree; nodes are exclusively owned by their parent through unique_ptr.
struct term
{
    virtual ~term() = default;

    // ACCESSOR METHODS
    // checks if the term is syntactically equal to another (names included)
    virtual bool equals(const std::unique_ptr<term>& a_other) const = 0;
    // prints the term in canonical form to a_ostream
    virtual void print(std::ostream& a_ostream,
                       const print_options& a_options) const = 0;
    // creates a deep copy of the term
    virtual std::unique_ptr<term> clone() const = 0;
    // inserts every variable not bound by a_binders or an inner abstraction
    virtual void collect_free(std::set<std::string>& a_free,
                              std::vector<std::string>& a_binders) const = 0;
    // inserts every abstraction parameter, referenced or not
    virtual void collect_bound(std::set<std::string>& a_bound) const = 0;

    explicit term(size_t a_size);
    term(const term& other) = delete;
    term& operator=(const term& other) = delete;

    // MEMBER VARIABLES
    // number of nodes in the tree rooted here
    const size_t m_size;
};

struct var : term
{
    virtual ~var() = default;

    bool equals(const std::unique_ptr<term>& a_other) const override;
    void print(std::ostream& a_ostream,
               const print_options& a_options) const override;
    std::unique_ptr<term> clone() const override;
    void collect_free(std::set<std::string>& a_free,
                      std::vector<std::string>& a_binders) const override;
    void collect_bound(std::set<std::string>& a_bound) const override;

    const std::string m_name;

  private:
    explicit var(std::string a_name);
    friend std::unique_ptr<term> v(std::string a_name);
};

struct func : term
{
    virtual ~func() = default;

    bool equals(const std::unique_ptr<term>& a_other) const override;
    void print(std::ostream& a_ostream,
               const print_options& a_options) const override;
    std::unique_ptr<term> clone() const override;
    void collect_free(std::set<std::string>& a_free,
                      std::vector<std::string>& a_binders) const override;
    void collect_bound(std::set<std::string>& a_bound) const override;

    const std::string m_param;
    const std::unique_ptr<term> m_body;

  private:
    func(std::string a_param, std::unique_ptr<term>&& a_body);
    friend std::unique_ptr<term> f(std::string a_param,
                                   std::unique_ptr<term>&& a_body);
};

struct app : term
{
    virtual ~app() = default;

    bool equals(const std::unique_ptr<term>& a_other) const override;
    void print(std::ostream& a_ostream,
               const print_options& a_options) const override;
    std::unique_ptr<term> clone() const override;
    void collect_free(std::set<std::string>& a_free,
                      std::vector<std::string>& a_binders) const override;
    void collect_bound(std::set<std::string>& a_bound) const override;

    const std::unique_ptr<term> m_lhs;
    const std::unique_ptr<term> m_rhs;

  private:
    app(std::unique_ptr<term>&& a_lhs, std::unique_ptr<term>&& a_rhs);
    friend std::unique_ptr<term> a(std::unique_ptr<term>&& a_lhs,
                                   std::unique_ptr<term>&& a_rhs);
};

// FACTORY FUNCTIONS
// v and f throw std::invalid_argument if the name is not an identifier,
// f and a throw std::invalid_argument on a null child.

std::unique_ptr<term> v(std::string a_name);
std::unique_ptr<term> f(std::string a_param, std::unique_ptr<term>&& a_body);
std::unique_ptr<term> a(std::unique_ptr<term>&& a_lhs,
                        std::unique_ptr<term>&& a_rhs);

// a letter followed by letters or digits
bool is_identifier(const std::string& a_name);

// prints with default options
std::ostream& operator<<(std::ostream& a_ostream, const term& a_term);

// canonical printed form
std::string to_string(const term& a_term,
                      const print_options& a_options = print_options());

// DERIVED PROPERTIES
// always recomputed from the tree, never stored on it

std::set<std::string> free_variables(const term& a_term);
std::set<std::string> bound_variables(const term& a_term);

// a named helper bound around a main term by construct_program
struct definition
{
    std::string m_name;
    std::unique_ptr<term> m_body;
};

// construct_program: builds a tower of lambda abstractions so that named
// helper definitions are introduced through beta-reductions.
//
// Given helpers [(n0, d0), (n1, d1), ...] and a main term M, constructs:
//   (\n0.((\n1.M) d1)) d0
//
// Each definition is in scope of every earlier one, so d1 may refer to n0.
//
// Template parameter IT must support:
//   - Member access it->m_name (std::string) and
//     it->m_body (const std::unique_ptr<term>&)
//   - std::next(it) -> IT
//   - Equality comparison (it == end)
template <typename IT>
std::unique_ptr<term> construct_program(IT a_helpers_begin, IT a_helpers_end,
                                        const std::unique_ptr<term>& a_main)
{
    // Base case: no helpers, just the main term
    if(a_helpers_begin == a_helpers_end)
        return a_main->clone();

    // Recursive case: bind the first helper around the rest
    return a(f(a_helpers_begin->m_name,
               construct_program(std::next(a_helpers_begin), a_helpers_end,
                                 a_main)),
             a_helpers_begin->m_body->clone());
}

} // namespace redex

#endif
