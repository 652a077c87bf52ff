#ifndef EQPP_PARSER_HPP
#define EQPP_PARSER_HPP

#include "eqpp/ast.hpp"

#include <string>

namespace eqpp {

/**
 * @brief Parses equation source into a SystemAst.
 *
 * Accepted constructs, separated by ';':
 *   D(x) == expr
 *   {D(x), D(y)} == {expr, expr}
 * Derivatives may also be written x', x'[t], x'(t) or D[x[t], t], and calls
 * may use square brackets (Sin[x]). Names are not resolved here; that is the
 * binder's job.
 *
 * @throws ParseError with kind UnexpectedToken, UnterminatedGroup or EmptyInput.
 */
SystemAst
parse(const std::string &source);

/**
 * @brief Canonical cache key for equation text.
 *
 * The token texts are concatenated, with a single space only between two
 * tokens that would otherwise read as one ("1 2", "a b"). Texts that tokenize
 * differently never share a key.
 *
 * @throws ParseError if the text does not tokenize.
 */
std::string
normalize_source(const std::string &source);

} // namespace eqpp

#endif // EQPP_PARSER_HPP
