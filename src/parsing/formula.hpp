#ifndef EXFALSO_PARSING_FORMULA_HPP
#define EXFALSO_PARSING_FORMULA_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <common.hpp>
#include <core/expr.hpp>

namespace exfalso::parsing {
#include "macros_open.hpp"

  // An exception class representing a syntax error.
  // Positions are 1-based; `line` is 0 when the input was a single formula.
  struct ParseError: public std::runtime_error {
    size_t line, column;
    ParseError(size_t line, size_t column, std::string const& s):
        std::runtime_error(s),
        line(line),
        column(column) {}
  };

  // Deepest implication nesting accepted by `parseExpr`.
  // Terms and trace lines are walked recursively, so this bounds their stack usage.
  constexpr size_t maxFormulaDepth = 10000;

  // Converts prefix notation into a formula:
  //   `!`          contradiction
  //   `a`...`z`    variables (keyed by character code)
  //   `A`...`Z`    metavariables (keyed by character code)
  //   `>PQ`        implication (any other character is read as the operator)
  // The whole input must be consumed, nested no deeper than `maxFormulaDepth`.
  // Lifetime of the resulting formula is bounded by `pool`.
  // Throws `ParseError` on failure
  auto parseExpr(std::string_view s, Allocator<core::Expr>& pool) -> core::Expr const*;

#include "macros_close.hpp"
}

#endif // EXFALSO_PARSING_FORMULA_HPP
