#ifndef EXFALSO_PARSING_SCRIPT_HPP
#define EXFALSO_PARSING_SCRIPT_HPP

#include <string_view>
#include <common.hpp>
#include <core/proof.hpp>
#include "formula.hpp"

namespace exfalso::parsing {
#include "macros_open.hpp"

  // Reads a proof script. One directive per line, `#` starts a comment:
  //   goal <formula>
  //   axiom <index> <formula> <formula> <formula>
  //   mp <implication-line> <premise-line>
  // Steps are numbered from 0. Formulas must not contain metavariables.
  // Lifetime of the resulting formulas is bounded by `pool`.
  // Throws `ParseError` on failure
  auto parseScript(std::string_view s, Allocator<core::Expr>& pool) -> core::Proof;

#include "macros_close.hpp"
}

#endif // EXFALSO_PARSING_SCRIPT_HPP
