#include "formula.hpp"

using std::string;
using std::string_view;

namespace exfalso::parsing {
#include "macros_open.hpp"

  using core::Expr;

  namespace {

    // ASCII only, independent of the current locale.
    auto isLower(char c) -> bool { return c >= 'a' && c <= 'z'; }
    auto isUpper(char c) -> bool { return c >= 'A' && c <= 'Z'; }

    // Reads one formula starting at `pos`, advancing `pos` past it.
    auto chew(string_view s, size_t& pos, size_t depth, Allocator<Expr>& pool) -> Expr const* {
      if (pos >= s.size())
        throw ParseError(0, pos + 1, "unexpected end of formula");
      if (depth > maxFormulaDepth)
        throw ParseError(0, pos + 1, "formula nested too deeply");
      auto const c = s[pos++];
      if (c == '!') return pool.make(Expr::False);
      if (isLower(c)) return pool.make(Expr::Var, static_cast<uint64_t>(c));
      if (isUpper(c)) return pool.make(Expr::Meta, static_cast<uint64_t>(c));
      // Implication
      auto const l = chew(s, pos, depth + 1, pool);
      auto const r = chew(s, pos, depth + 1, pool);
      return pool.make(l, r);
    }

  }

  auto parseExpr(string_view s, Allocator<Expr>& pool) -> Expr const* {
    auto pos = size_t{0};
    auto const res = chew(s, pos, 0, pool);
    if (pos < s.size())
      throw ParseError(0, pos + 1, "redundant input after formula: \"" + string(s.substr(pos)) + "\"");
    return res;
  }

#include "macros_close.hpp"
}
