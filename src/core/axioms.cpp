#include "axioms.hpp"
#include <parsing/formula.hpp>

namespace exfalso::core {
#include "macros_open.hpp"

  Axioms::Axioms() {
    for (size_t i = 0; i < count; i++) {
      auto const e = parsing::parseExpr(sources[i], pool);
      // Schemas may only mention A, B and C
      for (auto c = uint64_t{'A'}; c <= 'Z'; c++)
        if (e->occurs(Expr::Meta, c) && c != metas[0] && c != metas[1] && c != metas[2])
          unreachable;
      schemas[i] = e;
    }
  }

  // Initialisation of function-local statics is thread-safe.
  auto Axioms::instance() -> Axioms const& {
    static Axioms const axioms;
    return axioms;
  }

  auto Axioms::get(size_t index) -> Expr const* {
    if (!valid(index))
      unreachable;
    return instance().schemas[index];
  }

#include "macros_close.hpp"
}
