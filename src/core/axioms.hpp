// Core :: Axioms

#ifndef EXFALSO_CORE_AXIOMS_HPP
#define EXFALSO_CORE_AXIOMS_HPP

#include <array>
#include <string_view>
#include <common.hpp>
#include "expr.hpp"

namespace exfalso::core {
#include "macros_open.hpp"

  // The fixed axiom schemas, built once and never modified.
  // Safe for concurrent reads.
  class Axioms {
  public:
    static constexpr size_t count = 4;

    // Metavariables in the order they are instantiated (A, B, C).
    static constexpr std::array<uint64_t, 3> metas = {'A', 'B', 'C'};

    // Source of each schema, in the notation of `parsing::parseExpr()`.
    static constexpr std::array<std::string_view, count> sources = {
      ">A>BA",         // A -> (B -> A)
      ">>A>BC>>AB>AC", // (A -> (B -> C)) -> ((A -> B) -> (A -> C))
      ">>>ABAA",       // ((A -> B) -> A) -> A
      ">!A",           // ! -> A
    };

    static auto valid(size_t index) noexcept -> bool {
      return index < count;
    }

    // Pre: `valid(index)`
    // The returned pointer is valid for the whole program lifetime.
    static auto get(size_t index) -> Expr const*;

  private:
    Allocator<Expr> pool;
    std::array<Expr const*, count> schemas{};

    Axioms();
    static auto instance() -> Axioms const&;
  };

#include "macros_close.hpp"
}

#endif // EXFALSO_CORE_AXIOMS_HPP
