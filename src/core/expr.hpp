#ifndef EXFALSO_CORE_EXPR_HPP
#define EXFALSO_CORE_EXPR_HPP

#include <cstdint>
#include <string>
#include <common.hpp>

namespace exfalso::core {
#include "macros_open.hpp"

  // Formula node, and related syntactic operations.
  // Immutable.
  // Pre (for all methods): there is no "cycle" throughout the tree / DAG
  // Pre & invariant (for all methods): all pointers (in the "active variant") are valid
  // Subtrees may be shared between formulas (substitution does not copy unchanged parts).
  class Expr {
  public:
    // clang-format off
    enum class Tag: uint32_t { Var, Meta, False, Imp }; using enum Tag;

    Tag const tag;
    union {
      struct { uint64_t const id; } var; // Var, Meta
      struct { Expr const *l, *r; } imp;
    };
    // clang-format on

    // The constructors below guarantee that all pointers in the "active variant" are valid, if parameters are valid
    explicit Expr(Tag tag, uint64_t id = 0):
        tag(tag),
        var{id} {
      if (tag == Imp)
        unreachable;
    }

    Expr(Expr const* l, Expr const* r):
        tag(Imp),
        imp{l, r} {}

    Expr(Expr const&) = delete;
    Expr(Expr&&) = delete;
    auto operator=(Expr const&) -> Expr& = delete;
    auto operator=(Expr&&) -> Expr& = delete;
    ~Expr() = default;

    // Deep copy whole formula to `pool`
    // O(size)
    auto clone(Allocator<Expr>& pool) const -> Expr const*;

    // Syntactical equality and hash code
    // O(size)
    auto operator==(Expr const& rhs) const noexcept -> bool;
    auto operator!=(Expr const& rhs) const noexcept -> bool {
      return !(*this == rhs);
    }
    auto hash() const noexcept -> size_t;

    // Print with letters for variables, `!` for contradiction and right-associative `->`
    // O(size)
    auto toString() const -> std::string;

    // Print in the prefix notation accepted by `parsing::parseExpr()`
    // O(size)
    auto toPrefix() const -> std::string;

    // Display names of variables and metavariables
    static auto varName(uint64_t id) -> std::string;
    static auto metaName(uint64_t id) -> std::string;

    // Modification (lifetime of the resulting formula is bounded by `this` and `pool`)
    // `f` is called on every `Var` and `Meta` node; unchanged subtrees are returned as-is
    template <typename F>
    auto updateVars(F f, Allocator<Expr>& pool) const -> Expr const* {
      using enum Tag; // These are needed to avoid ICE on gcc...
      switch (tag) {
        case Var:
        case Meta:
          return f(this);
        case False:
          return this;
        case Imp: {
          auto const l = imp.l->updateVars(f, pool);
          auto const r = imp.r->updateVars(f, pool);
          return (l == imp.l && r == imp.r) ? this : pool.make(l, r);
        }
      }
      unreachable;
    }

    // Replace every occurrence of metavariable `id` by `t`.
    // Lifetime of the resulting formula is bounded by `this`, `t` and `pool`.
    auto replaceMeta(uint64_t id, Expr const* t, Allocator<Expr>& pool) const -> Expr const* {
      return updateVars(
        [id, t](Expr const* x) -> Expr const* {
          if (x->tag == Meta && x->var.id == id)
            return t;
          return x;
        },
        pool
      );
    }

    // Returns the number of symbols of the formula.
    auto size() const noexcept -> size_t;

    // Check if given variable (`Var` or `Meta`) is in the subtree.
    auto occurs(Tag vartag, uint64_t id) const noexcept -> bool;

    // Check if the formula does not contain metavariables.
    auto isGround() const noexcept -> bool;
  };

#include "macros_close.hpp"
}

#endif // EXFALSO_CORE_EXPR_HPP
