#include "expr.hpp"
#include <type_traits>

using std::string;

namespace exfalso::core {
#include "macros_open.hpp"

  auto Expr::clone(Allocator<Expr>& pool) const -> Expr const* {
    switch (tag) {
      case Var: return pool.make(Var, var.id);
      case Meta: return pool.make(Meta, var.id);
      case False: return pool.make(False);
      case Imp: return pool.make(imp.l->clone(pool), imp.r->clone(pool));
    }
    unreachable;
  }

  auto Expr::operator==(Expr const& rhs) const noexcept -> bool {
    if (this == &rhs) return true;
    if (tag != rhs.tag) return false;
    // Mid: tag == rhs.tag
    switch (tag) {
      case Var: return var.id == rhs.var.id;
      case Meta: return var.id == rhs.var.id;
      case False: return true;
      case Imp: return *imp.l == *rhs.imp.l && *imp.r == *rhs.imp.r;
    }
    unreachable;
  }

  auto Expr::hash() const noexcept -> size_t {
    auto res = static_cast<size_t>(static_cast<std::underlying_type_t<Tag>>(tag));
    switch (tag) {
      case Var:
      case Meta: return combineHash(res, var.id);
      case False: return res;
      case Imp:
        res = combineHash(res, imp.l->hash());
        res = combineHash(res, imp.r->hash());
        return res;
    }
    unreachable;
  }

  auto Expr::varName(uint64_t id) -> string {
    if (id >= 'a' && id <= 'z') return string(1, static_cast<char>(id));
    return "v" + std::to_string(id);
  }

  auto Expr::metaName(uint64_t id) -> string {
    if (id >= 'A' && id <= 'Z') return string(1, static_cast<char>(id));
    return "V" + std::to_string(id);
  }

  auto Expr::toString() const -> string {
    switch (tag) {
      case Var: return varName(var.id);
      case Meta: return metaName(var.id);
      case False: return "!";
      case Imp: {
        // `->` is right-associative, so only an implication on the left needs parentheses
        bool const fl = (imp.l->tag == Imp);
        return (fl ? "(" : "") + imp.l->toString() + (fl ? ")" : "") + " -> " + imp.r->toString();
      }
    }
    unreachable;
  }

  auto Expr::toPrefix() const -> string {
    switch (tag) {
      case Var: return varName(var.id);
      case Meta: return metaName(var.id);
      case False: return "!";
      case Imp: return ">" + imp.l->toPrefix() + imp.r->toPrefix();
    }
    unreachable;
  }

  auto Expr::size() const noexcept -> size_t {
    switch (tag) {
      case Var: return 1;
      case Meta: return 1;
      case False: return 1;
      case Imp: return 1 + imp.l->size() + imp.r->size();
    }
    unreachable;
  }

  auto Expr::occurs(Tag vartag, uint64_t id) const noexcept -> bool {
    switch (tag) {
      case Var:
      case Meta: return tag == vartag && var.id == id;
      case False: return false;
      case Imp: return imp.l->occurs(vartag, id) || imp.r->occurs(vartag, id);
    }
    unreachable;
  }

  auto Expr::isGround() const noexcept -> bool {
    switch (tag) {
      case Var: return true;
      case Meta: return false;
      case False: return true;
      case Imp: return imp.l->isGround() && imp.r->isGround();
    }
    unreachable;
  }

#include "macros_close.hpp"
}
