#include "proof.hpp"
#include <algorithm>
#include "axioms.hpp"

using std::string;
using std::vector;

namespace exfalso::core {
#include "macros_open.hpp"

  auto failureName(Failure f) -> std::string_view {
    switch (f) {
      case Failure::UnknownAxiom: return "UnknownAxiom";
      case Failure::UnexpectedMeta: return "UnexpectedMeta";
      case Failure::DanglingReference: return "DanglingReference";
      case Failure::NotAnImplication: return "NotAnImplication";
      case Failure::PremiseMismatch: return "PremiseMismatch";
      case Failure::GoalNotDerived: return "GoalNotDerived";
    }
    unreachable;
  }

  auto Proof::statements(Allocator<Expr>& pool) const -> vector<Expr const*> {
    auto res = vector<Expr const*>();
    res.reserve(steps.size());

    for (size_t i = 0; i < steps.size(); i++) {
      // Helper for fetching earlier lines
      // Throws exception on failure
      auto line = [&res, i](size_t k) -> Expr const* {
        if (k >= res.size())
          throw InvalidProof(
            Failure::DanglingReference,
            i,
            "line " + std::to_string(k) + " is not derived before step " + std::to_string(i)
          );
        return res[k];
      };

      auto const e = match(
        steps[i],
        [&](AxiomStep const& s) -> Expr const* {
          if (!Axioms::valid(s.index))
            throw InvalidProof(Failure::UnknownAxiom, i, "unknown axiom " + std::to_string(s.index));
          // Substitution is sequential, so a metavariable in a term could be captured by a later one
          for (size_t j = 0; j < s.terms.size(); j++)
            if (!s.terms[j]->isGround())
              throw InvalidProof(
                Failure::UnexpectedMeta,
                i,
                "term for " + Expr::metaName(Axioms::metas[j]) + " contains metavariables: " + s.terms[j]->toString()
              );
          auto x = Axioms::get(s.index);
          for (size_t j = 0; j < s.terms.size(); j++)
            x = x->replaceMeta(Axioms::metas[j], s.terms[j], pool);
          return x;
        },
        [&](ModusPonensStep const& s) -> Expr const* {
          auto const p = line(s.implication);
          auto const q = line(s.premise);
          if (p->tag != Expr::Imp)
            throw InvalidProof(
              Failure::NotAnImplication,
              i,
              "line " + std::to_string(s.implication) + " is not an implication: " + p->toString()
            );
          if (*p->imp.l != *q)
            throw InvalidProof(
              Failure::PremiseMismatch,
              i,
              "premise mismatch, line " + std::to_string(s.implication) + " requires " + p->imp.l->toString()
                + ", line " + std::to_string(s.premise) + " is " + q->toString()
            );
          return p->imp.r;
        }
      );
      res.push_back(e);
    }

    return res;
  }

  auto Proof::verify(Allocator<Expr>& pool) const -> VerificationResult {
    auto trace = vector<Expr const*>();
    try {
      trace = statements(pool);
    } catch (InvalidProof& e) {
      return Failed{e.reason, e.step, e.what()};
    }
    auto const it = std::find_if(trace.begin(), trace.end(), [this](Expr const* x) { return *x == *goal; });
    if (it == trace.end())
      return Failed{Failure::GoalNotDerived, steps.size(), "goal " + goal->toString() + " is not derived"};
    auto const goalLine = static_cast<size_t>(it - trace.begin());
    return Derived{std::move(trace), goalLine};
  }

#include "macros_close.hpp"
}
