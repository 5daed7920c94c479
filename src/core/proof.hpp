// Core :: Proof, Step, InvalidProof, VerificationResult

#ifndef EXFALSO_CORE_PROOF_HPP
#define EXFALSO_CORE_PROOF_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <common.hpp>
#include "expr.hpp"

namespace exfalso::core {
#include "macros_open.hpp"

  // Instantiates axiom `index`, replacing A, B, C by `terms[0]`, `terms[1]`, `terms[2]`.
  struct AxiomStep {
    size_t index;
    std::array<Expr const*, 3> terms;
  };

  // From line `implication` (P -> Q) and line `premise` (P), derives Q.
  struct ModusPonensStep {
    size_t implication, premise;
  };

  using Step = std::variant<AxiomStep, ModusPonensStep>;

  // Code consistency (unchecked): if you change this, also update `failureName()` and `io::json`
  enum class Failure: uint32_t {
    UnknownAxiom,      // Axiom index outside of the table
    UnexpectedMeta,    // Instantiation term contains a metavariable
    DanglingReference, // Modus ponens cites a line not yet derived
    NotAnImplication,  // Cited implication line is not an implication
    PremiseMismatch,   // Premise of the implication differs from the cited premise line
    GoalNotDerived     // All steps valid, but the goal is not in the trace
  };

  auto failureName(Failure f) -> std::string_view;

  // An exception class representing checking failure
  class InvalidProof: public std::runtime_error {
  public:
    Failure reason;
    size_t step;
    InvalidProof(Failure reason, size_t step, std::string const& s):
        std::runtime_error(s),
        reason(reason),
        step(step) {}
  };

  struct Derived {
    std::vector<Expr const*> trace;
    size_t goalLine; // First line equal to the goal
  };

  struct Failed {
    Failure reason;
    size_t step; // Equals the number of steps for `GoalNotDerived`
    std::string message;
  };

  using VerificationResult = std::variant<Derived, Failed>;

  // A goal with a linear sequence of inference steps.
  // Pointers are not owned; their lifetime is bounded by the allocator(s) they came from.
  class Proof {
  public:
    Expr const* goal;
    std::vector<Step> steps;

    Proof(Expr const* goal, std::vector<Step> steps):
        goal(goal),
        steps(std::move(steps)) {}

    // Replays all steps and returns the derived statements, one per step.
    // Does not look at `goal`.
    // (Returned pointers' lifetime is bounded by `this`, `pool` and the axiom table)
    // Throws `InvalidProof` at the first invalid step
    auto statements(Allocator<Expr>& pool) const -> std::vector<Expr const*>;

    // Checks that all steps are valid and the goal appears among the statements.
    // Never throws `InvalidProof`: failures are returned as `Failed`.
    auto verify(Allocator<Expr>& pool) const -> VerificationResult;
  };

#include "macros_close.hpp"
}

#endif // EXFALSO_CORE_PROOF_HPP
