#ifndef EXFALSO_CORE_HPP
#define EXFALSO_CORE_HPP

// The `core` folder contains everything related to the verifier:

#include "core/axioms.hpp" // Axioms
#include "core/expr.hpp"   // Expr
#include "core/proof.hpp"  // Proof, Step, InvalidProof, VerificationResult

#endif // EXFALSO_CORE_HPP
