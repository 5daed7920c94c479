#include "report.hpp"
#include <iostream>
#include <core/axioms.hpp>
#include "json.hpp"

using std::string;

namespace exfalso::io {
#include "macros_open.hpp"

  using core::Axioms;
  using core::Expr;

  auto formatStep(core::Step const& step) -> string {
    return match(
      step,
      [](core::AxiomStep const& s) -> string {
        // Unknown axioms never reach a complete trace, but may still be printed on their own
        auto res = "Axiom " + std::to_string(s.index);
        if (Axioms::valid(s.index)) res += " " + Axioms::get(s.index)->toString();
        res += "; terms";
        for (size_t j = 0; j < s.terms.size(); j++)
          res += (j == 0 ? " " : ", ") + Expr::metaName(Axioms::metas[j]) + " = " + s.terms[j]->toString();
        return res;
      },
      [](core::ModusPonensStep const& s) -> string {
        return "Inferred from " + std::to_string(s.implication) + " using " + std::to_string(s.premise);
      }
    );
  }

  auto formatResult(core::Proof const& proof, core::VerificationResult const& result) -> string {
    auto res = "Goal is " + proof.goal->toString() + "\n";
    match(
      result,
      [&](core::Derived const& d) {
        res += "Proof is:\n";
        for (size_t i = 0; i < d.trace.size(); i++)
          res += std::to_string(i) + ": " + d.trace[i]->toString() + " (" + formatStep(proof.steps[i]) + ")\n";
        res += "Q.E.D.\n";
      },
      [&](core::Failed const& f) {
        res += "Proof is invalid at step " + std::to_string(f.step) + ": " + f.message + "\n";
      }
    );
    return res;
  }

  auto TextReporter::report(string const& name, core::Proof const& proof, core::VerificationResult const& result)
    -> void {
    if (quiet) {
      out << name << ": "
          << match(
               result,
               [](core::Derived const&) -> string { return "valid"; },
               [](core::Failed const& f) -> string {
                 return "invalid at step " + std::to_string(f.step) + " (" + string(core::failureName(f.reason)) + ")";
               }
             )
          << std::endl;
      return;
    }
    if (count++ > 0) out << std::endl;
    out << "== " << name << std::endl << formatResult(proof, result) << std::flush;
  }

  auto JsonReporter::report(string const& name, core::Proof const& proof, core::VerificationResult const& result)
    -> void {
    results.push_back(resultToJson(name, proof, result));
  }

  auto JsonReporter::finish() -> void {
    // Names come from the command line and need not be valid UTF-8
    out << results.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }

#include "macros_close.hpp"
}
