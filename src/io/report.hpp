#ifndef EXFALSO_IO_REPORT_HPP
#define EXFALSO_IO_REPORT_HPP

#include <iosfwd>
#include <string>
#include <common.hpp>
#include <core/proof.hpp>
#include <nlohmann/json.hpp>

namespace exfalso::io {
#include "macros_open.hpp"

  // Human-readable listing of a verification outcome:
  //   Goal is <goal>
  //   Proof is:
  //   <i>: <formula> (<justification>)
  //   ...
  //   Q.E.D.
  // Failures end with "Proof is invalid at step <i>: <message>" instead.
  auto formatResult(core::Proof const& proof, core::VerificationResult const& result) -> std::string;

  // Justification part of a trace line (without parentheses).
  auto formatStep(core::Step const& step) -> std::string;

  // Output sink for verification outcomes of named proofs.
  class Reporter {
    interface(Reporter);

  public:
    virtual auto report(std::string const& name, core::Proof const& proof, core::VerificationResult const& result)
      -> void required;
    // Called once after the last proof
    virtual auto finish() -> void {}
  };

  class TextReporter: public Reporter {
  public:
    // With `quiet`, writes a single status line per proof
    TextReporter(std::ostream& out, bool quiet):
        out(out),
        quiet(quiet) {}

    auto report(std::string const& name, core::Proof const& proof, core::VerificationResult const& result)
      -> void override;

  private:
    std::ostream& out;
    bool quiet;
    size_t count = 0;
  };

  // Writes all outcomes as a single JSON array at `finish()`
  class JsonReporter: public Reporter {
  public:
    explicit JsonReporter(std::ostream& out):
        out(out) {}

    auto report(std::string const& name, core::Proof const& proof, core::VerificationResult const& result)
      -> void override;
    auto finish() -> void override;

  private:
    std::ostream& out;
    nlohmann::json results = nlohmann::json::array();
  };

#include "macros_close.hpp"
}

#endif // EXFALSO_IO_REPORT_HPP
