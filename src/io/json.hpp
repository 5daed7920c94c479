#ifndef EXFALSO_IO_JSON_HPP
#define EXFALSO_IO_JSON_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <common.hpp>
#include <core/proof.hpp>
#include <nlohmann/json.hpp>

namespace exfalso::io {
#include "macros_open.hpp"

  // An exception class representing ill-formed input documents
  struct FormatError: public std::runtime_error {
    explicit FormatError(std::string const& s):
        std::runtime_error(s) {}
  };

  // Reads a proof of the form:
  //   { "goal": ">aa",
  //     "steps": [ { "rule": "axiom", "index": 1, "terms": ["a", ">aa", "a"] },
  //                { "rule": "mp", "implication": 1, "premise": 0 } ] }
  // Lifetime of the resulting formulas is bounded by `pool`.
  // Throws `FormatError` on failure
  auto proofFromJson(nlohmann::json const& j, Allocator<core::Expr>& pool) -> core::Proof;
  auto parseJsonProof(std::string_view s, Allocator<core::Expr>& pool) -> core::Proof;

  // Description of a single step, without the derived formula
  auto stepToJson(core::Step const& step) -> nlohmann::json;

  // Verification outcome, including the full trace on success
  auto resultToJson(std::string const& name, core::Proof const& proof, core::VerificationResult const& result)
    -> nlohmann::json;

#include "macros_close.hpp"
}

#endif // EXFALSO_IO_JSON_HPP
