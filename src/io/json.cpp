#include "json.hpp"
#include <parsing/formula.hpp>

using std::string;
using nlohmann::json;

namespace exfalso::io {
#include "macros_open.hpp"

  using core::Expr;

  namespace {

    // `where` is a JSON-pointer-like path used in error messages
    auto formula(json const& j, string const& where, Allocator<Expr>& pool) -> Expr const* {
      if (!j.is_string()) throw FormatError(where + ": expected formula string");
      auto e = static_cast<Expr const*>(nullptr);
      try {
        e = parsing::parseExpr(j.get<string>(), pool);
      } catch (parsing::ParseError& ex) {
        throw FormatError(where + ": column " + std::to_string(ex.column) + ": " + ex.what());
      }
      if (!e->isGround()) throw FormatError(where + ": metavariables are not allowed in proofs");
      return e;
    }

    auto number(json const& j, char const* key, string const& where) -> size_t {
      if (j.contains(key)) {
        auto const& v = j[key];
        if (v.is_number_unsigned()) return v.get<size_t>();
        if (v.is_number_integer() && v.get<int64_t>() >= 0) return static_cast<size_t>(v.get<int64_t>());
      }
      throw FormatError(where + "/" + key + ": expected non-negative integer");
    }

    auto step(json const& j, string const& where, Allocator<Expr>& pool) -> core::Step {
      if (!j.is_object()) throw FormatError(where + ": expected object");
      if (!j.contains("rule") || !j["rule"].is_string()) throw FormatError(where + "/rule: expected string");
      auto const rule = j["rule"].get<string>();
      if (rule == "axiom") {
        auto const& terms = j.contains("terms") ? j["terms"] : json();
        if (!terms.is_array() || terms.size() != 3) throw FormatError(where + "/terms: expected array of 3 formulas");
        return core::AxiomStep{
          number(j, "index", where),
          {formula(terms[0], where + "/terms/0", pool),
           formula(terms[1], where + "/terms/1", pool),
           formula(terms[2], where + "/terms/2", pool)}
        };
      }
      if (rule == "mp")
        return core::ModusPonensStep{number(j, "implication", where), number(j, "premise", where)};
      throw FormatError(where + "/rule: unknown rule \"" + rule + "\", expected axiom or mp");
    }

  }

  auto proofFromJson(json const& j, Allocator<Expr>& pool) -> core::Proof {
    if (!j.is_object()) throw FormatError("expected object at top level");
    if (!j.contains("goal")) throw FormatError("/goal: missing");
    auto const goal = formula(j["goal"], "/goal", pool);
    if (!j.contains("steps") || !j["steps"].is_array()) throw FormatError("/steps: expected array");
    auto steps = std::vector<core::Step>();
    for (size_t i = 0; i < j["steps"].size(); i++)
      steps.push_back(step(j["steps"][i], "/steps/" + std::to_string(i), pool));
    return {goal, std::move(steps)};
  }

  auto parseJsonProof(std::string_view s, Allocator<Expr>& pool) -> core::Proof {
    auto j = json();
    try {
      j = json::parse(s);
    } catch (json::parse_error& e) {
      throw FormatError(e.what());
    }
    return proofFromJson(j, pool);
  }

  auto stepToJson(core::Step const& step) -> json {
    return match(
      step,
      [](core::AxiomStep const& s) -> json {
        auto terms = json::array();
        for (auto const t: s.terms)
          terms.push_back(t->toPrefix());
        return {
          { "rule", "axiom"},
          {"index", s.index},
          {"terms",   terms}
        };
      },
      [](core::ModusPonensStep const& s) -> json {
        return {
          {       "rule",          "mp"},
          {"implication", s.implication},
          {    "premise",     s.premise}
        };
      }
    );
  }

  auto resultToJson(string const& name, core::Proof const& proof, core::VerificationResult const& result) -> json {
    auto res = json{
      {"name",                name},
      {"goal", proof.goal->toPrefix()}
    };
    match(
      result,
      [&](core::Derived const& d) {
        auto trace = json::array();
        for (size_t i = 0; i < d.trace.size(); i++) {
          auto line = stepToJson(proof.steps[i]);
          line["line"] = i;
          line["formula"] = d.trace[i]->toString();
          line["prefix"] = d.trace[i]->toPrefix();
          trace.push_back(std::move(line));
        }
        res["valid"] = true;
        res["goalLine"] = d.goalLine;
        res["trace"] = std::move(trace);
      },
      [&](core::Failed const& f) {
        res["valid"] = false;
        res["reason"] = string(core::failureName(f.reason));
        res["step"] = f.step;
        res["message"] = f.message;
      }
    );
    return res;
  }

#include "macros_close.hpp"
}
