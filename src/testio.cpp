#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <variant>
#include <core.hpp>
#include <io/json.hpp>
#include <io/report.hpp>
#include <nlohmann/json.hpp>
#include <parsing/formula.hpp>
#include <parsing/script.hpp>

using std::string;
using nlohmann::json;
using namespace exfalso;
using core::Expr;
using io::FormatError;

namespace {

  constexpr auto identityJson = R"({
    "goal": ">aa",
    "steps": [
      { "rule": "axiom", "index": 1, "terms": ["a", ">aa", "a"] },
      { "rule": "axiom", "index": 0, "terms": ["a", ">aa", "a"] },
      { "rule": "mp", "implication": 0, "premise": 1 },
      { "rule": "axiom", "index": 0, "terms": ["a", "a", "a"] },
      { "rule": "mp", "implication": 2, "premise": 3 }
    ]
  })";

  constexpr auto identityScript = "goal >aa\n"
                                  "axiom 1 a >aa a\n"
                                  "axiom 0 a >aa a\n"
                                  "mp 0 1\n"
                                  "axiom 0 a a a\n"
                                  "mp 2 3\n";

  // Message of the `FormatError` raised while reading `s`, or empty if there is none
  auto formatError(string const& s) -> string {
    auto pool = Allocator<Expr>();
    try {
      io::parseJsonProof(s, pool);
    } catch (FormatError& e) {
      return e.what();
    }
    return "";
  }

}

TEST(JsonTest, ReadsProof) {
  auto pool = Allocator<Expr>();
  auto const proof = io::parseJsonProof(identityJson, pool);
  EXPECT_EQ(proof.steps.size(), 5u);
  auto const res = proof.verify(pool);
  ASSERT_TRUE(std::holds_alternative<core::Derived>(res));
  EXPECT_EQ(*std::get<core::Derived>(res).trace.back(), *parsing::parseExpr(">aa", pool));
}

TEST(JsonTest, AgreesWithScript) {
  auto pool = Allocator<Expr>();
  auto const a = io::parseJsonProof(identityJson, pool);
  auto const b = parsing::parseScript(identityScript, pool);
  auto const ta = a.statements(pool), tb = b.statements(pool);
  ASSERT_EQ(ta.size(), tb.size());
  for (size_t i = 0; i < ta.size(); i++)
    EXPECT_EQ(*ta[i], *tb[i]);
  for (size_t i = 0; i < a.steps.size(); i++)
    EXPECT_EQ(io::stepToJson(a.steps[i]), io::stepToJson(b.steps[i]));
}

TEST(JsonTest, RejectsMalformedDocuments) {
  EXPECT_NE(formatError("{ \"goal\": "), "");
  EXPECT_NE(formatError("[]").find("top level"), string::npos);
  EXPECT_NE(formatError(R"({ "steps": [] })").find("/goal"), string::npos);
  EXPECT_NE(formatError(R"({ "goal": "a" })").find("/steps"), string::npos);
  EXPECT_NE(formatError(R"({ "goal": ">a", "steps": [] })").find("column 3"), string::npos);
  EXPECT_NE(formatError(R"({ "goal": ">AA", "steps": [] })").find("metavariables"), string::npos);
  EXPECT_NE(formatError(R"({ "goal": "a", "steps": [ { "rule": "cut" } ] })").find("/steps/0/rule"), string::npos);
  EXPECT_NE(
    formatError(R"({ "goal": "a", "steps": [ { "rule": "axiom", "index": 0, "terms": ["a", "b"] } ] })").find("/terms"),
    string::npos
  );
  EXPECT_NE(
    formatError(R"({ "goal": "a", "steps": [ { "rule": "axiom", "index": 0, "terms": ["a", "b", 3] } ] })")
      .find("/steps/0/terms/2"),
    string::npos
  );
  EXPECT_NE(
    formatError(R"({ "goal": "a", "steps": [ { "rule": "mp", "implication": -1, "premise": 0 } ] })")
      .find("/steps/0/implication"),
    string::npos
  );
  EXPECT_EQ(formatError(R"({ "goal": "a", "steps": [ { "rule": "mp", "implication": 0, "premise": 0 } ] })"), "");
}

TEST(JsonTest, DerivedResult) {
  auto pool = Allocator<Expr>();
  auto const proof = io::parseJsonProof(identityJson, pool);
  auto const j = io::resultToJson("id", proof, proof.verify(pool));
  EXPECT_EQ(j["name"], "id");
  EXPECT_EQ(j["goal"], ">aa");
  EXPECT_EQ(j["valid"], true);
  EXPECT_EQ(j["goalLine"], 4);
  ASSERT_EQ(j["trace"].size(), 5u);
  EXPECT_EQ(j["trace"][0]["rule"], "axiom");
  EXPECT_EQ(j["trace"][0]["index"], 1);
  EXPECT_EQ(j["trace"][0]["terms"], json({"a", ">aa", "a"}));
  EXPECT_EQ(j["trace"][2]["rule"], "mp");
  EXPECT_EQ(j["trace"][2]["implication"], 0);
  EXPECT_EQ(j["trace"][2]["formula"], "(a -> a -> a) -> a -> a");
  EXPECT_EQ(j["trace"][4]["prefix"], ">aa");
  EXPECT_EQ(j["trace"][4]["line"], 4);
}

TEST(JsonTest, FailedResult) {
  auto pool = Allocator<Expr>();
  auto const proof = core::Proof(parsing::parseExpr(">aa", pool), {core::ModusPonensStep{0, 0}});
  auto const j = io::resultToJson("bad", proof, proof.verify(pool));
  EXPECT_EQ(j["valid"], false);
  EXPECT_EQ(j["reason"], "DanglingReference");
  EXPECT_EQ(j["step"], 0);
  EXPECT_TRUE(j["message"].is_string());
  EXPECT_FALSE(j.contains("trace"));
}

TEST(ReportTest, DerivationListing) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript("goal >a>ba\naxiom 0 a b c\n", pool);
  EXPECT_EQ(
    io::formatResult(proof, proof.verify(pool)),
    "Goal is a -> b -> a\n"
    "Proof is:\n"
    "0: a -> b -> a (Axiom 0 A -> B -> A; terms A = a, B = b, C = c)\n"
    "Q.E.D.\n"
  );
}

TEST(ReportTest, ModusPonensLines) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript(identityScript, pool);
  auto const s = io::formatResult(proof, proof.verify(pool));
  EXPECT_NE(s.find("\n4: a -> a (Inferred from 2 using 3)\nQ.E.D.\n"), string::npos);
  EXPECT_NE(s.find("\n0: (a -> (a -> a) -> a) -> (a -> a -> a) -> a -> a (Axiom 1 "), string::npos);
}

TEST(ReportTest, FailureListing) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript("goal >bb\naxiom 0 a b c\n", pool);
  auto const s = io::formatResult(proof, proof.verify(pool));
  EXPECT_EQ(s.rfind("Goal is b -> b\nProof is invalid at step 1: ", 0), 0u);
  EXPECT_EQ(s.find("Q.E.D."), string::npos);
}

TEST(ReportTest, UnknownAxiomStep) {
  auto pool = Allocator<Expr>();
  auto const a = parsing::parseExpr("a", pool);
  EXPECT_EQ(io::formatStep(core::AxiomStep{9, {a, a, a}}), "Axiom 9; terms A = a, B = a, C = a");
}

TEST(ReportTest, QuietTextReporter) {
  auto pool = Allocator<Expr>();
  auto const good = parsing::parseScript("goal >a>ba\naxiom 0 a b c\n", pool);
  auto const bad = parsing::parseScript("goal >a>ba\nmp 0 0\n", pool);
  auto out = std::ostringstream();
  auto reporter = io::TextReporter(out, true);
  reporter.report("good", good, good.verify(pool));
  reporter.report("bad", bad, bad.verify(pool));
  reporter.finish();
  EXPECT_EQ(out.str(), "good: valid\nbad: invalid at step 0 (DanglingReference)\n");
}

TEST(ReportTest, TextReporterSeparatesProofs) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript("goal >a>ba\naxiom 0 a b c\n", pool);
  auto out = std::ostringstream();
  auto reporter = io::TextReporter(out, false);
  reporter.report("one", proof, proof.verify(pool));
  reporter.report("two", proof, proof.verify(pool));
  auto const s = out.str();
  EXPECT_EQ(s.rfind("== one\nGoal is ", 0), 0u);
  EXPECT_NE(s.find("Q.E.D.\n\n== two\n"), string::npos);
}

TEST(ReportTest, JsonReporter) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript("goal >a>ba\naxiom 0 a b c\n", pool);
  auto out = std::ostringstream();
  auto reporter = io::JsonReporter(out);
  reporter.report("one", proof, proof.verify(pool));
  reporter.report("two", proof, proof.verify(pool));
  EXPECT_EQ(out.str(), "");
  reporter.finish();
  auto const j = json::parse(out.str());
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[1]["name"], "two");
  EXPECT_EQ(j[1]["valid"], true);
}

TEST(ReportTest, JsonReporterReplacesInvalidUtf8) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript("goal >a>ba\naxiom 0 a b c\n", pool);
  auto out = std::ostringstream();
  auto reporter = io::JsonReporter(out);
  reporter.report("x\xff.proof", proof, proof.verify(pool));
  reporter.report("y.proof", proof, proof.verify(pool));
  reporter.finish();
  auto const j = json::parse(out.str());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["name"], "x\xEF\xBF\xBD.proof");
  EXPECT_EQ(j[0]["valid"], true);
  EXPECT_EQ(j[1]["name"], "y.proof");
}
