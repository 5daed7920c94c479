#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <core.hpp>
#include <parsing/formula.hpp>
#include <parsing/script.hpp>

using std::string;
using namespace exfalso;
using core::Expr;
using parsing::ParseError;

namespace {

  // Returns the error raised by `f`, failing the test if there is none
  template <typename F>
  auto parseError(F f) -> ParseError {
    try {
      f();
    } catch (ParseError& e) {
      return e;
    }
    ADD_FAILURE() << "expected ParseError";
    return ParseError(0, 0, "");
  }

  constexpr auto identityScript = R"(# |- a -> a
goal >aa

axiom 1 a >aa a   # 0
axiom 0 a >aa a   # 1
mp 0 1            # 2
axiom 0 a a a     # 3
mp 2 3            # 4
)";

}

TEST(FormulaTest, Atoms) {
  auto pool = Allocator<Expr>();
  auto const f = parsing::parseExpr("!", pool);
  EXPECT_EQ(f->tag, Expr::False);
  auto const v = parsing::parseExpr("q", pool);
  EXPECT_EQ(v->tag, Expr::Var);
  EXPECT_EQ(v->var.id, static_cast<uint64_t>('q'));
  auto const m = parsing::parseExpr("Q", pool);
  EXPECT_EQ(m->tag, Expr::Meta);
  EXPECT_EQ(m->var.id, static_cast<uint64_t>('Q'));
}

TEST(FormulaTest, PrefixImplication) {
  auto pool = Allocator<Expr>();
  auto const e = parsing::parseExpr(">>ab>!a", pool);
  ASSERT_EQ(e->tag, Expr::Imp);
  ASSERT_EQ(e->imp.l->tag, Expr::Imp);
  EXPECT_EQ(e->imp.l->imp.l->var.id, static_cast<uint64_t>('a'));
  EXPECT_EQ(e->imp.l->imp.r->var.id, static_cast<uint64_t>('b'));
  ASSERT_EQ(e->imp.r->tag, Expr::Imp);
  EXPECT_EQ(e->imp.r->imp.l->tag, Expr::False);
  EXPECT_EQ(e->toString(), "(a -> b) -> ! -> a");
}

TEST(FormulaTest, AnyOtherCharacterIsAnImplication) {
  auto pool = Allocator<Expr>();
  EXPECT_EQ(*parsing::parseExpr("-ab", pool), *parsing::parseExpr(">ab", pool));
  EXPECT_EQ(*parsing::parseExpr("*0ab!", pool), *parsing::parseExpr(">>ab!", pool));
}

TEST(FormulaTest, RejectsRedundantInput) {
  auto pool = Allocator<Expr>();
  auto const e = parseError([&] { parsing::parseExpr(">abc", pool); });
  EXPECT_EQ(e.line, 0u);
  EXPECT_EQ(e.column, 4u);
  EXPECT_NE(string(e.what()).find("\"c\""), string::npos);
}

TEST(FormulaTest, RejectsPrematureEnd) {
  auto pool = Allocator<Expr>();
  EXPECT_EQ(parseError([&] { parsing::parseExpr(">a", pool); }).column, 3u);
  EXPECT_EQ(parseError([&] { parsing::parseExpr("", pool); }).column, 1u);
}

TEST(FormulaTest, NestingDepthIsBounded) {
  auto pool = Allocator<Expr>();
  auto nested = [](size_t depth) {
    auto res = string();
    for (size_t i = 0; i < depth; i++) res += ">a";
    return res + "a";
  };
  auto const e = parsing::parseExpr(nested(parsing::maxFormulaDepth), pool);
  EXPECT_EQ(e->size(), 2 * parsing::maxFormulaDepth + 1);
  auto const err = parseError([&] { parsing::parseExpr(nested(parsing::maxFormulaDepth + 1), pool); });
  EXPECT_EQ(err.column, 2 * parsing::maxFormulaDepth + 3);
  EXPECT_NE(string(err.what()).find("too deeply"), string::npos);
  EXPECT_EQ(parseError([&] { parsing::parseExpr(nested(300000), pool); }).column, 2 * parsing::maxFormulaDepth + 3);
}

TEST(ScriptTest, DeeplyNestedTermIsAnError) {
  auto pool = Allocator<Expr>();
  auto script = string("goal a\naxiom 0 ");
  for (size_t i = 0; i < 300000; i++) script += ">a";
  script += "a b c\n";
  auto const e = parseError([&] { parsing::parseScript(script, pool); });
  EXPECT_EQ(e.line, 2u);
  EXPECT_EQ(e.column, 9 + 2 * parsing::maxFormulaDepth + 2);
}

TEST(ScriptTest, IdentityProof) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript(identityScript, pool);
  EXPECT_EQ(*proof.goal, *parsing::parseExpr(">aa", pool));
  ASSERT_EQ(proof.steps.size(), 5u);
  ASSERT_TRUE(std::holds_alternative<core::AxiomStep>(proof.steps[0]));
  auto const& s0 = std::get<core::AxiomStep>(proof.steps[0]);
  EXPECT_EQ(s0.index, 1u);
  EXPECT_EQ(*s0.terms[1], *parsing::parseExpr(">aa", pool));
  ASSERT_TRUE(std::holds_alternative<core::ModusPonensStep>(proof.steps[4]));
  EXPECT_EQ(std::get<core::ModusPonensStep>(proof.steps[4]).implication, 2u);
  EXPECT_EQ(std::get<core::ModusPonensStep>(proof.steps[4]).premise, 3u);
  EXPECT_TRUE(std::holds_alternative<core::Derived>(proof.verify(pool)));
}

TEST(ScriptTest, GoalMayComeLastAndLinesMayEndWithCarriageReturn) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript("axiom 3 a b c\r\n\tgoal   >!a\r\n", pool);
  EXPECT_EQ(proof.steps.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<core::Derived>(proof.verify(pool)));
}

TEST(ScriptTest, UnknownAxiomIsLeftToTheVerifier) {
  auto pool = Allocator<Expr>();
  auto const proof = parsing::parseScript("goal >aa\naxiom 7 a a a\n", pool);
  auto const res = proof.verify(pool);
  ASSERT_TRUE(std::holds_alternative<core::Failed>(res));
  EXPECT_EQ(std::get<core::Failed>(res).reason, core::Failure::UnknownAxiom);
}

TEST(ScriptTest, MissingGoal) {
  auto pool = Allocator<Expr>();
  auto const e = parseError([&] { parsing::parseScript("axiom 0 a b c\n", pool); });
  EXPECT_NE(string(e.what()).find("missing goal"), string::npos);
}

TEST(ScriptTest, DuplicateGoal) {
  auto pool = Allocator<Expr>();
  auto const e = parseError([&] { parsing::parseScript("goal a\n\n  goal b\n", pool); });
  EXPECT_EQ(e.line, 3u);
  EXPECT_EQ(e.column, 3u);
}

TEST(ScriptTest, UnknownDirective) {
  auto pool = Allocator<Expr>();
  auto const e = parseError([&] { parsing::parseScript("goal a\nassume a\n", pool); });
  EXPECT_EQ(e.line, 2u);
  EXPECT_EQ(e.column, 1u);
}

TEST(ScriptTest, WrongArgumentCount) {
  auto pool = Allocator<Expr>();
  EXPECT_EQ(parseError([&] { parsing::parseScript("goal a\naxiom 0 a b\n", pool); }).line, 2u);
  EXPECT_EQ(parseError([&] { parsing::parseScript("goal a\nmp 0 1 2\n", pool); }).line, 2u);
  EXPECT_EQ(parseError([&] { parsing::parseScript("goal\n", pool); }).line, 1u);
}

TEST(ScriptTest, BadNumber) {
  auto pool = Allocator<Expr>();
  auto const e = parseError([&] { parsing::parseScript("goal a\nmp 0 x1\n", pool); });
  EXPECT_EQ(e.line, 2u);
  EXPECT_EQ(e.column, 6u);
  EXPECT_EQ(parseError([&] { parsing::parseScript("goal a\nmp -1 0\n", pool); }).column, 4u);
}

TEST(ScriptTest, FormulaErrorsPointIntoTheLine) {
  auto pool = Allocator<Expr>();
  auto const e = parseError([&] { parsing::parseScript("goal a\naxiom 0 a >a b\n", pool); });
  EXPECT_EQ(e.line, 2u);
  EXPECT_EQ(e.column, 13u);
}

TEST(ScriptTest, MetavariablesAreRejected) {
  auto pool = Allocator<Expr>();
  auto const e = parseError([&] { parsing::parseScript("goal >AA\n", pool); });
  EXPECT_EQ(e.line, 1u);
  EXPECT_EQ(e.column, 6u);
  EXPECT_EQ(parseError([&] { parsing::parseScript("goal a\naxiom 0 a b C\n", pool); }).column, 13u);
}
