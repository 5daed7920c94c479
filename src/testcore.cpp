#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <variant>
#include <vector>
#include <core.hpp>
#include <parsing/formula.hpp>

using std::string;
using namespace exfalso;
using core::AxiomStep;
using core::Axioms;
using core::Derived;
using core::Expr;
using core::Failed;
using core::Failure;
using core::ModusPonensStep;
using core::Proof;

class CoreTest: public ::testing::Test {
protected:
  Allocator<Expr> pool;

  auto p(string const& s) -> Expr const* {
    return parsing::parseExpr(s, pool);
  }

  // |- a -> a
  auto identity() -> Proof {
    return Proof(
      p(">aa"),
      {
        AxiomStep{1, {p("a"), p(">aa"), p("a")}}, // (a -> (a -> a) -> a) -> (a -> a -> a) -> a -> a
        AxiomStep{0, {p("a"), p(">aa"), p("a")}}, // a -> (a -> a) -> a
        ModusPonensStep{0, 1},                    // (a -> a -> a) -> a -> a
        AxiomStep{0, {p("a"), p("a"), p("a")}},   // a -> a -> a
        ModusPonensStep{2, 3},                    // a -> a
      }
    );
  }

  auto derived(core::VerificationResult const& res) -> Derived const& {
    EXPECT_TRUE(std::holds_alternative<Derived>(res)) << std::get<Failed>(res).message;
    return std::get<Derived>(res);
  }

  auto failed(core::VerificationResult const& res) -> Failed const& {
    EXPECT_TRUE(std::holds_alternative<Failed>(res));
    return std::get<Failed>(res);
  }
};

TEST_F(CoreTest, StructuralEquality) {
  auto const x = p(">>ab>!a"), y = p(">>ab>!a");
  EXPECT_NE(x, y);
  EXPECT_EQ(*x, *y);
  EXPECT_EQ(*x, *x);
  EXPECT_NE(*x, *p(">>ab>!b"));
  EXPECT_NE(*x, *p(">ab"));
  EXPECT_NE(*p("a"), *p("b"));
  EXPECT_NE(*p("!"), *p("a"));
  // Same key, different kind
  EXPECT_NE(*pool.make(Expr::Var, 7), *pool.make(Expr::Meta, 7));
}

TEST_F(CoreTest, HashAgreesWithEquality) {
  EXPECT_EQ(p(">>ab>!a")->hash(), p(">>ab>!a")->hash());
  EXPECT_EQ(p("!")->hash(), pool.make(Expr::False)->hash());
}

TEST_F(CoreTest, ReplaceMetaWithoutOccurrenceIsIdentity) {
  auto const x = p(">>AB>!A");
  EXPECT_EQ(x->replaceMeta('C', p("a"), pool), x);
  auto const y = p(">>ab>!a");
  EXPECT_EQ(y->replaceMeta('A', p("b"), pool), y);
}

TEST_F(CoreTest, ReplaceMetaReplacesEveryOccurrence) {
  auto const x = p(">A>BA")->replaceMeta('A', p(">ab"), pool);
  EXPECT_EQ(*x, *p(">>ab>B>ab"));
  EXPECT_EQ(*x->replaceMeta('B', p("!"), pool), *p(">>ab>!>ab"));
}

TEST_F(CoreTest, ReplaceMetaLeavesVariablesAlone) {
  // Variable 'A' and metavariable 'A' share the key but not the kind
  auto const x = pool.make(pool.make(Expr::Var, 'A'), pool.make(Expr::Meta, 'A'));
  auto const y = x->replaceMeta('A', p("!"), pool);
  EXPECT_EQ(y->imp.l, x->imp.l);
  EXPECT_EQ(*y->imp.r, *p("!"));
}

TEST_F(CoreTest, ReplaceMetaSharesUnchangedSubtrees) {
  auto const x = p(">>ab>Ab");
  auto const c = p("c");
  auto const before = pool.size();
  auto const y = x->replaceMeta('A', c, pool);
  EXPECT_EQ(y->imp.l, x->imp.l);
  EXPECT_NE(y->imp.r, x->imp.r);
  EXPECT_EQ(y->imp.r->imp.l, c);
  // Only the root and its right-hand side are rebuilt
  EXPECT_EQ(pool.size(), before + 2);
  EXPECT_EQ(x->replaceMeta('B', c, pool), x);
  EXPECT_EQ(pool.size(), before + 2);
}

TEST(AllocatorTest, SizeAndReset) {
  auto pool = Allocator<Expr>(4);
  EXPECT_EQ(pool.size(), 0u);
  parsing::parseExpr(">>ab>!a", pool);
  EXPECT_EQ(pool.size(), 7u);
  pool.reset();
  EXPECT_EQ(pool.size(), 0u);
  auto const e = parsing::parseExpr(">ab", pool);
  EXPECT_EQ(pool.size(), 3u);
  EXPECT_EQ(e->toString(), "a -> b");
}

TEST_F(CoreTest, CloneIsDeepAndEqual) {
  auto other = Allocator<Expr>();
  auto const x = p(">>ab>!C");
  auto const y = x->clone(other);
  EXPECT_NE(y, x);
  EXPECT_NE(y->imp.l, x->imp.l);
  EXPECT_EQ(*y, *x);
}

TEST_F(CoreTest, Printing) {
  EXPECT_EQ(p(">>ab>ba")->toString(), "(a -> b) -> b -> a");
  EXPECT_EQ(p(">a>b>cd")->toString(), "a -> b -> c -> d");
  EXPECT_EQ(p(">!A")->toString(), "! -> A");
  EXPECT_EQ(pool.make(Expr::Var, 200)->toString(), "v200");
  EXPECT_EQ(pool.make(Expr::Meta, 5)->toString(), "V5");
  EXPECT_EQ(p(">>ab>!C")->toPrefix(), ">>ab>!C");
  EXPECT_EQ(p("-ab")->toPrefix(), ">ab");
}

TEST_F(CoreTest, SizeOccursGround) {
  auto const x = p(">>ab>!C");
  EXPECT_EQ(x->size(), 7u);
  EXPECT_TRUE(x->occurs(Expr::Var, 'b'));
  EXPECT_TRUE(x->occurs(Expr::Meta, 'C'));
  EXPECT_FALSE(x->occurs(Expr::Var, 'C'));
  EXPECT_FALSE(x->occurs(Expr::Meta, 'a'));
  EXPECT_FALSE(x->isGround());
  EXPECT_TRUE(p(">>ab>!c")->isGround());
}

TEST_F(CoreTest, AxiomTable) {
  ASSERT_EQ(Axioms::count, 4u);
  EXPECT_EQ(*Axioms::get(0), *p(">A>BA"));
  EXPECT_EQ(*Axioms::get(1), *p(">>A>BC>>AB>AC"));
  EXPECT_EQ(*Axioms::get(2), *p(">>>ABAA"));
  EXPECT_EQ(*Axioms::get(3), *p(">!A"));
  EXPECT_TRUE(Axioms::valid(3));
  EXPECT_FALSE(Axioms::valid(4));
  // Built once
  EXPECT_EQ(Axioms::get(2), Axioms::get(2));
  for (size_t i = 0; i < Axioms::count; i++) {
    EXPECT_FALSE(Axioms::get(i)->isGround());
    EXPECT_FALSE(Axioms::get(i)->occurs(Expr::Meta, 'D'));
  }
}

TEST_F(CoreTest, SingleAxiomInstance) {
  auto const proof = Proof(p(">x>yx"), {AxiomStep{0, {p("x"), p("y"), p("z")}}});
  auto const res = proof.verify(pool);
  auto const& d = derived(res);
  ASSERT_EQ(d.trace.size(), 1u);
  EXPECT_EQ(*d.trace[0], *p(">x>yx"));
  EXPECT_EQ(d.goalLine, 0u);
}

TEST_F(CoreTest, EveryAxiomInstantiates) {
  auto const proof = Proof(
    p("a"),
    {
      AxiomStep{1, {p("a"), p("b"), p("c")}},
      AxiomStep{2, {p(">ab"), p("!"), p("c")}},
      AxiomStep{3, {p(">ab"), p("b"), p("c")}},
    }
  );
  auto const trace = proof.statements(pool);
  ASSERT_EQ(trace.size(), 3u);
  EXPECT_EQ(*trace[0], *p(">>a>bc>>ab>ac"));
  EXPECT_EQ(*trace[1], *p(">>>>ab!>ab>ab"));
  EXPECT_EQ(*trace[2], *p(">!>ab"));
}

TEST_F(CoreTest, IdentityProof) {
  auto const proof = identity();
  auto const res = proof.verify(pool);
  auto const& d = derived(res);
  ASSERT_EQ(d.trace.size(), 5u);
  EXPECT_EQ(*d.trace[2], *p(">>a>aa>aa"));
  EXPECT_EQ(*d.trace[4], *p(">aa"));
  EXPECT_EQ(d.goalLine, 4u);
}

TEST_F(CoreTest, GoalMayAppearBeforeTheLastLine) {
  auto proof = identity();
  proof.goal = p(">a>aa");
  auto const res = proof.verify(pool);
  EXPECT_EQ(derived(res).goalLine, 3u);
}

TEST_F(CoreTest, GoalNotDerived) {
  auto proof = identity();
  proof.goal = p(">bb");
  auto const res = proof.verify(pool);
  auto const& f = failed(res);
  EXPECT_EQ(f.reason, Failure::GoalNotDerived);
  EXPECT_EQ(f.step, 5u);
}

TEST_F(CoreTest, EmptyProofDerivesNothing) {
  auto const proof = Proof(p(">aa"), {});
  EXPECT_TRUE(proof.statements(pool).empty());
  EXPECT_EQ(failed(proof.verify(pool)).reason, Failure::GoalNotDerived);
}

TEST_F(CoreTest, SelfReference) {
  auto const proof = Proof(p(">aa"), {ModusPonensStep{0, 0}});
  auto const res = proof.verify(pool);
  auto const& f = failed(res);
  EXPECT_EQ(f.reason, Failure::DanglingReference);
  EXPECT_EQ(f.step, 0u);
}

TEST_F(CoreTest, ForwardReference) {
  auto const proof = Proof(p(">aa"), {AxiomStep{0, {p("a"), p("a"), p("a")}}, ModusPonensStep{0, 1}});
  auto const res = proof.verify(pool);
  auto const& f = failed(res);
  EXPECT_EQ(f.reason, Failure::DanglingReference);
  EXPECT_EQ(f.step, 1u);
}

TEST_F(CoreTest, SwappedModusPonensIsRejected) {
  auto proof = identity();
  proof.steps[2] = ModusPonensStep{1, 0};
  auto const res = proof.verify(pool);
  auto const& f = failed(res);
  EXPECT_EQ(f.reason, Failure::PremiseMismatch);
  EXPECT_EQ(f.step, 2u);

  proof = identity();
  proof.steps[4] = ModusPonensStep{3, 2};
  auto const res1 = proof.verify(pool);
  EXPECT_EQ(failed(res1).reason, Failure::PremiseMismatch);
  EXPECT_EQ(failed(res1).step, 4u);
}

TEST_F(CoreTest, UnknownAxiom) {
  auto const proof = Proof(p(">aa"), {AxiomStep{0, {p("a"), p("a"), p("a")}}, AxiomStep{4, {p("a"), p("a"), p("a")}}});
  auto const res = proof.verify(pool);
  auto const& f = failed(res);
  EXPECT_EQ(f.reason, Failure::UnknownAxiom);
  EXPECT_EQ(f.step, 1u);
}

TEST_F(CoreTest, MetavariablesInTermsAreRejected) {
  // Unchecked, the second substitution would replace the B introduced by the first
  auto const proof = Proof(p(">aa"), {AxiomStep{0, {p("B"), p("a"), p("a")}}});
  auto const res = proof.verify(pool);
  auto const& f = failed(res);
  EXPECT_EQ(f.reason, Failure::UnexpectedMeta);
  EXPECT_EQ(f.step, 0u);
}

TEST_F(CoreTest, FailsAtFirstInvalidStep) {
  auto const proof = Proof(p(">aa"), {ModusPonensStep{3, 4}, AxiomStep{9, {p("a"), p("a"), p("a")}}});
  auto const res = proof.verify(pool);
  EXPECT_EQ(failed(res).reason, Failure::DanglingReference);
  EXPECT_EQ(failed(res).step, 0u);
}

TEST_F(CoreTest, StatementsThrowInvalidProof) {
  auto proof = identity();
  proof.steps.push_back(ModusPonensStep{4, 0});
  try {
    proof.statements(pool);
    FAIL() << "expected InvalidProof";
  } catch (core::InvalidProof& e) {
    EXPECT_EQ(e.reason, Failure::PremiseMismatch);
    EXPECT_EQ(e.step, 5u);
  }
}

TEST_F(CoreTest, FailureNames) {
  EXPECT_EQ(core::failureName(Failure::UnknownAxiom), "UnknownAxiom");
  EXPECT_EQ(core::failureName(Failure::UnexpectedMeta), "UnexpectedMeta");
  EXPECT_EQ(core::failureName(Failure::DanglingReference), "DanglingReference");
  EXPECT_EQ(core::failureName(Failure::NotAnImplication), "NotAnImplication");
  EXPECT_EQ(core::failureName(Failure::PremiseMismatch), "PremiseMismatch");
  EXPECT_EQ(core::failureName(Failure::GoalNotDerived), "GoalNotDerived");
}

TEST_F(CoreTest, ParallelVerification) {
  auto const proof = identity();
  auto constexpr n = 8;
  auto ok = std::vector<int>(n, 0);
  {
    auto threads = std::vector<std::jthread>();
    for (auto i = 0; i < n; i++)
      threads.emplace_back([&proof, &ok, i]() {
        auto local = Allocator<Expr>();
        auto const res = proof.verify(local);
        ok[static_cast<size_t>(i)] = std::holds_alternative<Derived>(res) ? 1 : 0;
      });
  }
  for (auto x: ok)
    EXPECT_EQ(x, 1);
}
