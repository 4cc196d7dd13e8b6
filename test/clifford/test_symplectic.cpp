//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "circuit/Circuit.hpp"
#include "clifford/SymplecticMatrix.hpp"

#include "gtest/gtest.h"
#include <sstream>
#include <stdexcept>
#include <string>

namespace clifford {

TEST(TestSymplecticMatrix, Identity) {
  const SymplecticMatrix sm(2, 3);
  EXPECT_EQ(sm.getQuditCount(), 2U);
  EXPECT_TRUE(sm.isIdentity());

  std::stringstream ss;
  ss << sm;
  const std::string representation = "1;0;0;0;\n"
                                     "0;1;0;0;\n"
                                     "0;0;1;0;\n"
                                     "0;0;0;1;\n";
  EXPECT_EQ(ss.str(), representation);
  EXPECT_EQ(SymplecticMatrix(representation, 3), sm);
}

TEST(TestSymplecticMatrix, SingleQuditGates) {
  SymplecticMatrix sm(1, 5);
  sm.applyH(0);
  EXPECT_EQ(sm[0][0], 0);
  EXPECT_EQ(sm[0][1], 4);
  EXPECT_EQ(sm[1][0], 1);
  EXPECT_EQ(sm[1][1], 0);

  sm.applyH(0);
  EXPECT_EQ(sm.toString(), "4;0;\n0;4;\n");
  sm.applyH(0, 2);
  EXPECT_TRUE(sm.isIdentity());

  sm.applyS(0, 2);
  EXPECT_EQ(sm.toString(), "1;0;\n3;1;\n");
  sm.applyS(0, 3);
  EXPECT_TRUE(sm.isIdentity());

  sm.applyMul(0, 2);
  EXPECT_EQ(sm.toString(), "2;0;\n0;3;\n");
  sm.applyMul(0, 3);
  EXPECT_TRUE(sm.isIdentity());

  sm.applyX(0);
  sm.applyZ(0);
  EXPECT_TRUE(sm.isIdentity());
  EXPECT_THROW(sm.applyMul(0, 5), std::domain_error);
}

TEST(TestSymplecticMatrix, TwoQuditGates) {
  SymplecticMatrix cx(2, 3);
  cx.applyCX(0, 1, 2);
  EXPECT_EQ(cx.toString(), "1;0;0;0;\n"
                           "0;1;0;1;\n"
                           "2;0;1;0;\n"
                           "0;0;0;1;\n");

  SymplecticMatrix cz(2, 3);
  cz.applyCZ(0, 1);
  SymplecticMatrix zc(2, 3);
  zc.applyCZ(1, 0);
  EXPECT_EQ(cz, zc);

  SymplecticMatrix swap(2, 3);
  swap.applySwap(0, 1);
  EXPECT_EQ(swap.toString(), "0;0;1;0;\n"
                             "0;0;0;1;\n"
                             "1;0;0;0;\n"
                             "0;1;0;0;\n");
  swap.applySwap(1, 0);
  EXPECT_TRUE(swap.isIdentity());

  EXPECT_THROW(swap.applyCX(0, 2), std::invalid_argument);
}

TEST(TestSymplecticMatrix, CircuitAndAdjointCancel) {
  circuit::Circuit qc(3, 5);
  qc.h(0);
  qc.s(1, 3);
  qc.cx(0, 2, 2);
  qc.cz(2, 1, 4);
  qc.mul(1, 3);
  qc.swap(0, 1);
  qc.h(2, 3);
  const SymplecticMatrix sm(qc);
  EXPECT_FALSE(sm.isIdentity());

  auto roundTrip = qc;
  for (const auto& g : qc.adjoint()) {
    roundTrip.addGate(g);
  }
  EXPECT_TRUE(SymplecticMatrix(roundTrip).isIdentity());
}

TEST(TestSymplecticMatrix, PaulisDoNotChangeTheMatrix) {
  circuit::Circuit qc(2, 3);
  qc.cx(0, 1);
  circuit::Circuit withPaulis(2, 3);
  withPaulis.x(0, 2);
  withPaulis.cx(0, 1);
  withPaulis.z(1);
  EXPECT_EQ(SymplecticMatrix(qc), SymplecticMatrix(withPaulis));
}

TEST(TestSymplecticMatrix, MalformedDescription) {
  EXPECT_THROW(SymplecticMatrix("1;0;\n0;1;0;\n", 3), std::invalid_argument);
  EXPECT_THROW(SymplecticMatrix("1;\n", 3), std::invalid_argument);
  EXPECT_THROW(SymplecticMatrix(1, 1), std::invalid_argument);
}

TEST(TestSymplecticMatrix, DumpAndImport) {
  SymplecticMatrix sm(1, 3);
  sm.applyS(0);
  std::stringstream ss;
  sm.dump(ss);
  SymplecticMatrix imported(1, 3);
  imported.import(ss);
  EXPECT_EQ(imported, sm);
  EXPECT_THROW(imported.import("does_not_exist.txt"), std::runtime_error);
}

/// Rewrite identities used by the Clifford simplifier, checked for several
/// dimensions and repetition counts.
class TestRewriteIdentities : public testing::TestWithParam<Integer> {
protected:
  Integer dim = GetParam();

  [[nodiscard]] circuit::Circuit
  makeCircuit(const std::size_t qudits = 2) const {
    return {qudits, dim};
  }
};

INSTANTIATE_TEST_SUITE_P(
    Dimensions, TestRewriteIdentities, testing::Values(3, 5, 7),
    [](const testing::TestParamInfo<TestRewriteIdentities::ParamType>& inf) {
      return "d" + std::to_string(inf.param);
    });

TEST_P(TestRewriteIdentities, EulerDecomposition) {
  auto lhs = makeCircuit(1);
  lhs.h(0);
  lhs.s(0);
  lhs.h(0);
  auto rhs = makeCircuit(1);
  rhs.s(0, -1);
  rhs.h(0);
  rhs.s(0, -1);
  rhs.x(0, -1);
  EXPECT_EQ(SymplecticMatrix(lhs), SymplecticMatrix(rhs));
}

TEST_P(TestRewriteIdentities, HadamardTurnsCXIntoCZ) {
  for (Integer a = 1; a < dim; ++a) {
    auto lhs = makeCircuit();
    lhs.h(1);
    lhs.cx(0, 1, a);
    auto rhs = makeCircuit();
    rhs.cz(0, 1, a);
    rhs.h(1);
    EXPECT_EQ(SymplecticMatrix(lhs), SymplecticMatrix(rhs));

    auto lhs3 = makeCircuit();
    lhs3.h(0, 3);
    lhs3.cz(0, 1, a);
    auto rhs3 = makeCircuit();
    rhs3.cx(1, 0, a);
    rhs3.h(0, 3);
    EXPECT_EQ(SymplecticMatrix(lhs3), SymplecticMatrix(rhs3));
  }
}

TEST_P(TestRewriteIdentities, PhaseGatePastCX) {
  for (Integer a = 1; a < dim; ++a) {
    for (Integer b = 1; b < dim; ++b) {
      auto lhs = makeCircuit();
      lhs.s(1, a);
      lhs.cx(0, 1, b);
      auto rhs = makeCircuit();
      rhs.cx(0, 1, b);
      rhs.cz(0, 1, -a * b);
      rhs.s(1, a);
      rhs.s(0, a * b * b);
      EXPECT_EQ(SymplecticMatrix(lhs), SymplecticMatrix(rhs));
    }
  }
}

TEST_P(TestRewriteIdentities, CZPastCX) {
  for (Integer a = 1; a < dim; ++a) {
    for (Integer b = 1; b < dim; ++b) {
      auto lhs = makeCircuit();
      lhs.cz(1, 0, a);
      lhs.cx(0, 1, b);
      auto rhs = makeCircuit();
      rhs.cx(0, 1, b);
      rhs.cz(1, 0, a);
      rhs.s(0, -2 * a * b);
      EXPECT_EQ(SymplecticMatrix(lhs), SymplecticMatrix(rhs));
    }
  }
}

TEST_P(TestRewriteIdentities, CXPairBecomesSwap) {
  // a * b = -1
  const Integer a = 2;
  const Integer b = (dim - 1) / 2;
  auto lhs = makeCircuit();
  lhs.cx(0, 1, a);
  lhs.cx(1, 0, b);
  auto rhs = makeCircuit();
  rhs.cx(1, 0, -b);
  rhs.swap(0, 1);
  rhs.mul(1, a);
  rhs.mul(0, (dim - 1) / 2);
  EXPECT_EQ(SymplecticMatrix(lhs), SymplecticMatrix(rhs));
}
} // namespace clifford
