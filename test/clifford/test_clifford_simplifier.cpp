//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "circuit/Circuit.hpp"
#include "circuit/Gate.hpp"
#include "clifford/CliffordSimplifier.hpp"
#include "clifford/Configuration.hpp"
#include "clifford/Dag.hpp"
#include "clifford/SymplecticMatrix.hpp"
#include "zx/Modular.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <iostream>
#include <nlohmann/json.hpp>
#include <plog/Severity.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace clifford {
using circuit::Circuit;
using circuit::Control;
using circuit::Gate;
using circuit::GateType;

namespace {
using Amplitudes = std::vector<std::complex<double>>;
using Rule = bool (CliffordSimplifier::*)();

/// Dense simulation of qudit Clifford circuits with
/// X|k> = |k+1>, Z|k> = w^k|k>, S|k> = w^(k(k-1)/2)|k>,
/// H|j> = sum_k w^(-jk)|k> / sqrt(d), CX|c,t> = |c,t+c>, CZ|c,t> = w^(ct)|c,t>.
class CircuitSimulator {
public:
  CircuitSimulator(const std::size_t nQudits, const Integer d)
      : dim(d), strides(nQudits, 1) {
    for (std::size_t q = nQudits - 1; q > 0; --q) {
      strides[q - 1] = strides[q] * static_cast<std::size_t>(d);
    }
    size = strides.front() * static_cast<std::size_t>(d);
  }

  /// Columns of the unitary implemented by `qc`.
  [[nodiscard]] std::vector<Amplitudes> unitary(const Circuit& qc) const {
    std::vector<Amplitudes> columns;
    columns.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
      Amplitudes psi(size);
      psi[i] = 1.;
      for (const auto& g : qc) {
        psi = apply(g, psi);
      }
      columns.emplace_back(std::move(psi));
    }
    return columns;
  }

private:
  Integer dim;
  std::vector<std::size_t> strides;
  std::size_t size = 1;

  [[nodiscard]] Integer digit(const std::size_t i, const Qudit q) const {
    return static_cast<Integer>((i / strides[q]) %
                                static_cast<std::size_t>(dim));
  }

  [[nodiscard]] std::size_t withDigit(const std::size_t i, const Qudit q,
                                      const Integer value) const {
    const auto v = static_cast<std::size_t>(zx::mod(value, dim));
    return i - static_cast<std::size_t>(digit(i, q)) * strides[q] +
           v * strides[q];
  }

  [[nodiscard]] std::complex<double> omega(const Integer exponent) const {
    return std::polar(1., 2. * M_PI *
                              static_cast<double>(zx::mod(exponent, dim)) /
                              static_cast<double>(dim));
  }

  [[nodiscard]] Amplitudes fourier(const Qudit q, const Amplitudes& psi) const {
    Amplitudes out(size);
    const auto norm = std::sqrt(static_cast<double>(dim));
    for (std::size_t i = 0; i < size; ++i) {
      if (psi[i] == 0.) {
        continue;
      }
      const auto j = digit(i, q);
      for (Integer k = 0; k < dim; ++k) {
        out[withDigit(i, q, k)] += omega(-j * k) * psi[i] / norm;
      }
    }
    return out;
  }

  [[nodiscard]] Amplitudes apply(const Gate& g, const Amplitudes& psi) const {
    const auto t = g.getTarget();
    const auto r = g.getRepetitions();
    if (g.is(GateType::H)) {
      auto out = psi;
      for (Integer k = 0; k < zx::mod(r, 4); ++k) {
        out = fourier(t, out);
      }
      return out;
    }
    Amplitudes out(size);
    for (std::size_t i = 0; i < size; ++i) {
      if (psi[i] == 0.) {
        continue;
      }
      const auto k = digit(i, t);
      const auto c = g.isTwoQuditGate() ? digit(i, *g.getControl()) : 0;
      switch (g.getType()) {
      case GateType::X:
        out[withDigit(i, t, k + r)] += psi[i];
        break;
      case GateType::Z:
        out[i] += omega(r * k) * psi[i];
        break;
      case GateType::S:
        out[i] += omega(r * (k * (k - 1) / 2)) * psi[i];
        break;
      case GateType::MUL:
        out[withDigit(i, t, g.getMultValue() * k)] += psi[i];
        break;
      case GateType::CX:
        out[withDigit(i, t, k + r * c)] += psi[i];
        break;
      case GateType::CZ:
        out[i] += omega(r * c * k) * psi[i];
        break;
      case GateType::SWAP:
        if (zx::mod(r, 2) == 1) {
          out[withDigit(withDigit(i, t, c), *g.getControl(), k)] += psi[i];
        } else {
          out[i] += psi[i];
        }
        break;
      case GateType::H:
        break;
      }
    }
    return out;
  }
};

bool equalUpToGlobalPhase(const std::vector<Amplitudes>& lhs,
                          const std::vector<Amplitudes>& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  std::complex<double> factor{};
  for (std::size_t i = 0; i < rhs.size() && factor == 0.; ++i) {
    for (std::size_t j = 0; j < rhs[i].size(); ++j) {
      if (std::abs(rhs[i][j]) > 1e-6) {
        factor = lhs[i][j] / rhs[i][j];
        break;
      }
    }
  }
  if (std::abs(std::abs(factor) - 1.) > 1e-9) {
    return false;
  }
  for (std::size_t i = 0; i < rhs.size(); ++i) {
    for (std::size_t j = 0; j < rhs[i].size(); ++j) {
      if (std::abs(lhs[i][j] - factor * rhs[i][j]) > 1e-9) {
        return false;
      }
    }
  }
  return true;
}

void expectSameUnitary(const Circuit& lhs, const Circuit& rhs) {
  const CircuitSimulator simulator(lhs.getQudits(), lhs.getDim());
  EXPECT_TRUE(equalUpToGlobalPhase(simulator.unitary(lhs),
                                   simulator.unitary(rhs)))
      << "Before:\n"
      << lhs << "After:\n"
      << rhs;
}

/// Acyclic, wire-adjacent edges and a total order of the gates per qudit.
void expectValidDag(const Dag& dag) {
  EXPECT_TRUE(dag.isAcyclic());
  const auto order = dag.topologicalOrder();
  EXPECT_EQ(order.size(), dag.size());
  for (const auto id : order) {
    for (const auto p : dag.parents(id)) {
      EXPECT_NE(p, id);
      const auto anc = dag.ancestors(p);
      EXPECT_EQ(std::find(anc.begin(), anc.end(), id), anc.end())
          << "node " << id << " is its own ancestor";
      if (p == Dag::ROOT) {
        continue;
      }
      const auto qudits = dag.gate(id).qudits();
      EXPECT_TRUE(std::any_of(qudits.begin(), qudits.end(), [&](Qudit q) {
        return dag.gate(p).actsOn(q);
      })) << "edge " << p << " -> " << id << " joins unrelated gates";
    }
  }
  for (Qudit q = 0; q < dag.getQudits(); ++q) {
    std::vector<NodeId> wire{};
    std::copy_if(order.begin(), order.end(), std::back_inserter(wire),
                 [&](const NodeId id) { return dag.gate(id).actsOn(q); });
    for (std::size_t i = 1; i < wire.size(); ++i) {
      EXPECT_TRUE(dag.isAncestor(wire[i - 1], wire[i]))
          << "gates " << wire[i - 1] << " and " << wire[i] << " on qudit "
          << q << " are unordered";
    }
  }
}
} // namespace

class TestCliffordSimplifier : public testing::Test {
protected:
  Configuration config;

  void SetUp() override { config.checkSemanticsEachStep = true; }

  static void expectSameSemantics(const Circuit& lhs, const Circuit& rhs) {
    EXPECT_EQ(SymplecticMatrix(lhs), SymplecticMatrix(rhs));
  }
};

TEST_F(TestCliffordSimplifier, InitialState) {
  Circuit qc(2, 3, "initial");
  qc.h(0);
  qc.cx(0, 1);
  const CliffordSimplifier simplifier(qc, config);
  EXPECT_EQ(simplifier.getCircuit(), qc);
  EXPECT_EQ(simplifier.getCircuitList().size(), 1U);
  EXPECT_TRUE(simplifier.getStepsDone().empty());
  EXPECT_EQ(simplifier.getResults().getInitialGates(), 2U);
  EXPECT_EQ(simplifier.getResults().getInitialTwoQuditGates(), 1U);
  EXPECT_TRUE(simplifier.getConfiguration().checkSemanticsEachStep);
  EXPECT_EQ(simplifier.getDag().size(), 2U);
}

TEST_F(TestCliffordSimplifier, CombineGates) {
  Circuit qc(2, 3);
  qc.s(1);
  qc.s(1);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.combineGates());

  Circuit expected(2, 3);
  expected.s(1, 2);
  EXPECT_EQ(simplifier.getCircuit(), expected);
  EXPECT_EQ(simplifier.getStepsDone(),
            std::vector<std::string>{"Combine gates"});
  ASSERT_EQ(simplifier.getCircuitList().size(), 2U);
  EXPECT_EQ(simplifier.getCircuitList().front(), qc);
  EXPECT_FALSE(simplifier.combineGates());
}

TEST_F(TestCliffordSimplifier, CombineSymmetricGates) {
  Circuit qc(2, 5);
  qc.cz(0, 1, 2);
  qc.cz(1, 0, 2);
  qc.cx(0, 1);
  qc.cx(1, 0);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.combineGates());

  Circuit expected(2, 5);
  expected.cz(0, 1, 4);
  expected.cx(0, 1);
  expected.cx(1, 0);
  EXPECT_EQ(simplifier.getCircuit(), expected);
}

TEST_F(TestCliffordSimplifier, RemoveIdentityGate) {
  Circuit qc(1, 3);
  qc.s(0, 3);
  qc.h(0);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.removeIdentityGate());
  EXPECT_EQ(simplifier.getCircuit().size(), 1U);
  EXPECT_EQ(simplifier.getCircuit().at(0), Gate(GateType::H, 0));
  EXPECT_FALSE(simplifier.removeIdentityGate());
}

TEST_F(TestCliffordSimplifier, RemoveIdentityOfEveryKind) {
  Circuit qc(2, 5);
  qc.h(0, 4);
  qc.mul(1, 6);
  qc.addGate(Gate(GateType::SWAP, Control{0}, 1, 2));
  qc.cx(1, 0, 5);
  CliffordSimplifier simplifier(qc, config);
  while (simplifier.removeIdentityGate()) {
  }
  EXPECT_TRUE(simplifier.getCircuit().empty());
  EXPECT_EQ(simplifier.getStepsDone().size(), 4U);
}

TEST_F(TestCliffordSimplifier, PushSPastCX) {
  Circuit qc(2, 3);
  qc.s(1);
  qc.cx(0, 1, 2);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.pushSPastCX());
  EXPECT_EQ(simplifier.getStepsDone(),
            std::vector<std::string>{"Push S past CX"});

  // S^a(t);CX^b(c,t) = CX^b;CZ^-ab;S^a(t);S^ab^2(c);Z^ab(b+1)/2(c)
  Circuit expected(2, 3);
  expected.cx(0, 1, 2);
  expected.cz(0, 1, 1);
  expected.s(1, 1);
  expected.s(0, 1);
  expected.z(0, 0);
  EXPECT_EQ(simplifier.getCircuit(), expected);
  expectSameSemantics(simplifier.getCircuit(), qc);
}

TEST_F(TestCliffordSimplifier, PushCZPastCX) {
  Circuit qc(2, 5);
  qc.cz(0, 1, 2);
  qc.cx(0, 1, 3);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.pushCZPastCX());

  Circuit expected(2, 5);
  expected.cx(0, 1, 3);
  expected.cz(0, 1, 2);
  expected.s(0, 3);
  expected.z(0, 4);
  EXPECT_EQ(simplifier.getCircuit(), expected);
}

TEST_F(TestCliffordSimplifier, PushHGate) {
  Circuit qc(2, 3);
  qc.h(1);
  qc.cx(0, 1);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.pushHGate());
  Circuit expected(2, 3);
  expected.cz(0, 1);
  expected.h(1);
  EXPECT_EQ(simplifier.getCircuit(), expected);

  Circuit inverse(2, 3);
  inverse.h(1, 3);
  inverse.cz(0, 1, 2);
  CliffordSimplifier other(inverse, config);
  EXPECT_TRUE(other.pushHGate());
  Circuit expectedInverse(2, 3);
  expectedInverse.cx(0, 1, 2);
  expectedInverse.h(1, 3);
  EXPECT_EQ(other.getCircuit(), expectedInverse);
}

TEST_F(TestCliffordSimplifier, TransformCXToSwap) {
  Circuit qc(2, 5);
  qc.cx(0, 1, 2);
  qc.cx(1, 0, 2);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.transformCXToSwap());

  Circuit expected(2, 5);
  expected.cx(1, 0, 3);
  expected.swap(0, 1);
  expected.mul(1, 2);
  expected.mul(0, 2);
  EXPECT_EQ(simplifier.getCircuit(), expected);
  EXPECT_EQ(simplifier.getResults().getInitialGates(), 2U);
}

TEST_F(TestCliffordSimplifier, ToggleCXPair) {
  Circuit pair(2, 5);
  pair.cx(0, 1);
  pair.cx(1, 0);
  CliffordSimplifier untouched(pair, config);
  // only rewritten in front of another CX
  EXPECT_FALSE(untouched.toggleCXPair());

  auto qc = pair;
  qc.cx(0, 1);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.toggleCXPair());

  Circuit expected(2, 5);
  expected.cx(1, 0, 3);
  expected.cx(0, 1, 2);
  expected.mul(1, 3);
  expected.mul(0, 2);
  expected.cx(0, 1);
  EXPECT_EQ(simplifier.getCircuit(), expected);
}

TEST_F(TestCliffordSimplifier, PushSwap) {
  Circuit qc(2, 3);
  qc.swap(0, 1);
  qc.s(0);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.pushSwap());
  Circuit expected(2, 3);
  expected.s(1);
  expected.swap(0, 1);
  EXPECT_EQ(simplifier.getCircuit(), expected);

  Circuit withCX(2, 3);
  withCX.swap(0, 1);
  withCX.cx(0, 1, 2);
  CliffordSimplifier other(withCX, config);
  EXPECT_TRUE(other.pushSwap());
  Circuit expectedCX(2, 3);
  expectedCX.cx(1, 0, 2);
  expectedCX.swap(0, 1);
  EXPECT_EQ(other.getCircuit(), expectedCX);
}

TEST_F(TestCliffordSimplifier, PushPauli) {
  Circuit order(1, 3);
  order.x(0);
  order.z(0);
  CliffordSimplifier simplifier(order, config);
  EXPECT_TRUE(simplifier.pushPauli());
  Circuit expected(1, 3);
  expected.z(0);
  expected.x(0);
  EXPECT_EQ(simplifier.getCircuit(), expected);
  // Z before X stays
  EXPECT_FALSE(simplifier.pushPauli());

  Circuit throughCX(2, 3);
  throughCX.x(0);
  throughCX.cx(0, 1);
  CliffordSimplifier cx(throughCX, config);
  EXPECT_TRUE(cx.pushPauli());
  Circuit expectedCX(2, 3);
  expectedCX.cx(0, 1);
  expectedCX.x(0);
  expectedCX.x(1);
  EXPECT_EQ(cx.getCircuit(), expectedCX);

  Circuit targetZ(2, 3);
  targetZ.z(1, 2);
  targetZ.cx(0, 1);
  CliffordSimplifier z(targetZ, config);
  EXPECT_TRUE(z.pushPauli());
  Circuit expectedZ(2, 3);
  expectedZ.cx(0, 1);
  expectedZ.z(1, 2);
  expectedZ.z(0, 1);
  EXPECT_EQ(z.getCircuit(), expectedZ);

  Circuit throughS(1, 3);
  throughS.x(0);
  throughS.s(0, 2);
  CliffordSimplifier s(throughS, config);
  EXPECT_TRUE(s.pushPauli());
  Circuit expectedS(1, 3);
  expectedS.s(0, 2);
  expectedS.z(0, 2);
  expectedS.x(0);
  EXPECT_EQ(s.getCircuit(), expectedS);
}

TEST_F(TestCliffordSimplifier, PushDoubleHadamard) {
  Circuit qc(1, 3);
  qc.h(0, 2);
  qc.s(0);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.pushDoubleHadamard());
  Circuit expected(1, 3);
  expected.s(0);
  expected.h(0, 2);
  expected.z(0, 2);
  EXPECT_EQ(simplifier.getCircuit(), expected);

  Circuit withCX(2, 3);
  withCX.h(0, 2);
  withCX.cx(0, 1);
  CliffordSimplifier other(withCX, config);
  EXPECT_TRUE(other.pushDoubleHadamard());
  Circuit expectedCX(2, 3);
  expectedCX.cx(0, 1, 2);
  expectedCX.h(0, 2);
  EXPECT_EQ(other.getCircuit(), expectedCX);
}

TEST_F(TestCliffordSimplifier, PushSGate) {
  Circuit qc(2, 3);
  qc.s(0);
  qc.cz(0, 1);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.pushSGate());
  Circuit expected(2, 3);
  expected.cz(0, 1);
  expected.s(0);
  EXPECT_EQ(simplifier.getCircuit(), expected);

  // S on the target of a CX does not commute
  Circuit target(2, 3);
  target.s(1);
  target.cx(0, 1);
  CliffordSimplifier other(target, config);
  EXPECT_FALSE(other.pushSGate());
}

TEST_F(TestCliffordSimplifier, EulerDecomposition) {
  Circuit qc(1, 3);
  qc.h(0);
  qc.s(0);
  qc.h(0);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.singleQuditOptimize());

  Circuit expected(1, 3);
  expected.s(0, 2);
  expected.h(0);
  expected.s(0, 2);
  expected.x(0, 2);
  EXPECT_EQ(simplifier.getCircuit(), expected);
  EXPECT_EQ(simplifier.getStepsDone(),
            std::vector<std::string>{"Euler decomposition H;S;H"});
}

TEST_F(TestCliffordSimplifier, SecondEulerDecomposition) {
  Circuit qc(1, 3);
  qc.s(0, 2);
  qc.h(0);
  qc.s(0, 2);
  CliffordSimplifier alone(qc, config);
  // only rewritten behind an H gate
  EXPECT_FALSE(alone.eulerDecomp2());

  Circuit afterH(1, 3);
  afterH.h(0);
  afterH.s(0, 2);
  afterH.h(0);
  afterH.s(0, 2);
  CliffordSimplifier simplifier(afterH, config);
  EXPECT_TRUE(simplifier.eulerDecomp2());
  Circuit expected(1, 3);
  expected.h(0);
  expected.h(0);
  expected.s(0);
  expected.h(0);
  expected.x(0);
  EXPECT_EQ(simplifier.getCircuit(), expected);
}

TEST_F(TestCliffordSimplifier, PushSPastSingleCX) {
  Circuit qc(2, 3);
  qc.s(1);
  qc.cx(0, 1);
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.pushSPastCX());

  Circuit expected(2, 3);
  expected.cx(0, 1);
  expected.cz(0, 1, 2);
  expected.s(1);
  expected.s(0);
  expected.z(0);
  EXPECT_EQ(simplifier.getCircuit(), expected);
  expectSameUnitary(qc, simplifier.getCircuit());
}

TEST_F(TestCliffordSimplifier, RewritesAreExactUpToGlobalPhase) {
  std::vector<std::pair<Circuit, Rule>> rewrites{};
  const auto add = [&rewrites](const Circuit& qc, const Rule rule) {
    rewrites.emplace_back(qc, rule);
  };

  Circuit xz(1, 3);
  xz.x(0);
  xz.z(0);
  add(xz, &CliffordSimplifier::pushPauli);
  Circuit xThroughCX(2, 3);
  xThroughCX.x(0);
  xThroughCX.cx(0, 1);
  add(xThroughCX, &CliffordSimplifier::pushPauli);
  Circuit zThroughCX(2, 3);
  zThroughCX.z(1, 2);
  zThroughCX.cx(0, 1);
  add(zThroughCX, &CliffordSimplifier::pushPauli);
  Circuit xThroughS(1, 5);
  xThroughS.x(0, 3);
  xThroughS.s(0, 2);
  add(xThroughS, &CliffordSimplifier::pushPauli);

  Circuit doubleH(1, 3);
  doubleH.h(0, 2);
  doubleH.s(0);
  add(doubleH, &CliffordSimplifier::pushDoubleHadamard);
  Circuit doubleHCX(2, 3);
  doubleHCX.h(0, 2);
  doubleHCX.cx(0, 1);
  add(doubleHCX, &CliffordSimplifier::pushDoubleHadamard);

  Circuit hCX(2, 3);
  hCX.h(1);
  hCX.cx(0, 1);
  add(hCX, &CliffordSimplifier::pushHGate);
  Circuit hCZ(2, 3);
  hCZ.h(1, 3);
  hCZ.cz(0, 1, 2);
  add(hCZ, &CliffordSimplifier::pushHGate);

  for (const Integer d : {3, 5, 7}) {
    Circuit sCX(2, d);
    sCX.s(1, 2);
    sCX.cx(0, 1, d - 2);
    add(sCX, &CliffordSimplifier::pushSPastCX);
  }
  Circuit czCX(2, 5);
  czCX.cz(0, 1, 2);
  czCX.cx(0, 1, 3);
  add(czCX, &CliffordSimplifier::pushCZPastCX);

  for (const Integer d : {3, 5}) {
    Circuit euler(1, d);
    euler.h(0);
    euler.s(0);
    euler.h(0);
    add(euler, &CliffordSimplifier::eulerDecomp);
  }
  Circuit euler2(1, 3);
  euler2.h(0);
  euler2.s(0, 2);
  euler2.h(0);
  euler2.s(0, 2);
  add(euler2, &CliffordSimplifier::eulerDecomp2);

  Circuit cxPair(2, 5);
  cxPair.cx(0, 1, 2);
  cxPair.cx(1, 0, 2);
  add(cxPair, &CliffordSimplifier::transformCXToSwap);
  Circuit cxTriple(2, 5);
  cxTriple.cx(0, 1);
  cxTriple.cx(1, 0);
  cxTriple.cx(0, 1);
  add(cxTriple, &CliffordSimplifier::toggleCXPair);

  Circuit swapS(2, 3);
  swapS.swap(0, 1);
  swapS.s(0);
  add(swapS, &CliffordSimplifier::pushSwap);
  Circuit swapCX(2, 3);
  swapCX.swap(0, 1);
  swapCX.cx(0, 1, 2);
  add(swapCX, &CliffordSimplifier::pushSwap);

  for (const auto& [qc, rule] : rewrites) {
    CliffordSimplifier simplifier(qc, config);
    EXPECT_TRUE((simplifier.*rule)()) << qc;
    expectSameUnitary(qc, simplifier.getCircuit());
    expectValidDag(simplifier.getDag());
  }
}

TEST_F(TestCliffordSimplifier, SimpleOptimizeCancelsCircuitAndAdjoint) {
  Circuit qc(3, 5);
  qc.h(0);
  qc.cx(0, 1, 2);
  qc.cz(1, 2, 3);
  qc.swap(0, 2);
  qc.s(1, 4);
  auto roundTrip = qc;
  for (const auto& g : qc.adjoint()) {
    roundTrip.addGate(g);
  }
  CliffordSimplifier simplifier(roundTrip, config);
  EXPECT_TRUE(simplifier.simpleOptimize());
  EXPECT_TRUE(simplifier.getCircuit().empty());
  EXPECT_EQ(simplifier.getResults().getGates(), 0U);
  EXPECT_EQ(simplifier.getResults().getSteps(),
            simplifier.getStepsDone().size());
}

TEST_F(TestCliffordSimplifier, IntermediateCircuitsAreOptional) {
  Circuit qc(1, 3);
  qc.s(0);
  qc.s(0);
  qc.s(0);
  config.recordIntermediateCircuits = false;
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.simpleOptimize());
  EXPECT_TRUE(simplifier.getCircuit().empty());
  EXPECT_EQ(simplifier.getCircuitList().size(), 1U);
  EXPECT_EQ(simplifier.getStepsDone(),
            (std::vector<std::string>{"Combine gates", "Remove identity"}));
}

TEST_F(TestCliffordSimplifier, IterationLimit) {
  Circuit qc(1, 3);
  qc.s(0);
  qc.s(0);
  qc.h(0);
  qc.h(0);
  qc.x(0);
  config.maxIterations = 1;
  CliffordSimplifier simplifier(qc, config);
  EXPECT_TRUE(simplifier.simpleOptimize());
  EXPECT_EQ(simplifier.getStepsDone(),
            std::vector<std::string>{"Combine gates"});
}

TEST_F(TestCliffordSimplifier, ConfigurationAndResultsOutput) {
  config.verbosity = plog::Severity::info;
  std::stringstream ss;
  ss << config;
  const auto j = nlohmann::json::parse(ss.str());
  EXPECT_TRUE(j["check_semantics_each_step"].get<bool>());
  EXPECT_EQ(j["verbosity"].get<std::string>(), "INFO");

  Circuit qc(1, 3);
  qc.h(0, 4);
  CliffordSimplifier simplifier(qc, config);
  simplifier.simpleOptimize();
  std::stringstream rs;
  rs << simplifier.getResults();
  const auto results = nlohmann::json::parse(rs.str());
  EXPECT_EQ(results["initial_gates"].get<std::size_t>(), 1U);
  EXPECT_EQ(results["single_qudit_gates"].get<std::size_t>(), 0U);
  EXPECT_EQ(results["steps"].get<std::size_t>(), 1U);
  EXPECT_THAT(simplifier.getResults().getResultCircuit(),
              testing::HasSubstr("\"gates\":[]"));
}

struct TestConfiguration {
  std::string description;
  nlohmann::json circuit;

  std::size_t expectedSimpleGates{};
  std::size_t expectedSimpleTwoQuditGates{};
  std::size_t expectedSingleQuditOptimizeGates{};
};

// NOLINTNEXTLINE (readability-identifier-naming)
inline void from_json(const nlohmann::json& j, TestConfiguration& test) {
  test.description = j.at("description").get<std::string>();
  test.circuit = j.at("circuit");
  test.expectedSimpleGates = j.at("expected_simple_gates").get<std::size_t>();
  test.expectedSimpleTwoQuditGates =
      j.at("expected_simple_two_qudit_gates").get<std::size_t>();
  test.expectedSingleQuditOptimizeGates =
      j.at("expected_single_qudit_optimize_gates").get<std::size_t>();
}

namespace {
std::vector<TestConfiguration> getTests(const std::string& path) {
  std::ifstream input(path);
  nlohmann::json j;
  input >> j;
  return j;
}
} // namespace

class SimplificationTest : public testing::TestWithParam<TestConfiguration> {
protected:
  void SetUp() override {
    test = GetParam();
    qc = Circuit::fromJson(test.circuit);
    std::cout << "Initial circuit:\n" << qc << "\n";

    config.checkSemanticsEachStep = true;
    config.verbosity = plog::Severity::verbose;
  }

  void check(const CliffordSimplifier& simplifier) const {
    const auto& result = simplifier.getCircuit();
    std::cout << "Resulting circuit:\n" << result << "\n";
    std::cout << "Results:\n" << simplifier.getResults() << "\n";
    EXPECT_EQ(SymplecticMatrix(result), SymplecticMatrix(qc));
    EXPECT_EQ(simplifier.getCircuitList().size(),
              simplifier.getStepsDone().size() + 1);
  }

  TestConfiguration test;
  Circuit qc{1, 2};
  Configuration config;
};

INSTANTIATE_TEST_SUITE_P(
    Circuits, SimplificationTest,
    testing::ValuesIn(getTests("clifford/circuits.json")),
    [](const testing::TestParamInfo<SimplificationTest::ParamType>& inf) {
      return inf.param.description;
    });

TEST_P(SimplificationTest, SimpleOptimize) {
  CliffordSimplifier simplifier(qc, config);
  simplifier.simpleOptimize();
  check(simplifier);
  EXPECT_EQ(simplifier.getResults().getGates(), test.expectedSimpleGates);
  EXPECT_EQ(simplifier.getResults().getTwoQuditGates(),
            test.expectedSimpleTwoQuditGates);
}

TEST_P(SimplificationTest, SingleQuditOptimize) {
  CliffordSimplifier simplifier(qc, config);
  simplifier.singleQuditOptimize();
  check(simplifier);
  EXPECT_EQ(simplifier.getResults().getGates(),
            test.expectedSingleQuditOptimizeGates);
}

TEST_P(SimplificationTest, EveryStepIsExactUpToGlobalPhase) {
  if (qc.getDim() % 2 == 0) {
    GTEST_SKIP() << "Pauli corrections are only exact for odd dimensions";
  }
  if (std::pow(qc.getDim(), qc.getQudits()) > 343.) {
    GTEST_SKIP() << "Hilbert space too large for dense simulation";
  }
  for (const auto simplify : {&CliffordSimplifier::simpleOptimize,
                              &CliffordSimplifier::singleQuditOptimize}) {
    CliffordSimplifier simplifier(qc, config);
    (simplifier.*simplify)();
    const auto& circuits = simplifier.getCircuitList();
    for (std::size_t i = 1; i < circuits.size(); ++i) {
      SCOPED_TRACE(simplifier.getStepsDone()[i - 1]);
      expectSameUnitary(circuits[i - 1], circuits[i]);
    }
  }
}

TEST_P(SimplificationTest, EveryStepKeepsTheDagWellFormed) {
  const std::vector<Rule> rules{
      &CliffordSimplifier::combineGates,
      &CliffordSimplifier::removeIdentityGate,
      &CliffordSimplifier::pushPauli,
      &CliffordSimplifier::pushDoubleHadamard,
      &CliffordSimplifier::pushSwap,
      &CliffordSimplifier::pushSGate,
      &CliffordSimplifier::pushSPastCX,
      &CliffordSimplifier::pushCZPastCX,
      &CliffordSimplifier::eulerDecomp,
      &CliffordSimplifier::eulerDecomp2};

  CliffordSimplifier simplifier(qc, config);
  expectValidDag(simplifier.getDag());
  std::size_t steps = 0U;
  bool applied = true;
  while (applied && steps < 10000U) {
    applied = std::any_of(rules.begin(), rules.end(), [&](const Rule rule) {
      return (simplifier.*rule)();
    });
    if (applied) {
      ++steps;
      SCOPED_TRACE(simplifier.getStepsDone().back());
      expectValidDag(simplifier.getDag());
      ASSERT_FALSE(testing::Test::HasFailure()) << simplifier.getCircuit();
    }
  }
  EXPECT_FALSE(applied);
  EXPECT_EQ(SymplecticMatrix(simplifier.getCircuit()), SymplecticMatrix(qc));

  // rules outside the drivers on the original circuit
  for (const auto rule :
       {&CliffordSimplifier::pushHGate, &CliffordSimplifier::transformCXToSwap,
        &CliffordSimplifier::toggleCXPair}) {
    CliffordSimplifier other(qc, config);
    if ((other.*rule)()) {
      expectValidDag(other.getDag());
    }
  }

  for (const auto simplify : {&CliffordSimplifier::simpleOptimize,
                              &CliffordSimplifier::singleQuditOptimize}) {
    CliffordSimplifier driven(qc, config);
    (driven.*simplify)();
    expectValidDag(driven.getDag());
  }
}

TEST_P(SimplificationTest, SimplifiedCircuitIsAFixpoint) {
  CliffordSimplifier simplifier(qc, config);
  simplifier.simpleOptimize();
  CliffordSimplifier again(simplifier.getCircuit(), config);
  EXPECT_FALSE(again.simpleOptimize());
  EXPECT_EQ(again.getCircuit(), simplifier.getCircuit());
}
} // namespace clifford
