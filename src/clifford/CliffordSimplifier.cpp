//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "clifford/CliffordSimplifier.hpp"

#include "circuit/Circuit.hpp"
#include "circuit/Gate.hpp"
#include "clifford/Configuration.hpp"
#include "clifford/Dag.hpp"
#include "clifford/Results.hpp"
#include "clifford/SymplecticMatrix.hpp"
#include "zx/Modular.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <plog/Logger.h>
#include <plog/Severity.h>
#include <string>
#include <utility>
#include <vector>

namespace clifford {
using circuit::Gate;
using circuit::GateType;

CliffordSimplifier::CliffordSimplifier(const circuit::Circuit& qc,
                                       const Configuration& config)
    : configuration(config), initialCircuit(qc), circuit(qc),
      dag(Dag::fromCircuit(qc)) {
  if (plog::get() == nullptr) {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::init(plog::none, &consoleAppender);
  }
  plog::get()->setMaxSeverity(configuration.verbosity);

  circuit = dag.toCircuit(qc.getName());
  circuitList.emplace_back(circuit);
  results = Results(initialCircuit, circuit);
  PLOG_INFO << "Simplifying " << qc.getQudits()
            << " qudit circuit of dimension " << qc.getDim() << " with "
            << qc.size() << " gates";
}

Integer CliffordSimplifier::mod(const Integer value) const {
  return zx::mod(value, circuit.getDim());
}

Gate CliffordSimplifier::single(const GateType type, const Qudit target,
                                const Integer reps) const {
  return {type, target,
          type == GateType::H ? zx::mod(reps, 4) : mod(reps)};
}

Gate CliffordSimplifier::two(const GateType type, const Qudit control,
                             const Qudit target, const Integer reps) const {
  return {type, circuit::Control{control}, target,
          type == GateType::SWAP ? zx::mod(reps, 2) : mod(reps)};
}

std::optional<NodeId> CliffordSimplifier::onlyChild(const NodeId id) const {
  const auto& children = dag.children(id);
  if (children.size() != 1) {
    return std::nullopt;
  }
  return children.front();
}

bool CliffordSimplifier::isIdentity(const Gate& gate) const {
  switch (gate.getType()) {
  case GateType::H:
    return zx::mod(gate.getRepetitions(), 4) == 0;
  case GateType::SWAP:
    return zx::mod(gate.getRepetitions(), 2) == 0;
  case GateType::MUL:
    return mod(gate.getMultValue()) == 1;
  default:
    return mod(gate.getRepetitions()) == 0;
  }
}

void CliffordSimplifier::replaceGate(const NodeId id, Gate gate) {
  gate.setIndex(dag.gate(id).getIndex());
  dag.gate(id) = std::move(gate);
}

bool CliffordSimplifier::reachedIterationLimit(
    const std::size_t iterations) const {
  if (configuration.maxIterations > 0 &&
      iterations >= configuration.maxIterations) {
    PLOG_WARNING << "Stopping after " << iterations
                 << " iterations without reaching a fixpoint";
    return true;
  }
  return false;
}

void CliffordSimplifier::updateCircuit(const std::string& step) {
  auto next = dag.toCircuit(initialCircuit.getName());
  if (configuration.checkSemanticsEachStep &&
      SymplecticMatrix(next) != SymplecticMatrix(circuit)) {
    const auto msg = "Rewrite step '" + step +
                     "' changed the semantics of the circuit";
    PLOG_FATAL << msg;
    PLOG_VERBOSE << "Before:\n" << circuit << "After:\n" << next;
    throw SemanticsException(msg);
  }
  circuit = std::move(next);
  stepsDone.emplace_back(step);
  if (configuration.recordIntermediateCircuits) {
    circuitList.emplace_back(circuit);
  }
  PLOG_DEBUG << "Applied " << step << ", " << circuit.size()
             << " gates remaining";
  PLOG_VERBOSE << circuit;
}

void CliffordSimplifier::updateResults(const double runtime) {
  results = Results(initialCircuit, circuit);
  results.setSteps(stepsDone.size());
  results.setRuntime(runtime);
}

bool CliffordSimplifier::applyToFirstMatch(
    const std::string& step, const std::function<bool(NodeId)>& rule) {
  for (const auto id : dag.topologicalOrder()) {
    if (rule(id)) {
      updateCircuit(step);
      return true;
    }
  }
  return false;
}

bool CliffordSimplifier::simpleOptimize() {
  const auto start = std::chrono::high_resolution_clock::now();
  const auto before = stepsDone.size();

  std::size_t iterations = 0U;
  while (!reachedIterationLimit(iterations)) {
    ++iterations;
    if (combineGates() || removeIdentityGate()) {
      continue;
    }
    if (pushPauli() || pushDoubleHadamard() || pushSwap() || pushSGate() ||
        pushSPastCX() || pushCZPastCX()) {
      continue;
    }
    break;
  }

  const auto end = std::chrono::high_resolution_clock::now();
  const std::chrono::duration<double> diff = end - start;
  updateResults(diff.count());
  PLOG_INFO << "Simple optimization applied " << stepsDone.size() - before
            << " rewrites in " << diff.count() << " seconds, "
            << initialCircuit.size() << " -> " << circuit.size() << " gates";
  return stepsDone.size() != before;
}

bool CliffordSimplifier::singleQuditOptimize() {
  const auto start = std::chrono::high_resolution_clock::now();
  const auto before = stepsDone.size();

  std::size_t iterations = 0U;
  while (!reachedIterationLimit(iterations)) {
    ++iterations;
    simpleOptimize();
    if (eulerDecomp() || eulerDecomp2()) {
      continue;
    }
    break;
  }

  const auto end = std::chrono::high_resolution_clock::now();
  const std::chrono::duration<double> diff = end - start;
  updateResults(diff.count());
  PLOG_INFO << "Single-qudit optimization applied "
            << stepsDone.size() - before << " rewrites in " << diff.count()
            << " seconds";
  return stepsDone.size() != before;
}

bool CliffordSimplifier::combineGates() {
  const auto tryMerge = [this](const NodeId id) {
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto& gate = dag.gate(id);
    const auto& next = dag.gate(*child);
    if (gate.getType() != next.getType()) {
      return false;
    }
    const bool symmetric = gate.is(GateType::CZ) || gate.is(GateType::SWAP);
    const bool aligned = gate.getTarget() == next.getTarget() &&
                         gate.getControl() == next.getControl();
    if (!aligned && !(symmetric && gate.sameQudits(next))) {
      return false;
    }
    auto merged = gate;
    merged.merge(next);
    if (merged.is(GateType::MUL)) {
      merged.setMultValue(mod(merged.getMultValue()));
    } else if (merged.is(GateType::H)) {
      merged.setRepetitions(zx::mod(merged.getRepetitions(), 4));
    } else if (merged.is(GateType::SWAP)) {
      merged.setRepetitions(zx::mod(merged.getRepetitions(), 2));
    } else {
      merged.setRepetitions(mod(merged.getRepetitions()));
    }
    replaceGate(id, merged);
    dag.merge(id, *child);
    PLOG_DEBUG << "Combined into " << merged;
    return true;
  };

  bool merged = false;
  bool found = true;
  while (found) {
    found = false;
    for (const auto id : dag.topologicalOrder()) {
      if (tryMerge(id)) {
        found = true;
        merged = true;
        break;
      }
    }
  }
  if (merged) {
    updateCircuit("Combine gates");
  }
  return merged;
}

bool CliffordSimplifier::removeIdentityGate() {
  return applyToFirstMatch("Remove identity", [this](const NodeId id) {
    if (!isIdentity(dag.gate(id))) {
      return false;
    }
    PLOG_DEBUG << "Removing " << dag.gate(id);
    dag.remove(id);
    return true;
  });
}

bool CliffordSimplifier::pushPauli() {
  return applyToFirstMatch("Push Pauli", [this](const NodeId id) {
    const auto pauli = dag.gate(id);
    if (!pauli.isPauli()) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto next = dag.gate(*child);
    const auto q = pauli.getTarget();
    const auto reps = pauli.getRepetitions();

    switch (next.getType()) {
    case GateType::X:
    case GateType::Z:
      // Z gates are moved in front of X gates
      if (pauli.is(GateType::X) && next.is(GateType::Z)) {
        replaceGate(id, next);
        replaceGate(*child, pauli);
        return true;
      }
      return false;
    case GateType::H: {
      const auto h = zx::mod(next.getRepetitions(), 4);
      auto moved = pauli;
      if (h == 2) {
        moved = single(pauli.getType(), q, -reps);
      } else if (h != 0 && pauli.is(GateType::Z)) {
        moved = single(GateType::X, q, h == 3 ? -reps : reps);
      } else if (h != 0) {
        moved = single(GateType::Z, q, h == 3 ? reps : -reps);
      }
      replaceGate(id, next);
      replaceGate(*child, moved);
      return true;
    }
    case GateType::S: {
      replaceGate(id, next);
      replaceGate(*child, pauli);
      if (pauli.is(GateType::X)) {
        const auto z =
            dag.addNode(single(GateType::Z, q, reps * next.getRepetitions()));
        dag.insertBetweenChild(id, z, *child);
      }
      return true;
    }
    case GateType::MUL:
      return false;
    case GateType::SWAP:
      dag.substitute({id, *child},
                     {next, single(pauli.getType(), next.other(q), reps)});
      return true;
    case GateType::CZ: {
      std::vector<Gate> replacement{next, pauli};
      if (pauli.is(GateType::X)) {
        replacement.emplace_back(
            single(GateType::Z, next.other(q), reps * next.getRepetitions()));
      }
      dag.substitute({id, *child}, replacement);
      return true;
    }
    case GateType::CX: {
      std::vector<Gate> replacement{next, pauli};
      const bool onControl = next.getControl() == q;
      const bool commutes = (pauli.is(GateType::Z) && onControl) ||
                            (pauli.is(GateType::X) && !onControl);
      if (!commutes) {
        const auto r = reps * next.getRepetitions();
        replacement.emplace_back(single(pauli.getType(), next.other(q),
                                        pauli.is(GateType::Z) ? -r : r));
      }
      dag.substitute({id, *child}, replacement);
      return true;
    }
    }
    return false;
  });
}

bool CliffordSimplifier::pushDoubleHadamard() {
  return applyToFirstMatch("Push H^2", [this](const NodeId id) {
    const auto h = dag.gate(id);
    if (!h.is(GateType::H) || zx::mod(h.getRepetitions(), 4) != 2) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto next = dag.gate(*child);
    const auto q = h.getTarget();

    switch (next.getType()) {
    case GateType::H:
      replaceGate(id, single(GateType::H, q,
                             h.getRepetitions() + next.getRepetitions()));
      dag.merge(id, *child);
      return true;
    case GateType::CX:
    case GateType::CZ: {
      auto negated = next;
      negated.setRepetitions(mod(-next.getRepetitions()));
      dag.substitute({id, *child}, {negated, h});
      return true;
    }
    case GateType::SWAP:
      dag.substitute({id, *child},
                     {next, single(GateType::H, next.other(q), 2)});
      return true;
    case GateType::S:
      replaceGate(id, next);
      replaceGate(*child, h);
      dag.insertSingleQuditGateAfter(
          *child, single(GateType::Z, q, -next.getRepetitions()));
      return true;
    default:
      return false;
    }
  });
}

bool CliffordSimplifier::pushHGate() {
  return applyToFirstMatch("Push H", [this](const NodeId id) {
    const auto h = dag.gate(id);
    const auto reps = zx::mod(h.getRepetitions(), 4);
    if (!h.is(GateType::H) || reps % 2 == 0) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto next = dag.gate(*child);
    const auto q = h.getTarget();
    const auto a = next.getRepetitions();

    if (next.is(GateType::CX) && next.getTarget() == q) {
      dag.substitute({id, *child},
                     {two(GateType::CZ, *next.getControl(), q,
                          reps == 1 ? a : -a),
                      h});
      return true;
    }
    if (next.is(GateType::CZ)) {
      dag.substitute({id, *child},
                     {two(GateType::CX, next.other(q), q, reps == 1 ? -a : a),
                      h});
      return true;
    }
    return false;
  });
}

bool CliffordSimplifier::eulerDecomp() {
  return applyToFirstMatch(
      "Euler decomposition H;S;H", [this](const NodeId id) {
        const auto& first = dag.gate(id);
        if (!first.is(GateType::H) ||
            zx::mod(first.getRepetitions(), 4) != 1) {
          return false;
        }
        const auto second = onlyChild(id);
        if (!second || !dag.gate(*second).is(GateType::S) ||
            mod(dag.gate(*second).getRepetitions()) != 1) {
          return false;
        }
        const auto third = onlyChild(*second);
        if (!third || !dag.gate(*third).is(GateType::H) ||
            zx::mod(dag.gate(*third).getRepetitions(), 4) != 1) {
          return false;
        }
        const auto q = first.getTarget();
        replaceGate(id, single(GateType::S, q, -1));
        replaceGate(*second, single(GateType::H, q, 1));
        replaceGate(*third, single(GateType::X, q, -1));
        const auto sdg = dag.addNode(single(GateType::S, q, -1));
        dag.insertBetweenChild(*second, sdg, *third);
        return true;
      });
}

bool CliffordSimplifier::eulerDecomp2() {
  return applyToFirstMatch(
      "Euler decomposition S^-1;H;S^-1", [this](const NodeId id) {
        const auto& first = dag.gate(id);
        if (!first.is(GateType::S) || mod(first.getRepetitions() + 1) != 0) {
          return false;
        }
        const auto& parents = dag.parents(id);
        const bool afterH =
            std::any_of(parents.begin(), parents.end(), [this](const NodeId p) {
              return p != Dag::ROOT && dag.gate(p).is(GateType::H);
            });
        if (!afterH) {
          return false;
        }
        const auto second = onlyChild(id);
        if (!second || !dag.gate(*second).is(GateType::H) ||
            zx::mod(dag.gate(*second).getRepetitions(), 4) != 1) {
          return false;
        }
        const auto third = onlyChild(*second);
        if (!third || !dag.gate(*third).is(GateType::S) ||
            mod(dag.gate(*third).getRepetitions() + 1) != 0) {
          return false;
        }
        const auto q = first.getTarget();
        replaceGate(id, single(GateType::H, q, 1));
        replaceGate(*second, single(GateType::S, q, 1));
        replaceGate(*third, single(GateType::X, q, 1));
        const auto h = dag.addNode(single(GateType::H, q, 1));
        dag.insertBetweenChild(*second, h, *third);
        return true;
      });
}

bool CliffordSimplifier::pushSGate() {
  return applyToFirstMatch("Push S", [this](const NodeId id) {
    const auto s = dag.gate(id);
    if (!s.is(GateType::S)) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto next = dag.gate(*child);
    if (next.is(GateType::CZ) ||
        (next.is(GateType::CX) && next.getControl() == s.getTarget())) {
      dag.substitute({id, *child}, {next, s});
      return true;
    }
    return false;
  });
}

bool CliffordSimplifier::pushSPastCX() {
  return applyToFirstMatch("Push S past CX", [this](const NodeId id) {
    const auto s = dag.gate(id);
    if (!s.is(GateType::S)) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto cx = dag.gate(*child);
    if (!cx.is(GateType::CX) || cx.getTarget() != s.getTarget()) {
      return false;
    }
    const auto a = mod(s.getRepetitions());
    const auto b = mod(cx.getRepetitions());
    const auto c = *cx.getControl();
    const auto t = cx.getTarget();

    std::vector<Gate> replacement{two(GateType::CX, c, t, b),
                                  two(GateType::CZ, c, t, -a * b),
                                  single(GateType::S, t, a),
                                  single(GateType::S, c, a * b * b),
                                  single(GateType::Z, c,
                                         a * (b * (b + 1) / 2))};
    dag.substitute({id, *child}, replacement);
    return true;
  });
}

bool CliffordSimplifier::pushCZPastCX() {
  return applyToFirstMatch("Push CZ past CX", [this](const NodeId id) {
    const auto cz = dag.gate(id);
    if (!cz.is(GateType::CZ)) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto cx = dag.gate(*child);
    if (!cx.is(GateType::CX) || !cx.sameQudits(cz)) {
      return false;
    }
    const auto a = cz.getRepetitions();
    const auto b = cx.getRepetitions();
    const auto c = *cx.getControl();
    dag.substitute({id, *child}, {cx, cz, single(GateType::S, c, -2 * a * b),
                                  single(GateType::Z, c, -a * b)});
    return true;
  });
}

bool CliffordSimplifier::transformCXToSwap() {
  return applyToFirstMatch("Transform CX pair to SWAP", [this](
                                                            const NodeId id) {
    const auto first = dag.gate(id);
    if (!first.is(GateType::CX)) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto second = dag.gate(*child);
    const auto c = *first.getControl();
    const auto t = first.getTarget();
    if (!second.is(GateType::CX) || second.getControl() != t ||
        second.getTarget() != c) {
      return false;
    }
    const auto a = mod(first.getRepetitions());
    const auto b = mod(second.getRepetitions());
    if (mod(a * b + 1) != 0) {
      return false;
    }

    std::vector<Gate> replacement{two(GateType::CX, t, c, -b),
                                  two(GateType::SWAP, c, t, 1)};
    if (a == 1) {
      replacement.emplace_back(single(GateType::H, c, 2));
    } else if (mod(a + 1) == 0) {
      replacement.emplace_back(single(GateType::H, t, 2));
    } else {
      const auto inverse = zx::requireInverse(a, circuit.getDim());
      replacement.emplace_back(Gate::mul(t, a));
      replacement.emplace_back(Gate::mul(c, mod(-inverse)));
    }
    dag.substitute({id, *child}, replacement);
    return true;
  });
}

bool CliffordSimplifier::toggleCXPair() {
  return applyToFirstMatch("Toggle CX pair", [this](const NodeId id) {
    const auto first = dag.gate(id);
    if (!first.is(GateType::CX)) {
      return false;
    }
    const auto child = onlyChild(id);
    if (!child) {
      return false;
    }
    const auto second = dag.gate(*child);
    const auto c = *first.getControl();
    const auto t = first.getTarget();
    if (!second.is(GateType::CX) || second.getControl() != t ||
        second.getTarget() != c) {
      return false;
    }
    const auto third = onlyChild(*child);
    if (!third || !dag.gate(*third).is(GateType::CX)) {
      return false;
    }
    const auto a = mod(first.getRepetitions());
    const auto b = mod(second.getRepetitions());
    const auto k = mod(a * b + 1);
    const auto inverse = zx::modInverse(k, circuit.getDim());
    if (k == 0 || !inverse) {
      return false;
    }

    std::vector<Gate> replacement{two(GateType::CX, t, c, b * *inverse),
                                  two(GateType::CX, c, t, a * k)};
    if (mod(k + 1) == 0) {
      replacement.emplace_back(single(GateType::H, t, 2));
      replacement.emplace_back(single(GateType::H, c, 2));
    } else {
      replacement.emplace_back(Gate::mul(t, *inverse));
      replacement.emplace_back(Gate::mul(c, k));
    }
    dag.substitute({id, *child}, replacement);
    return true;
  });
}

bool CliffordSimplifier::pushSwap() {
  return applyToFirstMatch("Push SWAP", [this](const NodeId id) {
    const auto swap = dag.gate(id);
    if (!swap.is(GateType::SWAP) || zx::mod(swap.getRepetitions(), 2) != 1) {
      return false;
    }
    for (const auto child : dag.children(id)) {
      const auto next = dag.gate(child);
      if (next.isTwoQuditGate()) {
        if (!next.sameQudits(swap) || !dag.isAdjacent(id, child)) {
          continue;
        }
        if (next.is(GateType::CZ)) {
          dag.substitute({id, child}, {next, swap});
          return true;
        }
        if (next.is(GateType::CX)) {
          dag.substitute({id, child},
                         {two(GateType::CX, next.getTarget(),
                              *next.getControl(), next.getRepetitions()),
                          swap});
          return true;
        }
        continue;
      }
      const bool oddH = next.is(GateType::H) &&
                        zx::mod(next.getRepetitions(), 2) == 1;
      if (next.is(GateType::S) || oddH) {
        auto moved = next;
        moved.setTarget(swap.other(next.getTarget()));
        dag.substitute({id, child}, {moved, swap});
        return true;
      }
    }
    return false;
  });
}
} // namespace clifford
