//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "circuit/Circuit.hpp"
#include "circuit/Gate.hpp"
#include "clifford/Configuration.hpp"
#include "clifford/Dag.hpp"
#include "clifford/Results.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clifford {

/// A rewrite changed the symplectic matrix of the circuit.
class SemanticsException : public std::runtime_error {
public:
  explicit SemanticsException(const std::string& msg)
      : std::runtime_error(msg) {}
};

/**
 * @brief Rule-based simplification of qudit Clifford circuits.
 * @details The circuit is kept as a dependency graph. Every rule scans the
 * gates in topological order and rewrites the first match. After a rewrite
 * the circuit is read back from the graph and the step is recorded. With
 * `checkSemanticsEachStep` the symplectic matrices before and after every
 * step are compared.
 *
 * For odd dimensions the rewrites are exact up to a global phase, including
 * the Pauli corrections, for X|k> = |k+1>, Z|k> = w^k|k>,
 * S|k> = w^(k(k-1)/2)|k>, H|j> = sum_k w^(-jk)|k> / sqrt(d),
 * CX|c,t> = |c,t+c> and CZ|c,t> = w^(ct)|c,t>. For even dimensions only the
 * symplectic part is preserved.
 */
class CliffordSimplifier final {
public:
  explicit CliffordSimplifier(const circuit::Circuit& qc,
                              const Configuration& config = {});

  /// Applies the gate-count preserving or reducing rules until none fires.
  bool simpleOptimize();
  /// simpleOptimize interleaved with the Euler rewrites.
  bool singleQuditOptimize();

  /// Merges adjacent gates of the same kind on the same qudits.
  bool combineGates();
  bool removeIdentityGate();
  /// Moves a Pauli gate behind its successor.
  bool pushPauli();
  bool pushDoubleHadamard();
  bool pushHGate();
  /// H;S;H -> S^-1;H;S^-1;X^-1
  bool eulerDecomp();
  /// S^-1;H;S^-1 -> H;S;H;X behind an H gate
  bool eulerDecomp2();
  bool pushSGate();
  bool pushSPastCX();
  bool pushCZPastCX();
  bool transformCXToSwap();
  bool toggleCXPair();
  bool pushSwap();

  [[nodiscard]] const circuit::Circuit& getCircuit() const { return circuit; }
  [[nodiscard]] const std::vector<circuit::Circuit>& getCircuitList() const {
    return circuitList;
  }
  [[nodiscard]] const std::vector<std::string>& getStepsDone() const {
    return stepsDone;
  }
  [[nodiscard]] const Results& getResults() const { return results; }
  [[nodiscard]] const Configuration& getConfiguration() const {
    return configuration;
  }
  [[nodiscard]] const Dag& getDag() const { return dag; }

protected:
  Configuration configuration;
  circuit::Circuit initialCircuit;
  circuit::Circuit circuit;
  Dag dag;
  std::vector<circuit::Circuit> circuitList;
  std::vector<std::string> stepsDone;
  Results results;

  void updateCircuit(const std::string& step);
  void updateResults(double runtime);
  bool applyToFirstMatch(const std::string& step,
                         const std::function<bool(NodeId)>& rule);
  [[nodiscard]] bool reachedIterationLimit(std::size_t iterations) const;

  [[nodiscard]] std::optional<NodeId> onlyChild(NodeId id) const;
  [[nodiscard]] bool isIdentity(const circuit::Gate& gate) const;
  /// Sets the gate of a node, keeping its index.
  void replaceGate(NodeId id, circuit::Gate gate);
  [[nodiscard]] circuit::Gate single(circuit::GateType type, Qudit target,
                                     Integer reps) const;
  [[nodiscard]] circuit::Gate two(circuit::GateType type, Qudit control,
                                  Qudit target, Integer reps) const;
  [[nodiscard]] Integer mod(Integer value) const;
};
} // namespace clifford
