//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "circuit/Circuit.hpp"
#include "circuit/Gate.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace clifford {
using circuit::Integer;
using circuit::Qudit;
using NodeId = std::size_t;

/**
 * @brief Dependency graph of a Clifford circuit.
 * @details Nodes live in an arena and are addressed by their id. Node 0 is a
 * gate-less root that is the parent of every node without other parents. An
 * edge u -> v means that u has to be applied before v. Edges only join gates
 * that follow each other on a common qudit, and for every qudit the gates
 * acting on it are totally ordered by reachability. All mutating operations
 * preserve both properties.
 */
class Dag {
public:
  static constexpr NodeId ROOT = 0;

  Dag(std::size_t nQudits, Integer dimension);

  /**
   * @brief Builds the dependency graph of a circuit.
   * @details Gates receive the indices 1, ..., n in circuit order. A gate
   * becomes a child of the latest gate on each of its qudits. If one of two
   * such predecessors is an ancestor of the other, only the edge from the
   * descendant is added.
   */
  static Dag fromCircuit(const circuit::Circuit& qc);

  [[nodiscard]] std::size_t getQudits() const { return qudits; }
  [[nodiscard]] Integer getDim() const { return dim; }
  /// Number of gate nodes.
  [[nodiscard]] std::size_t size() const { return liveNodes; }
  [[nodiscard]] bool contains(NodeId id) const;

  [[nodiscard]] const circuit::Gate& gate(NodeId id) const;
  [[nodiscard]] circuit::Gate& gate(NodeId id);
  [[nodiscard]] const std::vector<NodeId>& parents(NodeId id) const;
  [[nodiscard]] const std::vector<NodeId>& children(NodeId id) const;
  [[nodiscard]] bool isChild(NodeId parent, NodeId child) const;

  /// Adds a detached node and assigns it a fresh gate index.
  NodeId addNode(circuit::Gate g);
  /**
   * @brief Adds the edge parent -> child. Existing edges are kept.
   * @throws std::logic_error if the edge would close a cycle
   */
  void addChild(NodeId parent, NodeId child);
  /// @throws std::invalid_argument if `child` is not a child of `parent`
  void removeChild(NodeId parent, NodeId child);

  [[nodiscard]] bool isAncestor(NodeId ancestor, NodeId node) const;
  [[nodiscard]] std::vector<NodeId> ancestors(NodeId id) const;
  [[nodiscard]] std::vector<NodeId> descendants(NodeId id) const;
  [[nodiscard]] bool isAcyclic() const;

  /// The earliest descendant of `id` acting on `q`, if any.
  [[nodiscard]] std::optional<NodeId> findFirstDescendantOnQudit(NodeId id,
                                                                 Qudit q) const;
  /// The latest ancestor of `id` acting on `q`, the root if there is none.
  [[nodiscard]] NodeId findFirstAncestorOnQudit(NodeId id, Qudit q) const;

  /**
   * @brief Places the detached node `newNode` directly after `id`.
   * @details With a `child`, the edge id -> child is split. Without one,
   * `newNode` is linked in front of the first descendant of `id` on each of
   * its qudits. `id` has to act on all qudits of `newNode` unless it is the
   * root.
   */
  void insertBetweenChild(NodeId id, NodeId newNode,
                          std::optional<NodeId> child = std::nullopt);
  NodeId insertSingleQuditGateAfter(NodeId id, const circuit::Gate& g);
  NodeId insertSingleQuditGateBefore(NodeId id, const circuit::Gate& g);
  /// Inserts a gate on the same qudit pair as `id` directly after it.
  NodeId insertTwoQuditGateAfter(NodeId id, const circuit::Gate& g);

  /**
   * @brief Removes the adjacent child `child`, keeping the gate of `id`.
   * @details The gate of `id` is expected to already account for `child`.
   */
  void merge(NodeId id, NodeId child);
  /// Removes a node, reconnecting its neighbours on every qudit.
  void remove(NodeId id);

  /**
   * @brief Replaces a block of one node or of a node and one of its children
   * by a sequence of gates.
   * @details The replacement may only act on qudits of the block. Each qudit
   * is rewired as predecessor -> replacement gates -> successor.
   * @return the ids of the new nodes in the order of `gates`
   * @throws std::invalid_argument if the block is not convex or the gates
   * leave its qudits
   */
  std::vector<NodeId> substitute(const std::vector<NodeId>& block,
                                 const std::vector<circuit::Gate>& gates);
  /// Whether `child` is a child of `id` with no other path between them.
  [[nodiscard]] bool isAdjacent(NodeId id, NodeId child) const;

  /// Gate nodes in dependency order. Ready nodes are taken by gate index.
  [[nodiscard]] std::vector<NodeId> topologicalOrder() const;
  [[nodiscard]] circuit::Circuit toCircuit(const std::string& name = "") const;

  [[nodiscard]] std::string toString() const;
  friend std::ostream& operator<<(std::ostream& os, const Dag& dag) {
    return os << dag.toString();
  }

private:
  struct Node {
    std::optional<circuit::Gate> gate;
    std::vector<NodeId> parents;
    std::vector<NodeId> children;
    bool removed = false;
  };

  std::size_t qudits;
  Integer dim;
  std::vector<Node> nodes;
  std::size_t liveNodes = 0;
  std::size_t nextIndex = 1;

  [[nodiscard]] const Node& node(NodeId id) const;
  [[nodiscard]] Node& node(NodeId id);
  [[nodiscard]] bool actsOn(NodeId id, Qudit q) const;
  [[nodiscard]] std::vector<NodeId> reachable(NodeId id, bool downwards) const;
  void detach(NodeId id);
  std::vector<NodeId> splice(const std::vector<NodeId>& block,
                             const std::vector<NodeId>& replacement);
};
} // namespace clifford
