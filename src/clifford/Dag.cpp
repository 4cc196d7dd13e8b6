//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "clifford/Dag.hpp"

#include "zx/Modular.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <plog/Log.h>
#include <queue>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace clifford {

Dag::Dag(const std::size_t nQudits, const Integer dimension)
    : qudits(nQudits), dim(dimension) {
  zx::validateDimension(dimension);
  nodes.emplace_back();
}

Dag Dag::fromCircuit(const circuit::Circuit& qc) {
  Dag dag(qc.getQudits(), qc.getDim());
  std::vector<std::optional<NodeId>> latest(qc.getQudits());

  for (const auto& g : qc) {
    const auto id = dag.addNode(g);
    const auto target = g.getTarget();
    if (g.isTwoQuditGate()) {
      const auto control = *g.getControl();
      const auto p1 = latest.at(target);
      const auto p2 = latest.at(control);
      if (p1 && p2) {
        if (*p1 == *p2 || dag.isAncestor(*p2, *p1)) {
          dag.addChild(*p1, id);
        } else if (dag.isAncestor(*p1, *p2)) {
          dag.addChild(*p2, id);
        } else {
          dag.addChild(*p1, id);
          dag.addChild(*p2, id);
        }
      } else if (p1) {
        dag.addChild(*p1, id);
      } else if (p2) {
        dag.addChild(*p2, id);
      } else {
        dag.addChild(ROOT, id);
      }
      latest[control] = id;
    } else {
      const auto p = latest.at(target);
      dag.addChild(p ? *p : ROOT, id);
    }
    latest[target] = id;
  }
  PLOG_DEBUG << "Built dependency graph with " << dag.size()
             << " gate nodes for circuit " << qc.getName();
  return dag;
}

bool Dag::contains(const NodeId id) const {
  return id < nodes.size() && !nodes[id].removed;
}

const Dag::Node& Dag::node(const NodeId id) const {
  if (!contains(id)) {
    const auto msg = "Unknown DAG node " + std::to_string(id);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  return nodes[id];
}

Dag::Node& Dag::node(const NodeId id) {
  if (!contains(id)) {
    const auto msg = "Unknown DAG node " + std::to_string(id);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  return nodes[id];
}

const circuit::Gate& Dag::gate(const NodeId id) const {
  const auto& n = node(id);
  if (!n.gate) {
    const auto msg = "The root of the DAG carries no gate";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  return *n.gate;
}

circuit::Gate& Dag::gate(const NodeId id) {
  auto& n = node(id);
  if (!n.gate) {
    const auto msg = "The root of the DAG carries no gate";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  return *n.gate;
}

const std::vector<NodeId>& Dag::parents(const NodeId id) const {
  return node(id).parents;
}

const std::vector<NodeId>& Dag::children(const NodeId id) const {
  return node(id).children;
}

bool Dag::isChild(const NodeId parent, const NodeId child) const {
  const auto& ch = node(parent).children;
  return std::find(ch.begin(), ch.end(), child) != ch.end();
}

bool Dag::actsOn(const NodeId id, const Qudit q) const {
  return id != ROOT && gate(id).actsOn(q);
}

NodeId Dag::addNode(circuit::Gate g) {
  for (const auto q : g.qudits()) {
    if (q >= qudits) {
      const auto msg = "Gate " + g.toString() + " acts outside of the " +
                       std::to_string(qudits) + " qudits of the DAG";
      PLOG_ERROR << msg;
      throw std::invalid_argument(msg);
    }
  }
  g.setIndex(nextIndex++);
  Node n{};
  n.gate = std::move(g);
  nodes.emplace_back(std::move(n));
  ++liveNodes;
  return nodes.size() - 1;
}

void Dag::addChild(const NodeId parent, const NodeId child) {
  static_cast<void>(node(parent));
  const auto& c = node(child);
  if (child == ROOT) {
    const auto msg = "The root of the DAG cannot be a child";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  if (isChild(parent, child)) {
    return;
  }
  if (parent == child || (!c.children.empty() && isAncestor(child, parent))) {
    const auto msg = "Edge " + std::to_string(parent) + " -> " +
                     std::to_string(child) + " would create a cycle";
    PLOG_FATAL << msg;
    throw std::logic_error(msg);
  }
  nodes[parent].children.emplace_back(child);
  nodes[child].parents.emplace_back(parent);
}

void Dag::removeChild(const NodeId parent, const NodeId child) {
  auto& ch = node(parent).children;
  const auto it = std::find(ch.begin(), ch.end(), child);
  if (it == ch.end()) {
    const auto msg = "Node " + std::to_string(child) +
                     " is not a child of node " + std::to_string(parent);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  ch.erase(it);
  auto& pa = nodes[child].parents;
  pa.erase(std::remove(pa.begin(), pa.end(), parent), pa.end());
}

std::vector<NodeId> Dag::reachable(const NodeId id,
                                   const bool downwards) const {
  static_cast<void>(node(id));
  std::vector<bool> visited(nodes.size(), false);
  std::vector<NodeId> result{};
  std::vector<NodeId> stack{id};
  visited[id] = true;
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();
    const auto& next =
        downwards ? nodes[current].children : nodes[current].parents;
    for (const auto n : next) {
      if (!visited[n]) {
        visited[n] = true;
        result.emplace_back(n);
        stack.emplace_back(n);
      }
    }
  }
  return result;
}

bool Dag::isAncestor(const NodeId ancestor, const NodeId id) const {
  static_cast<void>(node(ancestor));
  static_cast<void>(node(id));
  if (ancestor == id) {
    return false;
  }
  if (ancestor == ROOT) {
    return true;
  }
  const auto anc = reachable(id, false);
  return std::find(anc.begin(), anc.end(), ancestor) != anc.end();
}

std::vector<NodeId> Dag::ancestors(const NodeId id) const {
  return reachable(id, false);
}

std::vector<NodeId> Dag::descendants(const NodeId id) const {
  return reachable(id, true);
}

bool Dag::isAcyclic() const {
  std::vector<std::size_t> pending(nodes.size(), 0);
  std::vector<NodeId> ready{};
  std::size_t live = 0;
  for (NodeId id = 0; id < nodes.size(); ++id) {
    if (nodes[id].removed) {
      continue;
    }
    ++live;
    pending[id] = nodes[id].parents.size();
    if (pending[id] == 0) {
      ready.emplace_back(id);
    }
  }
  std::size_t visited = 0;
  while (!ready.empty()) {
    const auto current = ready.back();
    ready.pop_back();
    ++visited;
    for (const auto c : nodes[current].children) {
      if (--pending[c] == 0) {
        ready.emplace_back(c);
      }
    }
  }
  return visited == live;
}

std::optional<NodeId> Dag::findFirstDescendantOnQudit(const NodeId id,
                                                      const Qudit q) const {
  std::optional<NodeId> best{};
  for (const auto d : descendants(id)) {
    if (!actsOn(d, q)) {
      continue;
    }
    if (!best || isAncestor(d, *best)) {
      best = d;
    }
  }
  return best;
}

NodeId Dag::findFirstAncestorOnQudit(const NodeId id, const Qudit q) const {
  std::optional<NodeId> best{};
  for (const auto a : ancestors(id)) {
    if (!actsOn(a, q)) {
      continue;
    }
    if (!best || isAncestor(*best, a)) {
      best = a;
    }
  }
  return best ? *best : ROOT;
}

void Dag::insertBetweenChild(const NodeId id, const NodeId newNode,
                             const std::optional<NodeId> child) {
  const auto& n = node(newNode);
  if (newNode == ROOT || !n.parents.empty() || !n.children.empty()) {
    const auto msg = "Only detached gate nodes can be inserted";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  const auto newQudits = gate(newNode).qudits();
  std::vector<std::optional<NodeId>> firsts{};
  for (const auto q : newQudits) {
    if (id != ROOT && !actsOn(id, q)) {
      const auto msg = "Cannot insert " + gate(newNode).toString() +
                       " after " + gate(id).toString() +
                       " since they share no qudit " + std::to_string(q);
      PLOG_ERROR << msg;
      throw std::invalid_argument(msg);
    }
    firsts.emplace_back(findFirstDescendantOnQudit(id, q));
  }

  if (child) {
    if (!isChild(id, *child)) {
      const auto msg = "Node " + std::to_string(*child) +
                       " is not a child of node " + std::to_string(id);
      PLOG_ERROR << msg;
      throw std::invalid_argument(msg);
    }
    for (const auto& f : firsts) {
      if (f != child) {
        const auto msg = "Node " + std::to_string(*child) +
                         " does not directly follow node " +
                         std::to_string(id) + " on the qudits of " +
                         gate(newNode).toString();
        PLOG_ERROR << msg;
        throw std::invalid_argument(msg);
      }
    }
  }

  addChild(id, newNode);
  for (const auto& f : firsts) {
    if (!f) {
      continue;
    }
    if (isChild(id, *f)) {
      removeChild(id, *f);
    }
    addChild(newNode, *f);
  }
}

NodeId Dag::insertSingleQuditGateAfter(const NodeId id,
                                       const circuit::Gate& g) {
  if (g.isTwoQuditGate()) {
    const auto msg = "Expected a single-qudit gate but got " + g.toString();
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  if (id != ROOT && !actsOn(id, g.getTarget())) {
    const auto msg = "Cannot insert " + g.toString() + " after " +
                     gate(id).toString() + " on a different qudit";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  const auto newNode = addNode(g);
  insertBetweenChild(id, newNode);
  return newNode;
}

NodeId Dag::insertSingleQuditGateBefore(const NodeId id,
                                        const circuit::Gate& g) {
  if (!actsOn(id, g.getTarget())) {
    const auto msg = "Cannot insert " + g.toString() + " before node " +
                     std::to_string(id) + " on a different qudit";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  return insertSingleQuditGateAfter(findFirstAncestorOnQudit(id, g.getTarget()),
                                    g);
}

NodeId Dag::insertTwoQuditGateAfter(const NodeId id, const circuit::Gate& g) {
  if (!g.isTwoQuditGate() || id == ROOT || !gate(id).isTwoQuditGate() ||
      !gate(id).sameQudits(g)) {
    const auto msg = "Cannot insert " + g.toString() +
                     " after node " + std::to_string(id) +
                     " as they do not act on the same qudit pair";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  const auto newNode = addNode(g);
  const auto oldChildren = nodes[id].children;
  for (const auto c : oldChildren) {
    removeChild(id, c);
    addChild(newNode, c);
  }
  addChild(id, newNode);
  return newNode;
}

bool Dag::isAdjacent(const NodeId id, const NodeId child) const {
  if (!isChild(id, child)) {
    return false;
  }
  return std::none_of(
      nodes[id].children.begin(), nodes[id].children.end(),
      [&](const NodeId c) { return c != child && isAncestor(c, child); });
}

void Dag::detach(const NodeId id) {
  const auto oldParents = nodes[id].parents;
  for (const auto p : oldParents) {
    removeChild(p, id);
  }
  const auto oldChildren = nodes[id].children;
  for (const auto c : oldChildren) {
    removeChild(id, c);
  }
}

std::vector<NodeId> Dag::splice(const std::vector<NodeId>& block,
                                const std::vector<NodeId>& replacement) {
  const auto inBlock = [&block](const NodeId id) {
    return std::find(block.begin(), block.end(), id) != block.end();
  };

  const auto order = topologicalOrder();
  std::vector<bool> isAnc(nodes.size(), false);
  std::vector<bool> isDesc(nodes.size(), false);
  std::vector<NodeId> formerChildren{};
  for (const auto b : block) {
    for (const auto a : ancestors(b)) {
      isAnc[a] = a != ROOT && !inBlock(a);
    }
    for (const auto d : descendants(b)) {
      isDesc[d] = !inBlock(d);
    }
    for (const auto c : nodes[b].children) {
      if (!inBlock(c)) {
        formerChildren.emplace_back(c);
      }
    }
  }
  for (NodeId id = 0; id < nodes.size(); ++id) {
    if (isAnc[id] && isDesc[id]) {
      const auto msg = "Cannot rewrite a block that is not convex";
      PLOG_ERROR << msg;
      throw std::invalid_argument(msg);
    }
  }

  std::vector<std::optional<NodeId>> pred(qudits);
  std::vector<std::optional<NodeId>> succ(qudits);
  for (const auto id : order) {
    for (const auto q : gate(id).qudits()) {
      if (isAnc[id]) {
        pred[q] = id;
      }
      if (isDesc[id] && !succ[q]) {
        succ[q] = id;
      }
    }
  }

  for (const auto b : block) {
    detach(b);
  }
  for (const auto b : block) {
    if (std::find(replacement.begin(), replacement.end(), b) ==
        replacement.end()) {
      nodes[b].removed = true;
      nodes[b].gate.reset();
      --liveNodes;
    }
  }

  for (Qudit q = 0; q < qudits; ++q) {
    auto last = pred[q];
    bool touched = false;
    for (const auto r : replacement) {
      if (!actsOn(r, q)) {
        continue;
      }
      if (last) {
        addChild(*last, r);
      }
      last = r;
      touched = true;
    }
    if (!succ[q]) {
      continue;
    }
    if (touched || pred[q]) {
      if (!isAncestor(*last, *succ[q])) {
        addChild(*last, *succ[q]);
      }
    }
  }

  std::vector<NodeId> orphans = replacement;
  orphans.insert(orphans.end(), formerChildren.begin(), formerChildren.end());
  for (const auto id : orphans) {
    if (nodes[id].parents.empty()) {
      addChild(ROOT, id);
    }
  }
  return replacement;
}

namespace {
void checkBlockSize(const std::vector<NodeId>& block) {
  if (block.empty() || block.size() > 2) {
    const auto msg = "A rewrite block consists of one or two nodes";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
}
} // namespace

std::vector<NodeId> Dag::substitute(const std::vector<NodeId>& block,
                                    const std::vector<circuit::Gate>& gates) {
  checkBlockSize(block);
  std::set<Qudit> blockQudits{};
  for (const auto b : block) {
    const auto qs = gate(b).qudits();
    blockQudits.insert(qs.begin(), qs.end());
  }
  if (block.size() == 2 && !isAdjacent(block[0], block[1])) {
    const auto msg = "Node " + std::to_string(block[1]) +
                     " does not directly follow node " +
                     std::to_string(block[0]);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  for (const auto& g : gates) {
    for (const auto q : g.qudits()) {
      if (blockQudits.count(q) == 0) {
        const auto msg = "Replacement gate " + g.toString() +
                         " acts outside of the rewritten block";
        PLOG_ERROR << msg;
        throw std::invalid_argument(msg);
      }
    }
  }

  std::vector<NodeId> replacement{};
  replacement.reserve(gates.size());
  for (const auto& g : gates) {
    replacement.emplace_back(addNode(g));
  }
  return splice(block, replacement);
}

void Dag::merge(const NodeId id, const NodeId child) {
  if (id == ROOT || !isAdjacent(id, child)) {
    const auto msg = "Node " + std::to_string(child) +
                     " cannot be merged into node " + std::to_string(id);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  splice({id, child}, {id});
}

void Dag::remove(const NodeId id) {
  if (id == ROOT) {
    const auto msg = "The root of the DAG cannot be removed";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  static_cast<void>(node(id));
  splice({id}, {});
}

std::vector<NodeId> Dag::topologicalOrder() const {
  using Entry = std::pair<std::size_t, NodeId>;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<>> ready{};
  std::vector<std::size_t> pending(nodes.size(), 0);
  for (NodeId id = 1; id < nodes.size(); ++id) {
    if (nodes[id].removed) {
      continue;
    }
    pending[id] = static_cast<std::size_t>(
        std::count_if(nodes[id].parents.begin(), nodes[id].parents.end(),
                      [](const NodeId p) { return p != ROOT; }));
    if (pending[id] == 0) {
      ready.emplace(nodes[id].gate->getIndex(), id);
    }
  }

  std::vector<NodeId> order{};
  order.reserve(liveNodes);
  while (!ready.empty()) {
    const auto current = ready.top().second;
    ready.pop();
    order.emplace_back(current);
    for (const auto c : nodes[current].children) {
      if (--pending[c] == 0) {
        ready.emplace(nodes[c].gate->getIndex(), c);
      }
    }
  }

  if (order.size() != liveNodes) {
    const auto msg = "The DAG contains a cycle";
    PLOG_FATAL << msg;
    throw std::logic_error(msg);
  }
  return order;
}

circuit::Circuit Dag::toCircuit(const std::string& name) const {
  circuit::Circuit qc(qudits, dim, name);
  for (const auto id : topologicalOrder()) {
    qc.addGate(gate(id));
  }
  return qc;
}

std::string Dag::toString() const {
  std::stringstream ss;
  ss << "Dag(" << qudits << " qudits, dim " << dim << ", " << liveNodes
     << " gates)\n";
  ss << "root ->";
  for (const auto c : nodes[ROOT].children) {
    ss << " " << c;
  }
  ss << "\n";
  for (const auto id : topologicalOrder()) {
    ss << id << ": " << gate(id).toString() << " ->";
    for (const auto c : nodes[id].children) {
      ss << " " << c;
    }
    ss << "\n";
  }
  return ss.str();
}
} // namespace clifford
