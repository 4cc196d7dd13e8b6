//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "zx/Rules.hpp"

#include "zx/Modular.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace zx {

namespace {
/// All neighbours of `v` other than `except` are Z spiders connected to `v`
/// through Hadamard edges, and `v` has no self-loop.
bool hasOnlyHadamardZNeighbors(const Graph& g, const Vertex v,
                               const std::optional<Vertex>& except) {
  for (const auto n : g.neighbors(v)) {
    if (except.has_value() && n == *except) {
      continue;
    }
    if (n == v || g.type(n) != VertexType::Z ||
        !g.edgeObject(v, n).isHadamard()) {
      return false;
    }
  }
  return true;
}

std::vector<Vertex> boundaryNeighbors(const Graph& g, const Vertex v) {
  std::vector<Vertex> result;
  for (const auto n : g.neighbors(v)) {
    if (g.type(n) == VertexType::Boundary) {
      result.emplace_back(n);
    }
  }
  return result;
}

bool isPivotPair(const Graph& g, const Vertex v1, const Vertex v2) {
  if (v1 == v2 || !g.hasVertex(v1) || !g.hasVertex(v2)) {
    return false;
  }
  if (g.type(v1) != VertexType::Z || g.type(v2) != VertexType::Z) {
    return false;
  }
  const auto e = g.edgeObject(v1, v2);
  if (!e.isHadamard() || !isInvertible(e.had(), g.dim())) {
    return false;
  }
  return g.phase(v1).isPauli() && g.phase(v2).isPauli();
}

/// The edge replacing the path n1 - v - n2 when `v` is eliminated.
std::optional<Edge> composedEdge(const Graph& g, const Vertex v,
                                 const Vertex n1, const Vertex n2) {
  const auto d = g.dim();
  const auto e1 = g.edgeObject(n1, v);
  const auto e2 = g.edgeObject(v, n2);
  if (!e1.isSingle() || !e2.isSingle()) {
    return std::nullopt;
  }
  if (e1.isHadamard() && e2.isSimple()) {
    return Edge(d, e1.had() * e2.simple());
  }
  if (e1.isSimple() && e2.isHadamard()) {
    return Edge(d, e1.simple() * e2.had());
  }
  if (e1.isHadamard() && e2.isHadamard()) {
    if (mod(e1.had() + e2.had(), d) == 0 && isInvertible(e1.had(), d)) {
      return Edge(d, 0, 1);
    }
    return std::nullopt;
  }
  // both simple
  const auto outer = [&g](const Vertex n) {
    return g.type(n) == VertexType::X || g.type(n) == VertexType::Boundary;
  };
  if (!outer(n1) || !outer(n2)) {
    return std::nullopt;
  }
  const auto inv = modInverse(e2.simple(), d);
  if (inv.has_value() && e1.simple() == *inv) {
    return Edge(d, 1);
  }
  return std::nullopt;
}

struct BoundaryPivotMatch {
  Vertex outer;
  Vertex inner;
  Vertex boundary;
};

std::optional<BoundaryPivotMatch>
matchBoundaryPivot(const Graph& g, const Vertex v1, const Vertex v2) {
  if (!isPivotPair(g, v1, v2)) {
    return std::nullopt;
  }
  const auto b1 = boundaryNeighbors(g, v1);
  const auto b2 = boundaryNeighbors(g, v2);
  BoundaryPivotMatch m{v1, v2, 0};
  if (b1.size() == 1 && b2.empty()) {
    m.boundary = b1.front();
  } else if (b2.size() == 1 && b1.empty()) {
    m = {v2, v1, b2.front()};
  } else {
    return std::nullopt;
  }
  for (const auto n : g.neighbors(m.outer)) {
    if (n == m.inner || n == m.boundary) {
      continue;
    }
    if (n == m.outer || g.type(n) != VertexType::Z ||
        !g.edgeObject(m.outer, n).isHadamard()) {
      return std::nullopt;
    }
  }
  if (!hasOnlyHadamardZNeighbors(g, m.inner, m.outer)) {
    return std::nullopt;
  }
  return m;
}
} // namespace

bool checkXColorChange(const Graph& g, const Vertex v) {
  return g.hasVertex(v) && g.type(v) == VertexType::X;
}

bool applyXColorChange(Graph& g, const Vertex v) {
  if (!checkXColorChange(g, v)) {
    return false;
  }
  const auto d = g.dim();
  // neighbour colours are taken before `v` changes its own
  std::vector<std::pair<Vertex, VertexType>> neighborTypes;
  for (const auto n : g.neighbors(v)) {
    const auto e = g.edgeObject(v, n);
    if (!e.isReduced()) {
      std::stringstream ss;
      ss << "The edge between vertex " << v << " and " << n
         << " needs to be reduced before a colour change, got " << e;
      PLOG_ERROR << ss.str();
      throw std::invalid_argument(ss.str());
    }
    neighborTypes.emplace_back(n, g.type(n));
  }

  g.setType(v, VertexType::Z);
  for (const auto& [n, t] : neighborTypes) {
    const auto e = g.edgeObject(v, n);
    if (e.isHadamard() && (t == VertexType::Z || t == VertexType::Boundary)) {
      g.removeEdge(v, n);
      const auto helper =
          g.addVertex(VertexType::Z, (g.qubit(v) + g.qubit(n)) / 2,
                      (g.row(v) + g.row(n)) / 2);
      g.addEdge(v, helper, Edge(d, 1));
      g.addEdge(helper, n, Edge(d, e.had()));
    } else if (e.isHadamard()) {
      g.setEdgeObject(v, n, Edge(d, 0, -e.had()));
    } else {
      g.setEdgeObject(v, n, Edge(d, e.simple(), 0));
    }
  }
  return true;
}

bool checkZFusion(const Graph& g, const Vertex v1, const Vertex v2) {
  if (v1 == v2 || !g.hasVertex(v1) || !g.hasVertex(v2)) {
    return false;
  }
  if (g.type(v1) != VertexType::Z || g.type(v2) != VertexType::Z ||
      !g.edgeObject(v1, v2).isSimple()) {
    return false;
  }
  // every edge of v2 has to be transferable to v1
  for (const auto n : g.neighbors(v2)) {
    if (n == v1) {
      continue;
    }
    const auto target = n == v2 ? v1 : n;
    if (!g.canAddEdge(v1, target, g.edgeObject(v2, n))) {
      return false;
    }
  }
  return true;
}

bool applyZFusion(Graph& g, const Vertex v1, const Vertex v2) {
  if (!checkZFusion(g, v1, v2)) {
    return false;
  }
  g.addToPhase(v1, g.phase(v2));
  std::vector<std::pair<Vertex, Edge>> moved;
  for (const auto n : g.neighbors(v2)) {
    if (n != v1) {
      moved.emplace_back(n == v2 ? v1 : n, g.edgeObject(v2, n));
    }
  }
  g.removeVertex(v2);
  for (const auto& [n, e] : moved) {
    g.addEdge(v1, n, e);
  }
  return true;
}

bool checkZElimination(const Graph& g, const Vertex v) {
  if (!g.hasVertex(v) || g.type(v) != VertexType::Z ||
      g.vertexDegree(v) != 2 || !g.phase(v).isZero()) {
    return false;
  }
  const auto ns = g.neighbors(v);
  if (ns[0] == v || ns[1] == v) {
    return false;
  }
  const auto e = composedEdge(g, v, ns[0], ns[1]);
  return e.has_value() && g.canAddEdge(ns[0], ns[1], *e);
}

bool applyZElimination(Graph& g, const Vertex v) {
  if (!checkZElimination(g, v)) {
    return false;
  }
  const auto ns = g.neighbors(v);
  const auto e1 = g.edgeObject(ns[0], v);
  const auto e2 = g.edgeObject(v, ns[1]);
  const auto e = *composedEdge(g, v, ns[0], ns[1]);
  if (e1.isHadamard() && e2.isHadamard()) {
    // H(h) H(-h) is dim times the identity
    g.scalar().addPower(2);
  }
  g.removeVertex(v);
  g.addEdge(ns[0], ns[1], e);
  return true;
}

bool checkParallelEdgeRemoval(const Graph& g, const Vertex v1,
                              const Vertex v2) {
  if (v1 == v2 || !g.hasVertex(v1) || !g.hasVertex(v2)) {
    return false;
  }
  if (g.type(v1) != VertexType::Z || g.type(v2) != VertexType::Z) {
    return false;
  }
  const auto e = g.edgeObject(v1, v2);
  return e.isPresent() && !e.isReduced();
}

bool applyParallelEdgeRemoval(Graph& g, const Vertex v1, const Vertex v2) {
  if (!checkParallelEdgeRemoval(g, v1, v2)) {
    return false;
  }
  const auto d = g.dim();
  const auto e = g.edgeObject(v1, v2);
  g.addToPhase(v1, CliffordPhase(d, 0, 2 * e.had()));
  g.setEdgeObject(v1, v2, Edge(d, 0, 1));
  if (!applyZFusion(g, v1, v2)) {
    // the spiders stay connected by a plain edge
    PLOG_DEBUG << "Parallel edges between " << v1 << " and " << v2
               << " reduced without fusing";
  }
  return true;
}

bool checkSelfLoopRemoval(const Graph& g, const Vertex v) {
  return g.hasVertex(v) && g.type(v) == VertexType::Z && g.connected(v, v);
}

bool applySelfLoopRemoval(Graph& g, const Vertex v) {
  if (!checkSelfLoopRemoval(g, v)) {
    return false;
  }
  const auto e = g.edgeObject(v, v);
  if (e.had() != 0) {
    g.addToPhase(v, CliffordPhase(g.dim(), 0, 2 * e.had()));
  }
  g.removeEdge(v, v);
  return true;
}

bool checkLocalComplementation(const Graph& g, const Vertex v) {
  return g.hasVertex(v) && g.type(v) == VertexType::Z &&
         g.phase(v).isStrictlyClifford() &&
         hasOnlyHadamardZNeighbors(g, v, std::nullopt);
}

bool applyLocalComplementation(Graph& g, const Vertex v) {
  if (!checkLocalComplementation(g, v)) {
    return false;
  }
  const auto d = g.dim();
  const auto p = g.phase(v);
  const auto a = p.x();
  const auto zInv = requireInverse(p.y(), d);
  const auto ns = g.neighbors(v);
  std::vector<Integer> weights;
  weights.reserve(ns.size());
  for (const auto n : ns) {
    weights.emplace_back(g.edgeObject(v, n).had());
  }

  for (std::size_t i = 0; i < ns.size(); ++i) {
    const auto e = weights[i];
    g.addToPhase(ns[i], CliffordPhase(d, -zInv * mod(a * e, d),
                                      -zInv * mod(e * e, d)));
  }
  for (std::size_t i = 0; i < ns.size(); ++i) {
    for (std::size_t j = i + 1; j < ns.size(); ++j) {
      g.addEdge(ns[i], ns[j],
                Edge(d, -zInv * mod(weights[i] * weights[j], d)));
    }
  }
  g.scalar().addGaussSum(p);
  g.removeVertex(v);
  return true;
}

bool checkPivot(const Graph& g, const Vertex v1, const Vertex v2) {
  return isPivotPair(g, v1, v2) && hasOnlyHadamardZNeighbors(g, v1, v2) &&
         hasOnlyHadamardZNeighbors(g, v2, v1);
}

bool applyPivot(Graph& g, const Vertex v1, const Vertex v2) {
  if (!checkPivot(g, v1, v2)) {
    return false;
  }
  const auto d = g.dim();
  const auto wInv = requireInverse(g.edgeObject(v1, v2).had(), d);
  const auto a = g.phase(v1).x();
  const auto b = g.phase(v2).x();

  std::vector<Vertex> ns;
  for (const auto n : g.neighbors(v1)) {
    if (n != v2) {
      ns.emplace_back(n);
    }
  }
  for (const auto n : g.neighbors(v2)) {
    if (n != v1 && std::find(ns.begin(), ns.end(), n) == ns.end()) {
      ns.emplace_back(n);
    }
  }
  std::vector<Integer> e1;
  std::vector<Integer> e2;
  for (const auto n : ns) {
    e1.emplace_back(g.edgeObject(v1, n).had());
    e2.emplace_back(g.edgeObject(v2, n).had());
  }

  for (std::size_t i = 0; i < ns.size(); ++i) {
    const auto x = -wInv * mod((b * e1[i]) + (a * e2[i]), d);
    const auto y = -2 * wInv * mod(e1[i] * e2[i], d);
    g.addToPhase(ns[i], CliffordPhase(d, x, y));
  }
  for (std::size_t i = 0; i < ns.size(); ++i) {
    for (std::size_t j = i + 1; j < ns.size(); ++j) {
      const auto w = mod((e1[i] * e2[j]) + (e1[j] * e2[i]), d);
      if (w != 0) {
        g.addEdge(ns[i], ns[j], Edge(d, -wInv * w));
      }
    }
  }

  auto& scalar = g.scalar();
  scalar.addPower(2);
  if (const auto quarter = modInverse(4, d); quarter.has_value()) {
    scalar.addOmegaPower(-wInv * (*quarter * mod(a * b, d) % d));
  } else {
    scalar.setUnknown();
  }
  g.removeVertex(v1);
  g.removeVertex(v2);
  return true;
}

bool checkBoundaryPivot(const Graph& g, const Vertex v1, const Vertex v2) {
  return matchBoundaryPivot(g, v1, v2).has_value();
}

bool applyBoundaryPivot(Graph& g, const Vertex v1, const Vertex v2) {
  const auto match = matchBoundaryPivot(g, v1, v2);
  if (!match.has_value()) {
    return false;
  }
  const auto d = g.dim();
  const auto [outer, inner, b] = *match;

  // b - e - outer becomes b - e - z1 - H(1) - z2 - H(-1) - outer
  const auto e = g.edgeObject(outer, b);
  g.removeEdge(outer, b);
  const auto q = g.qubit(b);
  const auto r = g.row(b);
  const auto z1 = g.addVertex(VertexType::Z, q, (2 * r + g.row(outer)) / 3);
  const auto z2 = g.addVertex(VertexType::Z, q, (r + 2 * g.row(outer)) / 3);
  g.addEdge(b, z1, e);
  g.addEdge(z1, z2, Edge(d, 1));
  g.addEdge(z2, outer, Edge(d, -1));
  g.scalar().addPower(-2);

  if (!applyPivot(g, outer, inner)) {
    const auto* const msg =
        "Pivot not applicable after unfusing the boundary wire";
    PLOG_FATAL << msg;
    throw std::logic_error(msg);
  }
  return true;
}

} // namespace zx
