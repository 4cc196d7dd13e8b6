//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "zx/Simplify.hpp"

#include "zx/Rules.hpp"

#include <cstddef>
#include <plog/Log.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace zx {

namespace {
std::size_t interiorCliffordSimp(Graph& g) {
  std::size_t lc = 0;
  std::size_t pivots = 0;
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto v : g.vertices()) {
      if (applyLocalComplementation(g, v)) {
        ++lc;
        changed = true;
        break;
      }
    }
    if (changed) {
      continue;
    }
    for (const auto& [v, w] : g.edges()) {
      if (applyPivot(g, v, w)) {
        ++pivots;
        changed = true;
        break;
      }
    }
  }
  PLOG_DEBUG << "Local complementations: " << lc << ", pivots: " << pivots;
  return lc + pivots;
}

/// b - h - z becomes b - 1 - n - h - z
void insertSimpleBoundaryWire(Graph& g, const Vertex b, const Vertex z) {
  const auto e = g.edgeObject(b, z);
  g.removeEdge(b, z);
  const auto n = g.addVertex(VertexType::Z, g.qubit(b),
                             (g.row(b) + g.row(z)) / 2);
  g.addEdge(b, n, Edge(g.dim(), 0, 1));
  g.addEdge(n, z, e);
}
} // namespace

std::size_t toGh(Graph& g) {
  std::size_t count = 0;
  for (const auto v : g.vertices()) {
    if (applyXColorChange(g, v)) {
      ++count;
    }
  }
  return count;
}

std::size_t spiderSimp(Graph& g) {
  std::size_t fusions = 0;
  std::size_t parallel = 0;
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto& [v, w] : g.edges()) {
      if (applyZFusion(g, v, w)) {
        ++fusions;
        changed = true;
        break;
      }
      if (applyParallelEdgeRemoval(g, v, w)) {
        ++parallel;
        changed = true;
        break;
      }
    }
  }
  PLOG_DEBUG << "Spider fusions: " << fusions
             << ", parallel edge removals: " << parallel;
  return fusions + parallel;
}

std::size_t selfLoopSimp(Graph& g) {
  std::size_t count = 0;
  for (const auto v : g.vertices()) {
    if (applySelfLoopRemoval(g, v)) {
      ++count;
    }
  }
  return count;
}

bool isGraphLike(const Graph& g) {
  for (const auto v : g.vertices()) {
    const auto t = g.type(v);
    if (t == VertexType::X) {
      return false;
    }
    if (g.connected(v, v)) {
      return false;
    }
    if (t == VertexType::Boundary) {
      if (g.vertexDegree(v) != 1) {
        return false;
      }
      const auto n = g.neighbors(v).front();
      if (g.type(n) != VertexType::Z || !g.edgeObject(v, n).isSimple()) {
        return false;
      }
      continue;
    }
    std::size_t boundaries = 0;
    for (const auto n : g.neighbors(v)) {
      if (g.type(n) == VertexType::Boundary) {
        ++boundaries;
      } else if (!g.edgeObject(v, n).isHadamard()) {
        return false;
      }
    }
    if (boundaries > 1) {
      return false;
    }
  }
  return true;
}

void toGraphLike(Graph& g) {
  const auto d = g.dim();
  const auto colorChanges = toGh(g);
  const auto fused = spiderSimp(g);
  const auto loops = selfLoopSimp(g);

  // every Z spider keeps at most one boundary
  std::size_t split = 0;
  for (const auto v : g.vertices()) {
    if (!g.hasVertex(v) || g.type(v) != VertexType::Z) {
      continue;
    }
    std::vector<Vertex> bs;
    for (const auto n : g.neighbors(v)) {
      if (g.type(n) == VertexType::Boundary) {
        bs.emplace_back(n);
      }
    }
    for (std::size_t i = 1; i < bs.size(); ++i) {
      // b - e - v becomes b - e - z1 - H(-1) - z2 - H(1) - v
      const auto b = bs[i];
      const auto e = g.edgeObject(v, b);
      g.removeEdge(v, b);
      const auto z1 = g.addVertex(VertexType::Z, g.qubit(b), g.row(b));
      const auto z2 = g.addVertex(VertexType::Z, g.qubit(b),
                                  (g.row(b) + g.row(v)) / 2);
      g.addEdge(b, z1, e);
      g.addEdge(z1, z2, Edge(d, -1));
      g.addEdge(z2, v, Edge(d, 1));
      g.scalar().addPower(-2);
      ++split;
    }
  }

  // every boundary is attached to a Z spider through a simple edge
  std::size_t wires = 0;
  for (const auto b : g.vertices()) {
    if (!g.hasVertex(b) || g.type(b) != VertexType::Boundary ||
        g.vertexDegree(b) != 1) {
      continue;
    }
    const auto n = g.neighbors(b).front();
    const auto e = g.edgeObject(b, n);
    if (g.type(n) == VertexType::Z) {
      if (e.isHadamard()) {
        insertSimpleBoundaryWire(g, b, n);
        ++wires;
      }
      continue;
    }
    if (g.type(n) != VertexType::Boundary) {
      continue;
    }
    // a bare wire between two boundaries
    g.removeEdge(b, n);
    const auto r = (g.row(b) + g.row(n)) / 2;
    const auto z1 = g.addVertex(VertexType::Z, g.qubit(b), r);
    const auto z2 = g.addVertex(VertexType::Z, g.qubit(b), r);
    g.addEdge(b, z1, Edge(d, 0, 1));
    g.addEdge(z2, n, Edge(d, 0, 1));
    if (e.isHadamard()) {
      g.addEdge(z1, z2, e);
    } else {
      const auto z3 = g.addVertex(VertexType::Z, g.qubit(b), r);
      g.addEdge(z1, z3, Edge(d, 1));
      g.addEdge(z3, z2, Edge(d, -1));
      g.scalar().addPower(-2);
    }
    ++wires;
  }

  PLOG_INFO << "Graph-like form: " << colorChanges << " colour changes, "
            << fused << " fusions, " << loops << " self-loops, " << split
            << " boundary splits, " << wires << " boundary wires";
  if (!isGraphLike(g)) {
    const auto* const msg = "Graph is not graph-like after simplification";
    PLOG_FATAL << msg;
    PLOG_VERBOSE << g;
    throw std::logic_error(msg);
  }
}

void toApForm(Graph& g) {
  const auto count = interiorCliffordSimp(g);
  PLOG_INFO << "AP form reached after " << count << " rewrites";
}

void cliffordSimp(Graph& g) {
  toGraphLike(g);
  auto count = interiorCliffordSimp(g);
  std::size_t boundaryPivots = 0;
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto& [v, w] : g.edges()) {
      if (!checkBoundaryPivot(g, v, w)) {
        continue;
      }
      auto trial = g;
      applyBoundaryPivot(trial, v, w);
      const auto follow = interiorCliffordSimp(trial);
      if (trial.numVertices() < g.numVertices()) {
        g = std::move(trial);
        count += follow + 1;
        ++boundaryPivots;
        changed = true;
        break;
      }
    }
  }
  PLOG_INFO << "Clifford simplification: " << count << " rewrites ("
            << boundaryPivots << " boundary pivots)";
}

} // namespace zx
