//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "zx/Graph.hpp"

#include "zx/Modular.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <plog/Log.h>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace zx {

Graph::Graph(const Integer dim) : d(dim), globalScalar(dim) {
  validateDimension(dim);
}

const Graph::VertexData& Graph::data(const Vertex v) const {
  const auto it = vertexData.find(v);
  if (it == vertexData.end()) {
    const auto msg = "Vertex " + std::to_string(v) + " is not in the graph";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  return it->second;
}

Graph::VertexData& Graph::data(const Vertex v) {
  return const_cast<VertexData&>(static_cast<const Graph&>(*this).data(v));
}

Vertex Graph::addVertex(const VertexType type, const double qubit,
                        const double row,
                        const std::optional<CliffordPhase>& phase) {
  const auto v = nextVertex++;
  auto p = phase.value_or(CliffordPhase(d));
  if (p.dim() != d) {
    const auto msg = "Phase of dimension " + std::to_string(p.dim()) +
                     " does not match graph of dimension " + std::to_string(d);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  if (type == VertexType::Boundary) {
    p = CliffordPhase(d);
  }
  vertexData.emplace(v, VertexData{type, p, qubit, row});
  adjacency[v];
  return v;
}

std::vector<Vertex> Graph::addVertices(const std::size_t n) {
  std::vector<Vertex> added;
  added.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    added.emplace_back(addVertex(VertexType::Z));
  }
  return added;
}

void Graph::storeEdge(const Vertex v, const Vertex w, const Edge& edge) {
  auto& adjV = adjacency.at(v);
  const bool existed = adjV.find(w) != adjV.end();
  if (!edge.isPresent()) {
    if (existed) {
      adjV.erase(w);
      adjacency.at(w).erase(v);
      --nEdges;
    }
    return;
  }
  if (!existed) {
    ++nEdges;
  }
  adjV.insert_or_assign(w, edge);
  adjacency.at(w).insert_or_assign(v, edge);
}

std::optional<std::string> Graph::edgeInsertionError(const Vertex v,
                                                     const Vertex w,
                                                     const Edge& edge) const {
  if (!hasVertex(v) || !hasVertex(w)) {
    return "Cannot add an edge between " + std::to_string(v) + " and " +
           std::to_string(w) + ": unknown vertex";
  }
  if (edge.dim() != d) {
    return "Edge of dimension " + std::to_string(edge.dim()) +
           " does not match graph of dimension " + std::to_string(d);
  }
  if (!edge.isPresent()) {
    return std::nullopt;
  }
  const auto t1 = type(v);
  const auto t2 = type(w);
  const auto old = edgeObject(v, w);
  if (t1 == VertexType::Boundary || t2 == VertexType::Boundary) {
    if (old.isPresent()) {
      return "Trying to add an edge to a boundary while there is already an "
             "edge present";
    }
    if (!edge.isSingle()) {
      return "Cannot add compound edge " + edge.toString() +
             " to a boundary vertex";
    }
    return std::nullopt;
  }
  if (t1 == VertexType::Z && t2 == VertexType::Z) {
    return std::nullopt;
  }
  if (!edge.isReduced()) {
    return "Compound edge " + edge.toString() +
           " is not supported between these spiders";
  }
  if (t1 == VertexType::X && t2 == VertexType::X) {
    if ((edge.isHadamard() && old.isSimple()) ||
        (edge.isSimple() && old.isHadamard())) {
      return "Mixing Hadamard and simple edges between X spiders is not "
             "supported";
    }
    return std::nullopt;
  }
  if ((edge.isSimple() && old.isHadamard()) ||
      (edge.isHadamard() && old.isSimple())) {
    return "Mixing Hadamard and simple edges between a Z and an X spider is "
           "not supported";
  }
  return std::nullopt;
}

bool Graph::canAddEdge(const Vertex v, const Vertex w, const Edge& edge) const {
  return !edgeInsertionError(v, w, edge).has_value();
}

void Graph::addEdge(const Vertex v, const Vertex w, const Edge& edge) {
  if (const auto error = edgeInsertionError(v, w, edge); error.has_value()) {
    PLOG_ERROR << *error;
    throw std::invalid_argument(*error);
  }
  if (!edge.isPresent()) {
    return;
  }
  const auto t1 = type(v);
  const auto t2 = type(w);
  const auto old = edgeObject(v, w);

  if (t1 == VertexType::Boundary || t2 == VertexType::Boundary) {
    storeEdge(v, w, edge);
    return;
  }
  if (t1 == VertexType::Z && t2 == VertexType::Z) {
    if (edge.simple() != 0 || old.simple() != 0) {
      // the spiders fuse, Hadamard wires in parallel become a phase
      const auto h = mod(old.had() + edge.had(), d);
      addToPhase(v, CliffordPhase(d, 0, 2 * h));
      storeEdge(v, w, Edge(d, 0, 1));
      return;
    }
    storeEdge(v, w, Edge(d, old.had() + edge.had(), 0));
    return;
  }
  if (t1 == VertexType::X && t2 == VertexType::X) {
    if (edge.isHadamard()) {
      storeEdge(v, w, Edge(d, old.had() + edge.had(), 0));
    } else {
      storeEdge(v, w, Edge(d, 0, 1));
    }
    return;
  }
  // one Z and one X spider
  if (edge.isSimple()) {
    storeEdge(v, w, Edge(d, 0, old.simple() + edge.simple()));
  } else {
    storeEdge(v, w, Edge(d, 1, 0));
  }
}

void Graph::removeEdge(const Vertex v, const Vertex w) {
  if (!connected(v, w)) {
    const auto msg = "No edge between " + std::to_string(v) + " and " +
                     std::to_string(w);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  storeEdge(v, w, Edge(d));
}

void Graph::removeVertex(const Vertex v) {
  static_cast<void>(data(v));
  for (const auto& [n, e] : adjacency.at(v)) {
    static_cast<void>(e);
    if (n != v) {
      adjacency.at(n).erase(v);
    }
    --nEdges;
  }
  adjacency.erase(v);
  vertexData.erase(v);
  ins.erase(std::remove(ins.begin(), ins.end(), v), ins.end());
  outs.erase(std::remove(outs.begin(), outs.end(), v), outs.end());
}

void Graph::removeVertices(const std::vector<Vertex>& vs) {
  for (const auto v : vs) {
    removeVertex(v);
  }
}

std::vector<Vertex> Graph::neighbors(const Vertex v) const {
  static_cast<void>(data(v));
  std::vector<Vertex> result;
  const auto& adj = adjacency.at(v);
  result.reserve(adj.size());
  for (const auto& [n, e] : adj) {
    static_cast<void>(e);
    result.emplace_back(n);
  }
  return result;
}

std::size_t Graph::vertexDegree(const Vertex v) const {
  static_cast<void>(data(v));
  return adjacency.at(v).size();
}

std::vector<std::pair<Vertex, Vertex>>
Graph::incidentEdges(const Vertex v) const {
  std::vector<std::pair<Vertex, Vertex>> result;
  for (const auto n : neighbors(v)) {
    result.emplace_back(std::min(v, n), std::max(v, n));
  }
  return result;
}

bool Graph::connected(const Vertex v, const Vertex w) const {
  const auto it = adjacency.find(v);
  return it != adjacency.end() && it->second.find(w) != it->second.end();
}

Edge Graph::edgeObject(const Vertex v, const Vertex w) const {
  const auto it = adjacency.find(v);
  if (it == adjacency.end()) {
    return Edge(d);
  }
  const auto eit = it->second.find(w);
  if (eit == it->second.end()) {
    return Edge(d);
  }
  return eit->second;
}

void Graph::setEdgeObject(const Vertex v, const Vertex w, const Edge& edge) {
  static_cast<void>(data(v));
  static_cast<void>(data(w));
  storeEdge(v, w, edge);
}

VertexType Graph::type(const Vertex v) const { return data(v).type; }

void Graph::setType(const Vertex v, const VertexType type) {
  auto& vd = data(v);
  vd.type = type;
  if (type == VertexType::Boundary) {
    vd.phase = CliffordPhase(d);
  }
}

CliffordPhase Graph::phase(const Vertex v) const { return data(v).phase; }

void Graph::setPhase(const Vertex v, const CliffordPhase& phase) {
  auto& vd = data(v);
  if (vd.type == VertexType::Boundary && !phase.isZero()) {
    const auto msg =
        "Boundary vertex " + std::to_string(v) + " cannot carry a phase";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  if (phase.dim() != d) {
    const auto msg = "Phase of dimension " + std::to_string(phase.dim()) +
                     " does not match graph of dimension " + std::to_string(d);
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  vd.phase = phase;
}

void Graph::addToPhase(const Vertex v, const CliffordPhase& phase) {
  setPhase(v, data(v).phase + phase);
}

double Graph::qubit(const Vertex v) const { return data(v).qubit; }
void Graph::setQubit(const Vertex v, const double q) { data(v).qubit = q; }
double Graph::row(const Vertex v) const { return data(v).row; }
void Graph::setRow(const Vertex v, const double r) { data(v).row = r; }

std::vector<Vertex> Graph::vertices() const {
  std::vector<Vertex> result;
  result.reserve(vertexData.size());
  for (const auto& [v, vd] : vertexData) {
    static_cast<void>(vd);
    result.emplace_back(v);
  }
  return result;
}

std::vector<std::pair<Vertex, Vertex>> Graph::edges() const {
  std::vector<std::pair<Vertex, Vertex>> result;
  result.reserve(nEdges);
  for (const auto& [v, adj] : adjacency) {
    for (const auto& [w, e] : adj) {
      static_cast<void>(e);
      if (v <= w) {
        result.emplace_back(v, w);
      }
    }
  }
  return result;
}

void Graph::setInputs(std::vector<Vertex> inputs) {
  for (const auto v : inputs) {
    static_cast<void>(data(v));
  }
  ins = std::move(inputs);
}

void Graph::setOutputs(std::vector<Vertex> outputs) {
  for (const auto v : outputs) {
    static_cast<void>(data(v));
  }
  outs = std::move(outputs);
}

double Graph::depth() const {
  double maxRow = -1;
  for (const auto& [v, vd] : vertexData) {
    static_cast<void>(v);
    maxRow = std::max(maxRow, vd.row);
  }
  return maxRow;
}

std::size_t Graph::qubitCount() const {
  double maxQubit = -1;
  for (const auto& [v, vd] : vertexData) {
    static_cast<void>(v);
    maxQubit = std::max(maxQubit, vd.qubit);
  }
  return static_cast<std::size_t>(std::floor(maxQubit) + 1);
}

Graph Graph::copy(const bool adjoint) const {
  Graph g(d);
  g.globalScalar = globalScalar;
  if (adjoint) {
    g.globalScalar.conjugate();
  }
  const auto maxRow = depth();
  std::unordered_map<Vertex, Vertex> table;
  for (const auto& [v, vd] : vertexData) {
    const auto r = adjoint ? maxRow - vd.row : vd.row;
    table[v] = g.addVertex(vd.type, vd.qubit, r,
                           adjoint ? vd.phase.adjoint() : vd.phase);
  }
  for (const auto& [v, w] : edges()) {
    const auto e = edgeObject(v, w);
    g.storeEdge(table.at(v), table.at(w),
                adjoint ? Edge(d, -e.had(), e.simple()) : e);
  }
  std::vector<Vertex> newIns;
  std::vector<Vertex> newOuts;
  for (const auto v : ins) {
    newIns.emplace_back(table.at(v));
  }
  for (const auto v : outs) {
    newOuts.emplace_back(table.at(v));
  }
  if (adjoint) {
    std::swap(newIns, newOuts);
  }
  g.ins = std::move(newIns);
  g.outs = std::move(newOuts);
  return g;
}

std::size_t Graph::removeIsolatedVertices() {
  std::set<Vertex> rem;
  for (const auto v : vertices()) {
    if (rem.count(v) != 0) {
      continue;
    }
    const auto deg = vertexDegree(v);
    if (deg == 0) {
      if (type(v) == VertexType::Boundary) {
        const auto* const msg = "Diagram is not a well-typed ZX-diagram: "
                                "contains isolated boundary vertex";
        PLOG_FATAL << msg;
        throw std::runtime_error(msg);
      }
      globalScalar.addNode(phase(v));
      rem.insert(v);
      continue;
    }
    if (deg != 1 || type(v) == VertexType::Boundary) {
      continue;
    }
    const auto w = adjacency.at(v).begin()->first;
    if (w == v || vertexDegree(w) > 1 || type(w) == VertexType::Boundary) {
      continue;
    }
    // v and w are only connected to each other
    const auto e = edgeObject(v, w);
    const bool bothZ = type(v) == VertexType::Z && type(w) == VertexType::Z;
    if (bothZ && e.isHadamard() && e.had() == 1 && phase(v).isPauli()) {
      globalScalar.addSpiderPair(phase(v), phase(w));
    } else if (bothZ && e.isHadamard() && e.had() == 1 &&
               phase(w).isPauli()) {
      globalScalar.addSpiderPair(phase(w), phase(v));
    } else if (type(v) == type(w) && e.isSimple()) {
      globalScalar.addNode(phase(v) + phase(w));
    } else {
      globalScalar.setUnknown();
    }
    rem.insert(v);
    rem.insert(w);
  }
  removeVertices(std::vector<Vertex>(rem.begin(), rem.end()));
  return rem.size();
}

nlohmann::basic_json<> Graph::json() const {
  nlohmann::basic_json<> j;
  j["dim"] = d;
  auto vs = nlohmann::basic_json<>::array();
  for (const auto& [v, vd] : vertexData) {
    nlohmann::basic_json<> vj;
    vj["id"] = v;
    vj["type"] = zx::toString(vd.type);
    vj["qubit"] = vd.qubit;
    vj["row"] = vd.row;
    vj["phase"] = vd.phase.json();
    vs.push_back(vj);
  }
  j["vertices"] = vs;
  auto es = nlohmann::basic_json<>::array();
  for (const auto& [v, w] : edges()) {
    auto ej = edgeObject(v, w).json();
    ej["source"] = v;
    ej["target"] = w;
    es.push_back(ej);
  }
  j["edges"] = es;
  j["inputs"] = ins;
  j["outputs"] = outs;
  j["scalar"] = globalScalar.json();
  return j;
}

Graph Graph::fromJson(const nlohmann::basic_json<>& j) {
  Graph g(j.at("dim").get<Integer>());
  std::unordered_map<Vertex, Vertex> table;
  for (const auto& vj : j.at("vertices")) {
    std::optional<CliffordPhase> p;
    if (vj.contains("phase")) {
      const auto& pj = vj.at("phase");
      p = CliffordPhase(g.d, pj.at(0).get<Integer>(), pj.at(1).get<Integer>());
    }
    table[vj.at("id").get<Vertex>()] =
        g.addVertex(vertexTypeFromString(vj.at("type").get<std::string>()),
                    vj.value("qubit", -1.), vj.value("row", -1.), p);
  }
  for (const auto& ej : j.at("edges")) {
    g.addEdge(table.at(ej.at("source").get<Vertex>()),
              table.at(ej.at("target").get<Vertex>()),
              Edge(g.d, ej.value("had", Integer{0}),
                   ej.value("simple", Integer{0})));
  }
  std::vector<Vertex> inputs;
  std::vector<Vertex> outputs;
  for (const auto& v : j.value("inputs", std::vector<Vertex>{})) {
    inputs.emplace_back(table.at(v));
  }
  for (const auto& v : j.value("outputs", std::vector<Vertex>{})) {
    outputs.emplace_back(table.at(v));
  }
  g.setInputs(std::move(inputs));
  g.setOutputs(std::move(outputs));
  return g;
}

std::string Graph::toString() const {
  std::stringstream ss;
  ss << "Graph(dim=" << d << ", " << numVertices() << " vertices, "
     << numEdges() << " edges)\n";
  for (const auto& [v, vd] : vertexData) {
    ss << "  " << v << ": " << zx::toString(vd.type);
    if (vd.type != VertexType::Boundary) {
      ss << " " << vd.phase;
    }
    ss << " ->";
    for (const auto& [w, e] : adjacency.at(v)) {
      ss << " " << w << e;
    }
    ss << "\n";
  }
  return ss.str();
}

} // namespace zx
