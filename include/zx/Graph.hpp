//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Definitions.hpp"
#include "zx/Edge.hpp"
#include "zx/Phase.hpp"
#include "zx/Scalar.hpp"

#include <cstddef>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace zx {

/**
 * @brief A qudit ZX-diagram.
 * @details Vertices are identified by handles that are never reused during
 * the lifetime of a graph. Between each pair of vertices there is at most
 * one Edge. Inserting an edge combines it with the existing one according to
 * the colours of the endpoints (see addEdge).
 */
class Graph {
public:
  explicit Graph(Integer dim);

  [[nodiscard]] Integer dim() const { return d; }

  Vertex addVertex(VertexType type, double qubit = -1, double row = -1,
                   const std::optional<CliffordPhase>& phase = std::nullopt);
  /// Adds `n` Z spiders with zero phase.
  std::vector<Vertex> addVertices(std::size_t n);

  /**
   * @brief Adds `edge` to the existing edge between `v` and `w`.
   * @details
   * - Boundary: only a single edge is allowed and it must not be compound.
   * - Z-Z: a simple component on either side fuses the spiders. The summed
   *   Hadamard weight h moves into the phase of `v` as (0, 2h) and the edge
   *   becomes a single simple edge. Otherwise Hadamard weights are summed.
   * - X-X: Hadamard weights are summed, simple edges collapse to weight 1.
   * - Z-X: simple weights are summed, Hadamard edges collapse to weight 1.
   * An edge whose weights sum to zero is removed.
   * @throws std::invalid_argument for combinations that cannot be expressed
   */
  void addEdge(Vertex v, Vertex w, const Edge& edge);
  /// Whether addEdge would succeed for the given arguments.
  [[nodiscard]] bool canAddEdge(Vertex v, Vertex w, const Edge& edge) const;
  void removeEdge(Vertex v, Vertex w);

  void removeVertex(Vertex v);
  void removeVertices(const std::vector<Vertex>& vs);

  [[nodiscard]] bool hasVertex(Vertex v) const {
    return vertexData.find(v) != vertexData.end();
  }
  /// Snapshot of the neighbours of `v` (including `v` itself for self-loops).
  [[nodiscard]] std::vector<Vertex> neighbors(Vertex v) const;
  /// Number of neighbours; a self-loop counts once.
  [[nodiscard]] std::size_t vertexDegree(Vertex v) const;
  [[nodiscard]] std::vector<std::pair<Vertex, Vertex>>
  incidentEdges(Vertex v) const;
  [[nodiscard]] bool connected(Vertex v, Vertex w) const;
  /// The edge between `v` and `w`; an edge without weights if there is none.
  [[nodiscard]] Edge edgeObject(Vertex v, Vertex w) const;
  /// Overwrites the edge between `v` and `w` without any combination rules.
  void setEdgeObject(Vertex v, Vertex w, const Edge& edge);

  [[nodiscard]] VertexType type(Vertex v) const;
  void setType(Vertex v, VertexType type);
  [[nodiscard]] CliffordPhase phase(Vertex v) const;
  void setPhase(Vertex v, const CliffordPhase& phase);
  void addToPhase(Vertex v, const CliffordPhase& phase);
  [[nodiscard]] double qubit(Vertex v) const;
  void setQubit(Vertex v, double q);
  [[nodiscard]] double row(Vertex v) const;
  void setRow(Vertex v, double r);

  [[nodiscard]] std::vector<Vertex> vertices() const;
  /// All edges as pairs (v, w) with v <= w.
  [[nodiscard]] std::vector<std::pair<Vertex, Vertex>> edges() const;
  [[nodiscard]] std::size_t numVertices() const { return vertexData.size(); }
  [[nodiscard]] std::size_t numEdges() const { return nEdges; }

  [[nodiscard]] const std::vector<Vertex>& inputs() const { return ins; }
  [[nodiscard]] const std::vector<Vertex>& outputs() const { return outs; }
  void setInputs(std::vector<Vertex> inputs);
  void setOutputs(std::vector<Vertex> outputs);
  [[nodiscard]] std::size_t numInputs() const { return ins.size(); }
  [[nodiscard]] std::size_t numOutputs() const { return outs.size(); }

  /// Highest row of any vertex, -1 if the graph is empty.
  [[nodiscard]] double depth() const;
  /// One more than the highest qubit index of any vertex.
  [[nodiscard]] std::size_t qubitCount() const;

  [[nodiscard]] Scalar& scalar() { return globalScalar; }
  [[nodiscard]] const Scalar& scalar() const { return globalScalar; }

  /**
   * @brief Copy of the graph with consecutive vertex handles.
   * @param adjoint if set, phases and Hadamard weights are negated, rows are
   * mirrored, inputs and outputs swapped and the scalar is conjugated
   */
  [[nodiscard]] Graph copy(bool adjoint = false) const;

  /**
   * @brief Removes spiders without neighbours and pairs of spiders that are
   * only connected to each other, folding their value into the scalar.
   * @return the number of removed vertices
   * @throws std::runtime_error if a boundary vertex is isolated
   */
  std::size_t removeIsolatedVertices();

  [[nodiscard]] nlohmann::basic_json<> json() const;
  static Graph fromJson(const nlohmann::basic_json<>& j);

  [[nodiscard]] std::string toString() const;
  friend std::ostream& operator<<(std::ostream& os, const Graph& g) {
    return os << g.toString();
  }

private:
  struct VertexData {
    VertexType type;
    CliffordPhase phase;
    double qubit;
    double row;
  };

  Integer d;
  Vertex nextVertex = 0;
  std::size_t nEdges = 0;
  std::map<Vertex, VertexData> vertexData;
  std::map<Vertex, std::map<Vertex, Edge>> adjacency;
  std::vector<Vertex> ins;
  std::vector<Vertex> outs;
  Scalar globalScalar;

  const VertexData& data(Vertex v) const;
  VertexData& data(Vertex v);
  void storeEdge(Vertex v, Vertex w, const Edge& edge);
  [[nodiscard]] std::optional<std::string>
  edgeInsertionError(Vertex v, Vertex w, const Edge& edge) const;
};
} // namespace zx
