//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Definitions.hpp"
#include "zx/Graph.hpp"

namespace zx {

// Every rewrite comes as a check/apply pair. `check*` never modifies the
// graph. `apply*` re-checks the precondition and returns false without
// touching the graph if it does not hold. All rules keep the denotation of
// the graph times its scalar invariant.

/// Any X spider can be turned into a Z spider.
bool checkXColorChange(const Graph& g, Vertex v);
/**
 * @brief Turns the X spider `v` into a Z spider.
 * @details Simple edges become Hadamard edges, Hadamard edges to X spiders
 * become (negated) simple edges and Hadamard edges to Z spiders or
 * boundaries are routed through a new Z spider.
 * @throws std::invalid_argument if an incident edge is not reduced
 */
bool applyXColorChange(Graph& g, Vertex v);

/// Two distinct Z spiders connected by a simple edge.
bool checkZFusion(const Graph& g, Vertex v1, Vertex v2);
/// Fuses `v2` into `v1`.
bool applyZFusion(Graph& g, Vertex v1, Vertex v2);

/**
 * @brief Phase-free Z spider with exactly two distinct neighbours whose
 * edges compose to a single edge.
 * @details The compositions are
 * - Hadamard(h) and simple(s): Hadamard(h * s),
 * - Hadamard(h) and Hadamard(-h) with h invertible: simple(1),
 * - simple(s) and simple(s^-1) between X spiders or boundaries: Hadamard(1).
 */
bool checkZElimination(const Graph& g, Vertex v);
bool applyZElimination(Graph& g, Vertex v);

/// Two distinct Z spiders whose edge has both a simple and a Hadamard part.
bool checkParallelEdgeRemoval(const Graph& g, Vertex v1, Vertex v2);
bool applyParallelEdgeRemoval(Graph& g, Vertex v1, Vertex v2);

bool checkSelfLoopRemoval(const Graph& g, Vertex v);
bool applySelfLoopRemoval(Graph& g, Vertex v);

/**
 * @brief Z spider with strictly Clifford phase whose neighbours are all Z
 * spiders connected through Hadamard edges.
 */
bool checkLocalComplementation(const Graph& g, Vertex v);
/**
 * @brief Removes `v` by complementing its neighbourhood.
 * @details With phase (a, z) and z' = z^-1, every neighbour n connected by
 * weight e_n receives the phase (-z' a e_n, -z' e_n^2) and every pair of
 * neighbours (n, m) a Hadamard edge of weight -z' e_n e_m.
 */
bool applyLocalComplementation(Graph& g, Vertex v);

/**
 * @brief Two Z spiders with Pauli phases connected by a Hadamard edge of
 * invertible weight, all other neighbours being Z spiders connected through
 * Hadamard edges.
 */
bool checkPivot(const Graph& g, Vertex v1, Vertex v2);
bool applyPivot(Graph& g, Vertex v1, Vertex v2);

/**
 * @brief Like checkPivot, but exactly one of the two spiders is additionally
 * connected to exactly one boundary.
 */
bool checkBoundaryPivot(const Graph& g, Vertex v1, Vertex v2);
/// Unfuses the boundary wire through two new spiders and pivots.
bool applyBoundaryPivot(Graph& g, Vertex v1, Vertex v2);

} // namespace zx
