//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Graph.hpp"

#include <cstddef>

namespace zx {

/// Colour changes every X spider. Returns the number of changed spiders.
std::size_t toGh(Graph& g);

/**
 * @brief Fuses Z spiders along simple edges and removes parallel edges
 * until neither rule applies any more.
 * @return the number of applied rewrites
 */
std::size_t spiderSimp(Graph& g);

/// Removes all self-loops of Z spiders.
std::size_t selfLoopSimp(Graph& g);

/**
 * @brief Whether the graph is graph-like.
 * @details Only Z spiders and boundaries, Z spiders are pairwise connected
 * through Hadamard edges only, there are no self-loops, every boundary has a
 * single Z neighbour reached through a simple edge and every Z spider is
 * connected to at most one boundary.
 */
[[nodiscard]] bool isGraphLike(const Graph& g);

/**
 * @brief Brings the graph into graph-like form.
 * @throws std::logic_error if the result is not graph-like (e.g. because of
 * an isolated boundary)
 */
void toGraphLike(Graph& g);

/// Local complementation and pivoting on interior spiders until neither
/// applies. The graph should be graph-like.
void toApForm(Graph& g);

/**
 * @brief Clifford simplification of a graph.
 * @details Brings the graph into graph-like form and then alternates
 * interior local complementation and pivoting with pivots along boundary
 * spiders. Each matching boundary pivot is applied to a copy of the graph,
 * followed by the interior rewrites. The copy replaces the graph only if it
 * ends with fewer vertices, otherwise it is discarded and the next match is
 * tried. The loop stops once no boundary pivot is kept.
 */
void cliffordSimp(Graph& g);

} // namespace zx
