//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Definitions.hpp"

#include <nlohmann/json_fwd.hpp>
#include <ostream>
#include <string>

namespace zx {

/**
 * @brief Label of the (single) edge between two vertices.
 * @details An edge carries a Hadamard weight and a simple weight, both taken
 * modulo the qudit dimension. Parallel wires between the same pair of
 * vertices are folded into these weights, so a graph never stores more than
 * one Edge per vertex pair.
 */
class Edge {
public:
  explicit Edge(Integer dim, Integer had = 0, Integer simple = 0);

  [[nodiscard]] Integer dim() const { return d; }
  [[nodiscard]] Integer had() const { return hadWeight; }
  [[nodiscard]] Integer simple() const { return simpleWeight; }

  [[nodiscard]] bool isPresent() const {
    return hadWeight != 0 || simpleWeight != 0;
  }
  /// Present and without a simple component.
  [[nodiscard]] bool isHadamard() const {
    return isPresent() && simpleWeight == 0;
  }
  /// Present and without a Hadamard component.
  [[nodiscard]] bool isSimple() const { return isPresent() && hadWeight == 0; }
  /// At most one of the two components is non-zero.
  [[nodiscard]] bool isReduced() const {
    return hadWeight == 0 || simpleWeight == 0;
  }
  [[nodiscard]] bool isSingle() const { return isPresent() && isReduced(); }

  /// Component-wise sum; both operands must share the dimension.
  Edge operator+(const Edge& other) const;

  bool operator==(const Edge& other) const {
    return d == other.d && hadWeight == other.hadWeight &&
           simpleWeight == other.simpleWeight;
  }
  bool operator!=(const Edge& other) const { return !(*this == other); }

  [[nodiscard]] std::string toString() const;
  [[nodiscard]] nlohmann::basic_json<> json() const;

  friend std::ostream& operator<<(std::ostream& os, const Edge& edge) {
    return os << edge.toString();
  }

private:
  Integer d;
  Integer hadWeight;
  Integer simpleWeight;
};
} // namespace zx
