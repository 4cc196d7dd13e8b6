//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace zx {
using Vertex = std::size_t;
using Integer = std::int64_t;

enum class VertexType : std::uint8_t { Boundary, Z, X };

[[maybe_unused]] static inline std::string toString(const VertexType type) {
  switch (type) {
  case VertexType::Boundary:
    return "boundary";
  case VertexType::Z:
    return "z";
  case VertexType::X:
    return "x";
  }
  return "Error";
}

[[maybe_unused]] static VertexType
vertexTypeFromString(const std::string& type) {
  if (type == "boundary" || type == "B") {
    return VertexType::Boundary;
  }
  if (type == "z" || type == "Z") {
    return VertexType::Z;
  }
  if (type == "x" || type == "X") {
    return VertexType::X;
  }
  throw std::invalid_argument("Unknown vertex type: " + type);
}

[[maybe_unused]] static inline VertexType toggle(const VertexType type) {
  switch (type) {
  case VertexType::Z:
    return VertexType::X;
  case VertexType::X:
    return VertexType::Z;
  default:
    return type;
  }
}
} // namespace zx
