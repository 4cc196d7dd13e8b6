//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "zx/Edge.hpp"

#include "zx/Modular.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace zx {

Edge::Edge(const Integer dim, const Integer had, const Integer simple)
    : d(dim) {
  validateDimension(dim);
  hadWeight = mod(had, dim);
  simpleWeight = mod(simple, dim);
}

Edge Edge::operator+(const Edge& other) const {
  if (d != other.d) {
    std::stringstream ss;
    ss << "Cannot add edges of different dimensions (" << d << " and "
       << other.d << ")";
    PLOG_ERROR << ss.str();
    throw std::invalid_argument(ss.str());
  }
  return Edge(d, hadWeight + other.hadWeight,
              simpleWeight + other.simpleWeight);
}

std::string Edge::toString() const {
  std::stringstream ss;
  ss << "Edge(h=" << hadWeight << ",s=" << simpleWeight << ")";
  return ss.str();
}

nlohmann::basic_json<> Edge::json() const {
  nlohmann::basic_json<> j;
  j["had"] = hadWeight;
  j["simple"] = simpleWeight;
  return j;
}

} // namespace zx
