//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "zx/Phase.hpp"

#include "zx/Modular.hpp"

#include <cmath>
#include <complex>
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace zx {

CliffordPhase::CliffordPhase(const Integer dim, const Integer x,
                             const Integer y)
    : d(dim) {
  validateDimension(dim);
  xComp = mod(x, dim);
  yComp = mod(y, dim);
}

std::complex<double> CliffordPhase::value() const {
  const auto twoPi = 2. * std::acos(-1.);
  const auto halfInv = modInverse(2, d);
  std::complex<double> sum{0., 0.};
  for (Integer k = 0; k < d; ++k) {
    const auto exponent = (xComp * k) + (yComp * k * k);
    double angle = 0.;
    if (halfInv.has_value()) {
      angle = twoPi * static_cast<double>(mod(*halfInv * exponent, d)) /
              static_cast<double>(d);
    } else {
      angle = twoPi * static_cast<double>(exponent) /
              (2. * static_cast<double>(d));
    }
    sum += std::polar(1., angle);
  }
  return sum;
}

void CliffordPhase::checkDimension(const CliffordPhase& other) const {
  if (d != other.d) {
    std::stringstream ss;
    ss << "Phases of different dimensions (" << d << " and " << other.d
       << ") cannot be combined";
    PLOG_ERROR << ss.str();
    throw std::invalid_argument(ss.str());
  }
}

CliffordPhase CliffordPhase::operator+(const CliffordPhase& other) const {
  checkDimension(other);
  return CliffordPhase(d, xComp + other.xComp, yComp + other.yComp);
}

CliffordPhase CliffordPhase::operator-(const CliffordPhase& other) const {
  checkDimension(other);
  return CliffordPhase(d, xComp - other.xComp, yComp - other.yComp);
}

bool CliffordPhase::isStrictlyClifford() const {
  return yComp != 0 && isInvertible(yComp, d);
}

std::string CliffordPhase::toString() const {
  std::stringstream ss;
  ss << "(" << xComp << "," << yComp << ")";
  return ss.str();
}

nlohmann::basic_json<> CliffordPhase::json() const {
  return nlohmann::basic_json<>::array({xComp, yComp});
}

} // namespace zx
