//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "zx/Scalar.hpp"

#include "zx/Modular.hpp"

#include <cmath>
#include <complex>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace zx {

Scalar::Scalar(const Integer d) : dim(d) { validateDimension(d); }

void Scalar::addPhase(const PiRational& p) {
  phase += p;
  // reduce into [0, 2)
  const auto turns = boost::rational_cast<double>(phase / 2);
  phase -= PiRational(2 * static_cast<Integer>(std::floor(turns)));
  if (phase >= 2) {
    phase -= 2;
  } else if (phase < 0) {
    phase += 2;
  }
}

void Scalar::addOmegaPower(const Integer e) {
  addPhase(PiRational(2 * mod(e, dim), dim));
}

void Scalar::multiply(const Scalar& other) {
  if (other.dim != dim) {
    const auto msg = "Cannot multiply scalars of different dimensions";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  powerDim += other.powerDim;
  addPhase(other.phase);
  floatFactor *= other.floatFactor;
  zero = zero || other.zero;
  unknown = unknown || other.unknown;
}

void Scalar::conjugate() {
  const auto negated = -phase;
  phase = 0;
  addPhase(negated);
  floatFactor = std::conj(floatFactor);
}

void Scalar::addSpiderPair(const CliffordPhase& p1, const CliffordPhase& p2) {
  if (!p1.isPauli()) {
    const auto msg = "Scalar::addSpiderPair: first phase must be Pauli, got " +
                     p1.toString();
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  const auto quarter = modInverse(4, dim);
  const auto eighth = modInverse(8, dim);
  if (!quarter.has_value() || !eighth.has_value()) {
    setUnknown();
    return;
  }
  addPower(1);
  const auto x1 = p1.x();
  addOmegaPower((*quarter * x1 % dim * p2.x()) +
                (*eighth * mod(x1 * x1, dim) % dim * p2.y()));
}

void Scalar::addGaussSum(const CliffordPhase& p) {
  const auto half = modInverse(2, dim);
  const auto eighth = modInverse(8, dim);
  const auto zInv = modInverse(p.y(), dim);
  if (!half.has_value() || !eighth.has_value() || !zInv.has_value()) {
    setUnknown();
    return;
  }
  addNode(CliffordPhase(dim, 0, p.y()));
  const auto a = p.x();
  addOmegaPower(-(*eighth * *zInv % dim * mod(a * a, dim)));
}

std::complex<double> Scalar::toNumber() const {
  if (zero) {
    return {0., 0.};
  }
  const auto pi = std::acos(-1.);
  auto val = std::polar(1., pi * boost::rational_cast<double>(phase));
  val *= std::pow(std::sqrt(static_cast<double>(dim)),
                  static_cast<double>(powerDim));
  return val * floatFactor;
}

std::string Scalar::toString() const {
  if (unknown) {
    return "UNKNOWN";
  }
  std::stringstream ss;
  const auto number = toNumber();
  ss << std::fixed << std::setprecision(2) << number.real() << std::showpos
     << number.imag() << std::noshowpos << "i = ";
  if (floatFactor != std::complex<double>{1., 0.}) {
    ss << floatFactor.real() << std::showpos << floatFactor.imag()
       << std::noshowpos << "i";
  }
  if (phase != 0) {
    ss << "exp(" << phase.numerator() << "/" << phase.denominator() << "ipi)";
  }
  ss << "sqrt(" << dim << ")^" << powerDim;
  return ss.str();
}

nlohmann::basic_json<> Scalar::json() const {
  nlohmann::basic_json<> j;
  j["power_dim"] = powerDim;
  j["phase"] = {phase.numerator(), phase.denominator()};
  j["float_factor"] = {floatFactor.real(), floatFactor.imag()};
  j["is_zero"] = zero;
  j["is_unknown"] = unknown;
  return j;
}

} // namespace zx
