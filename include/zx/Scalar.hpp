//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Definitions.hpp"
#include "zx/Phase.hpp"

#include <boost/rational.hpp>
#include <complex>
#include <nlohmann/json_fwd.hpp>
#include <ostream>
#include <string>

namespace zx {

using PiRational = boost::rational<Integer>;

/**
 * @brief Global scalar factor of a diagram.
 * @details The value is sqrt(dim)^powerDim * exp(i pi phase) * floatFactor,
 * or exactly zero if `isZero` is set. Rewrite rules only ever multiply into
 * the scalar. If a rule cannot express its contribution exactly (for example
 * because 2 is not invertible modulo the dimension) it marks the scalar as
 * unknown instead.
 */
class Scalar {
public:
  explicit Scalar(Integer dim);

  [[nodiscard]] Integer getDim() const { return dim; }
  [[nodiscard]] Integer getPowerDim() const { return powerDim; }
  [[nodiscard]] const PiRational& getPhase() const { return phase; }
  [[nodiscard]] std::complex<double> getFloatFactor() const {
    return floatFactor;
  }
  [[nodiscard]] bool isZero() const { return zero; }
  [[nodiscard]] bool isUnknown() const { return unknown; }

  void setUnknown() { unknown = true; }
  void setZero() { zero = true; }

  /// Multiplies by sqrt(dim)^n.
  void addPower(Integer n) { powerDim += n; }
  /// Multiplies by exp(i pi p); the phase is kept in [0, 2).
  void addPhase(const PiRational& p);
  /// Multiplies by omega^e with omega = exp(2 pi i / dim).
  void addOmegaPower(Integer e);
  void addFloat(std::complex<double> f) { floatFactor *= f; }
  /// Folds a spider without any legs into the scalar.
  void addNode(const CliffordPhase& p) { addFloat(p.value()); }
  void multiply(const Scalar& other);
  /// Complex conjugate, used for adjoint diagrams.
  void conjugate();

  /// Contribution of two spiders (p1)-H-(p2); `p1` must be a Pauli phase.
  void addSpiderPair(const CliffordPhase& p1, const CliffordPhase& p2);

  /**
   * @brief Normalisation lost when complementing about a spider with
   * strictly Clifford phase (a, z).
   * @details Multiplies by sum_k omega^(2^-1 z k^2) and omega^(-2^-3 z^-1 a^2).
   */
  void addGaussSum(const CliffordPhase& p);

  [[nodiscard]] std::complex<double> toNumber() const;
  [[nodiscard]] std::string toString() const;
  [[nodiscard]] nlohmann::basic_json<> json() const;

  friend std::ostream& operator<<(std::ostream& os, const Scalar& s) {
    return os << s.toString();
  }

private:
  Integer dim;
  Integer powerDim = 0;
  PiRational phase{0};
  std::complex<double> floatFactor{1., 0.};
  bool unknown = false;
  bool zero = false;
};
} // namespace zx
