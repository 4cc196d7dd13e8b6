//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Definitions.hpp"

#include <complex>
#include <nlohmann/json_fwd.hpp>
#include <ostream>
#include <string>

namespace zx {

/**
 * @brief Phase of a Clifford spider.
 * @details A Z spider with phase (x, y) maps |k> to
 * omega^(2^-1 (x k + y k^2)) |k> with omega = exp(2 pi i / dim). The linear
 * component x is the Pauli part, the quadratic component y the Clifford part.
 * Both components are reduced modulo the dimension.
 */
class CliffordPhase {
public:
  explicit CliffordPhase(Integer dim, Integer x = 0, Integer y = 0);

  [[nodiscard]] Integer dim() const { return d; }
  [[nodiscard]] Integer x() const { return xComp; }
  [[nodiscard]] Integer y() const { return yComp; }

  /// Sum of the diagonal entries, i.e. the value of the spider without legs.
  [[nodiscard]] std::complex<double> value() const;

  [[nodiscard]] CliffordPhase adjoint() const {
    return CliffordPhase(d, -xComp, -yComp);
  }
  CliffordPhase operator+(const CliffordPhase& other) const;
  CliffordPhase operator-(const CliffordPhase& other) const;
  CliffordPhase& operator+=(const CliffordPhase& other) {
    *this = *this + other;
    return *this;
  }

  bool operator==(const CliffordPhase& other) const {
    return d == other.d && xComp == other.xComp && yComp == other.yComp;
  }
  bool operator!=(const CliffordPhase& other) const {
    return !(*this == other);
  }

  [[nodiscard]] bool isPauli() const { return yComp == 0; }
  [[nodiscard]] bool isClifford() const { return true; }
  [[nodiscard]] bool isPureClifford() const { return xComp == 0; }
  [[nodiscard]] bool isZero() const { return xComp == 0 && yComp == 0; }
  /// The quadratic component is invertible modulo the dimension.
  [[nodiscard]] bool isStrictlyClifford() const;

  [[nodiscard]] std::string toString() const;
  [[nodiscard]] nlohmann::basic_json<> json() const;

  friend std::ostream& operator<<(std::ostream& os,
                                  const CliffordPhase& phase) {
    return os << phase.toString();
  }

private:
  Integer d;
  Integer xComp;
  Integer yComp;

  void checkDimension(const CliffordPhase& other) const;
};
} // namespace zx
