//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "zx/Modular.hpp"

#include <plog/Log.h>
#include <stdexcept>
#include <string>

namespace zx {

NotInvertibleError::NotInvertibleError(const Integer v, const Integer d)
    : std::domain_error(std::to_string(v) + " is not invertible modulo " +
                        std::to_string(d)),
      value(v), dim(d) {}

void validateDimension(const Integer dim) {
  if (dim < 2) {
    const auto msg = "Invalid qudit dimension " + std::to_string(dim) +
                     ". The dimension must be at least 2.";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
}

bool isPrime(const Integer n) {
  if (n < 2) {
    return false;
  }
  for (Integer i = 2; i * i <= n; ++i) {
    if (n % i == 0) {
      return false;
    }
  }
  return true;
}

Integer mod(const Integer a, const Integer dim) {
  const auto r = a % dim;
  return r < 0 ? r + dim : r;
}

std::optional<Integer> modInverse(const Integer a, const Integer dim) {
  // extended Euclid on (a mod dim, dim)
  Integer oldR = mod(a, dim);
  Integer r = dim;
  Integer oldS = 1;
  Integer s = 0;
  while (r != 0) {
    const auto q = oldR / r;
    const auto tmpR = oldR - (q * r);
    oldR = r;
    r = tmpR;
    const auto tmpS = oldS - (q * s);
    oldS = s;
    s = tmpS;
  }
  if (oldR != 1) {
    return std::nullopt;
  }
  return mod(oldS, dim);
}

Integer requireInverse(const Integer a, const Integer dim) {
  const auto inv = modInverse(a, dim);
  if (!inv.has_value()) {
    PLOG_ERROR << "No inverse of " << a << " modulo " << dim;
    throw NotInvertibleError(a, dim);
  }
  return *inv;
}

bool isInvertible(const Integer a, const Integer dim) {
  return modInverse(a, dim).has_value();
}

Integer modPow(Integer base, Integer exp, const Integer dim) {
  if (exp < 0) {
    base = requireInverse(base, dim);
    exp = -exp;
  }
  Integer result = mod(1, dim);
  base = mod(base, dim);
  while (exp > 0) {
    if ((exp & 1) != 0) {
      result = mod(result * base, dim);
    }
    base = mod(base * base, dim);
    exp >>= 1;
  }
  return result;
}

} // namespace zx
