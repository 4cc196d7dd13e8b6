//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Definitions.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace zx {

/// Raised when a value has no multiplicative inverse modulo the dimension.
class NotInvertibleError : public std::domain_error {
public:
  NotInvertibleError(Integer value, Integer dim);

  [[nodiscard]] Integer getValue() const { return value; }
  [[nodiscard]] Integer getDim() const { return dim; }

private:
  Integer value;
  Integer dim;
};

/// Throws std::invalid_argument unless `dim` is a usable qudit dimension.
void validateDimension(Integer dim);

[[nodiscard]] bool isPrime(Integer n);

/// Non-negative residue of `a` modulo `dim`.
[[nodiscard]] Integer mod(Integer a, Integer dim);

/**
 * @brief Multiplicative inverse of `a` modulo `dim`.
 * @return std::nullopt if `gcd(a, dim) != 1`
 */
[[nodiscard]] std::optional<Integer> modInverse(Integer a, Integer dim);

/// Like modInverse, but throws NotInvertibleError instead of returning empty.
[[nodiscard]] Integer requireInverse(Integer a, Integer dim);

[[nodiscard]] bool isInvertible(Integer a, Integer dim);

/// `base^exp mod dim`; negative exponents go through the inverse of `base`.
[[nodiscard]] Integer modPow(Integer base, Integer exp, Integer dim);

} // namespace zx
