//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <ostream>
#include <plog/Severity.h>

namespace clifford {

struct Configuration {
  Configuration() = default;

  /// Compare the symplectic matrices before and after every rewrite
  bool checkSemanticsEachStep = false;
  /// Keep the circuit after every rewrite
  bool recordIntermediateCircuits = true;
  /// Bound on the iterations of the optimization loops, 0 means unbounded
  std::size_t maxIterations = 0U;
  plog::Severity verbosity = plog::Severity::warning;

  [[nodiscard]] nlohmann::basic_json<> json() const {
    nlohmann::basic_json j;
    j["check_semantics_each_step"] = checkSemanticsEachStep;
    j["record_intermediate_circuits"] = recordIntermediateCircuits;
    j["max_iterations"] = maxIterations;
    j["verbosity"] = plog::severityToString(verbosity);
    return j;
  }

  friend std::ostream& operator<<(std::ostream& os,
                                  const Configuration& config) {
    os << config.json().dump(2);
    return os;
  }
};
} // namespace clifford
