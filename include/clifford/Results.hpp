//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "circuit/Circuit.hpp"

#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <ostream>
#include <string>

namespace clifford {
class Results {
public:
  Results() = default;
  Results(const circuit::Circuit& initial, const circuit::Circuit& result);

  virtual ~Results() = default;

  [[nodiscard]] std::size_t getInitialGates() const { return initialGates; }
  [[nodiscard]] std::size_t getInitialTwoQuditGates() const {
    return initialTwoQuditGates;
  }
  [[nodiscard]] std::size_t getGates() const {
    return getSingleQuditGates() + getTwoQuditGates();
  }
  [[nodiscard]] std::size_t getTwoQuditGates() const { return twoQuditGates; }
  [[nodiscard]] std::size_t getSingleQuditGates() const {
    return singleQuditGates;
  }
  [[nodiscard]] std::size_t getSteps() const { return steps; }
  [[nodiscard]] double getRuntime() const { return runtime; }

  [[nodiscard]] std::string getResultCircuit() const { return resultCircuit; }

  void setInitialGates(const std::size_t g) { initialGates = g; }
  void setInitialTwoQuditGates(const std::size_t g) {
    initialTwoQuditGates = g;
  }
  void setSingleQuditGates(const std::size_t g) { singleQuditGates = g; }
  void setTwoQuditGates(const std::size_t g) { twoQuditGates = g; }
  void setSteps(const std::size_t s) { steps = s; }
  void setRuntime(const double t) { runtime = t; }

  void setResultCircuit(const circuit::Circuit& qc);

  [[nodiscard]] virtual nlohmann::basic_json<> json() const;

  friend std::ostream& operator<<(std::ostream& os, const Results& results);

protected:
  std::size_t initialGates = 0U;
  std::size_t initialTwoQuditGates = 0U;
  std::size_t singleQuditGates = 0U;
  std::size_t twoQuditGates = 0U;
  std::size_t steps = 0U;
  double runtime = 0.0;

  std::string resultCircuit;
};

} // namespace clifford
