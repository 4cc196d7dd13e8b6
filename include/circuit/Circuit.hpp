//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "circuit/Gate.hpp"

#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace circuit {

/**
 * @brief An ordered list of Clifford gates on `qudits` qudits of dimension
 * `dim`.
 */
class Circuit {
public:
  Circuit(std::size_t nQudits, Integer dimension, std::string circuitName = "");

  [[nodiscard]] std::size_t getQudits() const { return qudits; }
  [[nodiscard]] Integer getDim() const { return dim; }
  [[nodiscard]] const std::string& getName() const { return name; }
  void setName(const std::string& n) { name = n; }

  [[nodiscard]] const std::vector<Gate>& getGates() const { return gates; }
  [[nodiscard]] std::size_t size() const { return gates.size(); }
  [[nodiscard]] bool empty() const { return gates.empty(); }
  [[nodiscard]] auto begin() const { return gates.cbegin(); }
  [[nodiscard]] auto end() const { return gates.cend(); }
  [[nodiscard]] const Gate& at(const std::size_t i) const {
    return gates.at(i);
  }

  /**
   * @brief Appends a gate.
   * @throws std::invalid_argument if the gate acts outside of the circuit or
   * is a MUL gate with a multiplier that is not invertible
   */
  void addGate(const Gate& gate);

  void x(Qudit q, Integer reps = 1);
  void z(Qudit q, Integer reps = 1);
  void s(Qudit q, Integer reps = 1);
  void h(Qudit q, Integer reps = 1);
  void mul(Qudit q, Integer multiplier);
  void cx(Qudit control, Qudit target, Integer reps = 1);
  void cz(Qudit control, Qudit target, Integer reps = 1);
  void swap(Qudit q1, Qudit q2);

  void clear() { gates.clear(); }

  [[nodiscard]] Circuit adjoint() const;

  [[nodiscard]] std::size_t twoQuditGateCount() const;
  [[nodiscard]] std::size_t singleQuditGateCount() const {
    return size() - twoQuditGateCount();
  }

  [[nodiscard]] nlohmann::basic_json<> json() const;
  static Circuit fromJson(const nlohmann::basic_json<>& j);
  static Circuit fromFile(const std::string& filename);

  [[nodiscard]] std::string toString() const;
  friend std::ostream& operator<<(std::ostream& os, const Circuit& qc) {
    return os << qc.toString();
  }

  /// Equal gate sequences on the same register.
  bool operator==(const Circuit& other) const {
    return qudits == other.qudits && dim == other.dim &&
           gates == other.gates;
  }
  bool operator!=(const Circuit& other) const { return !(*this == other); }

private:
  std::size_t qudits;
  Integer dim;
  std::string name;
  std::vector<Gate> gates;
};
} // namespace circuit
