//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "zx/Definitions.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace circuit {
using Qudit = std::size_t;
using zx::Integer;

enum class GateType : std::uint8_t { X, Z, S, H, MUL, CX, CZ, SWAP };

[[maybe_unused]] static inline std::string toString(const GateType type) {
  switch (type) {
  case GateType::X:
    return "X";
  case GateType::Z:
    return "Z";
  case GateType::S:
    return "S";
  case GateType::H:
    return "H";
  case GateType::MUL:
    return "MUL";
  case GateType::CX:
    return "CX";
  case GateType::CZ:
    return "CZ";
  case GateType::SWAP:
    return "SWAP";
  }
  return "Error";
}

[[maybe_unused]] static GateType gateTypeFromString(const std::string& type) {
  if (type == "X" || type == "x") {
    return GateType::X;
  }
  if (type == "Z" || type == "z") {
    return GateType::Z;
  }
  if (type == "S" || type == "s") {
    return GateType::S;
  }
  if (type == "H" || type == "h" || type == "HAD") {
    return GateType::H;
  }
  if (type == "MUL" || type == "mul") {
    return GateType::MUL;
  }
  if (type == "CX" || type == "cx" || type == "CNOT") {
    return GateType::CX;
  }
  if (type == "CZ" || type == "cz") {
    return GateType::CZ;
  }
  if (type == "SWAP" || type == "swap") {
    return GateType::SWAP;
  }
  throw std::invalid_argument("Unknown gate type: " + type);
}

[[maybe_unused]] static inline bool isTwoQuditGateType(const GateType type) {
  return type == GateType::CX || type == GateType::CZ ||
         type == GateType::SWAP;
}

[[maybe_unused]] static inline bool isPauli(const GateType type) {
  return type == GateType::X || type == GateType::Z;
}

/// Control qudit of a two-qudit gate.
struct Control {
  explicit Control(const Qudit q) : qudit(q) {}
  Qudit qudit;
};

/**
 * @brief A Clifford gate acting on one or two qudits.
 * @details `repetitions` is the power the gate is raised to. MUL gates
 * instead carry the multiplier `multValue` (|k> -> |m k>). The index is the
 * position of the gate in the circuit it was read from and is used to break
 * ties when a gate dependency graph is linearised. It does not take part in
 * comparisons.
 */
class Gate {
public:
  Gate(GateType gateType, Qudit target, Integer reps = 1);
  Gate(GateType gateType, Control ctrl, Qudit target, Integer reps = 1);

  static Gate mul(Qudit target, Integer multiplier);

  [[nodiscard]] GateType getType() const { return type; }
  [[nodiscard]] Qudit getTarget() const { return target; }
  [[nodiscard]] std::optional<Qudit> getControl() const { return control; }
  [[nodiscard]] Integer getRepetitions() const { return repetitions; }
  [[nodiscard]] Integer getMultValue() const { return multValue; }
  [[nodiscard]] std::size_t getIndex() const { return index; }

  void setTarget(Qudit t);
  void setControl(Qudit c);
  void setRepetitions(const Integer reps) { repetitions = reps; }
  void setMultValue(const Integer m) { multValue = m; }
  void setIndex(const std::size_t i) { index = i; }

  [[nodiscard]] bool isTwoQuditGate() const { return control.has_value(); }
  [[nodiscard]] bool isPauli() const { return circuit::isPauli(type); }
  [[nodiscard]] bool is(const GateType t) const { return type == t; }
  [[nodiscard]] bool actsOn(Qudit q) const;
  [[nodiscard]] std::vector<Qudit> qudits() const;
  /// The qudit of a two-qudit gate that is not `q`.
  [[nodiscard]] Qudit other(Qudit q) const;
  [[nodiscard]] bool sameQudits(const Gate& other) const;

  [[nodiscard]] std::string name() const { return circuit::toString(type); }

  /**
   * @brief Absorbs `other` into this gate.
   * @details Repetitions are added, multipliers are multiplied. CZ and SWAP
   * are symmetric and merge regardless of the orientation.
   * @throws std::invalid_argument if the gates are of different type or act
   * on different qudits
   */
  void merge(const Gate& other);

  /**
   * @brief The inverse gate.
   * @param dim the qudit dimension, needed to invert MUL gates
   */
  [[nodiscard]] Gate adjoint(Integer dim) const;

  [[nodiscard]] std::string toString() const;

  [[nodiscard]] nlohmann::basic_json<> json() const;
  static Gate fromJson(const nlohmann::basic_json<>& j);

  bool operator==(const Gate& other) const;
  bool operator!=(const Gate& other) const { return !(*this == other); }

  friend std::ostream& operator<<(std::ostream& os, const Gate& gate) {
    return os << gate.toString();
  }

private:
  GateType type;
  Qudit target;
  std::optional<Qudit> control;
  Integer repetitions = 1;
  Integer multValue = 1;
  std::size_t index = 0;
};
} // namespace circuit
