//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "circuit/Gate.hpp"

#include "zx/Modular.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace circuit {

Gate::Gate(const GateType gateType, const Qudit t, const Integer reps)
    : type(gateType), target(t), repetitions(reps) {
  if (isTwoQuditGateType(gateType)) {
    const auto msg = circuit::toString(gateType) + " requires a control qudit";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
}

Gate::Gate(const GateType gateType, const Control ctrl, const Qudit t,
           const Integer reps)
    : type(gateType), target(t), control(ctrl.qudit), repetitions(reps) {
  if (!isTwoQuditGateType(gateType)) {
    const auto msg = circuit::toString(gateType) + " acts on a single qudit";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  if (ctrl.qudit == t) {
    std::stringstream ss;
    ss << "Control and target of " << circuit::toString(gateType)
       << " coincide (qudit " << t << ")";
    PLOG_ERROR << ss.str();
    throw std::invalid_argument(ss.str());
  }
}

Gate Gate::mul(const Qudit target, const Integer multiplier) {
  Gate g(GateType::MUL, target);
  g.multValue = multiplier;
  return g;
}

void Gate::setTarget(const Qudit t) {
  if (control.has_value() && *control == t) {
    throw std::invalid_argument("Target must differ from the control");
  }
  target = t;
}

void Gate::setControl(const Qudit c) {
  if (!isTwoQuditGate()) {
    throw std::invalid_argument("Single-qudit gates have no control");
  }
  if (c == target) {
    throw std::invalid_argument("Control must differ from the target");
  }
  control = c;
}

bool Gate::actsOn(const Qudit q) const {
  return target == q || (control.has_value() && *control == q);
}

std::vector<Qudit> Gate::qudits() const {
  if (control.has_value()) {
    return {*control, target};
  }
  return {target};
}

Qudit Gate::other(const Qudit q) const {
  if (!control.has_value() || !actsOn(q)) {
    std::stringstream ss;
    ss << "Gate " << *this << " has no partner of qudit " << q;
    throw std::invalid_argument(ss.str());
  }
  return q == target ? *control : target;
}

bool Gate::sameQudits(const Gate& other) const {
  if (isTwoQuditGate() != other.isTwoQuditGate()) {
    return false;
  }
  if (!isTwoQuditGate()) {
    return target == other.target;
  }
  return actsOn(other.target) && actsOn(*other.control);
}

void Gate::merge(const Gate& other) {
  if (type != other.type) {
    std::stringstream ss;
    ss << "Cannot merge gates of different types: " << *this << " and "
       << other;
    PLOG_ERROR << ss.str();
    throw std::invalid_argument(ss.str());
  }
  const bool aligned = target == other.target && control == other.control;
  const bool symmetric = type == GateType::CZ || type == GateType::SWAP;
  if (!aligned && !(symmetric && sameQudits(other))) {
    std::stringstream ss;
    ss << "Cannot merge gates on different qudits: " << *this << " and "
       << other;
    PLOG_ERROR << ss.str();
    throw std::invalid_argument(ss.str());
  }
  if (type == GateType::MUL) {
    multValue *= other.multValue;
  } else {
    repetitions += other.repetitions;
  }
}

Gate Gate::adjoint(const Integer dim) const {
  auto g = *this;
  if (type == GateType::MUL) {
    g.multValue = zx::requireInverse(multValue, dim);
  } else {
    g.repetitions = -repetitions;
  }
  return g;
}

std::string Gate::toString() const {
  std::stringstream ss;
  ss << name();
  if (type == GateType::MUL) {
    ss << "[" << multValue << "]";
  } else if (repetitions != 1) {
    ss << "^" << repetitions;
  }
  ss << "(";
  if (control.has_value()) {
    ss << *control << ",";
  }
  ss << target << ")";
  return ss.str();
}

nlohmann::basic_json<> Gate::json() const {
  nlohmann::basic_json<> j;
  j["type"] = name();
  j["target"] = target;
  if (control.has_value()) {
    j["control"] = *control;
  }
  if (type == GateType::MUL) {
    j["mult"] = multValue;
  } else {
    j["repetitions"] = repetitions;
  }
  return j;
}

Gate Gate::fromJson(const nlohmann::basic_json<>& j) {
  const auto t = gateTypeFromString(j.at("type").get<std::string>());
  const auto target = j.at("target").get<Qudit>();
  const auto reps = j.value("repetitions", Integer{1});
  if (t == GateType::MUL) {
    return mul(target, j.at("mult").get<Integer>());
  }
  if (isTwoQuditGateType(t)) {
    return {t, Control(j.at("control").get<Qudit>()), target, reps};
  }
  return {t, target, reps};
}

bool Gate::operator==(const Gate& other) const {
  return type == other.type && target == other.target &&
         control == other.control && repetitions == other.repetitions &&
         multValue == other.multValue;
}

} // namespace circuit
