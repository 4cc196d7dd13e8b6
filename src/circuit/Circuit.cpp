//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "circuit/Circuit.hpp"

#include "zx/Modular.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace circuit {

Circuit::Circuit(const std::size_t nQudits, const Integer dimension,
                 std::string circuitName)
    : qudits(nQudits), dim(dimension), name(std::move(circuitName)) {
  zx::validateDimension(dim);
}

void Circuit::addGate(const Gate& gate) {
  for (const auto q : gate.qudits()) {
    if (q >= qudits) {
      std::stringstream ss;
      ss << "Gate " << gate << " acts on qudit " << q << " but the circuit "
         << "only has " << qudits << " qudits";
      PLOG_ERROR << ss.str();
      throw std::invalid_argument(ss.str());
    }
  }
  if (gate.is(GateType::MUL) && !zx::isInvertible(gate.getMultValue(), dim)) {
    std::stringstream ss;
    ss << "Multiplier of " << gate << " is not invertible modulo " << dim;
    PLOG_ERROR << ss.str();
    throw std::invalid_argument(ss.str());
  }
  gates.emplace_back(gate);
}

void Circuit::x(const Qudit q, const Integer reps) {
  addGate(Gate(GateType::X, q, reps));
}
void Circuit::z(const Qudit q, const Integer reps) {
  addGate(Gate(GateType::Z, q, reps));
}
void Circuit::s(const Qudit q, const Integer reps) {
  addGate(Gate(GateType::S, q, reps));
}
void Circuit::h(const Qudit q, const Integer reps) {
  addGate(Gate(GateType::H, q, reps));
}
void Circuit::mul(const Qudit q, const Integer multiplier) {
  addGate(Gate::mul(q, multiplier));
}
void Circuit::cx(const Qudit control, const Qudit target, const Integer reps) {
  addGate(Gate(GateType::CX, Control(control), target, reps));
}
void Circuit::cz(const Qudit control, const Qudit target, const Integer reps) {
  addGate(Gate(GateType::CZ, Control(control), target, reps));
}
void Circuit::swap(const Qudit q1, const Qudit q2) {
  addGate(Gate(GateType::SWAP, Control(q1), q2));
}

Circuit Circuit::adjoint() const {
  Circuit adj(qudits, dim, name + "Adjoint");
  for (auto it = gates.rbegin(); it != gates.rend(); ++it) {
    adj.addGate(it->adjoint(dim));
  }
  return adj;
}

std::size_t Circuit::twoQuditGateCount() const {
  return static_cast<std::size_t>(
      std::count_if(gates.begin(), gates.end(),
                    [](const Gate& g) { return g.isTwoQuditGate(); }));
}

nlohmann::basic_json<> Circuit::json() const {
  nlohmann::basic_json<> j;
  j["name"] = name;
  j["qudits"] = qudits;
  j["dim"] = dim;
  auto& gs = j["gates"];
  gs = nlohmann::basic_json<>::array();
  for (const auto& g : gates) {
    gs.emplace_back(g.json());
  }
  return j;
}

Circuit Circuit::fromJson(const nlohmann::basic_json<>& j) {
  Circuit qc(j.at("qudits").get<std::size_t>(), j.at("dim").get<Integer>(),
             j.value("name", std::string{}));
  for (const auto& g : j.at("gates")) {
    qc.addGate(Gate::fromJson(g));
  }
  return qc;
}

Circuit Circuit::fromFile(const std::string& filename) {
  std::ifstream ifs(filename);
  if (!ifs.good()) {
    const auto msg = "Could not open circuit file " + filename;
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  return fromJson(nlohmann::basic_json<>::parse(ifs));
}

std::string Circuit::toString() const {
  std::stringstream ss;
  ss << "Circuit(" << qudits << " qudits, dim " << dim << ", " << gates.size()
     << " gates)";
  for (const auto& g : gates) {
    ss << "\n  " << g;
  }
  return ss.str();
}

} // namespace circuit
