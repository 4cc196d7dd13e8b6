//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "clifford/Results.hpp"

#include "circuit/Circuit.hpp"

#include <nlohmann/json.hpp>
#include <ostream>

namespace clifford {

Results::Results(const circuit::Circuit& initial,
                 const circuit::Circuit& result) {
  setInitialGates(initial.size());
  setInitialTwoQuditGates(initial.twoQuditGateCount());
  setSingleQuditGates(result.singleQuditGateCount());
  setTwoQuditGates(result.twoQuditGateCount());
  setResultCircuit(result);
}

void Results::setResultCircuit(const circuit::Circuit& qc) {
  resultCircuit = qc.json().dump();
}

nlohmann::basic_json<> Results::json() const {
  nlohmann::basic_json resultJSON{};
  resultJSON["initial_gates"] = initialGates;
  resultJSON["initial_two_qudit_gates"] = initialTwoQuditGates;
  resultJSON["single_qudit_gates"] = singleQuditGates;
  resultJSON["two_qudit_gates"] = twoQuditGates;
  resultJSON["steps"] = steps;
  resultJSON["runtime"] = runtime;

  return resultJSON;
}

std::ostream& operator<<(std::ostream& os, const Results& results) {
  os << results.json().dump(2);
  return os;
}
} // namespace clifford
