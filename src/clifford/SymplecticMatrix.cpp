//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#include "clifford/SymplecticMatrix.hpp"

#include "zx/Modular.hpp"

#include <cstddef>
#include <fstream>
#include <istream>
#include <ostream>
#include <plog/Log.h>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace clifford {

namespace {
void parseLine(const std::string& line, const char separator,
               const std::set<char>& ignoredChars,
               std::vector<std::string>& result) {
  result.clear();
  std::string word;
  for (const char c : line) {
    if (ignoredChars.find(c) != ignoredChars.end()) {
      continue;
    }
    if (c == separator) {
      result.push_back(word);
      word = "";
    } else {
      word += c;
    }
  }
  result.push_back(word);
}
} // namespace

SymplecticMatrix::SymplecticMatrix(const std::size_t nq, const Integer d)
    : nQudits(nq), dim(d) {
  zx::validateDimension(d);
  matrix.assign(2 * nq, RowType(2 * nq, 0));
  for (std::size_t i = 0U; i < 2 * nq; ++i) {
    matrix[i][i] = 1;
  }
}

SymplecticMatrix::SymplecticMatrix(const circuit::Circuit& qc)
    : SymplecticMatrix(qc.getQudits(), qc.getDim()) {
  for (const auto& gate : qc) {
    applyGate(gate);
  }
}

SymplecticMatrix::SymplecticMatrix(const std::string& description,
                                   const Integer d)
    : dim(d) {
  zx::validateDimension(d);
  fromString(description);
}

void SymplecticMatrix::checkQudit(const Qudit q) const {
  if (q >= nQudits) {
    const auto msg = "Qudit " + std::to_string(q) +
                     " is out of range for a symplectic matrix on " +
                     std::to_string(nQudits) + " qudits";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
}

void SymplecticMatrix::transformQudit(const Qudit q, const Integer a,
                                      const Integer b, const Integer c,
                                      const Integer e) {
  checkQudit(q);
  auto& xRow = matrix[2 * q];
  auto& zRow = matrix[2 * q + 1];
  for (std::size_t col = 0U; col < 2 * nQudits; ++col) {
    const auto x = xRow[col];
    const auto z = zRow[col];
    xRow[col] = zx::mod(a * x + b * z, dim);
    zRow[col] = zx::mod(c * x + e * z, dim);
  }
}

void SymplecticMatrix::addRow(const std::size_t target,
                              const std::size_t source, const Integer factor) {
  for (std::size_t col = 0U; col < 2 * nQudits; ++col) {
    matrix[target][col] =
        zx::mod(matrix[target][col] + factor * matrix[source][col], dim);
  }
}

void SymplecticMatrix::applyGate(const circuit::Gate& gate) {
  const auto target = gate.getTarget();
  const auto reps = gate.getRepetitions();
  switch (gate.getType()) {
  case circuit::GateType::X:
    applyX(target);
    break;
  case circuit::GateType::Z:
    applyZ(target);
    break;
  case circuit::GateType::S:
    applyS(target, reps);
    break;
  case circuit::GateType::H:
    applyH(target, reps);
    break;
  case circuit::GateType::MUL:
    applyMul(target, gate.getMultValue());
    break;
  case circuit::GateType::CX:
    applyCX(*gate.getControl(), target, reps);
    break;
  case circuit::GateType::CZ:
    applyCZ(*gate.getControl(), target, reps);
    break;
  case circuit::GateType::SWAP:
    if (zx::mod(reps, 2) == 1) {
      applySwap(*gate.getControl(), target);
    }
    break;
  }
}

void SymplecticMatrix::applyX(const Qudit target) { checkQudit(target); }

void SymplecticMatrix::applyZ(const Qudit target) { checkQudit(target); }

void SymplecticMatrix::applyS(const Qudit target, const Integer reps) {
  // z -> z - r x
  transformQudit(target, 1, 0, -reps, 1);
}

void SymplecticMatrix::applyH(const Qudit target, const Integer reps) {
  switch (zx::mod(reps, 4)) {
  case 1:
    // x -> -z, z -> x
    transformQudit(target, 0, -1, 1, 0);
    break;
  case 2:
    transformQudit(target, -1, 0, 0, -1);
    break;
  case 3:
    transformQudit(target, 0, 1, -1, 0);
    break;
  default:
    checkQudit(target);
    break;
  }
}

void SymplecticMatrix::applyMul(const Qudit target, const Integer multiplier) {
  const auto inverse = zx::requireInverse(multiplier, dim);
  transformQudit(target, multiplier, 0, 0, inverse);
}

void SymplecticMatrix::applyCX(const Qudit control, const Qudit target,
                               const Integer reps) {
  checkQudit(control);
  checkQudit(target);
  // both updates read rows that stay unchanged
  addRow(2 * control + 1, 2 * target + 1, -reps);
  addRow(2 * target, 2 * control, reps);
}

void SymplecticMatrix::applyCZ(const Qudit control, const Qudit target,
                               const Integer reps) {
  checkQudit(control);
  checkQudit(target);
  addRow(2 * control + 1, 2 * target, -reps);
  addRow(2 * target + 1, 2 * control, -reps);
}

void SymplecticMatrix::applySwap(const Qudit q1, const Qudit q2) {
  checkQudit(q1);
  checkQudit(q2);
  std::swap(matrix[2 * q1], matrix[2 * q2]);
  std::swap(matrix[2 * q1 + 1], matrix[2 * q2 + 1]);
}

bool SymplecticMatrix::isIdentity() const {
  for (std::size_t i = 0U; i < matrix.size(); ++i) {
    for (std::size_t j = 0U; j < matrix[i].size(); ++j) {
      if (matrix[i][j] != (i == j ? 1 : 0)) {
        return false;
      }
    }
  }
  return true;
}

void SymplecticMatrix::dump(const std::string& filename) const {
  auto of = std::ofstream(filename);
  if (!of.good()) {
    const auto msg = "Error opening file " + filename;
    PLOG_FATAL << msg;
    throw std::runtime_error(msg);
  }
  dump(of);
}

void SymplecticMatrix::dump(std::ostream& of) const { of << *this; }

void SymplecticMatrix::import(const std::string& filename) {
  auto is = std::ifstream(filename);
  if (!is.good()) {
    const auto msg = "Error opening file " + filename;
    PLOG_FATAL << msg;
    throw std::runtime_error(msg);
  }
  import(is);
}

void SymplecticMatrix::import(std::istream& is) {
  matrix.clear();

  std::string line;
  std::vector<std::string> data{};
  while (std::getline(is, line)) {
    parseLine(line, ';', {' ', '\r', '\n', '\t'}, data);
    RowType row{};
    for (const auto& datum : data) {
      if (datum.empty()) {
        continue;
      }
      row.emplace_back(zx::mod(std::stoll(datum), dim));
    }
    if (!row.empty()) {
      matrix.emplace_back(std::move(row));
    }
  }

  for (const auto& row : matrix) {
    if (row.size() != matrix.size()) {
      const auto msg = "Symplectic matrix is not square";
      PLOG_ERROR << msg;
      throw std::invalid_argument(msg);
    }
  }
  if (matrix.size() % 2 != 0) {
    const auto msg = "Symplectic matrix must have an even number of rows";
    PLOG_ERROR << msg;
    throw std::invalid_argument(msg);
  }
  nQudits = matrix.size() / 2;
}

std::string SymplecticMatrix::toString() const {
  std::stringstream ss;
  for (const auto& row : matrix) {
    for (const auto& entry : row) {
      ss << entry << ";";
    }
    ss << "\n";
  }
  return ss.str();
}

void SymplecticMatrix::fromString(const std::string& str) {
  std::stringstream ss(str);
  import(ss);
}
} // namespace clifford
