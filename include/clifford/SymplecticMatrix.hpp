//
// This file is part of the QuditZX library released under the MIT license.
// See README.md for more information.
//

#pragma once

#include "circuit/Circuit.hpp"
#include "circuit/Gate.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace clifford {
using circuit::Integer;
using circuit::Qudit;

/**
 * @brief The 2n x 2n symplectic matrix over Z_d of a qudit Clifford circuit.
 * @details Rows and columns are ordered (x_0, z_0, x_1, z_1, ...). A gate
 * applied after the current circuit multiplies the matrix from the left, so
 * the matrix of g_1, ..., g_k is M_k * ... * M_1. Pauli gates only change
 * phases and act as the identity. Two circuits implement the same Clifford
 * operation up to Pauli corrections iff their matrices are equal.
 */
class SymplecticMatrix {
  using RowType = std::vector<Integer>;
  using MatrixType = std::vector<RowType>;
  std::size_t nQudits{};
  Integer dim{};
  MatrixType matrix;

  /// Applies [[a, b], [c, e]] to the (x_q, z_q) rows.
  void transformQudit(Qudit q, Integer a, Integer b, Integer c, Integer e);
  /// row(target) += factor * row(source)
  void addRow(std::size_t target, std::size_t source, Integer factor);
  void checkQudit(Qudit q) const;

public:
  /// The identity on `nq` qudits of dimension `d`.
  SymplecticMatrix(std::size_t nq, Integer d);
  explicit SymplecticMatrix(const circuit::Circuit& qc);
  SymplecticMatrix(const std::string& description, Integer d);

  [[nodiscard]] std::size_t getQuditCount() const { return nQudits; }
  [[nodiscard]] Integer getDim() const { return dim; }
  [[nodiscard]] const RowType& operator[](const std::size_t index) const {
    return matrix[index];
  }
  [[nodiscard]] const MatrixType& getMatrix() const { return matrix; }

  void applyGate(const circuit::Gate& gate);
  void applyX(Qudit target);
  void applyZ(Qudit target);
  void applyS(Qudit target, Integer reps = 1);
  void applyH(Qudit target, Integer reps = 1);
  void applyMul(Qudit target, Integer multiplier);
  void applyCX(Qudit control, Qudit target, Integer reps = 1);
  void applyCZ(Qudit control, Qudit target, Integer reps = 1);
  void applySwap(Qudit q1, Qudit q2);

  [[nodiscard]] bool isIdentity() const;

  void dump(const std::string& filename) const;
  void dump(std::ostream& of) const;
  void import(const std::string& filename);
  void import(std::istream& is);

  [[gnu::pure]] friend bool operator==(const SymplecticMatrix& lhs,
                                       const SymplecticMatrix& rhs) {
    return lhs.dim == rhs.dim && lhs.matrix == rhs.matrix;
  }
  [[gnu::pure]] friend bool operator!=(const SymplecticMatrix& lhs,
                                       const SymplecticMatrix& rhs) {
    return !(lhs == rhs);
  }

  friend std::ostream& operator<<(std::ostream& os,
                                  const SymplecticMatrix& sm) {
    os << sm.toString();
    return os;
  }
  friend std::istream& operator>>(std::istream& is, SymplecticMatrix& sm) {
    if (is.good()) {
      std::stringstream ss;
      ss << is.rdbuf();
      sm.fromString(ss.str());
    }
    return is;
  }

  [[nodiscard]] std::string toString() const;
  void fromString(const std::string& str);
};
} // namespace clifford
