/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_MATRIX_BITMATRIX_HPP_
#define MATGEN_INCLUDE_MATRIX_BITMATRIX_HPP_

#include <cstddef>
#include <string>
#include <vector>

// A square matrix over GF(2) with at most MAX_MTX_SIZE rows. Each row is stored as one word where bit j holds
// the entry in column j, i.e., the first column is at the LSB.
class BitMatrix {
 private:
  std::vector<size_t> rows;

 public:
  BitMatrix() = default;

  // Creates a size x size zero matrix.
  explicit BitMatrix(size_t size);

  // Takes the rows as given; the matrix is square, so only bits below rows.size() may be set.
  explicit BitMatrix(std::vector<size_t> rows);

  static BitMatrix identity(size_t size);

  [[nodiscard]] size_t size() const { return rows.size(); }

  [[nodiscard]] size_t row(size_t i) const { return rows.at(i); }

  [[nodiscard]] const std::vector<size_t> &get_rows() const { return rows; }

  [[nodiscard]] bool get(size_t i, size_t j) const { return (rows.at(i) >> j) & 1ULL; }

  void set(size_t i, size_t j, bool value);

  // Computes this * other, where addition is XOR and multiplication is AND.
  [[nodiscard]] BitMatrix multiply(const BitMatrix &other) const;

  [[nodiscard]] bool is_identity() const;

  // Computes this * vec, where bit j of vec is the j-th vector entry. Bit i of the result is the parity of
  // (row i AND vec).
  [[nodiscard]] size_t apply(size_t vec) const;

  // Mask with the lowest size() bits set.
  [[nodiscard]] size_t column_mask() const;

  // One line per row, column 0 printed rightmost.
  [[nodiscard]] std::string to_string() const;

  bool operator==(const BitMatrix &other) const { return rows == other.rows; }

  bool operator!=(const BitMatrix &other) const { return !(*this == other); }
};

#endif //MATGEN_INCLUDE_MATRIX_BITMATRIX_HPP_
