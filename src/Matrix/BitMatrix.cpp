/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "Matrix/BitMatrix.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "GlobalDefines.hpp"

BitMatrix::BitMatrix(size_t size) {
  if (size > MAX_MTX_SIZE) {
    throw std::length_error(format_string("BitMatrix: size %zu exceeds the maximum of %zu.", size, MAX_MTX_SIZE));
  }
  rows.assign(size, 0);
}

BitMatrix::BitMatrix(std::vector<size_t> rows) : rows(std::move(rows)) {
  if (this->rows.size() > MAX_MTX_SIZE) {
    throw std::length_error(format_string("BitMatrix: size %zu exceeds the maximum of %zu.",
        this->rows.size(), MAX_MTX_SIZE));
  }
  for (auto r : this->rows) {
    if ((r & ~column_mask()) != 0) {
      throw std::invalid_argument(format_string("BitMatrix: row 0x%zx has bits beyond column %zu.",
          r, this->rows.size() - 1));
    }
  }
}

BitMatrix BitMatrix::identity(size_t size) {
  BitMatrix result(size);
  for (size_t i = 0; i < size; i++) {
    result.rows[i] = BIT_SET(i);
  }
  return result;
}

void BitMatrix::set(size_t i, size_t j, bool value) {
  if (j >= size()) {
    throw std::out_of_range(format_string("BitMatrix: column %zu out of range (size %zu).", j, size()));
  }
  if (value) {
    rows.at(i) |= BIT_SET(j);
  } else {
    rows.at(i) &= ~BIT_SET(j);
  }
}

BitMatrix BitMatrix::multiply(const BitMatrix &other) const {
  if (size() != other.size()) {
    throw std::invalid_argument(format_string("BitMatrix: cannot multiply %zux%zu with %zux%zu matrix.",
        size(), size(), other.size(), other.size()));
  }

  // result[i] = XOR of all other[k] where this[i][k] = 1
  BitMatrix result(size());
  for (size_t i = 0; i < size(); i++) {
    size_t acc = 0;
    for (size_t k = 0; k < size(); k++) {
      if (get(i, k)) acc ^= other.rows[k];
    }
    result.rows[i] = acc;
  }
  return result;
}

bool BitMatrix::is_identity() const {
  for (size_t i = 0; i < size(); i++) {
    if (rows[i] != BIT_SET(i)) {
      return false;
    }
  }
  return true;
}

size_t BitMatrix::apply(size_t vec) const {
  size_t result = 0;
  for (size_t i = 0; i < size(); i++) {
    result |= (size_t)__builtin_parityll(rows[i] & vec) << i;
  }
  return result;
}

size_t BitMatrix::column_mask() const {
  return (size() >= MAX_MTX_SIZE) ? ~0ULL : (BIT_SET(size()) - 1);
}

std::string BitMatrix::to_string() const {
  std::stringstream ss;
  for (size_t i = 0; i < size(); i++) {
    for (size_t j = size(); j-- > 0;) {
      ss << (get(i, j) ? '1' : '0');
    }
    if (i + 1 < size()) ss << "\n";
  }
  return ss.str();
}
