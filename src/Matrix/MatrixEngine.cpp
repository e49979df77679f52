/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "Matrix/MatrixEngine.hpp"

#include <array>
#include <utility>

#include "GlobalDefines.hpp"
#include "Mapping/Errors.hpp"

static void append_single_bit_functions(AddressFunction fn, std::vector<AddressFunction> &out) {
  for (size_t bit = 0; bit < MAX_MTX_SIZE; bit++) {
    if (fn & BIT_SET(bit)) {
      out.push_back(BIT_SET(bit));
    }
  }
}

std::vector<size_t> MatrixEngine::address_bits(const MappingScheme &scheme) {
  size_t referenced = scheme.get_column_function() | scheme.get_row_function();
  for (auto fn : scheme.get_bank_functions()) {
    referenced |= fn;
  }

  std::vector<size_t> bits;
  for (size_t bit = 0; bit < MAX_MTX_SIZE; bit++) {
    if (referenced & BIT_SET(bit)) {
      bits.push_back(bit);
    }
  }
  return bits;
}

std::vector<AddressFunction> MatrixEngine::row_functions(const MappingScheme &scheme) {
  std::vector<AddressFunction> fns(scheme.get_bank_functions());
  append_single_bit_functions(scheme.get_column_function(), fns);
  append_single_bit_functions(scheme.get_row_function(), fns);
  return fns;
}

DramMatrix MatrixEngine::build_forward(const MappingScheme &scheme) {
  const size_t size = scheme.matrix_size();
  if (size > MAX_MTX_SIZE) {
    throw DimensionError(format_string(
        "Scheme '%s': matrix size %zu (%zu bank + %zu column + %zu row bits) exceeds the maximum of %zu.",
        scheme.get_name().c_str(), size, scheme.bank_bits(), scheme.column_bits(), scheme.row_bits(), MAX_MTX_SIZE));
  }

  auto bits = address_bits(scheme);
  if (bits.size() != size) {
    throw DimensionError(format_string(
        "Scheme '%s': functions reference %zu distinct address bits, but the matrix size is %zu "
        "(%zu bank + %zu column + %zu row bits).",
        scheme.get_name().c_str(), bits.size(), size, scheme.bank_bits(), scheme.column_bits(), scheme.row_bits()));
  }

  // raw address bit -> compacted position
  std::array<size_t, MAX_MTX_SIZE> position {};
  for (size_t pos = 0; pos < bits.size(); pos++) {
    position[bits[pos]] = pos;
  }

  auto fns = row_functions(scheme);
  DramMatrix matrix(size);
  for (size_t i = 0; i < fns.size(); i++) {
    for (size_t bit = 0; bit < MAX_MTX_SIZE; bit++) {
      if (fns[i] & BIT_SET(bit)) {
        matrix.set(i, position[bit], true);
      }
    }
  }

  Logger::log_debug(format_string("Built %zux%zu DRAM matrix for scheme '%s'.", size, size, scheme.get_name().c_str()));
  return matrix;
}

AddressMatrix MatrixEngine::invert(const DramMatrix &matrix) {
  const size_t size = matrix.size();

  // Gauss-Jordan elimination in GF(2): reduce work to the identity and apply each row operation to inv as well.
  std::vector<size_t> work(matrix.get_rows());
  std::vector<size_t> inv(AddressMatrix::identity(size).get_rows());

  for (size_t col = 0; col < size; col++) {
    // Find the pivot row for this column.
    size_t pivot = col;
    while (pivot < size && !(work[pivot] & BIT_SET(col))) {
      pivot++;
    }
    if (pivot==size) {
      throw SingularMatrixError(format_string(
          "%zux%zu matrix is singular over GF(2): no pivot for column %zu (rank < %zu).",
          size, size, col, size));
    }

    std::swap(work[col], work[pivot]);
    std::swap(inv[col], inv[pivot]);

    // Clear this column in all other rows by XOR-ing them with the pivot row.
    for (size_t i = 0; i < size; i++) {
      if (i!=col && (work[i] & BIT_SET(col))) {
        work[i] ^= work[col];
        inv[i] ^= inv[col];
      }
    }
  }

  return AddressMatrix(std::move(inv));
}
