/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_MATRIX_MATRIXENGINE_HPP_
#define MATGEN_INCLUDE_MATRIX_MATRIXENGINE_HPP_

#include <vector>

#include "Mapping/MappingScheme.hpp"
#include "Matrix/BitMatrix.hpp"

// maps (compacted) physical address bits -> DRAM address bits (bank | column | row)
using DramMatrix = BitMatrix;
// maps DRAM address bits -> (compacted) physical address bits
using AddressMatrix = BitMatrix;

class MatrixEngine {
 public:
  // The physical address bits referenced by any of the scheme's functions, in ascending order. The index of an
  // address bit in this list is its compacted position, i.e., its column in the DRAM matrix.
  static std::vector<size_t> address_bits(const MappingScheme &scheme);

  // The scheme's functions in matrix row order: bank functions as given, then one single-bit function per
  // column bit and per row bit, each from the lowest to the highest address bit.
  static std::vector<AddressFunction> row_functions(const MappingScheme &scheme);

  // Builds the W x W DRAM matrix. Row i has a 1 in column j iff compacted address bit j contributes to DRAM
  // address bit i. Throws a DimensionError if the scheme does not reference exactly W address bits.
  static DramMatrix build_forward(const MappingScheme &scheme);

  // Inverts the matrix over GF(2) by Gauss-Jordan elimination. Throws a SingularMatrixError if there is no
  // inverse, i.e., the mapping is not bijective.
  static AddressMatrix invert(const DramMatrix &matrix);
};

#endif //MATGEN_INCLUDE_MATRIX_MATRIXENGINE_HPP_
