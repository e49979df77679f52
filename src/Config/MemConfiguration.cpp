/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "Config/MemConfiguration.hpp"

#include <bitset>

#include "GlobalDefines.hpp"

static bool matrix_product_is_identity_matrix(std::vector<size_t> const& mat_a, std::vector<size_t> const& mat_b) {
  // NOTE: This assumes square matrices of the same size.
  auto size = mat_a.size();

  std::vector<size_t> result(size, 0);

  // NOTE: The first column of the matrix is at the MSB, so we have to "reverse" the column index.
  for (size_t i = 0; i < size; i++) {
    for (size_t k = 0; k < size; k++) {
      // A[i][k] = 1 adds row k of B
      if ((mat_a[i] >> (size - k - 1)) & 0x1) {
        result[i] ^= mat_b[k];
      }
    }
  }

  // Verify we have the identity matrix.
  for (size_t i = 0; i < size; i++) {
    auto expected = BIT_SET(size - i - 1);
    if (result[i] != expected) {
      return false;
    }
  }

  return true;
}

// an empty field may sit at shift == MAX_MTX_SIZE, where a plain shift is undefined
static size_t shifted_mask(size_t mask, size_t shift) {
  return (shift >= MAX_MTX_SIZE) ? 0 : (mask << shift);
}

bool MemConfiguration::check_validity() const {
  // Check the number of DRAM address bits is the same as the matrix size.
  size_t total_num_bits = bank_bits() + row_bits() + column_bits();
  if (total_num_bits != matrix_size) {
    Logger::log_error(format_string(
        "[%s] Total number of DRAM address bits (bank + row + column = %zu) did not match address matrix size %zu.",
        name.c_str(), total_num_bits, matrix_size));
    return false;
  }

  // Check the matrices are of the size specified.
  if (dram_matrix.size() != matrix_size || addr_matrix.size() != matrix_size) {
    Logger::log_error(format_string("[%s] The address matrices do not have the size indicated in 'matrix_size'.",
        name.c_str()));
    return false;
  }

  // Check the masks of the different DRAM address parts don't overlap. Do this by checking that the OR of all
  // masks has the required shape (i.e., the (matrix_size) least significant bits are set).
  size_t combined_mask = shifted_mask(bank_mask, bank_shift)
      | shifted_mask(row_mask, row_shift)
      | shifted_mask(column_mask, column_shift);
  size_t required_mask = (matrix_size >= MAX_MTX_SIZE) ? ~0ULL : (BIT_SET(matrix_size) - 1);
  if (combined_mask != required_mask) {
    Logger::log_error(format_string(
        "[%s] The combined mask of all DRAM address parts is\n  %s,\nwhich is different from the mask required:\n  %s",
        name.c_str(),
        std::bitset<MAX_MTX_SIZE>(combined_mask).to_string().c_str(),
        std::bitset<MAX_MTX_SIZE>(required_mask).to_string().c_str()));
    return false;
  }

  // Check that dram_matrix and addr_matrix are inverses of each other (by checking that their product is the
  // identity matrix).
  if (!matrix_product_is_identity_matrix(dram_matrix, addr_matrix)) {
    Logger::log_error(format_string("[%s] The address matrix is not the inverse of the DRAM matrix.", name.c_str()));
    return false;
  }

  return true;
}

bool MemConfiguration::operator==(const MemConfiguration &other) const {
  return name == other.name
      && channels == other.channels
      && dimms == other.dimms
      && ranks == other.ranks
      && banks == other.banks
      && identifier == other.identifier
      && bank_shift == other.bank_shift
      && bank_mask == other.bank_mask
      && row_shift == other.row_shift
      && row_mask == other.row_mask
      && column_shift == other.column_shift
      && column_mask == other.column_mask
      && matrix_size == other.matrix_size
      && dram_matrix == other.dram_matrix
      && addr_matrix == other.addr_matrix
      && address_bits == other.address_bits;
}

#ifdef ENABLE_JSON

void to_json(nlohmann::json &j, const MemConfiguration &cfg) {
  j = {{ "name", cfg.name },
       { "channels", cfg.channels },
       { "dimms", cfg.dimms },
       { "ranks", cfg.ranks },
       { "banks", cfg.banks },
       { "identifier", cfg.identifier },
       { "bank_shift", cfg.bank_shift },
       { "bank_mask", cfg.bank_mask },
       { "row_shift", cfg.row_shift },
       { "row_mask", cfg.row_mask },
       { "column_shift", cfg.column_shift },
       { "column_mask", cfg.column_mask },
       { "matrix_size", cfg.matrix_size },
       { "dram_matrix", cfg.dram_matrix },
       { "addr_matrix", cfg.addr_matrix },
       { "address_bits", cfg.address_bits }
  };
}

#endif
