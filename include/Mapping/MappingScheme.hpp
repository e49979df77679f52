/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_MAPPING_MAPPINGSCHEME_HPP_
#define MATGEN_INCLUDE_MAPPING_MAPPINGSCHEME_HPP_

#include <cstddef>
#include <string>
#include <vector>

// A mask over physical address bits. The output bit it produces is the XOR (parity) of all masked bits.
using AddressFunction = size_t;

// Describes how a memory controller interleaves physical addresses over the DRAM topology. Instances are
// immutable values: a variant of a scheme is a new, fully specified MappingScheme.
class MappingScheme {
 private:
  std::string name;

  size_t channel_count;
  size_t dimm_count;
  size_t rank_count;
  size_t bank_count;

  // one function per bank bit (rank, bank group and bank bits are all lumped together as "bank"),
  // the first function yields the most significant bank bit
  std::vector<AddressFunction> bank_functions;

  // the address bits forming the column and row, respectively
  AddressFunction column_function;
  AddressFunction row_function;

 public:
  MappingScheme(std::string name,
                size_t channel_count,
                size_t dimm_count,
                size_t rank_count,
                size_t bank_count,
                std::vector<AddressFunction> bank_functions,
                AddressFunction column_function,
                AddressFunction row_function);

  [[nodiscard]] const std::string &get_name() const { return name; }
  [[nodiscard]] size_t get_channel_count() const { return channel_count; }
  [[nodiscard]] size_t get_dimm_count() const { return dimm_count; }
  [[nodiscard]] size_t get_rank_count() const { return rank_count; }
  [[nodiscard]] size_t get_bank_count() const { return bank_count; }

  [[nodiscard]] const std::vector<AddressFunction> &get_bank_functions() const { return bank_functions; }
  [[nodiscard]] AddressFunction get_column_function() const { return column_function; }
  [[nodiscard]] AddressFunction get_row_function() const { return row_function; }

  [[nodiscard]] size_t bank_bits() const { return bank_functions.size(); }
  [[nodiscard]] size_t column_bits() const { return __builtin_popcountll(column_function); }
  [[nodiscard]] size_t row_bits() const { return __builtin_popcountll(row_function); }

  // The size W of the (square) DRAM and address matrices.
  [[nodiscard]] size_t matrix_size() const { return bank_bits() + column_bits() + row_bits(); }

  // Checks that the number of bank functions equals log2(#ranks) + log2(#banks). Returns true or throws a
  // SchemeMismatchError.
  bool validate() const;

  [[nodiscard]] std::string to_string() const;
};

#endif //MATGEN_INCLUDE_MAPPING_MAPPINGSCHEME_HPP_
