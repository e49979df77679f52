/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_CONFIG_MEMCONFIGURATION_HPP_
#define MATGEN_INCLUDE_CONFIG_MEMCONFIGURATION_HPP_

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#ifdef ENABLE_JSON
#include <nlohmann/json.hpp>
#endif

// CHANS(#channels) | DIMMS(#dimms) | RANKS(#ranks) | BANKS(#banks)
typedef size_t mem_config_t;

// Everything the DRAMAddr/DRAMConfig address translation needs for one memory configuration. The matrices are
// laid out the way it applies them: the linearized DRAM address is (bank | column | row), composed by shift and
// mask, and the first matrix row yields its most significant bit.
struct MemConfiguration {
  // the scheme this configuration was derived from
  std::string name;
  size_t channels { 0 };
  size_t dimms { 0 };
  size_t ranks { 0 };
  size_t banks { 0 };

  mem_config_t identifier { 0 };

  // Internally, all "higher-order" address parts (e.g., rank, bank group, bank) are lumped together as "bank".
  size_t bank_shift { 0 };
  size_t bank_mask { 0 };

  size_t row_shift { 0 };
  size_t row_mask { 0 };

  size_t column_shift { 0 };
  size_t column_mask { 0 };

  size_t matrix_size { 0 };
  // maps physical addr -> DRAM addr (bank | col | row)
  std::vector<size_t> dram_matrix;
  // maps DRAM addr (bank | col | row) -> physical addr
  std::vector<size_t> addr_matrix;

  // compacted address position -> physical address bit
  std::vector<size_t> address_bits;

  [[nodiscard]] size_t bank_bits() const { return __builtin_popcountll(bank_mask); }
  [[nodiscard]] size_t row_bits() const { return __builtin_popcountll(row_mask); }
  [[nodiscard]] size_t column_bits() const { return __builtin_popcountll(column_mask); }

  // Checks the same preconditions DRAMConfig checks when loading a configuration: the field masks tile the
  // matrix size, both matrices have matrix_size rows, and dram_matrix * addr_matrix is the identity. Logs the
  // first violated condition and returns false.
  [[nodiscard]] bool check_validity() const;

  bool operator==(const MemConfiguration &other) const;
};

// identifier -> configuration, built once per generator invocation
using ConfigRegistry = std::map<mem_config_t, MemConfiguration>;

#ifdef ENABLE_JSON

void to_json(nlohmann::json &j, const MemConfiguration &cfg);

#endif

#endif //MATGEN_INCLUDE_CONFIG_MEMCONFIGURATION_HPP_
