/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "Mapping/MappingScheme.hpp"
#include "Mapping/Errors.hpp"
#include "Utilities/Logger.hpp"

#include <sstream>
#include <utility>

static bool is_power_of_two(size_t value) {
  return value != 0 && (value & (value - 1)) == 0;
}

MappingScheme::MappingScheme(std::string name,
                             size_t channel_count,
                             size_t dimm_count,
                             size_t rank_count,
                             size_t bank_count,
                             std::vector<AddressFunction> bank_functions,
                             AddressFunction column_function,
                             AddressFunction row_function)
    : name(std::move(name)), channel_count(channel_count), dimm_count(dimm_count), rank_count(rank_count),
      bank_count(bank_count), bank_functions(std::move(bank_functions)), column_function(column_function),
      row_function(row_function) {
}

bool MappingScheme::validate() const {
  // a non-power-of-two count has no integral log2, hence no number of functions can ever match it
  if (!is_power_of_two(rank_count) || !is_power_of_two(bank_count)) {
    throw SchemeMismatchError(format_string(
        "Scheme '%s': #ranks (%zu) and #banks (%zu) must be powers of two, cannot derive the expected number of "
        "bank functions (%zu given).",
        name.c_str(), rank_count, bank_count, bank_functions.size()));
  }

  size_t expected_functions = __builtin_ctzll(rank_count) + __builtin_ctzll(bank_count);
  if (expected_functions != bank_functions.size()) {
    throw SchemeMismatchError(format_string(
        "Scheme '%s': number of functions mismatch, expected %zu (log2(%zu ranks) + log2(%zu banks)) but got %zu.",
        name.c_str(), expected_functions, rank_count, bank_count, bank_functions.size()));
  }

  return true;
}

std::string MappingScheme::to_string() const {
  std::stringstream ss;
  ss << name << " (chans=" << channel_count
     << ", dimms=" << dimm_count
     << ", ranks=" << rank_count
     << ", banks=" << bank_count << ")" << std::hex;
  ss << " bank_fns={";
  for (size_t i = 0; i < bank_functions.size(); ++i) {
    ss << (i==0 ? "" : ", ") << "0x" << bank_functions[i];
  }
  ss << "} col_fn=0x" << column_function
     << " row_fn=0x" << row_function;
  return ss.str();
}
