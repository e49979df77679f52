/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_MAPPING_SCHEMELOADER_HPP_
#define MATGEN_INCLUDE_MAPPING_SCHEMELOADER_HPP_

#include <string>
#include <vector>

#include "Mapping/MappingScheme.hpp"

namespace YAML {
class Node;
}

// Reads mapping schemes from a YAML file of the form
//
//   schemes:
//     - name: coffeelake_1r_16b
//       channels: 1
//       dimms: 1
//       ranks: 1
//       banks: 16
//       bank_functions: [0x2040, 0x24000, 0x48000, 0x90000]
//       column_function: 0x3fbf
//       row_function: 0x3ffe0000
//
// Integers may be given in decimal, hexadecimal (0x) or binary (0b). All errors are reported as SchemeFileError.
class SchemeLoader {
 private:
  static MappingScheme parse_scheme(const YAML::Node &node, size_t index);

  static std::vector<MappingScheme> load_node(const YAML::Node &root, const std::string &origin);

 public:
  // Parses an integer literal in decimal, hexadecimal (0x) or binary (0b) notation.
  static size_t parse_integer(const std::string &literal);

  static std::vector<MappingScheme> load_string(const std::string &yaml);

  static std::vector<MappingScheme> load_file(const std::string &filepath);

  // Returns the scheme with the given name. Throws a SchemeFileError listing the available schemes if there is
  // none; origin names where the schemes came from.
  static const MappingScheme &find(const std::vector<MappingScheme> &schemes,
                                   const std::string &scheme_name,
                                   const std::string &origin);

  // Loads only the scheme with the given name.
  static MappingScheme load_file(const std::string &filepath, const std::string &scheme_name);
};

#endif //MATGEN_INCLUDE_MAPPING_SCHEMELOADER_HPP_
