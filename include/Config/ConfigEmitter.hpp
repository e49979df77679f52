/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_CONFIG_CONFIGEMITTER_HPP_
#define MATGEN_INCLUDE_CONFIG_CONFIGEMITTER_HPP_

#include <string>
#include <vector>

#include "Config/MemConfiguration.hpp"
#include "Mapping/MappingScheme.hpp"
#include "Matrix/MatrixEngine.hpp"

#ifdef ENABLE_JSON
#include <nlohmann/json.hpp>
#endif

class ConfigEmitter {
 private:
  // Bit index in the linearized DRAM address (bank | column | row) produced by DRAM matrix row r.
  static size_t linearized_bit(const MemConfiguration &cfg, size_t r);

  // Name of a linearized DRAM address bit, e.g., "bank b2".
  static std::string dram_bit_name(const MemConfiguration &cfg, size_t linearized);

 public:
  // Packages a scheme's matrices with the shifts and masks of the row (lowest), column and bank (highest) field
  // of the linearized DRAM address. Pure: the same inputs always yield the same configuration.
  static MemConfiguration render(const MappingScheme &scheme,
                                 const DramMatrix &dram_matrix,
                                 const AddressMatrix &addr_matrix);

  // Returns the registry extended by the given configuration. Throws std::invalid_argument if the registry
  // already holds a configuration with the same identifier.
  static ConfigRegistry register_config(ConfigRegistry registry, MemConfiguration config);

  // Runs a scheme through validate, build_forward, invert and render, then checks the result. Throws the
  // MatGenError of the first failing step, prefixed with the scheme name where the step does not know it.
  static MemConfiguration generate(const MappingScheme &scheme, bool verbose = false);

  // Generates and registers each scheme in turn. A scheme that fails is logged, its name appended to
  // failed_schemes, and skipped; it never affects the other schemes.
  static ConfigRegistry generate_registry(const std::vector<MappingScheme> &schemes,
                                          bool verbose,
                                          std::vector<std::string> &failed_schemes);

  // The C++ initializer expression of the configuration's identifier.
  static std::string identifier_expression(const MemConfiguration &cfg);

  // A single 'struct MemConfiguration' definition named after the configuration.
  static std::string to_source(const MemConfiguration &cfg);

  // The DRAMAddr::initialize_configs() function defining all registered configurations.
  static std::string to_source(const ConfigRegistry &registry);

#ifdef ENABLE_JSON
  static nlohmann::json to_json(const ConfigRegistry &registry);
#endif
};

#endif //MATGEN_INCLUDE_CONFIG_CONFIGEMITTER_HPP_
