/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "Config/ConfigEmitter.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "GlobalDefines.hpp"
#include "Mapping/Errors.hpp"

static size_t mask_of_width(size_t width) {
  return (width >= MAX_MTX_SIZE) ? ~0ULL : (BIT_SET(width) - 1);
}

static std::string to_binary_literal(size_t value, size_t width) {
  std::string digits;
  for (size_t i = width; i-- > 0;) {
    digits += ((value >> i) & 1) ? '1' : '0';
  }
  return "0b" + (digits.empty() ? std::string("0") : digits);
}

static std::string variable_name(const MemConfiguration &cfg) {
  std::string name = "dram_cfg_";
  for (auto c : cfg.name) {
    name += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
  }
  return name;
}

size_t ConfigEmitter::linearized_bit(const MemConfiguration &cfg, size_t r) {
  auto num_bank_bits = cfg.bank_bits();
  auto num_column_bits = cfg.column_bits();
  if (r < num_bank_bits) {
    // the first bank function yields the most significant bank bit
    return cfg.bank_shift + (num_bank_bits - 1 - r);
  } else if (r < num_bank_bits + num_column_bits) {
    return cfg.column_shift + (r - num_bank_bits);
  }
  return cfg.row_shift + (r - num_bank_bits - num_column_bits);
}

std::string ConfigEmitter::dram_bit_name(const MemConfiguration &cfg, size_t linearized) {
  if (linearized >= cfg.bank_shift) {
    return format_string("bank b%zu", linearized - cfg.bank_shift);
  } else if (linearized >= cfg.column_shift) {
    return format_string("col b%zu", linearized - cfg.column_shift);
  }
  return format_string("row b%zu", linearized - cfg.row_shift);
}

MemConfiguration ConfigEmitter::render(const MappingScheme &scheme,
                                       const DramMatrix &dram_matrix,
                                       const AddressMatrix &addr_matrix) {
  const size_t size = scheme.matrix_size();
  if (dram_matrix.size() != size || addr_matrix.size() != size) {
    throw std::invalid_argument(format_string(
        "Scheme '%s': cannot render %zux%zu DRAM and %zux%zu address matrix for matrix size %zu.",
        scheme.get_name().c_str(), dram_matrix.size(), dram_matrix.size(), addr_matrix.size(), addr_matrix.size(),
        size));
  }

  MemConfiguration cfg;
  cfg.name = scheme.get_name();
  cfg.channels = scheme.get_channel_count();
  cfg.dimms = scheme.get_dimm_count();
  cfg.ranks = scheme.get_rank_count();
  cfg.banks = scheme.get_bank_count();
  cfg.identifier = MEM_CONFIG(cfg.channels, cfg.dimms, cfg.ranks, cfg.banks);

  // shifts are cumulative field widths: row at the bottom, then column, then bank
  cfg.row_shift = 0;
  cfg.row_mask = mask_of_width(scheme.row_bits());
  cfg.column_shift = scheme.row_bits();
  cfg.column_mask = mask_of_width(scheme.column_bits());
  cfg.bank_shift = scheme.row_bits() + scheme.column_bits();
  cfg.bank_mask = mask_of_width(scheme.bank_bits());

  cfg.matrix_size = size;
  cfg.address_bits = MatrixEngine::address_bits(scheme);

  // The first row of both matrices yields the most significant bit of the respective result. DRAM matrix row r
  // yields linearized DRAM bit L, hence it goes to index (size - 1 - L) and becomes bit L in the address matrix.
  cfg.dram_matrix.assign(size, 0);
  cfg.addr_matrix.assign(size, 0);
  for (size_t r = 0; r < size; r++) {
    cfg.dram_matrix[size - 1 - linearized_bit(cfg, r)] = dram_matrix.row(r);
  }
  for (size_t pos = 0; pos < size; pos++) {
    size_t row = 0;
    for (size_t r = 0; r < size; r++) {
      if (addr_matrix.get(pos, r)) {
        row |= BIT_SET(linearized_bit(cfg, r));
      }
    }
    cfg.addr_matrix[size - 1 - pos] = row;
  }

  return cfg;
}

ConfigRegistry ConfigEmitter::register_config(ConfigRegistry registry, MemConfiguration config) {
  auto it = registry.find(config.identifier);
  if (it != registry.end()) {
    throw std::invalid_argument(format_string(
        "Cannot register configuration '%s': identifier %s is already used by '%s'.",
        config.name.c_str(), identifier_expression(config).c_str(), it->second.name.c_str()));
  }
  auto identifier = config.identifier;
  registry.emplace(identifier, std::move(config));
  return registry;
}

MemConfiguration ConfigEmitter::generate(const MappingScheme &scheme, bool verbose) {
  scheme.validate();

  auto dram_matrix = MatrixEngine::build_forward(scheme);

  std::stringstream bits;
  for (auto bit : MatrixEngine::address_bits(scheme)) bits << " " << bit;
  Logger::log_data(format_string("    matrix size = %zu (%zu bank + %zu column + %zu row bits)",
      scheme.matrix_size(), scheme.bank_bits(), scheme.column_bits(), scheme.row_bits()));
  Logger::log_data(format_string("    address bits =%s", bits.str().c_str()));

  AddressMatrix addr_matrix;
  try {
    addr_matrix = MatrixEngine::invert(dram_matrix);
  } catch (const SingularMatrixError &e) {
    throw SingularMatrixError(format_string("Scheme '%s': %s", scheme.get_name().c_str(), e.what()));
  }

  if (verbose) {
    Logger::log_data("    DRAM matrix (column 0 = lowest address bit rightmost):");
    Logger::log_data(dram_matrix.to_string());
    Logger::log_data("    address matrix:");
    Logger::log_data(addr_matrix.to_string());
  }

  auto cfg = render(scheme, dram_matrix, addr_matrix);
  if (!cfg.check_validity()) {
    throw std::logic_error(format_string("Scheme '%s': generated configuration is inconsistent.",
        scheme.get_name().c_str()));
  }
  return cfg;
}

ConfigRegistry ConfigEmitter::generate_registry(const std::vector<MappingScheme> &schemes,
                                                bool verbose,
                                                std::vector<std::string> &failed_schemes) {
  ConfigRegistry registry;
  for (const auto &scheme : schemes) {
    Logger::log_highlight(format_string("Generating configuration for %s", scheme.to_string().c_str()));
    try {
      auto cfg = generate(scheme, verbose);
      registry = register_config(registry, cfg);
      Logger::log_success(format_string("Scheme '%s' -> %s", scheme.get_name().c_str(),
          identifier_expression(cfg).c_str()));
    } catch (const MatGenError &e) {
      Logger::log_error(e.what());
      failed_schemes.push_back(scheme.get_name());
    } catch (const std::logic_error &e) {
      Logger::log_error(e.what());
      failed_schemes.push_back(scheme.get_name());
    }
  }
  return registry;
}

std::string ConfigEmitter::identifier_expression(const MemConfiguration &cfg) {
  return format_string("(CHANS(%zuUL) | DIMMS(%zuUL) | RANKS(%zuUL) | BANKS(%zuUL))",
      cfg.channels, cfg.dimms, cfg.ranks, cfg.banks);
}

std::string ConfigEmitter::to_source(const MemConfiguration &cfg) {
  const size_t size = cfg.matrix_size;
  std::stringstream ss;

  ss << "  // " << cfg.name << ": " << size << "-bit DRAM address matrix\n";
  ss << "  struct MemConfiguration " << variable_name(cfg) << " = {\n";
  ss << "      .IDENTIFIER = " << identifier_expression(cfg) << ",\n";
  ss << "      .BK_SHIFT = " << cfg.bank_shift << ",\n";
  ss << "      .BK_MASK = (" << to_binary_literal(cfg.bank_mask, cfg.bank_bits()) << "),\n";
  ss << "      .ROW_SHIFT = " << cfg.row_shift << ",\n";
  ss << "      .ROW_MASK = (" << to_binary_literal(cfg.row_mask, cfg.row_bits()) << "),\n";
  ss << "      .COL_SHIFT = " << cfg.column_shift << ",\n";
  ss << "      .COL_MASK = (" << to_binary_literal(cfg.column_mask, cfg.column_bits()) << "),\n";

  ss << "      .DRAM_MTX = {\n";
  for (size_t i = 0; i < size; i++) {
    auto row = cfg.dram_matrix[i];
    ss << "          " << to_binary_literal(row, size) << (i + 1 < size ? ", " : "  ")
       << "/* " << dram_bit_name(cfg, size - 1 - i) << " =";
    bool first = true;
    for (size_t pos = 0; pos < size; pos++) {
      if (row & BIT_SET(pos)) {
        ss << (first ? " addr b" : " + b") << cfg.address_bits.at(pos);
        first = false;
      }
    }
    ss << " */\n";
  }
  ss << "      },\n";

  ss << "      .ADDR_MTX = {\n";
  for (size_t i = 0; i < size; i++) {
    auto row = cfg.addr_matrix[i];
    ss << "          " << to_binary_literal(row, size) << (i + 1 < size ? ", " : "  ")
       << "/* addr b" << cfg.address_bits.at(size - 1 - i) << " =";
    bool first = true;
    for (size_t bit = size; bit-- > 0;) {
      if (row & BIT_SET(bit)) {
        ss << (first ? " " : " + ") << dram_bit_name(cfg, bit);
        first = false;
      }
    }
    ss << " */\n";
  }
  ss << "      }\n";
  ss << "  };\n";

  return ss.str();
}

std::string ConfigEmitter::to_source(const ConfigRegistry &registry) {
  std::stringstream ss;
  ss << "void DRAMAddr::initialize_configs() {\n";
  for (auto const &entry : registry) {
    ss << to_source(entry.second) << "\n";
  }
  ss << "  DRAMAddr::Configs = {\n";
  for (auto const &entry : registry) {
    ss << "      {" << identifier_expression(entry.second) << ", " << variable_name(entry.second) << "},\n";
  }
  ss << "  };\n";
  ss << "}\n";
  return ss.str();
}

#ifdef ENABLE_JSON
nlohmann::json ConfigEmitter::to_json(const ConfigRegistry &registry) {
  auto configs = nlohmann::json::array();
  for (auto const &entry : registry) {
    configs.push_back(entry.second);
  }
  return configs;
}
#endif
