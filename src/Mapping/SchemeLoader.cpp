/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "Mapping/SchemeLoader.hpp"

#include <set>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "Mapping/Errors.hpp"
#include "Utilities/Logger.hpp"

size_t SchemeLoader::parse_integer(const std::string &literal) {
  std::string digits = literal;
  int base = 10;
  if (digits.size() > 2 && digits[0]=='0' && (digits[1]=='b' || digits[1]=='B')) {
    digits = digits.substr(2);
    base = 2;
  } else if (digits.size() > 2 && digits[0]=='0' && (digits[1]=='x' || digits[1]=='X')) {
    digits = digits.substr(2);
    base = 16;
  }

  // stoull would silently accept (and wrap) signed values
  if (digits.empty() || digits[0]=='-' || digits[0]=='+') {
    throw SchemeFileError(format_string("'%s' is not a valid unsigned integer.", literal.c_str()));
  }

  size_t consumed = 0;
  unsigned long long value;
  try {
    value = std::stoull(digits, &consumed, base);
  } catch (const std::exception &e) {
    throw SchemeFileError(format_string("'%s' is not a valid unsigned integer (%s).", literal.c_str(), e.what()));
  }
  if (consumed != digits.size()) {
    throw SchemeFileError(format_string("'%s' is not a valid unsigned integer.", literal.c_str()));
  }
  return static_cast<size_t>(value);
}

MappingScheme SchemeLoader::parse_scheme(const YAML::Node &node, size_t index) {
  if (!node.IsMap()) {
    throw SchemeFileError(format_string("Scheme #%zu is not a mapping.", index));
  }

  auto require = [&node, index](const char *key) {
    auto child = node[key];
    if (!child) {
      throw SchemeFileError(format_string("Scheme #%zu: mandatory key '%s' is missing.", index, key));
    }
    return child;
  };
  auto require_integer = [&require, index](const char *key) {
    auto child = require(key);
    if (!child.IsScalar()) {
      throw SchemeFileError(format_string("Scheme #%zu: key '%s' must be an integer.", index, key));
    }
    return parse_integer(child.as<std::string>());
  };

  auto name = require("name").as<std::string>();

  auto fn_nodes = require("bank_functions");
  if (!fn_nodes.IsSequence()) {
    throw SchemeFileError(format_string("Scheme '%s': 'bank_functions' must be a list.", name.c_str()));
  }
  std::vector<AddressFunction> bank_functions;
  for (const auto &fn : fn_nodes) {
    bank_functions.push_back(parse_integer(fn.as<std::string>()));
  }

  return MappingScheme(name,
                       require_integer("channels"),
                       require_integer("dimms"),
                       require_integer("ranks"),
                       require_integer("banks"),
                       std::move(bank_functions),
                       require_integer("column_function"),
                       require_integer("row_function"));
}

std::vector<MappingScheme> SchemeLoader::load_node(const YAML::Node &root, const std::string &origin) {
  if (!root.IsMap() || !root["schemes"] || !root["schemes"].IsSequence()) {
    throw SchemeFileError(format_string("%s: expected a top-level 'schemes' list.", origin.c_str()));
  }

  auto scheme_nodes = root["schemes"];
  std::vector<MappingScheme> schemes;
  std::set<std::string> names;
  size_t index = 0;
  for (const auto &node : scheme_nodes) {
    try {
      schemes.push_back(parse_scheme(node, index));
    } catch (const YAML::Exception &e) {
      throw SchemeFileError(format_string("%s: scheme #%zu is malformed: %s", origin.c_str(), index, e.what()));
    }
    if (!names.insert(schemes.back().get_name()).second) {
      throw SchemeFileError(format_string("%s: scheme name '%s' is used more than once.",
          origin.c_str(), schemes.back().get_name().c_str()));
    }
    index++;
  }

  Logger::log_info(format_string("Loaded %zu scheme(s) from %s.", schemes.size(), origin.c_str()));
  return schemes;
}

std::vector<MappingScheme> SchemeLoader::load_string(const std::string &yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception &e) {
    throw SchemeFileError(format_string("Could not parse scheme definitions: %s", e.what()));
  }
  return load_node(root, "<string>");
}

std::vector<MappingScheme> SchemeLoader::load_file(const std::string &filepath) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(filepath);
  } catch (const YAML::Exception &e) {
    throw SchemeFileError(format_string("Could not load scheme file '%s': %s", filepath.c_str(), e.what()));
  }
  return load_node(root, filepath);
}

const MappingScheme &SchemeLoader::find(const std::vector<MappingScheme> &schemes,
                                        const std::string &scheme_name,
                                        const std::string &origin) {
  for (const auto &scheme : schemes) {
    if (scheme.get_name()==scheme_name) {
      return scheme;
    }
  }

  std::stringstream available;
  for (size_t i = 0; i < schemes.size(); i++) {
    available << (i==0 ? "" : ", ") << schemes[i].get_name();
  }
  throw SchemeFileError(format_string("Scheme '%s' does not exist in '%s'. Available schemes: %s",
      scheme_name.c_str(), origin.c_str(), available.str().c_str()));
}

MappingScheme SchemeLoader::load_file(const std::string &filepath, const std::string &scheme_name) {
  auto schemes = load_file(filepath);
  return find(schemes, scheme_name, filepath);
}
