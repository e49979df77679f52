/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_MATGEN_HPP_
#define MATGEN_INCLUDE_MATGEN_HPP_

#include <string>
#include <vector>

// defines the program's arguments and their default values
struct ProgramArguments {
  // path to the YAML file declaring the mapping schemes
  std::string schemes_filename;
  // the names of the schemes to generate configurations for (default: all schemes in the file)
  std::vector<std::string> scheme_names{};
  // file to write the generated DRAMAddr::initialize_configs() to (default: stdout)
  std::string out_filename;
  // file to additionally write the configurations to as JSON
  std::string json_filename;
  // file to write the log to (default: stderr)
  std::string logfile;
  // whether to log the DRAM and address matrix of each scheme
  bool verbose = false;
};

extern ProgramArguments program_args;

int main(int argc, char **argv);

void handle_args(int argc, char **argv);

#endif //MATGEN_INCLUDE_MATGEN_HPP_
