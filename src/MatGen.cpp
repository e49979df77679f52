/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "MatGen.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "Config/ConfigEmitter.hpp"
#include "GlobalDefines.hpp"
#include "Mapping/Errors.hpp"
#include "Mapping/SchemeLoader.hpp"

#include <argagg/argagg.hpp>
#include <argagg/convert/csv.hpp>

ProgramArguments program_args;

static void write_output(const std::string &filename, const std::string &content, const char *what) {
  if (filename.empty()) {
    std::cout << content;
    std::cout.flush();
    return;
  }

  std::ofstream out(filename, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    Logger::log_error(format_string("Could not open '%s' for writing the %s.", filename.c_str(), what));
    Logger::close();
    exit(EXIT_FAILURE);
  }
  out << content;
  Logger::log_info(format_string("Wrote %s to %s.", what, filename.c_str()));
}

int main(int argc, char **argv) {
  Logger::initialize();

  handle_args(argc, argv);

  if (!program_args.logfile.empty()) {
    Logger::initialize(program_args.logfile);
  }

  Logger::log_info(format_string("Generating %s of %s into %s.",
      program_args.scheme_names.empty() ? "all schemes" : "the selected schemes",
      program_args.schemes_filename.c_str(),
      program_args.out_filename.empty() ? "stdout" : program_args.out_filename.c_str()));

  std::vector<MappingScheme> schemes;
  try {
    schemes = SchemeLoader::load_file(program_args.schemes_filename);
  } catch (const MatGenError &e) {
    Logger::log_error(e.what());
    Logger::close();
    exit(EXIT_FAILURE);
  }

  // restrict to the requested schemes, in the order they were requested
  if (!program_args.scheme_names.empty()) {
    std::vector<MappingScheme> selected;
    try {
      for (const auto &name : program_args.scheme_names) {
        selected.push_back(SchemeLoader::find(schemes, name, program_args.schemes_filename));
      }
    } catch (const SchemeFileError &e) {
      Logger::log_error(e.what());
      Logger::close();
      exit(EXIT_FAILURE);
    }
    schemes = selected;
  }

  // every scheme is generated independently; a failing scheme is reported and skipped
  std::vector<std::string> failed_schemes;
  auto registry = ConfigEmitter::generate_registry(schemes, program_args.verbose, failed_schemes);

  if (!program_args.out_filename.empty() || !registry.empty()) {
    write_output(program_args.out_filename, ConfigEmitter::to_source(registry), "configuration source");
  }

#ifdef ENABLE_JSON
  if (!program_args.json_filename.empty()) {
    write_output(program_args.json_filename, ConfigEmitter::to_json(registry).dump(2) + "\n", "JSON configuration");
  }
#endif

  Logger::log_info(format_string("Generated %zu of %zu configuration(s), %zu failed.",
      registry.size(), schemes.size(), failed_schemes.size()));
  Logger::close();
  return failed_schemes.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

void handle_args(int argc, char **argv) {
  // An option is specified by four things:
  //    (1) the name of the option,
  //    (2) the strings that activate the option (flags),
  //    (3) the option's help message,
  //    (4) and the number of arguments the option expects.
  argagg::parser argparser{{
      {"help", {"-h", "--help"}, "shows this help message", 0},
      {"schemes", {"-c", "--schemes"}, "YAML file declaring the address mapping schemes", 1},
      {"names", {"-n", "--names"}, "comma-separated list of schemes to generate (default: all)", 1},
      {"out", {"-o", "--out"}, "file to write DRAMAddr::initialize_configs() to (default: stdout)", 1},
      {"json", {"-j", "--json"}, "file to additionally write the configurations to as JSON", 1},
      {"logfile", {"-l", "--logfile"}, "file to write the log to (default: stderr)", 1},
      {"verbose", {"-v", "--verbose"}, "log the DRAM and address matrix of each scheme", 0},
    }};

  argagg::parser_results parsed_args;
  try {
    parsed_args = argparser.parse(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << e.what() << '\n';
    exit(EXIT_FAILURE);
  }

  if (parsed_args["help"]) {
    std::cerr << argparser;
    exit(EXIT_SUCCESS);
  }

  /**
   * mandatory parameters
   */
  if (parsed_args.has_option("schemes")) {
    program_args.schemes_filename = parsed_args["schemes"].as<std::string>("");
  } else {
    Logger::log_error("Program argument '--schemes <file>' is mandatory! Cannot continue.");
    exit(EXIT_FAILURE);
  }

  /**
   * optional parameters
   */
  if (parsed_args.has_option("names")) {
    program_args.scheme_names = parsed_args["names"].as<argagg::csv<std::string>>().values;
  }

  program_args.out_filename = parsed_args["out"].as<std::string>(program_args.out_filename);
  program_args.logfile = parsed_args["logfile"].as<std::string>(program_args.logfile);

  program_args.json_filename = parsed_args["json"].as<std::string>(program_args.json_filename);
#ifndef ENABLE_JSON
  if (!program_args.json_filename.empty()) {
    Logger::log_error("Program argument '--json' requires a build with ENABLE_JSON. Cannot continue.");
    exit(EXIT_FAILURE);
  }
#endif

  program_args.verbose = parsed_args.has_option("verbose") || program_args.verbose;
  Logger::log_debug(format_string("Set --verbose=%s", program_args.verbose ? "true" : "false"));
}
