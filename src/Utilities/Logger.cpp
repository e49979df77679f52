/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include "Utilities/Logger.hpp"

#include <iostream>
#include <tuple>
#include <GlobalDefines.hpp>

// initialize the singleton instance
Logger Logger::instance; /* NOLINT */

Logger::Logger() : out(&std::cerr), colored(true) {
}

void Logger::initialize(const std::string &logfile_filename) {
  if (instance.logfile.is_open()) {
    instance.logfile.close();
  }
  instance.out = &std::cerr;
  instance.colored = true;

  if (logfile_filename.empty()) {
    return;
  }

  std::cerr << "Writing into logfile " FF_BOLD << logfile_filename << F_RESET << std::endl;
  // append mode so that several generator runs can share one logfile
  instance.logfile.open(logfile_filename, std::ios::out | std::ios::app);
  if (!instance.logfile.is_open()) {
    std::cerr << FC_RED "[-] Could not open logfile " << logfile_filename << ", logging to stderr." F_RESET
              << std::endl;
    return;
  }
  instance.out = &instance.logfile;
  instance.colored = false;
}

void Logger::close() {
  if (instance.logfile.is_open()) {
    instance.logfile << std::endl;
    instance.logfile.close();
  }
  instance.out = &std::cerr;
  instance.colored = true;
}

void Logger::write(const char *color, const std::string &prefix, const std::string &message, bool newline) {
  if (instance.colored && color != nullptr) *instance.out << color;
  *instance.out << prefix << message;
  if (instance.colored && color != nullptr) *instance.out << F_RESET;
  if (newline) *instance.out
#if (DEBUG==1)
    << std::endl;
#else
    << "\n";
#endif
}

void Logger::log_info(const std::string &message, bool newline) {
  write(FC_CYAN, "[+] ", message, newline);
}

void Logger::log_highlight(const std::string &message, bool newline) {
  write(FC_MAGENTA FF_BOLD, "[+] ", message, newline);
}

void Logger::log_error(const std::string &message, bool newline) {
  write(FC_RED, "[-] ", message, newline);
}

void Logger::log_success(const std::string &message, bool newline) {
  write(FC_GREEN, "[!] ", message, newline);
}

void Logger::log_data(const std::string &message, bool newline) {
  write(nullptr, "", message, newline);
}

void Logger::log_debug(const std::string &message, bool newline) {
#if (DEBUG==1)
  write(FC_YELLOW, "[DEBUG] ", message, newline);
#else
  // this is just to ignore complaints of the compiler about unused params
  std::ignore = message;
  std::ignore = newline;
#endif
}
