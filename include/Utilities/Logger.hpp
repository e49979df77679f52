/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_LOGGER_HPP_
#define MATGEN_INCLUDE_LOGGER_HPP_

#include <cstdio>
#include <fstream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

template<typename ... Args>
std::string format_string(const std::string &format, Args ... args) {
  int size = snprintf(nullptr, 0, format.c_str(), args ...) + 1; // Extra space for '\0'
  if (size <= 0) { throw std::runtime_error("Error during formatting."); }
  std::unique_ptr<char[]> buf(new char[size]);
  snprintf(buf.get(), size, format.c_str(), args ...);
  return std::string(buf.get(), buf.get() + size - 1); // We don't want the '\0' inside
}

class Logger {
 private:
  Logger();

  // the logfile, only open if initialize() was given a filename
  std::ofstream logfile;

  // where messages go: the logfile or std::cerr
  std::ostream *out;

  // whether to emit ANSI color codes (disabled for logfiles)
  bool colored;

  // the logger instance (a singleton)
  static Logger instance;

  static void write(const char *color, const std::string &prefix, const std::string &message, bool newline);

 public:
  // Logs into the given file, or to stderr if the filename is empty.
  static void initialize(const std::string &logfile_filename = "");

  static void close();

  static void log_info(const std::string &message, bool newline = true);

  static void log_highlight(const std::string &message, bool newline = true);

  static void log_error(const std::string &message, bool newline = true);

  static void log_success(const std::string &message, bool newline = true);

  static void log_data(const std::string &message, bool newline = true);

  static void log_debug(const std::string &message, bool newline = true);
};

#endif //MATGEN_INCLUDE_LOGGER_HPP_
