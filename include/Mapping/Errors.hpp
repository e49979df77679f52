/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef MATGEN_INCLUDE_MAPPING_ERRORS_HPP_
#define MATGEN_INCLUDE_MAPPING_ERRORS_HPP_

#include <stdexcept>
#include <string>

// Base of all errors raised while turning a scheme into a configuration. None of them is
// transient: the same scheme always fails the same way.
class MatGenError : public std::runtime_error {
 public:
  explicit MatGenError(const std::string &what) : std::runtime_error(what) {}
};

// The number of bank functions does not match log2(#ranks) + log2(#banks).
class SchemeMismatchError : public MatGenError {
 public:
  explicit SchemeMismatchError(const std::string &what) : MatGenError(what) {}
};

// The address bits referenced by a scheme do not span exactly the matrix size.
class DimensionError : public MatGenError {
 public:
  explicit DimensionError(const std::string &what) : MatGenError(what) {}
};

// The DRAM matrix has no inverse over GF(2).
class SingularMatrixError : public MatGenError {
 public:
  explicit SingularMatrixError(const std::string &what) : MatGenError(what) {}
};

// A scheme file could not be read or is malformed.
class SchemeFileError : public MatGenError {
 public:
  explicit SchemeFileError(const std::string &what) : MatGenError(what) {}
};

#endif //MATGEN_INCLUDE_MAPPING_ERRORS_HPP_
