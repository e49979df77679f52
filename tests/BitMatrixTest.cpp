/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include <catch2/catch.hpp>

#include "Matrix/BitMatrix.hpp"

#include <stdexcept>
#include <vector>

TEST_CASE("A new BitMatrix is all zeroes") {
  BitMatrix m(5);
  REQUIRE(m.size() == 5);
  for (size_t i = 0; i < m.size(); i++) {
    REQUIRE(m.row(i) == 0);
  }
  REQUIRE_FALSE(m.is_identity());
}

TEST_CASE("The identity matrix has a single bit on the diagonal") {
  auto size = GENERATE(as<size_t>{}, 1, 4, 30, 64);
  auto id = BitMatrix::identity(size);

  REQUIRE(id.size() == size);
  REQUIRE(id.is_identity());
  for (size_t i = 0; i < size; i++) {
    for (size_t j = 0; j < size; j++) {
      REQUIRE(id.get(i, j) == (i == j));
    }
  }
}

TEST_CASE("Setting and clearing single entries") {
  BitMatrix m(4);
  m.set(1, 3, true);
  m.set(1, 0, true);
  REQUIRE(m.row(1) == 0b1001);
  REQUIRE(m.get(1, 3));

  m.set(1, 3, false);
  REQUIRE(m.row(1) == 0b0001);
  REQUIRE_FALSE(m.get(1, 3));

  REQUIRE_THROWS_AS(m.set(1, 4, true), std::out_of_range);
  REQUIRE_THROWS_AS(m.set(4, 0, true), std::out_of_range);
}

TEST_CASE("Rows must not reference columns beyond the matrix size") {
  REQUIRE_NOTHROW(BitMatrix(std::vector<size_t>{0b11, 0b10}));
  REQUIRE_THROWS_AS(BitMatrix(std::vector<size_t>{0b100, 0b10}), std::invalid_argument);
  REQUIRE_THROWS_AS(BitMatrix(65), std::length_error);
}

TEST_CASE("Multiplication is carried out in GF(2)") {
  // [1 1]   [1 1]   [0 1]
  // [0 1] * [1 0] = [1 0]   (1+1 = 0)
  BitMatrix a(std::vector<size_t>{0b11, 0b10});
  BitMatrix b(std::vector<size_t>{0b11, 0b01});
  auto product = a.multiply(b);
  REQUIRE(product.get(0, 0) == false);
  REQUIRE(product.get(0, 1) == true);
  REQUIRE(product.get(1, 0) == true);
  REQUIRE(product.get(1, 1) == false);

  SECTION("Multiplying with the identity yields the same matrix") {
    REQUIRE(a.multiply(BitMatrix::identity(2)) == a);
    REQUIRE(BitMatrix::identity(2).multiply(a) == a);
  }

  SECTION("Sizes must match") {
    REQUIRE_THROWS_AS(a.multiply(BitMatrix::identity(3)), std::invalid_argument);
  }
}

TEST_CASE("Applying a matrix computes the parity of each masked row") {
  // y0 = x0 ^ x1, y1 = x1, y2 = x0 ^ x1 ^ x2
  BitMatrix m(std::vector<size_t>{0b011, 0b010, 0b111});

  REQUIRE(m.apply(0b000) == 0b000);
  REQUIRE(m.apply(0b001) == 0b101);
  REQUIRE(m.apply(0b010) == 0b111);
  REQUIRE(m.apply(0b011) == 0b010);
  REQUIRE(m.apply(0b100) == 0b100);
}

TEST_CASE("A matrix prints one row per line with column 0 rightmost") {
  BitMatrix m(std::vector<size_t>{0b001, 0b110, 0b100});
  REQUIRE(m.to_string() == "001\n110\n100");
}
