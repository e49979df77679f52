/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include <catch2/catch.hpp>

#include "Mapping/Errors.hpp"
#include "Matrix/MatrixEngine.hpp"
#include "TestSchemes.hpp"

#include <vector>

TEST_CASE("The compacted address bits are the sorted union of all referenced bits") {
  SECTION("a scheme covering bits 0-29 compacts to the identity") {
    auto bits = MatrixEngine::address_bits(test::coffeelake_1r());
    REQUIRE(bits.size() == 30);
    for (size_t i = 0; i < bits.size(); i++) {
      REQUIRE(bits[i] == i);
    }
  }

  SECTION("unused bits are skipped") {
    auto bits = MatrixEngine::address_bits(test::sparse_2r_4b());
    REQUIRE(bits.size() == 27);
    REQUIRE(bits[16] == 16);
    REQUIRE(bits[17] == 20);
    REQUIRE(bits[26] == 29);
  }
}

TEST_CASE("Row functions are ordered bank, column (low to high), row (low to high)") {
  auto fns = MatrixEngine::row_functions(test::sparse_2r_4b());
  REQUIRE(fns.size() == 27);
  REQUIRE(fns[0] == ((1UL << 14) | (1UL << 20)));
  REQUIRE(fns[2] == ((1UL << 16) | (1UL << 22)));
  REQUIRE(fns[3] == (1UL << 0));
  REQUIRE(fns[16] == (1UL << 13));
  REQUIRE(fns[17] == (1UL << 20));
  REQUIRE(fns[26] == (1UL << 29));
}

TEST_CASE("Each DRAM matrix row holds the compacted positions of its function") {
  auto scheme = GENERATE(test::coffeelake_1r(), test::coffeelake_2r(), test::sparse_2r_4b());
  CAPTURE(scheme.get_name());

  auto matrix = MatrixEngine::build_forward(scheme);
  auto bits = MatrixEngine::address_bits(scheme);
  auto fns = MatrixEngine::row_functions(scheme);

  REQUIRE(matrix.size() == scheme.matrix_size());
  for (size_t i = 0; i < matrix.size(); i++) {
    for (size_t j = 0; j < matrix.size(); j++) {
      bool contributes = (fns[i] >> bits[j]) & 1;
      REQUIRE(matrix.get(i, j) == contributes);
    }
  }
}

TEST_CASE("The sparse scheme's bank rows use compacted positions") {
  auto matrix = MatrixEngine::build_forward(test::sparse_2r_4b());
  // address bit 20 is compacted position 17
  REQUIRE(matrix.row(0) == ((1UL << 14) | (1UL << 17)));
  REQUIRE(matrix.row(1) == ((1UL << 15) | (1UL << 18)));
  REQUIRE(matrix.row(2) == ((1UL << 16) | (1UL << 19)));
  // first column row is address bit 0, first row-field row is address bit 20
  REQUIRE(matrix.row(3) == (1UL << 0));
  REQUIRE(matrix.row(17) == (1UL << 17));
}

TEST_CASE("A scheme whose functions do not span exactly W address bits is rejected") {
  SECTION("a bank function references one bit too many") {
    MappingScheme scheme("too_many_bits", 1, 1, 1, 4, {0x30, 0xc0}, 0x3, 0xc);
    REQUIRE(scheme.matrix_size() == 6);
    REQUIRE_THROWS_AS(MatrixEngine::build_forward(scheme), DimensionError);
  }

  SECTION("bank functions only reuse column bits") {
    MappingScheme scheme("too_few_bits", 1, 1, 1, 4, {0x1, 0x2}, 0x3, 0xc);
    REQUIRE_THROWS_AS(MatrixEngine::build_forward(scheme), DimensionError);
  }

  SECTION("the matrix would not fit into a machine word") {
    MappingScheme scheme("too_wide", 1, 1, 1, 2, {0x1}, 0x0, ~0UL);
    REQUIRE(scheme.matrix_size() == 65);
    REQUIRE_THROWS_AS(MatrixEngine::build_forward(scheme), DimensionError);
  }
}

TEST_CASE("A matrix of exactly 64 bits is accepted and inverted") {
  auto scheme = test::full_width_64();
  REQUIRE(scheme.validate());
  REQUIRE(scheme.matrix_size() == 64);

  auto forward = MatrixEngine::build_forward(scheme);
  REQUIRE(forward.size() == 64);
  // no bank functions and every address bit used once: column then row bits in address order
  REQUIRE(forward.is_identity());
  REQUIRE(MatrixEngine::invert(forward).is_identity());
}

TEST_CASE("A DimensionError names the scheme and both sizes") {
  MappingScheme scheme("too_many_bits", 1, 1, 1, 4, {0x30, 0xc0}, 0x3, 0xc);
  using Catch::Matchers::Contains;
  REQUIRE_THROWS_WITH(MatrixEngine::build_forward(scheme),
                      Contains("too_many_bits") && Contains("8 distinct") && Contains("size is 6"));
}

TEST_CASE("A 4x4 toy matrix inverts to its hand-computed inverse") {
  // y0 = x0 ^ x3, y1 = x0 ^ x1, y2 = x2, y3 = x3
  DramMatrix forward(std::vector<size_t>{0b1001, 0b0011, 0b0100, 0b1000});
  // x0 = y0 ^ y3, x1 = y0 ^ y1 ^ y3, x2 = y2, x3 = y3
  AddressMatrix expected(std::vector<size_t>{0b1001, 0b1011, 0b0100, 0b1000});

  auto inverse = MatrixEngine::invert(forward);
  REQUIRE(inverse == expected);
  REQUIRE(forward.multiply(inverse).is_identity());
  REQUIRE(inverse.multiply(forward).is_identity());
}

TEST_CASE("Inverting requires pivoting when the diagonal starts out empty") {
  // a permutation: y0 = x2, y1 = x0, y2 = x1
  DramMatrix forward(std::vector<size_t>{0b100, 0b001, 0b010});
  auto inverse = MatrixEngine::invert(forward);
  REQUIRE(inverse == AddressMatrix(std::vector<size_t>{0b010, 0b100, 0b001}));
}

TEST_CASE("Matrices without a GF(2) inverse are rejected") {
  SECTION("two identical bank functions") {
    MappingScheme scheme("duplicate_bank_fn", 1, 1, 1, 4, {0xc, 0xc}, 0x3, 0x30);
    REQUIRE(scheme.validate());
    auto forward = MatrixEngine::build_forward(scheme);
    REQUIRE_THROWS_AS(MatrixEngine::invert(forward), SingularMatrixError);
  }

  SECTION("a row is the XOR of two others") {
    DramMatrix forward(std::vector<size_t>{0b011, 0b110, 0b101});
    REQUIRE_THROWS_AS(MatrixEngine::invert(forward), SingularMatrixError);
  }

  SECTION("the zero matrix") {
    REQUIRE_THROWS_AS(MatrixEngine::invert(DramMatrix(3)), SingularMatrixError);
  }
}

TEST_CASE("DRAM matrix times address matrix is the identity") {
  auto scheme = GENERATE(test::coffeelake_1r(), test::coffeelake_2r(), test::sparse_2r_4b());
  CAPTURE(scheme.get_name());

  auto forward = MatrixEngine::build_forward(scheme);
  auto inverse = MatrixEngine::invert(forward);

  REQUIRE(inverse.size() == forward.size());
  REQUIRE(forward.multiply(inverse).is_identity());
  REQUIRE(inverse.multiply(forward).is_identity());

  SECTION("every basis vector survives the round trip") {
    for (size_t j = 0; j < forward.size(); j++) {
      REQUIRE(inverse.apply(forward.apply(1UL << j)) == (1UL << j));
    }
  }
}

TEST_CASE("Inverting twice yields the input matrix") {
  auto forward = MatrixEngine::build_forward(test::coffeelake_2r());
  REQUIRE(MatrixEngine::invert(MatrixEngine::invert(forward)) == forward);
}
