/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#include <catch2/catch.hpp>

#include "Mapping/Errors.hpp"
#include "Mapping/MappingScheme.hpp"
#include "TestSchemes.hpp"

#include <vector>

TEST_CASE("A scheme reports its field widths and matrix size") {
  auto scheme = test::sparse_2r_4b();
  REQUIRE(scheme.get_name() == "sparse_2r_4b");
  REQUIRE(scheme.bank_bits() == 3);
  REQUIRE(scheme.column_bits() == 14);
  REQUIRE(scheme.row_bits() == 10);
  REQUIRE(scheme.matrix_size() == 27);
}

TEST_CASE("The reference schemes validate") {
  REQUIRE(test::coffeelake_1r().validate());
  REQUIRE(test::coffeelake_2r().validate());
  REQUIRE(test::sparse_2r_4b().validate());
}

TEST_CASE("validate() fails exactly when the number of bank functions does not match the topology") {
  auto ranks = GENERATE(as<size_t>{}, 1, 2, 4);
  auto banks = GENERATE(as<size_t>{}, 4, 8, 16);
  auto num_functions = GENERATE(range<size_t>(0, 9));

  size_t expected = __builtin_ctzll(ranks) + __builtin_ctzll(banks);
  std::vector<AddressFunction> fns;
  for (size_t i = 0; i < num_functions; i++) {
    fns.push_back(1UL << (20 + i));
  }
  MappingScheme scheme("generated", 1, 1, ranks, banks, fns, 0xfff, 0xff000);

  if (num_functions == expected) {
    REQUIRE(scheme.validate());
  } else {
    REQUIRE_THROWS_AS(scheme.validate(), SchemeMismatchError);
  }
}

TEST_CASE("Counts without an integral log2 can never match") {
  SECTION("three ranks") {
    MappingScheme scheme("three_ranks", 1, 1, 3, 4, {0x100, 0x200, 0x400}, 0xff, 0xf800);
    REQUIRE_THROWS_AS(scheme.validate(), SchemeMismatchError);
  }
  SECTION("zero banks") {
    MappingScheme scheme("zero_banks", 1, 1, 1, 0, {}, 0xff, 0xff00);
    REQUIRE_THROWS_AS(scheme.validate(), SchemeMismatchError);
  }
}

TEST_CASE("A mismatch names the scheme and both counts") {
  MappingScheme scheme("too_few", 1, 1, 2, 16, {0x100, 0x200}, 0xff, 0xff000);
  using Catch::Matchers::Contains;
  REQUIRE_THROWS_WITH(scheme.validate(), Contains("too_few") && Contains("expected 5") && Contains("got 2"));
}

TEST_CASE("Validation does not change the scheme and can be repeated") {
  auto scheme = test::coffeelake_1r();
  REQUIRE(scheme.validate());
  REQUIRE(scheme.validate());
  REQUIRE(scheme.get_bank_functions() == std::vector<AddressFunction>{0x2040, 0x24000, 0x48000, 0x90000});
}
