/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
