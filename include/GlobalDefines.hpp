/*
 * Copyright (c) 2024 by ETH Zurich.
 * Licensed under the MIT License, see LICENSE file for more details.
 */

#ifndef GLOBAL_DEFINES
#define GLOBAL_DEFINES

#include <cstdint>
#include <cstddef>

#include "Utilities/Logger.hpp"

[[gnu::unused]] static inline uint64_t BIT_SET(uint64_t value) { return (1ULL << (value)); }

// ################### CONFIG IDENTIFIERS ##################

// a memory configuration is identified by its topology, one byte per axis
#define CHANS(x) ((x) << (8UL * 3UL))
#define DIMMS(x) ((x) << (8UL * 2UL))
#define RANKS(x) ((x) << (8UL * 1UL))
#define BANKS(x) ((x) << (8UL * 0UL))
#define MEM_CONFIG(ch, d, r, b) (CHANS(ch) | DIMMS(d) | RANKS(r) | BANKS(b))

// a matrix row is a single machine word
#define MAX_MTX_SIZE (8 * sizeof(size_t))

// ################### TERMINAL COLORS ##################

#define F_RESET "\u001b[0m"
#define FF_BOLD "\u001b[1m"
#define FC_RED "\u001b[31m"
#define FC_RED_BRIGHT "\u001b[31;1m"
#define FC_GREEN "\u001b[32m"
#define FC_YELLOW "\u001b[33m"
#define FC_MAGENTA "\u001b[35m"
#define FC_CYAN "\u001b[36m"

#endif /* GLOBAL_DEFINES */
