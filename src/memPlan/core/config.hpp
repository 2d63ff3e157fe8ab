#pragma once

#include <cstddef>

#include "types.hpp"

// Table capacities for no-flags builds. Every table is a fixed-capacity ETL
// container, so these bound the size of a single device memory map.
#ifndef MEMPLAN_MAX_REGIONS
#define MEMPLAN_MAX_REGIONS 16
#endif
#ifndef MEMPLAN_MAX_SECTIONS
#define MEMPLAN_MAX_SECTIONS 32
#endif
#ifndef MEMPLAN_MAX_SYMBOLS_PER_SECTION
#define MEMPLAN_MAX_SYMBOLS_PER_SECTION 4
#endif
#ifndef MEMPLAN_MAX_SYMBOLS_PER_REGION
#define MEMPLAN_MAX_SYMBOLS_PER_REGION 2
#endif
#ifndef MEMPLAN_MAX_SYMBOLS
#define MEMPLAN_MAX_SYMBOLS 96
#endif
#ifndef MEMPLAN_MAX_NAME_LENGTH
#define MEMPLAN_MAX_NAME_LENGTH 31
#endif

// Rendered linker script buffer (characters)
#ifndef MEMPLAN_SCRIPT_CAPACITY
#define MEMPLAN_SCRIPT_CAPACITY 4096
#endif

// Log every placement and symbol as it is resolved
#ifndef MEMPLAN_TRACE_RESOLUTION
#define MEMPLAN_TRACE_RESOLUTION 0
#endif

// Pointer width of the target whose mailbox structures are sized
#ifndef MEMPLAN_TARGET_POINTER_BYTES
#define MEMPLAN_TARGET_POINTER_BYTES 4
#endif

namespace memPlan::config {

        constexpr size_t max_regions             = MEMPLAN_MAX_REGIONS;
        constexpr size_t max_sections            = MEMPLAN_MAX_SECTIONS;
        constexpr size_t max_symbols_per_section = MEMPLAN_MAX_SYMBOLS_PER_SECTION;
        constexpr size_t max_symbols_per_region  = MEMPLAN_MAX_SYMBOLS_PER_REGION;
        constexpr size_t max_symbols             = MEMPLAN_MAX_SYMBOLS;
        constexpr size_t max_name_length         = MEMPLAN_MAX_NAME_LENGTH;
        constexpr size_t script_capacity         = MEMPLAN_SCRIPT_CAPACITY;

        constexpr bool trace_resolution          = (MEMPLAN_TRACE_RESOLUTION != 0);
        constexpr size_t target_pointer_bytes    = MEMPLAN_TARGET_POINTER_BYTES;

        // -------- Compile-time sanity checks for flag interrelations --------
        static_assert(max_regions >= 1, "MEMPLAN_MAX_REGIONS must be >= 1");
        static_assert(max_regions < invalid_index, "MEMPLAN_MAX_REGIONS must fit a table index");
        static_assert(max_sections >= 1, "MEMPLAN_MAX_SECTIONS must be >= 1");
        static_assert(max_sections < invalid_index, "MEMPLAN_MAX_SECTIONS must fit a table index");
        static_assert(max_name_length >= 8, "MEMPLAN_MAX_NAME_LENGTH must be >= 8");
        static_assert(max_symbols >= max_symbols_per_section,
                      "MEMPLAN_MAX_SYMBOLS must hold at least one section's symbols");
        static_assert(target_pointer_bytes == 4 || target_pointer_bytes == 8,
                      "MEMPLAN_TARGET_POINTER_BYTES must be 4 or 8");
        static_assert(script_capacity >= 256, "MEMPLAN_SCRIPT_CAPACITY must be >= 256");
}  // namespace memPlan::config

namespace memPlan {

/* Identifier of a region, section or symbol */
using name_t = string<config::max_name_length>;

}  // namespace memPlan
