#pragma once

#include <cstddef>
#include <cstdint>

#include <etl/optional.h>
#include <etl/string.h>

namespace memPlan {

// Basic integer types
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;

// String types (fixed size, no dynamic allocation)
template<size_t N>
using string = etl::string<N>;

// Optional types
template<typename T>
using optional = etl::optional<T>;

/* Target address space is 32-bit; wide arithmetic goes through u64 */
using address_t = u32;
using byte_count_t = u32;

constexpr u64 address_space_end = 0x100000000ULL;

/* Index into a fixed-capacity table */
using index_t = u16;
constexpr index_t invalid_index = 0xFFFF;

}  // namespace memPlan
