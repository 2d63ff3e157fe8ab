#pragma once

#include <cstring>

#include "../core/types.hpp"
#include "../core/config.hpp"

namespace memPlan {
    namespace utils {

        /**
         * @brief Constexpr min function
         */
        template<typename T>
        constexpr T min(const T& a, const T& b) noexcept {
            return (a < b) ? a : b;
        }

        /**
         * @brief Constexpr max function
         */
        template<typename T>
        constexpr T max(const T& a, const T& b) noexcept {
            return (a > b) ? a : b;
        }

        /**
         * @brief True for 1, 2, 4, 8, ... (zero is not a power of two)
         */
        constexpr bool is_power_of_two(u64 value) noexcept {
            return value != 0U && (value & (value - 1U)) == 0U;
        }

        /**
         * @brief Round up to a power-of-two alignment
         *
         * Done in 64 bits so a cursor near the top of the 32-bit space cannot wrap.
         */
        constexpr u64 align_up(u64 value, u64 alignment) noexcept {
            return (value + (alignment - 1U)) & ~(alignment - 1U);
        }

        constexpr bool is_aligned(u64 value, u64 alignment) noexcept {
            return (value & (alignment - 1U)) == 0U;
        }

        /**
         * @brief Integer division rounding up
         */
        constexpr size_t div_ceil(size_t x, size_t y) noexcept {
            return (x + y - 1U) / y;
        }

        /**
         * @brief Half-open ranges [a0, a1) and [b0, b1) share at least one byte
         */
        constexpr bool ranges_intersect(u64 a0, u64 a1, u64 b0, u64 b1) noexcept {
            return a0 < b1 && b0 < a1;
        }

        /**
         * @brief Identifier fits a name_t without truncation
         */
        inline bool is_valid_name(const char* name) noexcept {
            if (name == nullptr) {
                return false;
            }
            const size_t len = std::strlen(name);
            return len > 0U && len <= config::max_name_length;
        }

        static_assert(align_up(0x20030028U, 4U) == 0x20030028U, "align_up keeps aligned values");
        static_assert(align_up(0x2003008DU, 4U) == 0x20030090U, "align_up rounds to next boundary");
        static_assert(is_power_of_two(1U) && !is_power_of_two(0U) && !is_power_of_two(12U), "is_power_of_two");

    } // namespace utils
} // namespace memPlan
