#pragma once

#include <cstddef>

#include "../core/types.hpp"
#include "../utils/helpers.hpp"

namespace memPlan::mailbox {

/**
 * @brief One statically allocated object that goes into a mailbox section
 */
struct buffer_object {
    const char* name;
    byte_count_t size;
    byte_count_t alignment;
};

/**
 * @brief Section size for objects packed in order, each at its own alignment
 *
 * Mirrors how the linker lays out the input objects of one output section.
 */
template<size_t N>
constexpr byte_count_t packed_size(const buffer_object (&objects)[N]) noexcept {
    u64 offset = 0;
    for (size_t i = 0; i < N; ++i) {
        offset = utils::align_up(offset, objects[i].alignment);
        offset += objects[i].size;
    }
    return static_cast<byte_count_t>(offset);
}

/**
 * @brief Largest member alignment, used as the section alignment
 */
template<size_t N>
constexpr byte_count_t max_alignment(const buffer_object (&objects)[N]) noexcept {
    byte_count_t alignment = 1;
    for (size_t i = 0; i < N; ++i) {
        alignment = utils::max(alignment, objects[i].alignment);
    }
    return alignment;
}

/**
 * @brief Offset of the object at `index` from the section start
 */
template<size_t N>
constexpr byte_count_t offset_of(const buffer_object (&objects)[N], size_t index) noexcept {
    u64 offset = 0;
    for (size_t i = 0; i < N && i <= index; ++i) {
        offset = utils::align_up(offset, objects[i].alignment);
        if (i == index) {
            break;
        }
        offset += objects[i].size;
    }
    return static_cast<byte_count_t>(offset);
}

} // namespace memPlan::mailbox
