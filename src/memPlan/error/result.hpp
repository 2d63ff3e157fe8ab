#pragma once

#include <cstdint>

#include "../core/config.hpp"
#include <etl/optional.h>
#include <etl/utility.h>

namespace memPlan {

// Layout error codes. Every one of them is fatal to the build.
enum class error_code : int8_t {
    success = 0,
    duplicate_region_name = -1,
    overlap = -2,
    unknown_region = -3,
    invalid_alignment = -4,
    region_overflow = -5,
    missing_placement = -6,
    duplicate_symbol_name = -7,
    address_mismatch = -8,
    invalid_name = -9,
    invalid_length = -10,
    capacity_exceeded = -11,
    table_frozen = -12,
    unknown_section = -13,
    shared_entry_missing = -14,
    duplicate_section_name = -15
};

/**
 * @brief What went wrong and where
 *
 * `subject` is the offending region, section or symbol. `related` is the
 * other party (the region overlapped, the owning region) when there is one.
 * `data` holds the addresses involved; its meaning depends on `code`:
 *   overlap              : new origin, new end, existing origin, existing end
 *   region_overflow      : section start, section end, region origin, region end
 *   address_mismatch     : address in image A, address in image B
 *   invalid_alignment    : requested alignment
 *   invalid_length       : origin, length
 */
struct diagnostic {
    error_code code{error_code::success};
    name_t subject;
    name_t related;
    u32 data[4]{0, 0, 0, 0};

    diagnostic() noexcept = default;

    diagnostic(error_code c, const char* subj, const char* rel = "",
               u32 d0 = 0, u32 d1 = 0, u32 d2 = 0, u32 d3 = 0) noexcept
        : code(c), subject(subj), related(rel), data{d0, d1, d2, d3} {}

    bool operator==(const diagnostic& other) const noexcept {
        return code == other.code && subject == other.subject && related == other.related &&
               data[0] == other.data[0] && data[1] == other.data[1] &&
               data[2] == other.data[2] && data[3] == other.data[3];
    }
    bool operator!=(const diagnostic& other) const noexcept { return !(*this == other); }
};

// Result type for error handling without exceptions
template<typename T, typename E = diagnostic>
class result {
private:
    etl::optional<T> value_;
    etl::optional<E> error_;

public:
    explicit result(const T& value) noexcept : value_(value) {}

    explicit result(T&& value) noexcept : value_(etl::move(value)) {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return value_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const T& value() const noexcept { return value_.value(); }

    T& value() noexcept { return value_.value(); }

    const E& error() const noexcept { return error_.value(); }

    const T& value_or(const T& default_value) const noexcept {
        return is_ok() ? value() : default_value;
    }
};

// Specialization for void result type
template<typename E>
class result<void, E> {
private:
    etl::optional<E> error_;

public:
    result() noexcept : error_() {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const E& error() const noexcept { return error_.value(); }
};

// Helper function for creating successful void results
inline result<void> ok() noexcept {
    return {};
}

// Helper function for creating successful results with a value
template<typename T>
inline result<T> ok(const T& value) noexcept {
    return result<T>(value);
}

}  // namespace memPlan
