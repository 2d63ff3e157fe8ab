#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../utils/helpers.hpp"
#include <etl/vector.h>

namespace memPlan::layout {

/**
 * @brief Access and lifetime properties of a physical region
 *
 * `loaded` marks memory the image builder fills at boot (flash contents,
 * initialized RAM). `shared` marks a fixed-address channel between the two
 * cores; both images must agree on every shared region.
 */
struct attributes {
    bool readable{false};
    bool writable{false};
    bool executable{false};
    bool loaded{false};
    bool shared{false};

    static constexpr attributes flash() noexcept { return {true, false, true, true, false}; }
    static constexpr attributes ram() noexcept { return {true, true, true, true, false}; }
    static constexpr attributes shared_ram() noexcept { return {true, true, false, false, true}; }

    constexpr bool operator==(const attributes& other) const noexcept {
        return readable == other.readable && writable == other.writable &&
               executable == other.executable && loaded == other.loaded && shared == other.shared;
    }
    constexpr bool operator!=(const attributes& other) const noexcept { return !(*this == other); }
};

/* Which edge of the owning region or section a symbol marks */
enum class symbol_edge : u8 {
    start,
    end
};

enum class symbol_kind : u8 {
    region_start,
    region_end,
    section_start,
    section_end
};

/**
 * @brief How the image builder treats a section's memory at boot
 *
 * no_load sections are skipped by the zero-fill pass. Their memory keeps
 * whatever was last written to it, across resets too, until firmware clears
 * it explicitly. Never assume zero contents in a no_load section.
 */
enum class load_behavior : u8 {
    initialized,
    no_load
};

/**
 * @brief A boundary symbol asked for by a region or section declaration
 *
 * `name_fits` is false when the requested name was empty or did not fit a
 * name_t; the stored name is then cut short and the declaration is rejected.
 */
struct symbol_request {
    name_t name;
    symbol_edge edge{symbol_edge::start};
    bool name_fits{false};

    symbol_request() noexcept = default;
    symbol_request(const char* n, symbol_edge e) noexcept
        : name(n != nullptr ? n : ""), edge(e), name_fits(utils::is_valid_name(n)) {}

    bool operator==(const symbol_request& other) const noexcept {
        return name == other.name && edge == other.edge;
    }
    bool operator!=(const symbol_request& other) const noexcept { return !(*this == other); }
};

using region_symbols = etl::vector<symbol_request, config::max_symbols_per_region>;
using section_symbols = etl::vector<symbol_request, config::max_symbols_per_section>;

struct region {
    name_t name;
    address_t origin{0};
    byte_count_t length{0};
    attributes attrs;
    region_symbols symbols;

    /* One past the last byte; always representable, define() rejects wrap */
    address_t end() const noexcept { return origin + length; }

    bool operator==(const region& other) const noexcept {
        return name == other.name && origin == other.origin && length == other.length &&
               attrs == other.attrs && symbols == other.symbols;
    }
    bool operator!=(const region& other) const noexcept { return !(*this == other); }
};

/**
 * @brief A named group of code or data bound to one region
 *
 * `region` indexes the region table the section was declared against; the
 * table owns the region. `size` comes from the image builder.
 */
struct section {
    name_t name;
    index_t region{invalid_index};
    load_behavior behavior{load_behavior::initialized};
    byte_count_t alignment{1};
    byte_count_t size{0};
    section_symbols symbols;
};

struct placement {
    name_t section;
    index_t region{invalid_index};
    load_behavior behavior{load_behavior::initialized};
    address_t start{0};
    address_t end{0};

    byte_count_t size() const noexcept { return end - start; }

    bool operator==(const placement& other) const noexcept {
        return section == other.section && region == other.region && behavior == other.behavior &&
               start == other.start && end == other.end;
    }
    bool operator!=(const placement& other) const noexcept { return !(*this == other); }
};

struct boundary_symbol {
    name_t name;
    address_t address{0};
    symbol_kind marks{symbol_kind::section_start};
    name_t owner;   // region or section that declared it

    bool operator==(const boundary_symbol& other) const noexcept {
        return name == other.name && address == other.address && marks == other.marks &&
               owner == other.owner;
    }
    bool operator!=(const boundary_symbol& other) const noexcept { return !(*this == other); }
};

/**
 * @brief Half-open address range, used to bounds-check mailbox buffers
 */
struct address_range {
    address_t start{0};
    address_t end{0};

    constexpr byte_count_t size() const noexcept { return end - start; }

    constexpr bool contains(address_t address, byte_count_t length = 1) const noexcept {
        return address >= start && static_cast<u64>(address) + length <= end;
    }

    constexpr bool operator==(const address_range& other) const noexcept {
        return start == other.start && end == other.end;
    }
};

using region_list = etl::vector<region, config::max_regions>;
using section_list = etl::vector<section, config::max_sections>;
using placement_list = etl::vector<placement, config::max_sections>;
using symbol_list = etl::vector<boundary_symbol, config::max_symbols>;

} // namespace memPlan::layout
