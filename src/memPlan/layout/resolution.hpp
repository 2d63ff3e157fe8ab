#pragma once

#include "../core/types.hpp"
#include "layout_types.hpp"

namespace memPlan::layout {

/**
 * @brief Output of one build's resolution
 *
 * A snapshot of the region table together with the placement table and the
 * symbol table. Immutable once produced; two resolutions of the same inputs
 * compare equal.
 */
struct resolution {
    region_list regions;
    placement_list placements;
    symbol_list symbols;

    const region* find_region(const char* name) const noexcept {
        for (const auto& r : regions) {
            if (r.name == name) {
                return &r;
            }
        }
        return nullptr;
    }

    const placement* find_placement(const char* section) const noexcept {
        for (const auto& p : placements) {
            if (p.section == section) {
                return &p;
            }
        }
        return nullptr;
    }

    const boundary_symbol* find_symbol(const char* name) const noexcept {
        for (const auto& s : symbols) {
            if (s.name == name) {
                return &s;
            }
        }
        return nullptr;
    }

    /* Bytes from the region origin to the end of its last placement, padding included */
    byte_count_t used_bytes(index_t region_index) const noexcept {
        address_t high = regions[region_index].origin;
        for (const auto& p : placements) {
            if (p.region == region_index && p.end > high) {
                high = p.end;
            }
        }
        return high - regions[region_index].origin;
    }

    byte_count_t free_bytes(index_t region_index) const noexcept {
        return regions[region_index].length - used_bytes(region_index);
    }

    /**
     * @brief Range bracketed by a start and an end boundary symbol
     *
     * Empty optional when either symbol is missing or they are reversed.
     */
    optional<address_range> symbol_range(const char* start_symbol, const char* end_symbol) const noexcept {
        const boundary_symbol* first = find_symbol(start_symbol);
        const boundary_symbol* last = find_symbol(end_symbol);
        if (first == nullptr || last == nullptr || last->address < first->address) {
            return optional<address_range>();
        }
        return optional<address_range>(address_range{first->address, last->address});
    }

    bool operator==(const resolution& other) const noexcept {
        return regions == other.regions && placements == other.placements && symbols == other.symbols;
    }
    bool operator!=(const resolution& other) const noexcept { return !(*this == other); }
};

} // namespace memPlan::layout
