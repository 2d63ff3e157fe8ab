#pragma once

#include "../core/types.hpp"
#include "../platform/platform.hpp"
#include "layout_types.hpp"
#include "resolution.hpp"

namespace memPlan::layout {

inline const char* kind_name(symbol_kind kind) noexcept {
    switch (kind) {
        case symbol_kind::region_start:  return "region-start";
        case symbol_kind::region_end:    return "region-end";
        case symbol_kind::section_start: return "section-start";
        case symbol_kind::section_end:   return "section-end";
    }
    return "?";
}

/* "rwx" style flags, '-' for a missing permission */
inline string<8> attribute_flags(const attributes& attrs) noexcept {
    string<8> flags;
    flags.push_back(attrs.readable ? 'r' : '-');
    flags.push_back(attrs.writable ? 'w' : '-');
    flags.push_back(attrs.executable ? 'x' : '-');
    if (attrs.loaded) { flags.push_back('L'); }
    if (attrs.shared) { flags.push_back('S'); }
    return flags;
}

/**
 * @brief Log the region map, placements and symbols of a resolution
 */
inline void log_report(const resolution& res) noexcept {
    platform::log("[memPlan] ===== Regions =====");
    for (size_t i = 0; i < res.regions.size(); ++i) {
        const region& r = res.regions[i];
        const index_t index = static_cast<index_t>(i);
        platform::logf("[memPlan] %-12s %-5s [0x%08X, 0x%08X) used %u / %u, free %u",
                       r.name.c_str(), attribute_flags(r.attrs).c_str(), r.origin, r.end(),
                       res.used_bytes(index), r.length, res.free_bytes(index));
    }
    platform::log("[memPlan] ===== Placements =====");
    for (const auto& p : res.placements) {
        platform::logf("[memPlan] %-16s %-12s [0x%08X, 0x%08X) %u bytes%s",
                       p.section.c_str(), res.regions[p.region].name.c_str(), p.start, p.end, p.size(),
                       p.behavior == load_behavior::no_load ? " NOLOAD" : "");
    }
    platform::log("[memPlan] ===== Symbols =====");
    for (const auto& s : res.symbols) {
        platform::logf("[memPlan] %-16s = 0x%08X %-13s (%s)",
                       s.name.c_str(), s.address, kind_name(s.marks), s.owner.c_str());
    }
}

} // namespace memPlan::layout
