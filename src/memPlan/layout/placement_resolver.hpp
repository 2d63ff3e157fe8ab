#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../error/error_handler.hpp"
#include "../platform/platform.hpp"
#include "../utils/helpers.hpp"
#include "layout_types.hpp"
#include "region_table.hpp"
#include "section_set.hpp"

#include <etl/vector.h>

namespace memPlan::layout {

/**
 * @brief Assigns every section an address range inside its region
 *
 * Sections are packed in declaration order. Each region has its own cursor,
 * starting at the region origin; a section starts at its cursor rounded up to
 * the section alignment and the cursor then moves to the section end. Sections
 * in different regions never influence each other. Space left at the end of a
 * region is not an error.
 *
 * Regions come from the table the sections were declared against. The
 * cursors live in a single resolve() call, so nothing leaks from one
 * resolution into the next.
 */
class placement_resolver {
public:
    placement_resolver() noexcept = default;

    result<placement_list> resolve(const section_set& sections) const noexcept {
        const region_table& regions = sections.regions();
        etl::vector<u64, config::max_regions> cursors;
        for (const auto& r : regions.entries()) {
            cursors.push_back(r.origin);
        }

        placement_list placements;
        for (const auto& s : sections.entries()) {
            const region& owner = regions.at(s.region);
            u64& cursor = cursors[s.region];

            const u64 start = utils::align_up(cursor, s.alignment);
            const u64 end = start + s.size;
            if (end > owner.end()) {
                return result<placement_list>(error::raise(diagnostic(
                    error_code::region_overflow, s.name.c_str(), owner.name.c_str(),
                    clamp_address(start), clamp_address(end), owner.origin, owner.end())));
            }

            placement p;
            p.section = s.name;
            p.region = s.region;
            p.behavior = s.behavior;
            p.start = static_cast<address_t>(start);
            p.end = static_cast<address_t>(end);
            placements.push_back(p);
            cursor = end;

            if (config::trace_resolution) {
                platform::logf("[memPlan] place %-16s in %-12s [0x%08X, 0x%08X) %u bytes",
                               p.section.c_str(), owner.name.c_str(), p.start, p.end, p.size());
            }
        }
        return result<placement_list>(placements);
    }

private:
    static u32 clamp_address(u64 value) noexcept {
        return static_cast<u32>(utils::min<u64>(value, 0xFFFFFFFFULL));
    }
};

} // namespace memPlan::layout
