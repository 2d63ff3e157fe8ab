#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../error/error_handler.hpp"
#include "../layout/layout_types.hpp"
#include "../layout/resolution.hpp"

#include <etl/algorithm.h>
#include <etl/vector.h>

namespace memPlan::mailbox {

// Two images name at most 2 * max_regions shared regions and 2 * max_sections
// sections between them; each yields at most one mismatch.
constexpr size_t max_mismatches = 2U * (config::max_regions + config::max_sections);

using mismatch_list = etl::vector<diagnostic, max_mismatches>;

namespace detail {

using name_list = etl::vector<name_t, max_mismatches>;

inline void add_unique(name_list& names, const name_t& name) noexcept {
    for (const auto& n : names) {
        if (n == name) {
            return;
        }
    }
    if (!names.full()) {
        names.push_back(name);
    }
}

inline bool is_shared(const layout::resolution& res, const name_t& name) noexcept {
    const layout::region* r = res.find_region(name.c_str());
    return r != nullptr && r->attrs.shared;
}

/* Sections one image placed in the named region */
inline void collect_sections(const layout::resolution& res, const name_t& region_name, name_list& out) noexcept {
    for (const auto& p : res.placements) {
        if (res.regions[p.region].name == region_name) {
            add_unique(out, p.section);
        }
    }
}

inline void push(mismatch_list& out, const diagnostic& diag) noexcept {
    if (!out.full()) {
        out.push_back(diag);
    }
}

} // namespace detail

/**
 * @brief Every disagreement between two images over their shared regions
 *
 * A region counts as shared when either image tags it shared. Both images
 * must define it, tag it shared, give it the same origin and end, and place
 * the same sections in it at the same addresses. Regions and sections are
 * visited in name order, so swapping the two images yields the same
 * mismatches with the two addresses swapped.
 */
inline void collect_mismatches(const layout::resolution& a, const layout::resolution& b,
                               mismatch_list& out) noexcept {
    out.clear();

    detail::name_list shared;
    for (const auto& r : a.regions) {
        if (r.attrs.shared) { detail::add_unique(shared, r.name); }
    }
    for (const auto& r : b.regions) {
        if (r.attrs.shared) { detail::add_unique(shared, r.name); }
    }
    etl::sort(shared.begin(), shared.end());

    for (const auto& name : shared) {
        const bool in_a = detail::is_shared(a, name);
        const bool in_b = detail::is_shared(b, name);
        if (!in_a || !in_b) {
            detail::push(out, diagnostic(error_code::shared_entry_missing, name.c_str(), "region",
                                         in_a ? 0U : 1U));
            continue;
        }

        const layout::region& ra = *a.find_region(name.c_str());
        const layout::region& rb = *b.find_region(name.c_str());
        if (ra.origin != rb.origin) {
            detail::push(out, diagnostic(error_code::address_mismatch, name.c_str(), "origin",
                                         ra.origin, rb.origin));
            continue;
        }
        if (ra.end() != rb.end()) {
            detail::push(out, diagnostic(error_code::address_mismatch, name.c_str(), "end",
                                         ra.end(), rb.end()));
            continue;
        }

        detail::name_list sections;
        detail::collect_sections(a, name, sections);
        detail::collect_sections(b, name, sections);
        etl::sort(sections.begin(), sections.end());

        for (const auto& section : sections) {
            const layout::placement* pa = a.find_placement(section.c_str());
            const layout::placement* pb = b.find_placement(section.c_str());
            const bool placed_a = pa != nullptr && a.regions[pa->region].name == name;
            const bool placed_b = pb != nullptr && b.regions[pb->region].name == name;
            if (!placed_a || !placed_b) {
                detail::push(out, diagnostic(error_code::shared_entry_missing, name.c_str(),
                                             section.c_str(), placed_a ? 0U : 1U));
            } else if (pa->start != pb->start) {
                detail::push(out, diagnostic(error_code::address_mismatch, name.c_str(),
                                             section.c_str(), pa->start, pb->start));
            } else if (pa->end != pb->end) {
                detail::push(out, diagnostic(error_code::address_mismatch, name.c_str(),
                                             section.c_str(), pa->end, pb->end));
            }
        }
    }
}

/**
 * @brief Check that two independently resolved images agree on shared memory
 *
 * Run at build time on the application and coprocessor resolutions. Every
 * disagreement is reported; the first one is returned.
 */
inline result<void> verify(const layout::resolution& app, const layout::resolution& coprocessor) noexcept {
    mismatch_list mismatches;
    collect_mismatches(app, coprocessor, mismatches);
    if (mismatches.empty()) {
        return ok();
    }
    for (const auto& m : mismatches) {
        (void)error::raise(m);
    }
    return result<void>(mismatches.front());
}

} // namespace memPlan::mailbox
