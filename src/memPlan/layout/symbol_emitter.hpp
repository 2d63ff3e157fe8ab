#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../error/error_handler.hpp"
#include "../platform/platform.hpp"
#include "layout_types.hpp"
#include "region_table.hpp"
#include "section_set.hpp"

namespace memPlan::layout {

/**
 * @brief Turns symbol requests into addressed boundary symbols
 *
 * Region symbols come first, in region order, then section symbols in
 * section declaration order. Section symbols need the section's placement, so
 * the resolver has to run first. Symbol names are unique across the build.
 */
class symbol_emitter {
private:
    symbol_list symbols_;

    static result<void> fail(const diagnostic& diag) noexcept {
        return result<void>(error::raise(diag));
    }

    const boundary_symbol* find(const name_t& name) const noexcept {
        for (const auto& sym : symbols_) {
            if (sym.name == name) {
                return &sym;
            }
        }
        return nullptr;
    }

    result<void> add(const symbol_request& request, address_t address,
                     symbol_kind marks, const name_t& owner) noexcept {
        const boundary_symbol* existing = find(request.name);
        if (existing != nullptr) {
            return fail(diagnostic(error_code::duplicate_symbol_name, request.name.c_str(),
                                   existing->owner.c_str(), existing->address, address));
        }
        if (symbols_.full()) {
            return fail(diagnostic(error_code::capacity_exceeded, request.name.c_str(), "symbol",
                                   static_cast<u32>(config::max_symbols)));
        }

        boundary_symbol sym;
        sym.name = request.name;
        sym.address = address;
        sym.marks = marks;
        sym.owner = owner;
        symbols_.push_back(sym);

        if (config::trace_resolution) {
            platform::logf("[memPlan] symbol %-16s = 0x%08X (%s)",
                           sym.name.c_str(), sym.address, owner.c_str());
        }
        return ok();
    }

    static const placement* placement_of(const placement_list& placements,
                                         const name_t& section) noexcept {
        for (const auto& p : placements) {
            if (p.section == section) {
                return &p;
            }
        }
        return nullptr;
    }

public:
    symbol_emitter() noexcept = default;

    result<symbol_list> emit(const section_set& sections, const placement_list& placements) noexcept {
        symbols_.clear();

        for (const auto& r : sections.regions().entries()) {
            for (const auto& request : r.symbols) {
                const bool at_start = (request.edge == symbol_edge::start);
                const result<void> added = add(request, at_start ? r.origin : r.end(),
                                               at_start ? symbol_kind::region_start : symbol_kind::region_end,
                                               r.name);
                if (added.is_error()) {
                    return result<symbol_list>(added.error());
                }
            }
        }

        for (const auto& s : sections.entries()) {
            if (s.symbols.empty()) {
                continue;
            }
            const placement* p = placement_of(placements, s.name);
            if (p == nullptr) {
                return result<symbol_list>(error::raise(
                    diagnostic(error_code::missing_placement, s.name.c_str(),
                               sections.regions().at(s.region).name.c_str())));
            }
            for (const auto& request : s.symbols) {
                const bool at_start = (request.edge == symbol_edge::start);
                const result<void> added = add(request, at_start ? p->start : p->end,
                                               at_start ? symbol_kind::section_start : symbol_kind::section_end,
                                               s.name);
                if (added.is_error()) {
                    return result<symbol_list>(added.error());
                }
            }
        }
        return result<symbol_list>(symbols_);
    }
};

} // namespace memPlan::layout
