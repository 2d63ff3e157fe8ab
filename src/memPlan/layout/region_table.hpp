#pragma once

#include <initializer_list>

#include "../core/types.hpp"
#include "../error/result.hpp"
#include "../error/error_handler.hpp"
#include "../utils/helpers.hpp"
#include "layout_types.hpp"

namespace memPlan::layout {

/**
 * @brief The device's named physical address ranges
 *
 * Authored once per device target. Regions never overlap; the table is
 * frozen when resolution begins and rejects further definitions.
 */
class region_table {
private:
    region_list regions_;
    bool frozen_{false};

    static result<index_t> fail(const diagnostic& diag) noexcept {
        return result<index_t>(error::raise(diag));
    }

public:
    region_table() noexcept = default;

    /**
     * @brief Define a region
     * @param name Unique region name
     * @param origin First address
     * @param length Size in bytes, must be > 0
     * @param attrs Access/lifetime attributes
     * @param symbols Boundary symbols marking the region's start or end
     * @return Index of the new region
     */
    result<index_t> define(const char* name, address_t origin, byte_count_t length,
                           attributes attrs,
                           std::initializer_list<symbol_request> symbols = {}) noexcept {
        if (frozen_) {
            return fail(diagnostic(error_code::table_frozen, name != nullptr ? name : ""));
        }
        if (!utils::is_valid_name(name)) {
            return fail(diagnostic(error_code::invalid_name, name != nullptr ? name : ""));
        }
        if (find(name).has_value()) {
            return fail(diagnostic(error_code::duplicate_region_name, name));
        }
        if (length == 0U || static_cast<u64>(origin) + length >= address_space_end) {
            return fail(diagnostic(error_code::invalid_length, name, "", origin, length));
        }

        const u64 new_end = static_cast<u64>(origin) + length;
        for (const auto& existing : regions_) {
            if (utils::ranges_intersect(origin, new_end, existing.origin, existing.end())) {
                return fail(diagnostic(error_code::overlap, name, existing.name.c_str(),
                                       origin, static_cast<u32>(new_end),
                                       existing.origin, existing.end()));
            }
        }

        if (symbols.size() > config::max_symbols_per_region) {
            return fail(diagnostic(error_code::capacity_exceeded, name, "region symbol",
                                   static_cast<u32>(config::max_symbols_per_region)));
        }
        for (const auto& sym : symbols) {
            if (!sym.name_fits) {
                return fail(diagnostic(error_code::invalid_name, sym.name.c_str(), name));
            }
        }
        if (regions_.full()) {
            return fail(diagnostic(error_code::capacity_exceeded, name, "region",
                                   static_cast<u32>(config::max_regions)));
        }

        region entry;
        entry.name.assign(name);
        entry.origin = origin;
        entry.length = length;
        entry.attrs = attrs;
        for (const auto& sym : symbols) {
            entry.symbols.push_back(sym);
        }
        regions_.push_back(entry);
        return result<index_t>(static_cast<index_t>(regions_.size() - 1U));
    }

    /**
     * @brief Look a region up by name
     */
    result<region> lookup(const char* name) const noexcept {
        const optional<index_t> index = find(name);
        if (!index.has_value()) {
            return result<region>(error::raise(diagnostic(error_code::unknown_region,
                                                          name != nullptr ? name : "")));
        }
        return result<region>(regions_[index.value()]);
    }

    /* Index of a region by name, without reporting */
    optional<index_t> find(const char* name) const noexcept {
        if (name == nullptr) {
            return optional<index_t>();
        }
        for (size_t i = 0; i < regions_.size(); ++i) {
            if (regions_[i].name == name) {
                return optional<index_t>(static_cast<index_t>(i));
            }
        }
        return optional<index_t>();
    }

    const region& at(index_t index) const noexcept { return regions_[index]; }

    const region_list& entries() const noexcept { return regions_; }

    [[nodiscard]] size_t size() const noexcept { return regions_.size(); }
    [[nodiscard]] bool empty() const noexcept { return regions_.empty(); }

    void freeze() noexcept { frozen_ = true; }
    [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }
};

} // namespace memPlan::layout
