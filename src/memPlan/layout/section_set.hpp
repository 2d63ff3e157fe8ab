#pragma once

#include <initializer_list>

#include "../core/types.hpp"
#include "../error/result.hpp"
#include "../error/error_handler.hpp"
#include "../utils/helpers.hpp"
#include "layout_types.hpp"
#include "region_table.hpp"

namespace memPlan::layout {

/**
 * @brief Sections to place, in declaration order
 *
 * Declaration order is placement order: the resolver walks this list front
 * to back, so the same list always yields the same addresses.
 */
class section_set {
private:
    const region_table& regions_;
    section_list sections_;
    bool frozen_{false};

    static result<index_t> fail(const diagnostic& diag) noexcept {
        return result<index_t>(error::raise(diag));
    }

public:
    explicit section_set(const region_table& regions) noexcept : regions_(regions) {}

    /**
     * @brief Declare a section
     * @param name Unique section name
     * @param region_name Region the section is placed in
     * @param behavior initialized or no_load (see load_behavior)
     * @param alignment Required start alignment, a power of two
     * @param size Content size in bytes, supplied by the image builder
     * @param symbols Boundary symbols marking the section's start or end
     * @return Index of the new section
     */
    result<index_t> declare(const char* name, const char* region_name, load_behavior behavior,
                            byte_count_t alignment, byte_count_t size,
                            std::initializer_list<symbol_request> symbols = {}) noexcept {
        if (frozen_) {
            return fail(diagnostic(error_code::table_frozen, name != nullptr ? name : ""));
        }
        if (!utils::is_valid_name(name)) {
            return fail(diagnostic(error_code::invalid_name, name != nullptr ? name : ""));
        }
        if (find(name).has_value()) {
            return fail(diagnostic(error_code::duplicate_section_name, name));
        }
        const optional<index_t> region = regions_.find(region_name);
        if (!region.has_value()) {
            return fail(diagnostic(error_code::unknown_region,
                                   region_name != nullptr ? region_name : "", name));
        }
        if (!utils::is_power_of_two(alignment)) {
            return fail(diagnostic(error_code::invalid_alignment, name, region_name, alignment));
        }
        if (symbols.size() > config::max_symbols_per_section) {
            return fail(diagnostic(error_code::capacity_exceeded, name, "section symbol",
                                   static_cast<u32>(config::max_symbols_per_section)));
        }
        for (const auto& sym : symbols) {
            if (!sym.name_fits) {
                return fail(diagnostic(error_code::invalid_name, sym.name.c_str(), name));
            }
        }
        if (sections_.full()) {
            return fail(diagnostic(error_code::capacity_exceeded, name, "section",
                                   static_cast<u32>(config::max_sections)));
        }

        section entry;
        entry.name.assign(name);
        entry.region = region.value();
        entry.behavior = behavior;
        entry.alignment = alignment;
        entry.size = size;
        for (const auto& sym : symbols) {
            entry.symbols.push_back(sym);
        }
        sections_.push_back(entry);
        return result<index_t>(static_cast<index_t>(sections_.size() - 1U));
    }

    /**
     * @brief Replace a section's size with the one measured by the image builder
     */
    result<void> set_size(const char* name, byte_count_t size) noexcept {
        if (frozen_) {
            return result<void>(error::raise(diagnostic(error_code::table_frozen,
                                                        name != nullptr ? name : "")));
        }
        const optional<index_t> index = find(name);
        if (!index.has_value()) {
            return result<void>(error::raise(diagnostic(error_code::unknown_section,
                                                        name != nullptr ? name : "")));
        }
        sections_[index.value()].size = size;
        return ok();
    }

    optional<index_t> find(const char* name) const noexcept {
        if (name == nullptr) {
            return optional<index_t>();
        }
        for (size_t i = 0; i < sections_.size(); ++i) {
            if (sections_[i].name == name) {
                return optional<index_t>(static_cast<index_t>(i));
            }
        }
        return optional<index_t>();
    }

    const section& at(index_t index) const noexcept { return sections_[index]; }

    const section_list& entries() const noexcept { return sections_; }

    const region_table& regions() const noexcept { return regions_; }

    [[nodiscard]] size_t size() const noexcept { return sections_.size(); }

    void freeze() noexcept { frozen_ = true; }
    [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }
};

} // namespace memPlan::layout
