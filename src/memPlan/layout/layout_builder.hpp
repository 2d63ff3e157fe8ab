#pragma once

#include <initializer_list>

#include "../core/types.hpp"
#include "../error/result.hpp"
#include "layout_types.hpp"
#include "placement_resolver.hpp"
#include "region_table.hpp"
#include "resolution.hpp"
#include "section_set.hpp"
#include "symbol_emitter.hpp"

namespace memPlan::layout {

/**
 * @brief Collects one image's region and section declarations, then resolves
 *
 * Declare every region, then every section, then call resolve() once per
 * build. resolve() freezes both tables; later declarations fail with
 * table_frozen. The builder is not copyable because the section set refers
 * to the builder's own region table.
 */
class layout_builder {
private:
    region_table regions_;
    section_set sections_;

public:
    layout_builder() noexcept : regions_(), sections_(regions_) {}

    layout_builder(const layout_builder&) = delete;
    layout_builder& operator=(const layout_builder&) = delete;

    result<index_t> define_region(const char* name, address_t origin, byte_count_t length,
                                  attributes attrs,
                                  std::initializer_list<symbol_request> symbols = {}) noexcept {
        return regions_.define(name, origin, length, attrs, symbols);
    }

    result<index_t> declare_section(const char* name, const char* region_name, load_behavior behavior,
                                    byte_count_t alignment, byte_count_t size,
                                    std::initializer_list<symbol_request> symbols = {}) noexcept {
        return sections_.declare(name, region_name, behavior, alignment, size, symbols);
    }

    result<void> set_section_size(const char* name, byte_count_t size) noexcept {
        return sections_.set_size(name, size);
    }

    const region_table& regions() const noexcept { return regions_; }
    const section_set& sections() const noexcept { return sections_; }

    /**
     * @brief Place every section and emit every boundary symbol
     */
    result<resolution> resolve() noexcept {
        regions_.freeze();
        sections_.freeze();

        const placement_resolver resolver;
        const result<placement_list> placed = resolver.resolve(sections_);
        if (placed.is_error()) {
            return result<resolution>(placed.error());
        }

        symbol_emitter emitter;
        const result<symbol_list> emitted = emitter.emit(sections_, placed.value());
        if (emitted.is_error()) {
            return result<resolution>(emitted.error());
        }

        resolution out;
        out.regions = regions_.entries();
        out.placements = placed.value();
        out.symbols = emitted.value();
        return result<resolution>(out);
    }
};

} // namespace memPlan::layout
