#pragma once

// STM32WB55 memory map as seen by both the application core (Cortex-M4) and
// the radio coprocessor (Cortex-M0+). SRAM1 starts 8 bytes in; the first
// words are left to the coprocessor boot handshake. SRAM2a opens with the
// 10 KiB mailbox window both images must agree on.

#include "../core/types.hpp"
#include "../error/result.hpp"
#include "../layout/layout_builder.hpp"
#include "../layout/layout_types.hpp"
#include "../mailbox/tl_buffers.hpp"

namespace memPlan::device::stm32wb55 {

constexpr address_t flash_origin       = 0x08000000U;
constexpr byte_count_t flash_length    = 512U * 1024U;
constexpr address_t ram_origin         = 0x20000008U;
constexpr byte_count_t ram_length      = 0x2FFF8U;
constexpr address_t shared1_origin     = 0x20030000U;
constexpr byte_count_t shared1_length  = 0x28U;
constexpr address_t shared2_origin     = 0x20030028U;
constexpr byte_count_t shared2_length  = 0x27D8U;

constexpr const char* flash_region   = "FLASH";
constexpr const char* ram_region     = "RAM";
constexpr const char* shared1_region = "RAM_SHARED1";
constexpr const char* shared2_region = "RAM_SHARED2";

static_assert(ram_origin + ram_length == shared1_origin, "SRAM1 ends where the mailbox window begins");
static_assert(shared1_origin + shared1_length == shared2_origin, "mailbox regions are contiguous");
static_assert(shared1_length + shared2_length == 10U * 1024U, "mailbox window is 10 KiB");
static_assert(mailbox::tl::ref_table_bytes <= shared1_length, "reference table must fit RAM_SHARED1");
static_assert(mailbox::tl::mb_mem1_bytes + mailbox::tl::mb_mem2_bytes <= shared2_length,
              "mailbox buffers must fit RAM_SHARED2");

inline result<void> define_regions(layout::layout_builder& builder) noexcept {
    using layout::attributes;

    const result<index_t> flash = builder.define_region(flash_region, flash_origin, flash_length, attributes::flash());
    if (flash.is_error()) { return result<void>(flash.error()); }
    const result<index_t> ram = builder.define_region(ram_region, ram_origin, ram_length, attributes::ram());
    if (ram.is_error()) { return result<void>(ram.error()); }
    const result<index_t> shared1 = builder.define_region(shared1_region, shared1_origin, shared1_length, attributes::shared_ram());
    if (shared1.is_error()) { return result<void>(shared1.error()); }
    const result<index_t> shared2 = builder.define_region(shared2_region, shared2_origin, shared2_length, attributes::shared_ram());
    if (shared2.is_error()) { return result<void>(shared2.error()); }
    return ok();
}

/**
 * @brief Regions plus the transport-layer mailbox sections
 *
 * Application and coprocessor builds both call this, so both derive their
 * mailbox addresses from the same table.
 */
inline result<void> build_mailbox_layout(layout::layout_builder& builder) noexcept {
    const result<void> regions = define_regions(builder);
    if (regions.is_error()) {
        return regions;
    }
    return mailbox::tl::declare_tl_sections(builder, shared1_region, shared2_region);
}

} // namespace memPlan::device::stm32wb55
