#pragma once

/**
 * @file memPlan.hpp
 * @brief Main header for memPlan - static memory map and mailbox placement
 *
 * Header-only, no exceptions, no RTTI and no dynamic allocation.
 * Depends only on ETL (Embedded Template Library).
 *
 * @version 1.0.0
 */

#include "memPlan/core/types.hpp"
#include "memPlan/core/config.hpp"
#include "memPlan/error/result.hpp"
#include "memPlan/error/error_handler.hpp"
#include "memPlan/platform/platform.hpp"
#include "memPlan/layout/layout_builder.hpp"
#include "memPlan/layout/linker_script.hpp"
#include "memPlan/layout/report.hpp"
#include "memPlan/mailbox/contract.hpp"
#include "memPlan/mailbox/tl_buffers.hpp"
#include "memPlan/device/stm32wb55.hpp"

/**
 * @namespace memPlan
 * @brief Memory map resolution for dual-core devices
 */
namespace memPlan {

    /**
     * @brief Get library version
     */
    constexpr const char* version() noexcept {
        return "1.0.0";
    }

} // namespace memPlan
