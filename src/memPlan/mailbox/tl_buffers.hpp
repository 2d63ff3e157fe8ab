#pragma once

// Transport-layer mailbox buffers shared with the radio coprocessor.
// Sizes follow the coprocessor's packed C structures for a target with
// MEMPLAN_TARGET_POINTER_BYTES-wide pointers. Only placement matters here;
// the message format living in these buffers is the wire protocol's business.

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../layout/layout_builder.hpp"
#include "../utils/helpers.hpp"
#include "object_list.hpp"

namespace memPlan::mailbox::tl {

constexpr byte_count_t ptr = static_cast<byte_count_t>(config::target_pointer_bytes);

// -------- Wire-level building blocks --------
constexpr byte_count_t list_node_bytes      = 2U * ptr;       // next, prev
constexpr byte_count_t packet_header_bytes  = list_node_bytes;
constexpr byte_count_t cmd_header_bytes     = 4U;
constexpr byte_count_t evt_header_bytes     = 3U;
constexpr byte_count_t cs_evt_bytes         = 4U;             // status, numcmd, cmdcode
constexpr byte_count_t max_payload_bytes    = 255U;
constexpr byte_count_t cmd_packet_bytes     = packet_header_bytes + 1U + 2U + 1U + max_payload_bytes;
constexpr byte_count_t spare_evt_bytes      = packet_header_bytes + evt_header_bytes + max_payload_bytes;
constexpr byte_count_t cs_buffer_bytes      = packet_header_bytes + evt_header_bytes + cs_evt_bytes;
constexpr byte_count_t acl_data_bytes       = packet_header_bytes + 5U + 251U;

// -------- Asynchronous event pool --------
#ifndef MEMPLAN_TL_EVT_QUEUE_LENGTH
#define MEMPLAN_TL_EVT_QUEUE_LENGTH 5
#endif
constexpr byte_count_t evt_queue_length     = MEMPLAN_TL_EVT_QUEUE_LENGTH;
constexpr byte_count_t ble_event_frame_bytes = evt_header_bytes + max_payload_bytes;
constexpr byte_count_t evt_pool_bytes =
    evt_queue_length * 4U *
    static_cast<byte_count_t>(utils::div_ceil(packet_header_bytes + ble_event_frame_bytes, 4U));

static_assert(evt_queue_length >= 1, "MEMPLAN_TL_EVT_QUEUE_LENGTH must be >= 1");

// -------- Tables the coprocessor reads through the reference table --------
constexpr byte_count_t device_info_table_bytes = 4U + 12U + 16U;  // safe boot, FUS, wireless fw
constexpr byte_count_t ble_table_bytes         = 4U * ptr;
constexpr byte_count_t thread_table_bytes      = 4U * ptr;
constexpr byte_count_t lld_tests_table_bytes   = 2U * ptr;
constexpr byte_count_t ble_lld_table_bytes     = 2U * ptr;
constexpr byte_count_t sys_table_bytes         = 2U * ptr;
constexpr byte_count_t mem_manager_table_bytes = 5U * ptr + 2U * 4U;
constexpr byte_count_t traces_table_bytes      = ptr;
constexpr byte_count_t mac_802_15_4_table_bytes = 3U * ptr;
constexpr byte_count_t zigbee_table_bytes      = 3U * ptr;

constexpr byte_count_t ref_table_entries = 10U;

// Section contents in link order; everything in the mailbox is 4-byte aligned
constexpr buffer_object ref_table_objects[] = {
    {"TL_REF_TABLE", ref_table_entries * ptr, ptr},
};

constexpr buffer_object mb_mem1_objects[] = {
    {"TL_DEVICE_INFO_TABLE",  device_info_table_bytes,  4U},
    {"TL_BLE_TABLE",          ble_table_bytes,          4U},
    {"TL_THREAD_TABLE",       thread_table_bytes,       4U},
    {"TL_LLD_TESTS_TABLE",    lld_tests_table_bytes,    4U},
    {"TL_BLE_LLD_TABLE",      ble_lld_table_bytes,      4U},
    {"TL_SYS_TABLE",          sys_table_bytes,          4U},
    {"TL_MEM_MANAGER_TABLE",  mem_manager_table_bytes,  4U},
    {"TL_TRACES_TABLE",       traces_table_bytes,       4U},
    {"TL_MAC_802_15_4_TABLE", mac_802_15_4_table_bytes, 4U},
    {"TL_ZIGBEE_TABLE",       zigbee_table_bytes,       4U},
    {"FREE_BUF_QUEUE",        list_node_bytes,          4U},
    {"TRACES_EVT_QUEUE",      list_node_bytes,          4U},
    {"EVT_QUEUE",             list_node_bytes,          4U},
    {"SYSTEM_EVT_QUEUE",      list_node_bytes,          4U},
};

constexpr buffer_object mb_mem2_objects[] = {
    {"CS_BUFFER",           cs_buffer_bytes,  4U},
    {"EVT_POOL",            evt_pool_bytes,   4U},
    {"SYS_CMD_BUFFER",      cmd_packet_bytes, 4U},
    {"SYS_SPARE_EVT_BUF",   spare_evt_bytes,  4U},
    {"BLE_SPARE_EVT_BUF",   spare_evt_bytes,  4U},
    {"BLE_CMD_BUFFER",      cmd_packet_bytes, 4U},
    {"HCI_ACL_DATA_BUFFER", acl_data_bytes,   4U},
};

constexpr byte_count_t ref_table_bytes = packed_size(ref_table_objects);
constexpr byte_count_t mb_mem1_bytes   = packed_size(mb_mem1_objects);
constexpr byte_count_t mb_mem2_bytes   = packed_size(mb_mem2_objects);

constexpr const char* ref_table_section = "TL_REF_TABLE";
constexpr const char* mb_mem1_section   = "MB_MEM1";
constexpr const char* mb_mem2_section   = "MB_MEM2";
constexpr const char* mb_mem2_start_symbol = "_sMB_MEM2";
constexpr const char* mb_mem2_end_symbol   = "_eMB_MEM2";

/**
 * @brief Declare the three no-load mailbox sections
 *
 * TL_REF_TABLE goes alone into `ref_region` (its address is what the
 * coprocessor is told at boot). MB_MEM1 and then MB_MEM2 go into
 * `buffer_region`; MB_MEM2 is bracketed by _sMB_MEM2 / _eMB_MEM2. Nothing in
 * these sections is zeroed at boot, firmware initializes every table itself.
 */
inline result<void> declare_tl_sections(layout::layout_builder& builder,
                                        const char* ref_region, const char* buffer_region) noexcept {
    using layout::load_behavior;
    using layout::symbol_edge;

    const result<index_t> ref = builder.declare_section(
        ref_table_section, ref_region, load_behavior::no_load,
        max_alignment(ref_table_objects), ref_table_bytes);
    if (ref.is_error()) {
        return result<void>(ref.error());
    }
    const result<index_t> mem1 = builder.declare_section(
        mb_mem1_section, buffer_region, load_behavior::no_load,
        max_alignment(mb_mem1_objects), mb_mem1_bytes);
    if (mem1.is_error()) {
        return result<void>(mem1.error());
    }
    const result<index_t> mem2 = builder.declare_section(
        mb_mem2_section, buffer_region, load_behavior::no_load,
        max_alignment(mb_mem2_objects), mb_mem2_bytes,
        {layout::symbol_request(mb_mem2_start_symbol, symbol_edge::start),
         layout::symbol_request(mb_mem2_end_symbol, symbol_edge::end)});
    if (mem2.is_error()) {
        return result<void>(mem2.error());
    }
    return ok();
}

} // namespace memPlan::mailbox::tl
