#include <cstdio>

#include <memPlan/memPlan.hpp>

using namespace memPlan;

// Application image: the mailbox layout plus its own code and data
static bool build_application(layout::layout_builder& builder) {
    auto mailbox_result = device::stm32wb55::build_mailbox_layout(builder);
    if (mailbox_result.is_error()) {
        return false;
    }

    // Sizes as measured by the compiler for this build
    auto text = builder.declare_section(".text", device::stm32wb55::flash_region,
                                        layout::load_behavior::initialized, 4, 0x6400);
    auto data = builder.declare_section(".data", device::stm32wb55::ram_region,
                                        layout::load_behavior::initialized, 4, 0x180);
    auto bss = builder.declare_section(".bss", device::stm32wb55::ram_region,
                                       layout::load_behavior::no_load, 8, 0x2210,
                                       {layout::symbol_request("__bss_start", layout::symbol_edge::start),
                                        layout::symbol_request("__bss_end", layout::symbol_edge::end)});
    return text.is_ok() && data.is_ok() && bss.is_ok();
}

// Coprocessor side only needs the shared window, from the same device table
static bool build_coprocessor(layout::layout_builder& builder) {
    return device::stm32wb55::build_mailbox_layout(builder).is_ok();
}

int main() {
    layout::layout_builder app;
    layout::layout_builder coprocessor;
    if (!build_application(app) || !build_coprocessor(coprocessor)) {
        return 1;
    }

    auto app_result = app.resolve();
    auto cop_result = coprocessor.resolve();
    if (app_result.is_error() || cop_result.is_error()) {
        return 1;
    }

    auto contract = mailbox::verify(app_result.value(), cop_result.value());
    if (contract.is_error()) {
        // Already reported through the error handler; the build must stop here
        return 2;
    }

    layout::log_report(app_result.value());

    // Firmware locates MB_MEM2 through its boundary symbols
    auto mb_mem2 = app_result.value().symbol_range(mailbox::tl::mb_mem2_start_symbol,
                                                   mailbox::tl::mb_mem2_end_symbol);
    if (mb_mem2.has_value()) {
        platform::logf("[memPlan] MB_MEM2 window [0x%08X, 0x%08X)", mb_mem2.value().start, mb_mem2.value().end);
    }

    static layout::script_t script;
    auto rendered = layout::render_linker_script(app_result.value(), script);
    if (rendered.is_error()) {
        return 1;
    }
    std::fputs(script.c_str(), stdout);
    return 0;
}
