#pragma once

#include <cstdio>

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../error/result.hpp"
#include "../error/error_handler.hpp"
#include "layout_types.hpp"
#include "resolution.hpp"

#include <etl/string.h>

namespace memPlan::layout {

using script_t = string<config::script_capacity>;

namespace detail {

/* printf-style append; fails instead of truncating the script */
template<typename... Args>
inline bool append_line(etl::istring& out, const char* fmt, Args... args) noexcept {
    char line[192];
    const int written = std::snprintf(line, sizeof(line), fmt, args...); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */
    if (written < 0 || static_cast<size_t>(written) >= sizeof(line) ||
        static_cast<size_t>(written) > out.available()) {
        return false;
    }
    out.append(line);
    return true;
}

inline string<4> memory_flags(const attributes& attrs) noexcept {
    string<4> flags;
    if (attrs.readable)   { flags.push_back('r'); }
    if (attrs.writable)   { flags.push_back('w'); }
    if (attrs.executable) { flags.push_back('x'); }
    return flags;
}

/* Region holding the boot image: loaded and not writable. Null when there is none */
inline const region* load_region(const resolution& res) noexcept {
    for (const auto& r : res.regions) {
        if (r.attrs.loaded && !r.attrs.writable) {
            return &r;
        }
    }
    return nullptr;
}

} // namespace detail

/**
 * @brief Render a resolution as a GNU ld script fragment
 *
 * MEMORY lists every region. Region symbols become absolute assignments.
 * SECTIONS pins each output section at its resolved start, wraps its input
 * section with its boundary symbols and asserts the linked size never grows
 * past the resolved one. Initialized sections in writable memory get their
 * load address in the boot image region (`AT>FLASH`).
 */
inline result<void> render_linker_script(const resolution& res, etl::istring& out) noexcept {
    const diagnostic full(error_code::capacity_exceeded, "script", "linker script",
                          static_cast<u32>(out.capacity()));
    out.clear();

    bool fits = detail::append_line(out, "/* Generated by memPlan. Do not edit. */\n\nMEMORY\n{\n");
    for (const auto& r : res.regions) {
        const string<4> flags = detail::memory_flags(r.attrs);
        if (flags.empty()) {
            fits = fits && detail::append_line(out, "  %-12s : ORIGIN = 0x%08X, LENGTH = 0x%08X\n",
                                               r.name.c_str(), r.origin, r.length);
        } else {
            fits = fits && detail::append_line(out, "  %-12s (%s) : ORIGIN = 0x%08X, LENGTH = 0x%08X\n",
                                               r.name.c_str(), flags.c_str(), r.origin, r.length);
        }
    }
    fits = fits && detail::append_line(out, "}\n\n");

    for (const auto& s : res.symbols) {
        if (s.marks == symbol_kind::region_start || s.marks == symbol_kind::region_end) {
            fits = fits && detail::append_line(out, "%s = 0x%08X;\n", s.name.c_str(), s.address);
        }
    }

    const region* boot_image = detail::load_region(res);

    fits = fits && detail::append_line(out, "\nSECTIONS\n{\n");
    for (const auto& p : res.placements) {
        const char* name = p.section.c_str();
        fits = fits && detail::append_line(out, "  %s 0x%08X%s :\n  {\n", name, p.start,
                                           p.behavior == load_behavior::no_load ? " (NOLOAD)" : "");
        for (const auto& s : res.symbols) {
            if (s.owner == p.section && s.marks == symbol_kind::section_start) {
                fits = fits && detail::append_line(out, "    %s = .;\n", s.name.c_str());
            }
        }
        fits = fits && detail::append_line(out, "    KEEP(*(%s))\n", name);
        for (const auto& s : res.symbols) {
            if (s.owner == p.section && s.marks == symbol_kind::section_end) {
                fits = fits && detail::append_line(out, "    %s = .;\n", s.name.c_str());
            }
        }
        const region& home = res.regions[p.region];
        if (p.behavior == load_behavior::initialized && home.attrs.writable &&
            boot_image != nullptr && boot_image != &home) {
            fits = fits && detail::append_line(out, "  } >%s AT>%s\n", home.name.c_str(),
                                               boot_image->name.c_str());
        } else {
            fits = fits && detail::append_line(out, "  } >%s\n", home.name.c_str());
        }
        fits = fits && detail::append_line(out, "  ASSERT(SIZEOF(%s) <= 0x%X, \"%s outgrew its placement\")\n\n",
                                           name, p.size(), name);
    }
    fits = fits && detail::append_line(out, "}\n");

    if (!fits) {
        return result<void>(error::raise(full));
    }
    return ok();
}

} // namespace memPlan::layout
