#pragma once

#include <cstdio>

#include "../core/types.hpp"
#include "../platform/platform.hpp"
#include "result.hpp"

namespace memPlan {
namespace error {

/**
 * @brief Error severity levels
 */
enum class error_severity : u8 {
    info,       // Informational, no action needed
    warning,    // Layout is valid but suspicious
    error,      // Declaration rejected
    fatal       // Layout cannot be produced, build must stop
};

/**
 * @brief Error context information
 */
struct error_context {
    error_severity severity{error_severity::fatal};
    diagnostic diag;

    error_context() noexcept = default;
};

/**
 * @brief Error handler callback type
 */
using error_handler_fn = void(*)(const error_context& ctx) noexcept;

using message_t = string<192>;

inline const char* code_name(error_code code) noexcept {
    switch (code) {
        case error_code::success:               return "ok";
        case error_code::duplicate_region_name: return "DuplicateRegionName";
        case error_code::overlap:               return "OverlapError";
        case error_code::unknown_region:        return "UnknownRegion";
        case error_code::invalid_alignment:     return "InvalidAlignment";
        case error_code::region_overflow:       return "RegionOverflow";
        case error_code::missing_placement:     return "MissingPlacement";
        case error_code::duplicate_symbol_name: return "DuplicateSymbolName";
        case error_code::address_mismatch:      return "AddressMismatch";
        case error_code::invalid_name:          return "InvalidName";
        case error_code::invalid_length:        return "InvalidLength";
        case error_code::capacity_exceeded:     return "CapacityExceeded";
        case error_code::table_frozen:          return "TableFrozen";
        case error_code::unknown_section:       return "UnknownSection";
        case error_code::shared_entry_missing:  return "SharedEntryMissing";
        case error_code::duplicate_section_name: return "DuplicateSectionName";
    }
    return "?";
}

/**
 * @brief Render a diagnostic as a single human-readable line
 *
 * The line always names the offending entity and, for overlap, overflow and
 * cross-image mismatch, the concrete addresses.
 */
inline message_t describe(const diagnostic& d) noexcept {
    char buffer[192];
    const char* subj = d.subject.c_str();
    const char* rel = d.related.c_str();
    const char* kind = code_name(d.code);
    /* NOLINTBEGIN(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */
    switch (d.code) {
        case error_code::duplicate_region_name:
            std::snprintf(buffer, sizeof(buffer), "%s: region '%s' is already defined", kind, subj);
            break;
        case error_code::overlap:
            std::snprintf(buffer, sizeof(buffer), "%s: region '%s' [0x%08X, 0x%08X) overlaps '%s' [0x%08X, 0x%08X)",
                          kind, subj, d.data[0], d.data[1], rel, d.data[2], d.data[3]);
            break;
        case error_code::unknown_region:
            if (d.related.empty()) {
                std::snprintf(buffer, sizeof(buffer), "%s: region '%s' is not defined", kind, subj);
            } else {
                std::snprintf(buffer, sizeof(buffer), "%s: region '%s' is not defined (used by '%s')", kind, subj, rel);
            }
            break;
        case error_code::invalid_alignment:
            std::snprintf(buffer, sizeof(buffer), "%s: section '%s' alignment %u is not a power of two",
                          kind, subj, d.data[0]);
            break;
        case error_code::region_overflow:
            std::snprintf(buffer, sizeof(buffer), "%s: section '%s' [0x%08X, 0x%08X) does not fit region '%s' [0x%08X, 0x%08X)",
                          kind, subj, d.data[0], d.data[1], rel, d.data[2], d.data[3]);
            break;
        case error_code::missing_placement:
            std::snprintf(buffer, sizeof(buffer), "%s: section '%s' has not been placed", kind, subj);
            break;
        case error_code::duplicate_symbol_name:
            std::snprintf(buffer, sizeof(buffer), "%s: symbol '%s' is already emitted (by '%s')", kind, subj, rel);
            break;
        case error_code::address_mismatch:
            std::snprintf(buffer, sizeof(buffer), "%s: shared region '%s' %s is 0x%08X in one image and 0x%08X in the other",
                          kind, subj, rel, d.data[0], d.data[1]);
            break;
        case error_code::invalid_name:
            std::snprintf(buffer, sizeof(buffer), "%s: name '%s' is empty or longer than %u characters",
                          kind, subj, static_cast<u32>(config::max_name_length));
            break;
        case error_code::invalid_length:
            std::snprintf(buffer, sizeof(buffer), "%s: region '%s' at 0x%08X has length 0x%08X",
                          kind, subj, d.data[0], d.data[1]);
            break;
        case error_code::capacity_exceeded:
            std::snprintf(buffer, sizeof(buffer), "%s: %s table is full (capacity %u) adding '%s'",
                          kind, rel, d.data[0], subj);
            break;
        case error_code::table_frozen:
            std::snprintf(buffer, sizeof(buffer), "%s: '%s' declared after resolution began", kind, subj);
            break;
        case error_code::duplicate_section_name:
            std::snprintf(buffer, sizeof(buffer), "%s: section '%s' is already declared", kind, subj);
            break;
        case error_code::unknown_section:
            std::snprintf(buffer, sizeof(buffer), "%s: section '%s' is not declared", kind, subj);
            break;
        case error_code::shared_entry_missing:
            std::snprintf(buffer, sizeof(buffer), "%s: shared region '%s' entry '%s' exists in image %c only",
                          kind, subj, rel, d.data[0] == 0 ? 'A' : 'B');
            break;
        case error_code::success:
        default:
            std::snprintf(buffer, sizeof(buffer), "%s", kind);
            break;
    }
    /* NOLINTEND(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */
    return message_t(buffer);
}

/**
 * @brief Global error handler configuration
 */
class error_handler {
private:
    error_handler_fn callback_{nullptr};
    bool enabled_{false};
    u32 error_count_{0};
    error_context last_error_;

public:
    error_handler() noexcept = default;

    /**
     * @brief Set error handler callback
     */
    void set_callback(error_handler_fn callback) noexcept {
        callback_ = callback;
        enabled_ = (callback != nullptr);
    }

    /**
     * @brief Report an error
     */
    void report_error(const error_context& ctx) noexcept {
        error_count_++;
        last_error_ = ctx;

        if (enabled_ && callback_ != nullptr) {
            callback_(ctx);
        }

        if (ctx.severity >= error_severity::error) {
            const message_t line = describe(ctx.diag);
            platform::logf("[memPlan] %s: %s",
                           ctx.severity == error_severity::fatal ? "FATAL" : "ERROR",
                           line.c_str());
        }
    }

    static error_context make_context(const diagnostic& diag,
                                      error_severity severity = error_severity::fatal) noexcept {
        error_context ctx;
        ctx.severity = severity;
        ctx.diag = diag;
        return ctx;
    }

    u32 get_error_count() const noexcept {
        return error_count_;
    }

    const error_context& get_last_error() const noexcept {
        return last_error_;
    }

    /**
     * @brief Reset error statistics
     */
    void reset() noexcept {
        error_count_ = 0;
        last_error_ = error_context();
    }
};

/**
 * @brief Global error handler instance
 */
inline error_handler& get_global_error_handler() noexcept {
    static error_handler handler;
    return handler;
}

/**
 * @brief Report a fatal layout error and hand it back for returning
 */
inline const diagnostic& raise(const diagnostic& diag) noexcept {
    get_global_error_handler().report_error(error_handler::make_context(diag));
    return diag;
}

} // namespace error
} // namespace memPlan
