#pragma once

/**
 * @file lifecycle_log.hpp
 * @brief Debug tracing for native handle lifecycles and rejected input.
 *
 * Logs type names, operation names, error codes and sizes to stdout. Never
 * logs key bytes or plaintext.
 *
 * Enable via CMake: -DSIGIL_DEBUG_LIFECYCLE=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#include "sigil/core/format.hpp"

namespace sigil::debug {

#ifdef SIGIL_DEBUG_LIFECYCLE

inline void Emit(const std::string_view category, const std::string& line) {
    fprintf(stdout, "[SIGIL-DEBUG] %.*s %s\n",
        static_cast<int>(category.size()), category.data(),
        line.c_str());
    fflush(stdout);
}

// ============================================================================
// Core logging macros
// ============================================================================

#define SIGIL_LOG_LIFECYCLE(type_name, event) \
    do { \
        ::sigil::debug::Emit("LIFECYCLE", \
            ::sigil::compat::format("{} {}", (type_name), (event))); \
    } while(0)

#define SIGIL_LOG_NATIVE_ERROR(context, code) \
    do { \
        ::sigil::debug::Emit("NATIVE", \
            ::sigil::compat::format("{} failed with code {}", \
                (context), static_cast<uint32_t>(code))); \
    } while(0)

#define SIGIL_LOG_VALIDATION(type_name, reason, length) \
    do { \
        ::sigil::debug::Emit("VALIDATION", \
            ::sigil::compat::format("{} rejected {} ({} bytes)", \
                (type_name), (reason), static_cast<size_t>(length))); \
    } while(0)

#else // !SIGIL_DEBUG_LIFECYCLE

#define SIGIL_LOG_LIFECYCLE(type_name, event) ((void)0)
#define SIGIL_LOG_NATIVE_ERROR(context, code) ((void)0)
#define SIGIL_LOG_VALIDATION(type_name, reason, length) ((void)0)

#endif // SIGIL_DEBUG_LIFECYCLE

} // namespace sigil::debug
