/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides RIFT_ASSERT (debug-only) and RIFT_VERIFY (always evaluated).
 * They guard programming contracts only; recoverable conditions (stale
 * entities, malformed packets) are reported through Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RIFT_CORE_ASSERT_HPP
    #define RIFT_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace rift::core::detail {

[[noreturn]] inline void assertFail(
    const char* expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[RIFT ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace rift::core::detail

    #ifdef RIFT_DEBUG
        #define RIFT_ASSERT(cond)                                         \
            do {                                                           \
                if (RIFT_UNLIKELY(!(cond)))                                \
                    ::rift::core::detail::assertFail(#cond);               \
            } while (false)
    #else
        #define RIFT_ASSERT(cond) ((void)0)
    #endif

    #define RIFT_VERIFY(cond)                                             \
        do {                                                               \
            if (RIFT_UNLIKELY(!(cond)))                                    \
                ::rift::core::detail::assertFail(#cond);                   \
        } while (false)

#endif // RIFT_CORE_ASSERT_HPP
