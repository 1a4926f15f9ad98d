// ============================================================================
// coalesce/core/check.hpp - Lightweight Runtime Assertions
// ============================================================================
//
// COALESCE_CHECK(cond, msg) is an always-on assertion that works in both
// Debug and Release builds. Unlike assert(), it is never compiled out.
//
// On failure it prints the condition, message, and source location to stderr,
// then calls std::abort().
//
// Only for programming errors, such as a transfer built without a job.
// Runtime failures travel as Error values. A callback without a completion
// handler is valid and is simply skipped on delivery.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>

namespace coalesce::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fputs("COALESCE_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs(" (", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputs(":", stderr);
    std::fputs(std::to_string(loc.line()).c_str(), stderr);
    std::fputs(")\n", stderr);
    std::abort();
}

}  // namespace coalesce::detail

#define COALESCE_CHECK(cond, msg)                                                       \
    do {                                                                                \
        if (!(cond)) [[unlikely]] {                                                     \
            ::coalesce::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                               \
    } while (0)
