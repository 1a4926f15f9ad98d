// ============================================================================
// coalesce/core/error.hpp - Error Codes for coalesce
// ============================================================================
//
// Defines a std::error_code-based error infrastructure for the library.
// Errors raised by coalesce itself use the coalesce error category. Errors
// reported by a NetworkJob are carried through untouched, whatever their
// category.
//
// USAGE:
// ------
//   std::error_code ec = make_error_code(Errc::Cancelled);
//   if (ec == Errc::Cancelled) { /* caller withdrew */ }
//
// ============================================================================

#pragma once

#include <system_error>

namespace coalesce {

enum class Errc {
    JobFailed = 1,
    Cancelled,
    InvalidKey,
    JobCreationFailed,
    InvalidResponse,
    NoResponse,
    Shutdown,
};

const std::error_category& CoalesceCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Convenient alias used throughout the library
using Error = std::error_code;

}  // namespace coalesce

// Register with std::error_code
namespace std {
template <>
struct is_error_code_enum<coalesce::Errc> : true_type {};
}  // namespace std
