#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for kcfgvex
 *
 * Included by the CLI translation unit so an insufficient toolchain fails
 * with a readable message instead of a wall of template errors.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "kcfgvex requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::expected: Result<T> for every fallible operation
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "kcfgvex requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::format: evidence text, timestamps, DOT output
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "kcfgvex requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::ranges: sorting and projections over symbol sets
#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "kcfgvex requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::jthread: parallel batch evaluation
#if !defined(__cpp_lib_jthread) || __cpp_lib_jthread < 201'911L
    #error "kcfgvex requires std::jthread (__cpp_lib_jthread >= 201911L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define KCFGVEX_CPP23_FEATURES_VERIFIED 1

namespace kcfgvex::compat {

/**
 * @brief Always true once this header compiles.
 */
[[nodiscard]] constexpr bool verify_cpp23_features() noexcept
{
    return true;
}

}  // namespace kcfgvex::compat
