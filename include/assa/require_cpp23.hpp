#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for ASSA
 *
 * Include this header early in a translation unit (main.cpp does) to get a
 * clear error message when the toolchain lacks a library feature ASSA uses.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "ASSA requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::print / std::println: CLI output and diagnostics
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "ASSA requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::expected: Result<T> error handling
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "ASSA requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::views::enumerate: indexed iteration over assets and paths
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "ASSA requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::format: messages and timestamps
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "ASSA requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::ranges: sorting and projections
#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "ASSA requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define ASSA_CPP23_FEATURES_VERIFIED 1
