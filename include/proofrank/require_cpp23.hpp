#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for proofrank
 *
 * Include early in a translation unit (main.cpp does) to get a clear error
 * when the toolchain is too old. Requires GCC 14+ or Clang 19+.
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "proofrank requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::expected: Result<T> / VoidResult
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "proofrank requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// std::print / std::println: console output and diagnostics
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "proofrank requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

// std::format: report rendering
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "proofrank requires std::format (__cpp_lib_format >= 202110L)."
#endif

// std::views::enumerate: CLI argument iteration
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "proofrank requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

#define PROOFRANK_CPP23_FEATURES_VERIFIED 1
