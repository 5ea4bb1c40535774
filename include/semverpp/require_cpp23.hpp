#pragma once

/**
 * @file require_cpp23.hpp
 * @brief Compile-time check for the C++23 library features semverpp relies on
 *
 * Included first by the CLI so an old toolchain fails with a readable message
 * instead of a cascade of template errors.
 *
 * Known-good toolchains: GCC 14+, Clang 19+ with libstdc++ 14.
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "semverpp requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Console output in the CLI.
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "semverpp requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

// Result<T> / VoidResult.
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "semverpp requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// Argument parsing loops.
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "semverpp requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// Version rendering, file names and chrono timestamps.
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "semverpp requires std::format (__cpp_lib_format >= 202110L)."
#endif

// std::ios::noreplace for exclusive record creation.
#if !defined(__cpp_lib_ios_noreplace) || __cpp_lib_ios_noreplace < 202'207L
    #error "semverpp requires std::ios::noreplace (__cpp_lib_ios_noreplace >= 202207L)."
#endif

#define SEMVERPP_CPP23_FEATURES_VERIFIED 1
