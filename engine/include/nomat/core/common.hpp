#pragma once

/**
 * @file common.hpp
 * @brief Common utilities and macros for the nomat kernel
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <cpptrace/cpptrace.hpp>

#include "profiler.hpp"
#include "logger.hpp"

// ============================================================================
// Assertion Macros (Debug-only)
// ============================================================================

#ifdef DEBUG
#define NOMAT_ASSERT(condition, message)                                       \
  do {                                                                         \
    if (!(condition)) {                                                        \
        std::string trace = cpptrace::generate_trace().to_string();            \
        nomat::core::Logger::critical("ASSERTION FAILED: {}\nStack Trace:\n{}",\
            message, trace);                                                   \
      throw cpptrace::runtime_error(                                           \
          "ASSERTION FAILED: " + std::string(message) +                        \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));          \
    }                                                                          \
  } while (0)
#else
#define NOMAT_ASSERT(condition, message) (void)(0)
#endif

// ============================================================================
// Utilities
// ============================================================================

namespace nomat::util {

/**
 * @brief Helper function to convert any type to uint32_t cleanly
 */
template <typename T>
constexpr uint32_t u32(T value) noexcept {
  return static_cast<uint32_t>(value);
}

/**
 * @brief Helper function to convert any type to size_t cleanly
 */
template <typename T>
constexpr size_t sz(T value) noexcept {
  return static_cast<size_t>(value);
}

/**
 * @brief Bounds check that throws a traced out_of_range on failure.
 * Used where an index comes from loader data or from the host.
 */
inline void checkIndex(size_t index, size_t size, const char* what) {
  if (index >= size) {
    throw cpptrace::out_of_range(std::string(what) + " index " + std::to_string(index) +
                                 " out of range (size " + std::to_string(size) + ")");
  }
}

} // namespace nomat::util
