#pragma once
/**
 * @file alloc_error.hpp
 * @brief Error codes reported by the zero-initialized allocation factories.
 */

#include <cstdint>
#include <string_view>

namespace zeroalloc::mem {

/**
 * @brief Failure reasons for alloc_zeroed() and ZeroedBuffer<T> factories.
 * These are setup-time results; accessors on a live buffer never produce them.
 */
enum class AllocError : std::uint8_t {
  SizeOverflow = 1,   ///< count * size does not fit in std::size_t
  ZeroElementSize,    ///< Element size must not be zero
  BadAlignment,       ///< Alignment must be a non-zero power-of-two
  LimitExceeded,      ///< Request exceeds the configured byte cap
  OutOfMemory         ///< The underlying allocator returned null
};

/// @brief Stable label for logs and test diagnostics.
constexpr std::string_view to_string(AllocError e) noexcept {
  switch (e) {
    case AllocError::SizeOverflow:    return "size_overflow";
    case AllocError::ZeroElementSize: return "zero_element_size";
    case AllocError::BadAlignment:    return "bad_alignment";
    case AllocError::LimitExceeded:   return "limit_exceeded";
    case AllocError::OutOfMemory:     return "out_of_memory";
  }
  return "unknown";
}

} // namespace zeroalloc::mem
