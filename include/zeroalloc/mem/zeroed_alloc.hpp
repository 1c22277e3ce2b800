// =============================================================
// File: include/zeroalloc/mem/zeroed_alloc.hpp
// =============================================================
#pragma once

#include <cstddef>

#include "zeroalloc/compat/expected.hpp"  // zeroalloc_detail::expected / unexpected
#include "zeroalloc/config/constants.hpp"
#include "zeroalloc/mem/alloc_error.hpp"
#include "zeroalloc/obs/observability.hpp"

namespace zeroalloc::mem {

/**
 * @file zeroed_alloc.hpp
 * @brief Raw zero-initialized allocation (calloc-style) with explicit release.
 *
 * Contract:
 *  - alloc_zeroed(count, size) yields exactly count * size bytes, all zero.
 *  - count == 0 yields a valid empty region (data == nullptr, bytes == 0).
 *  - Failures are reported through AllocError; nothing is thrown.
 *  - Every non-empty region must be handed to release() exactly once.
 *
 * Prefer ZeroedBuffer<T> (zeroed_buffer.hpp) unless the caller really needs
 * to manage the lifetime by hand.
 */

/// @brief Non-owning descriptor of a zero-initialized block.
struct ZeroedRegion {
  void*       data{nullptr};  ///< First byte; null for an empty region
  std::size_t bytes{0};       ///< Requested size (count * size)
  std::size_t alignment{0};   ///< Alignment the block satisfies

  bool empty() const noexcept { return data == nullptr; }
};

/// @brief Per-request knobs (all defaulted from constants.hpp).
struct AllocOptions {
  std::size_t         alignment{zeroalloc::config::constants::DEFAULT_ALIGNMENT};
  std::size_t         max_bytes{zeroalloc::config::constants::DEFAULT_MAX_BYTES};
  zeroalloc::obs::Observer* observer{nullptr};
};

/**
 * @brief Overflow-checked total size of @p count elements of @p size bytes.
 * @return ZeroElementSize if size == 0, SizeOverflow if the product wraps.
 */
zeroalloc_detail::expected<std::size_t, AllocError>
checked_bytes(std::size_t count, std::size_t size) noexcept;

/**
 * @brief Allocate count * size zero-filled bytes.
 * @param count Number of elements (may be zero).
 * @param size  Size of one element in bytes (must be non-zero).
 * @param opts  Alignment, byte cap and optional observer.
 */
zeroalloc_detail::expected<ZeroedRegion, AllocError>
alloc_zeroed(std::size_t count, std::size_t size, const AllocOptions& opts = {}) noexcept;

/**
 * @brief Free a region obtained from alloc_zeroed() and reset it to empty.
 * Releasing an empty region is a no-op, so a second call on the same object
 * cannot double-free.
 */
void release(ZeroedRegion& region, zeroalloc::obs::Observer* observer = nullptr) noexcept;

/// @brief True if every byte in [p, p + bytes) is zero (bytes == 0 → true).
bool is_all_zero(const void* p, std::size_t bytes) noexcept;

/// @brief True for non-zero powers of two.
constexpr bool is_pow2(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

} // namespace zeroalloc::mem
