// =============================================================
// File: src/zeroalloc/mem/zeroed_alloc.cpp
// =============================================================
#include "zeroalloc/mem/zeroed_alloc.hpp"

#include <cstdlib>
#include <cstring>
#include <limits>

namespace zeroalloc::mem {

namespace {

using zeroalloc::obs::AllocEvent;
using zeroalloc::obs::AllocOp;

zeroalloc_detail::unexpected<AllocError>
fail(AllocError e, std::size_t bytes, std::size_t alignment, zeroalloc::obs::Observer* o) {
  zeroalloc::obs::notify(o, AllocEvent{AllocOp::Failure, bytes, alignment, e});
  return zeroalloc_detail::unexpected(e);
}

} // namespace

zeroalloc_detail::expected<std::size_t, AllocError>
checked_bytes(std::size_t count, std::size_t size) noexcept {
  if (size == 0) {
    return zeroalloc_detail::unexpected(AllocError::ZeroElementSize);
  }
  if (count > std::numeric_limits<std::size_t>::max() / size) {
    return zeroalloc_detail::unexpected(AllocError::SizeOverflow);
  }
  return count * size;
}

/**
 * Fundamental alignment goes straight to std::calloc, which zero-fills for us.
 * Larger alignments use std::aligned_alloc (size rounded up to a multiple of
 * the alignment) followed by an explicit memset. Both are freed with std::free.
 */
zeroalloc_detail::expected<ZeroedRegion, AllocError>
alloc_zeroed(std::size_t count, std::size_t size, const AllocOptions& opts) noexcept {
  if (!is_pow2(opts.alignment)) {
    return fail(AllocError::BadAlignment, 0, opts.alignment, opts.observer);
  }
  auto total = checked_bytes(count, size);
  if (!total) {
    return fail(total.error(), 0, opts.alignment, opts.observer);
  }
  const std::size_t bytes = *total;
  if (bytes > opts.max_bytes) {
    return fail(AllocError::LimitExceeded, bytes, opts.alignment, opts.observer);
  }
  if (bytes == 0) {
    return ZeroedRegion{nullptr, 0, opts.alignment};
  }

  void* p = nullptr;
  if (opts.alignment <= alignof(std::max_align_t)) {
    p = std::calloc(count, size);
  } else {
    const std::size_t mask = opts.alignment - 1;
    if (bytes > std::numeric_limits<std::size_t>::max() - mask) {
      return fail(AllocError::SizeOverflow, bytes, opts.alignment, opts.observer);
    }
    const std::size_t rounded = (bytes + mask) & ~mask;
    p = std::aligned_alloc(opts.alignment, rounded);
    if (p) std::memset(p, 0, rounded);
  }
  if (!p) {
    return fail(AllocError::OutOfMemory, bytes, opts.alignment, opts.observer);
  }

  zeroalloc::obs::notify(opts.observer, AllocEvent{AllocOp::Alloc, bytes, opts.alignment, {}});
  return ZeroedRegion{p, bytes, opts.alignment};
}

void release(ZeroedRegion& region, zeroalloc::obs::Observer* observer) noexcept {
  if (region.empty()) return;
  std::free(region.data);
  zeroalloc::obs::notify(observer, AllocEvent{AllocOp::Release, region.bytes, region.alignment, {}});
  region = ZeroedRegion{};
}

bool is_all_zero(const void* p, std::size_t bytes) noexcept {
  const auto* b = static_cast<const unsigned char*>(p);
  for (std::size_t i = 0; i < bytes; ++i) {
    if (b[i] != 0) return false;
  }
  return true;
}

} // namespace zeroalloc::mem
