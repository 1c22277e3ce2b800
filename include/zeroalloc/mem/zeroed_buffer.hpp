/**
 * @file zeroed_buffer.hpp
 * @brief Owning, zero-initialized contiguous buffer (managed alternative to alloc_zeroed).
 *
 * Design goals:
 *  - Same storage guarantees as alloc_zeroed(): contiguous, every element zero.
 *  - RAII: storage is released exactly once by the destructor (or release_storage()).
 *  - Exception-free: factory and resize() report AllocError via expected.
 *  - Growable: resize() keeps the prefix and zero-fills the new tail.
 *
 * Construction:
 *  - Use ZeroedBuffer<T>::with_count(n) to build.
 *
 * @tparam T Element type. Must be trivially copyable so all-zero bytes are its zero value.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <span>
#include <type_traits>
#include <utility>

#include "zeroalloc/compat/expected.hpp"
#include "zeroalloc/mem/zeroed_alloc.hpp"

namespace zeroalloc::mem {

template <class T>
class ZeroedBuffer final {
  static_assert(std::is_trivially_copyable_v<T>,
                "ZeroedBuffer<T> requires a trivially copyable element type");

public:
  using value_type     = T;
  using iterator       = T*;
  using const_iterator = const T*;

  /// @brief Empty buffer owning nothing.
  ZeroedBuffer() noexcept = default;

  /**
   * @brief Factory: allocate @p count zero-initialized elements.
   * @param count Element count (zero gives an empty, valid buffer).
   * @param opts  Alignment (raised to alignof(T) if lower), byte cap, observer.
   * @return expected<ZeroedBuffer, AllocError>.
   */
  static zeroalloc_detail::expected<ZeroedBuffer, AllocError>
  with_count(std::size_t count, AllocOptions opts = {}) noexcept {
    opts.alignment = std::max(opts.alignment, alignof(T));
    auto region = alloc_zeroed(count, sizeof(T), opts);
    if (!region) {
      return zeroalloc_detail::unexpected(region.error());
    }
    ZeroedBuffer b;
    b.region_   = *region;
    b.size_     = count;
    b.capacity_ = count;
    b.opts_     = opts;
    return b;
  }

  ZeroedBuffer(const ZeroedBuffer&)            = delete; ///< Non-copyable
  ZeroedBuffer& operator=(const ZeroedBuffer&) = delete; ///< Non-assignable

  ZeroedBuffer(ZeroedBuffer&& other) noexcept { move_from(std::move(other)); }

  ZeroedBuffer& operator=(ZeroedBuffer&& other) noexcept {
    if (this != &other) {
      release_storage();
      move_from(std::move(other));
    }
    return *this;
  }

  ~ZeroedBuffer() { release_storage(); }

  /**
   * @brief Change the element count.
   *
   * Growing within capacity exposes elements that are already zero; growing
   * beyond capacity reallocates (at least doubling, capped by max_bytes),
   * copies the prefix and frees the old block.
   * Shrinking re-zeroes the dropped tail and keeps the capacity.
   * On failure the buffer is left unchanged.
   */
  zeroalloc_detail::expected<void, AllocError> resize(std::size_t count) noexcept {
    if (count <= capacity_) {
      if (count < size_) {
        std::memset(static_cast<void*>(data() + count), 0, (size_ - count) * sizeof(T));
      }
      size_ = count;
      return {};
    }
    const std::size_t cap = grow_capacity(count);
    auto grown = alloc_zeroed(cap, sizeof(T), opts_);
    if (!grown) {
      return zeroalloc_detail::unexpected(grown.error());
    }
    if (size_ != 0) {
      std::memcpy(grown->data, region_.data, size_ * sizeof(T));
    }
    release(region_, opts_.observer);
    region_   = *grown;
    size_     = count;
    capacity_ = cap;
    return {};
  }

  /// @brief Overwrite every element with zero bytes.
  void clear_to_zero() noexcept {
    if (!region_.empty()) std::memset(region_.data, 0, region_.bytes);
  }

  /// @brief Free storage now; the buffer becomes empty. Idempotent.
  void release_storage() noexcept {
    release(region_, opts_.observer);
    size_     = 0;
    capacity_ = 0;
  }

  /// @brief Bounds-checked access; nullptr when @p i >= size().
  T*       at(std::size_t i)       noexcept { return i < size_ ? data() + i : nullptr; }
  const T* at(std::size_t i) const noexcept { return i < size_ ? data() + i : nullptr; }

  T&       operator[](std::size_t i)       noexcept { return data()[i]; }
  const T& operator[](std::size_t i) const noexcept { return data()[i]; }

  T*       data()       noexcept { return static_cast<T*>(region_.data); }
  const T* data() const noexcept { return static_cast<const T*>(region_.data); }

  iterator       begin()       noexcept { return data(); }
  iterator       end()         noexcept { return data() + size_; }
  const_iterator begin() const noexcept { return data(); }
  const_iterator end()   const noexcept { return data() + size_; }

  std::span<T>       span()       noexcept { return {data(), size_}; }
  std::span<const T> span() const noexcept { return {data(), size_}; }

  std::size_t size()     const noexcept { return size_; }
  std::size_t capacity() const noexcept { return capacity_; }
  std::size_t bytes()    const noexcept { return size_ * sizeof(T); }
  bool        empty()    const noexcept { return size_ == 0; }

private:
  /// Geometric growth; never below @p count so over-limit requests still fail as such.
  std::size_t grow_capacity(std::size_t count) const noexcept {
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    const std::size_t doubled = capacity_ > max / 2 ? count : capacity_ * 2;
    const std::size_t limit   = opts_.max_bytes / sizeof(T);
    return std::max(count, std::min(doubled, limit));
  }

  void move_from(ZeroedBuffer&& other) noexcept {
    region_   = std::exchange(other.region_, ZeroedRegion{});
    size_     = std::exchange(other.size_, 0);
    capacity_ = std::exchange(other.capacity_, 0);
    opts_     = other.opts_;
  }

  ZeroedRegion region_{};    ///< Owned block (empty when size/capacity is zero)
  std::size_t  size_{0};     ///< Visible element count
  std::size_t  capacity_{0}; ///< Elements the block can hold
  AllocOptions opts_{};      ///< Options reused by resize()
};

} // namespace zeroalloc::mem
