#pragma once
/**
 * @file allocator.hpp
 * @brief Config-bound front end over alloc_zeroed() and ZeroedBuffer<T>.
 * @details Applies AllocConfig (alignment, byte cap) to every request and
 *          routes events to one Observer.
 */

#include <cstddef>
#include "zeroalloc/config/config_loader.hpp"
#include "zeroalloc/mem/zeroed_alloc.hpp"
#include "zeroalloc/mem/zeroed_buffer.hpp"
#include "zeroalloc/obs/observability.hpp"

namespace zeroalloc::mem {

/** @class Allocator
 *  @brief Hands out zero-initialized regions and buffers under one configuration.
 */
class Allocator {
public:
    /// Construct with configuration and an optional observer (not owned).
    explicit Allocator(zeroalloc::config::AllocConfig cfg,
                       zeroalloc::obs::Observer* observer = nullptr) noexcept
        : cfg_(cfg), observer_(observer) {}

    /// @brief Raw zero-filled block; pair with release().
    zeroalloc_detail::expected<ZeroedRegion, AllocError>
    allocate(std::size_t count, std::size_t size) const noexcept {
        return alloc_zeroed(count, size, options());
    }

    /// @brief Free a block obtained from allocate().
    void release(ZeroedRegion& region) const noexcept {
        zeroalloc::mem::release(region, observer_);
    }

    /// @brief Managed buffer of @p count zero elements.
    template <class T>
    zeroalloc_detail::expected<ZeroedBuffer<T>, AllocError>
    make_buffer(std::size_t count) const noexcept {
        return ZeroedBuffer<T>::with_count(count, options());
    }

    /// @return Options derived from the current configuration.
    AllocOptions options() const noexcept {
        return AllocOptions{cfg_.alignment, cfg_.max_bytes, observer_};
    }

    /// @return Current configuration (by const reference).
    const zeroalloc::config::AllocConfig& config() const noexcept { return cfg_; }

    /// Replace the configuration.
    void update_config(zeroalloc::config::AllocConfig c) noexcept { cfg_ = c; }

private:
    zeroalloc::config::AllocConfig cfg_{};
    zeroalloc::obs::Observer*      observer_{nullptr};
};

} // namespace zeroalloc::mem
