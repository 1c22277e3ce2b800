#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: allocation events + counters.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include "zeroalloc/mem/alloc_error.hpp"

namespace zeroalloc::obs {

    /** @enum AllocOp
     *  @brief Kind of allocation event.
     */
    enum class AllocOp : std::uint8_t { Alloc, Release, Failure };

    /** @struct Counters
     *  @brief Process-level (or per-observer) allocation counters.
     */
    struct Counters {
        uint64_t allocations{0};   ///< Successful non-empty allocations
        uint64_t releases{0};      ///< Releases of non-empty regions
        uint64_t failures{0};      ///< Rejected or failed requests
        uint64_t bytes_live{0};    ///< Bytes currently held
        uint64_t bytes_peak{0};    ///< High-water mark of bytes_live
    };

    /** @struct AllocEvent
     *  @brief Payload describing a single allocation event.
     */
    struct AllocEvent {
        AllocOp     op{AllocOp::Alloc};                  ///< Event kind
        std::size_t bytes{0};                            ///< Region size in bytes
        std::size_t alignment{0};                        ///< Region alignment
        std::optional<zeroalloc::mem::AllocError> error; ///< Set for Failure events
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single allocation event. Called from noexcept allocation paths.
        virtual void record(const AllocEvent& e) noexcept = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide printf-backed observer (logs every event).
    Observer* make_simple_observer();

    /// Fresh observer owned by the caller; logs only when @p verbose is set.
    std::unique_ptr<Observer> make_counting_observer(bool verbose);

    /// Null-safe helper used by the allocation layer.
    inline void notify(Observer* o, const AllocEvent& e) noexcept {
        if (o) o->record(e);
    }

} // namespace zeroalloc::obs
