#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the allocation layer.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          config Loader (key = value file) in deployments.
 */

#include <cstddef>
#include <limits>

namespace zeroalloc::config::constants {

// =====================
// Alignment
// =====================
/// Alignment guaranteed by the plain calloc path (fundamental alignment).
inline constexpr std::size_t DEFAULT_ALIGNMENT = alignof(std::max_align_t);

/// Largest alignment accepted from configuration (one 4 KiB page).
inline constexpr std::size_t MAX_ALIGNMENT     = 4096;

// =====================
// Limits
// =====================
/// Per-request byte cap. Max size_t means "no cap beyond overflow checks".
inline constexpr std::size_t DEFAULT_MAX_BYTES = std::numeric_limits<std::size_t>::max();

// =====================
// Observability
// =====================
/// Emit one log line per allocation event when true.
inline constexpr bool DEFAULT_VERBOSE = false;

} // namespace zeroalloc::config::constants
