/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Allocation and config factories return expected<T, E>; this header keeps
 * the rest of the codebase independent of which implementation backs it.
 *
 * - In C++23 and later: uses <expected> from the standard library.
 * - In C++20 or earlier: falls back to <tl/expected.hpp> (TartanLlama's
 *   header-only backport, https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace zeroalloc_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace zeroalloc_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
