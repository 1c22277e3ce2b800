#ifndef ZEROALLOC_VERSION_HPP
#define ZEROALLOC_VERSION_HPP

#pragma once

namespace zeroalloc {

    /// Project semantic version components
    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 1;
    inline constexpr int version_patch = 0;

    /// Combined version string (e.g. "0.1.0")
    inline constexpr const char* version_string = "0.1.0";

} // namespace zeroalloc

#endif // ZEROALLOC_VERSION_HPP
