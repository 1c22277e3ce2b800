/**
 * @file zeroed_buffer.cpp
 * @brief Explicit template instantiations for ZeroedBuffer to reduce code bloat.
*/

#include "zeroalloc/mem/zeroed_buffer.hpp"
#include <cstdint>
namespace zeroalloc::mem {

    /// Explicit instantiations of ZeroedBuffer for commonly used types.
    /// This ensures one compiled instance instead of every TU instantiating its own.

    template class ZeroedBuffer<std::uint8_t>;  // raw byte buffers
    template class ZeroedBuffer<int>;           // unit tests and the probe tool
    template class ZeroedBuffer<double>;        // numeric arrays in benchmarks
} // namespace zeroalloc::mem
