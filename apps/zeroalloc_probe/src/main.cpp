// apps/zeroalloc_probe/src/main.cpp
// zeroalloc — zeroalloc_probe
// Purpose: allocate <count> elements of <size> bytes through both the raw
// routine and the managed buffer, verify the zero-fill guarantee and a
// write/read-back, then print the allocation counters.
//
// Usage:
//   ./zeroalloc_probe <count> <size> [config_file]
//
// Exit codes: 0 ok, 1 allocation or verification failure, 2 usage/config error.

#include <charconv>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string_view>

#include "zeroalloc/config/config_loader.hpp"
#include "zeroalloc/mem/allocator.hpp"
#include "zeroalloc/obs/observability.hpp"
#include "zeroalloc/version.hpp"

static bool parse_arg(std::string_view s, std::size_t& out) {
    const auto* end = s.data() + s.size();
    auto [p, ec] = std::from_chars(s.data(), end, out);
    return ec == std::errc{} && p == end;
}

static int probe_raw(const zeroalloc::mem::Allocator& alloc, std::size_t count, std::size_t size) {
    auto region = alloc.allocate(count, size);
    if (!region) {
        std::cerr << "raw: allocation failed: " << zeroalloc::mem::to_string(region.error()) << "\n";
        return 1;
    }
    const bool zero = zeroalloc::mem::is_all_zero(region->data, region->bytes);
    std::cout << "raw:     " << region->bytes << " bytes, all zero: " << (zero ? "yes" : "no") << "\n";
    bool readback = true;
    if (count > 0) {
        // Write a marker into the last element and read it back.
        auto* last = static_cast<unsigned char*>(region->data) + (count - 1) * size;
        std::memset(last, 0xA5, size);
        readback = last[0] == 0xA5 && zeroalloc::mem::is_all_zero(region->data, (count - 1) * size);
    }
    alloc.release(*region);
    return (zero && readback) ? 0 : 1;
}

static int probe_buffer(const zeroalloc::mem::Allocator& alloc, std::size_t count, std::size_t size) {
    auto buf = alloc.make_buffer<std::uint8_t>(count * size);
    if (!buf) {
        std::cerr << "buffer: allocation failed: " << zeroalloc::mem::to_string(buf.error()) << "\n";
        return 1;
    }
    const bool zero = zeroalloc::mem::is_all_zero(buf->data(), buf->bytes());
    std::cout << "buffer:  " << buf->bytes() << " bytes, all zero: " << (zero ? "yes" : "no") << "\n";
    if (auto* first = buf->at(0)) {
        *first = 0x5A;
        if ((*buf)[0] != 0x5A) return 1;
    }
    return zero ? 0 : 1;
} // buffer storage released here

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <count> <size> [config_file]\n";
        return 2;
    }
    std::size_t count = 0, size = 0;
    if (!parse_arg(argv[1], count) || !parse_arg(argv[2], size)) {
        std::cerr << "count and size must be unsigned integers\n";
        return 2;
    }

    auto cfg = zeroalloc::config::Loader::defaults();
    if (argc > 3) {
        auto loaded = zeroalloc::config::Loader::load_from_file(argv[3]);
        if (!loaded) {
            const auto& is = loaded.error();
            std::cerr << "config: " << zeroalloc::config::to_string(is.error)
                      << " (line " << is.line << ": " << is.detail << ")\n";
            return 2;
        }
        cfg = *loaded;
    }

    auto observer = zeroalloc::obs::make_counting_observer(cfg.verbose);
    zeroalloc::mem::Allocator alloc(cfg, observer.get());

    std::cout << "zeroalloc_probe " << zeroalloc::version_string
              << ": count=" << count << " size=" << size
              << " align=" << cfg.alignment << std::endl;

    // Overflow or zero size is rejected by the checked product before either path runs.
    if (auto total = zeroalloc::mem::checked_bytes(count, size); !total) {
        std::cerr << "request rejected: " << zeroalloc::mem::to_string(total.error()) << "\n";
        return 1;
    }

    int rc = probe_raw(alloc, count, size);
    if (rc == 0) rc = probe_buffer(alloc, count, size);

    const auto c = observer->snapshot();
    std::cout << "counters: allocations=" << c.allocations
              << " releases=" << c.releases
              << " failures=" << c.failures
              << " bytes_live=" << c.bytes_live
              << " bytes_peak=" << c.bytes_peak << std::endl;
    return rc;
}
