/**
 * @file zeroed_bench.cpp
 * @brief Microbenchmark for zero-initialized allocation paths.
 *
 * Measures allocate + touch + release cycles for three ways of obtaining
 * zeroed storage of N doubles:
 *   1) alloc_zeroed() / release()       (raw, manual lifetime)
 *   2) ZeroedBuffer<double>::with_count (managed)
 *   3) std::vector<double>(n)           (value-initialized standard container)
 *
 * Reports: cycles/sec and ns per cycle.
 */

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "zeroalloc/mem/zeroed_alloc.hpp"
#include "zeroalloc/mem/zeroed_buffer.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;             // e.g., "raw@4096"
  std::size_t iters = 0;        // allocate/release cycles
  double      seconds = 0.0;    // wall time
  double      cycles_per_s = 0.0;
  double      ns_per_cycle = 0.0;
};

// Sink defeating dead-store elimination of the touched element.
inline volatile double g_sink = 0.0;

template <class Fn>
Result run_one(std::string name, std::size_t iters, Fn&& cycle) {
  const auto t_start = clock::now();
  for (std::size_t i = 0; i < iters; ++i) cycle(i);
  const auto t_end = clock::now();

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  Result r;
  r.name         = std::move(name);
  r.iters        = iters;
  r.seconds      = seconds;
  r.cycles_per_s = (seconds > 0.0) ? (static_cast<double>(iters) / seconds) : 0.0;
  r.ns_per_cycle = (r.cycles_per_s > 0.0) ? 1e9 / r.cycles_per_s : 0.0;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(18) << r.name
            << "  iters=" << std::setw(9) << r.iters
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  cycles/s=" << std::setw(12) << r.cycles_per_s
            << "  ns/cycle=" << std::setw(10) << r.ns_per_cycle
            << '\n';
}

} // namespace bench

int main() {
  using bench::print;
  using bench::run_one;
  using zeroalloc::mem::ZeroedBuffer;

  constexpr std::size_t ITERS = 100'000;
  const std::vector<std::size_t> counts = {64, 4096, 262144};

  std::cout << "Zeroed allocation microbenchmark (allocate+touch+release)\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto n : counts) {
    const auto tag = "@" + std::to_string(n);

    print(run_one("raw" + tag, ITERS, [n](std::size_t i) {
      auto r = zeroalloc::mem::alloc_zeroed(n, sizeof(double));
      if (!r) {
        std::cerr << "alloc_zeroed failed: " << zeroalloc::mem::to_string(r.error()) << "\n";
        std::abort();
      }
      auto* d = static_cast<double*>(r->data);
      d[i % n] += 1.0;
      bench::g_sink = d[i % n];
      zeroalloc::mem::release(*r);
    }));

    print(run_one("buffer" + tag, ITERS, [n](std::size_t i) {
      auto b = ZeroedBuffer<double>::with_count(n);
      if (!b) {
        std::cerr << "ZeroedBuffer failed: " << zeroalloc::mem::to_string(b.error()) << "\n";
        std::abort();
      }
      (*b)[i % n] += 1.0;
      bench::g_sink = (*b)[i % n];
    }));

    print(run_one("vector" + tag, ITERS, [n](std::size_t i) {
      std::vector<double> v(n);
      v[i % n] += 1.0;
      bench::g_sink = v[i % n];
    }));
  }

  std::cout << std::flush;
  return 0;
}
