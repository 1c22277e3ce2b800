/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "zeroalloc/obs/observability.hpp"
#include <algorithm>
#include <mutex>
#include <cstdio>

namespace zeroalloc::obs {

    static const char* op_label(AllocOp op) {
        switch (op) {
            case AllocOp::Alloc:   return "alloc";
            case AllocOp::Release: return "release";
            case AllocOp::Failure: return "failure";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        explicit SimpleObserver(bool verbose) noexcept : verbose_(verbose) {}

        void record(const AllocEvent& e) noexcept override {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.op) {
                case AllocOp::Alloc:
                    ctr_.allocations++;
                    ctr_.bytes_live += e.bytes;
                    ctr_.bytes_peak = std::max(ctr_.bytes_peak, ctr_.bytes_live);
                    break;
                case AllocOp::Release:
                    ctr_.releases++;
                    ctr_.bytes_live -= std::min<uint64_t>(ctr_.bytes_live, e.bytes);
                    break;
                case AllocOp::Failure:
                    ctr_.failures++;
                    break;
            }
            if (!verbose_) return;
            const auto err = e.error ? zeroalloc::mem::to_string(*e.error) : std::string_view{"none"};
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"op":"%s","bytes":%zu,"align":%zu,"error":"%.*s","live":%llu})" "\n",
              op_label(e.op), e.bytes, e.alignment,
              static_cast<int>(err.size()), err.data(),
              static_cast<unsigned long long>(ctr_.bytes_live));
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        const bool verbose_;
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs{true}; // process-wide singleton
        return &obs;
    }

    std::unique_ptr<Observer> make_counting_observer(bool verbose) {
        return std::make_unique<SimpleObserver>(verbose);
    }

} // namespace zeroalloc::obs
