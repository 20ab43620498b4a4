#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace vbi {

// Progress display on stderr. advance() may be called from several
// worker threads; output is throttled to one line per 500ms.
class Progress {
public:
    Progress(const std::string& label, uint64_t total, bool enabled = true)
        : label_(label), total_(total), enabled_(enabled),
          start_(std::chrono::steady_clock::now()) {}

    void advance(uint64_t n) {
        uint64_t current = done_.fetch_add(n, std::memory_order_relaxed) + n;
        if (!enabled_ || total_ == 0) return;

        std::unique_lock<std::mutex> lock(mu_, std::try_to_lock);
        if (!lock.owns_lock()) return;

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - last_print_).count();
        if (elapsed < 500 && current < total_) return;
        last_print_ = now;

        double pct = 100.0 * static_cast<double>(current) / static_cast<double>(total_);
        std::fprintf(stderr, "\r%s: %.1f%% (%lu/%lu) [%lds]",
                     label_.c_str(), pct,
                     static_cast<unsigned long>(current),
                     static_cast<unsigned long>(total_),
                     static_cast<long>(seconds_since_start(now)));
        std::fflush(stderr);
    }

    void finish() {
        if (!enabled_) return;
        std::lock_guard<std::mutex> lock(mu_);
        std::fprintf(stderr, "\r%s: done (%lu items, %lds)\n",
                     label_.c_str(),
                     static_cast<unsigned long>(done_.load()),
                     static_cast<long>(seconds_since_start(
                         std::chrono::steady_clock::now())));
        std::fflush(stderr);
    }

    uint64_t done() const { return done_.load(); }

private:
    long seconds_since_start(std::chrono::steady_clock::time_point now) const {
        return static_cast<long>(
            std::chrono::duration_cast<std::chrono::seconds>(now - start_).count());
    }

    std::string label_;
    uint64_t total_;
    bool enabled_;
    std::atomic<uint64_t> done_{0};
    std::mutex mu_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_print_;
};

} // namespace vbi
