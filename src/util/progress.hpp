#pragma once

#include <cstdio>
#include <cstdint>
#include <string>
#include <chrono>

namespace ednakmer {

// Progress display on stderr, redrawn in place at most twice a second.
class Progress {
public:
    Progress(const std::string& label, uint64_t total, bool enabled = true)
        : label_(label), total_(total), enabled_(enabled),
          start_(std::chrono::steady_clock::now()) {}

    // detail: short trailing text, e.g. "12 species"
    void update(uint64_t current, const std::string& detail = {}) {
        if (!enabled_ || total_ == 0) return;

        auto now = std::chrono::steady_clock::now();
        auto since_print = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - last_print_).count();
        if (since_print < 500 && current < total_) return;
        last_print_ = now;

        double pct = 100.0 * static_cast<double>(current) / static_cast<double>(total_);
        std::fprintf(stderr, "\r%s: %.1f%% (%lu/%lu)%s%s",
                     label_.c_str(), pct,
                     static_cast<unsigned long>(current),
                     static_cast<unsigned long>(total_),
                     detail.empty() ? "" : " ",
                     detail.c_str());
        std::fflush(stderr);
    }

    void finish() {
        if (!enabled_) return;
        double secs = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_).count();
        double rate = secs > 0 ? static_cast<double>(total_) / secs : 0.0;
        std::fprintf(stderr, "\r%s: done (%lu records, %.2fs, %.0f/s)\n",
                     label_.c_str(),
                     static_cast<unsigned long>(total_),
                     secs, rate);
        std::fflush(stderr);
    }

private:
    std::string label_;
    uint64_t total_;
    bool enabled_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point last_print_;
};

} // namespace ednakmer
