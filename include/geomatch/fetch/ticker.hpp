#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>

namespace geomatch::fetch {

/// Fixed-interval rate limiter.
///
/// The first wait() returns immediately; each later call returns one period
/// after the previous deadline. A caller that falls behind gets the missed
/// ticks back to back rather than having the schedule shifted.
class Ticker {
   public:
    using clock = std::chrono::steady_clock;

    explicit Ticker(double ticks_per_second) {
        if (!(ticks_per_second > 0.0)) {
            throw std::invalid_argument("Ticker: rate must be positive");
        }
        period_ = std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double>(1.0 / ticks_per_second));
    }

    void wait() {
        if (!next_.has_value()) {
            next_ = clock::now() + period_;
            return;
        }
        std::this_thread::sleep_until(*next_);
        *next_ += period_;
    }

    [[nodiscard]] auto period() const noexcept -> clock::duration { return period_; }

   private:
    clock::duration period_{};
    std::optional<clock::time_point> next_;
};

}  // namespace geomatch::fetch
