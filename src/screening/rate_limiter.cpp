// src/screening/rate_limiter.cpp
#include "option_screener/screening/rate_limiter.hpp"
#include <thread>

namespace option_screener {

FixedIntervalRateLimiter::FixedIntervalRateLimiter(std::chrono::milliseconds interval, NowFn now,
                                                   SleepFn sleep)
    : interval_(interval < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero()
                                                             : interval),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })),
      sleep_(sleep ? std::move(sleep)
                   : SleepFn([](Clock::duration d) { std::this_thread::sleep_for(d); })) {}

void FixedIntervalRateLimiter::acquire() {
    auto now = now_();
    if (last_acquire_) {
        auto next_allowed = *last_acquire_ + interval_;
        if (now < next_allowed) {
            auto wait = next_allowed - now;
            sleep_(wait);
            total_wait_ += wait;
            now = next_allowed;
        }
    }
    last_acquire_ = now;
}

}  // namespace option_screener
