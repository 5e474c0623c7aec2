// include/option_screener/screening/rate_limiter.hpp
#pragma once

#include <chrono>
#include <functional>
#include <optional>

namespace option_screener {

/**
 * @brief Gate the pipeline passes through before each provider call
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * @brief Block until the next call is allowed
     */
    virtual void acquire() = 0;
};

/**
 * @brief Limiter that never waits
 */
class NoopRateLimiter : public IRateLimiter {
public:
    void acquire() override {}
};

/**
 * @brief Enforces a minimum interval between consecutive acquisitions
 *
 * The first acquisition passes immediately. Each later one sleeps for
 * whatever remains of the interval since the previous acquisition, so time
 * spent fetching and pricing counts towards the gap. Clock and sleep are
 * injectable so tests can run without wall-clock delay.
 */
class FixedIntervalRateLimiter : public IRateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using SleepFn = std::function<void(Clock::duration)>;

    explicit FixedIntervalRateLimiter(std::chrono::milliseconds interval, NowFn now = nullptr,
                                      SleepFn sleep = nullptr);

    void acquire() override;

    std::chrono::milliseconds interval() const {
        return interval_;
    }

    /**
     * @brief Total time spent sleeping so far
     */
    Clock::duration total_wait() const {
        return total_wait_;
    }

private:
    std::chrono::milliseconds interval_;
    NowFn now_;
    SleepFn sleep_;
    std::optional<Clock::time_point> last_acquire_;
    Clock::duration total_wait_{Clock::duration::zero()};
};

}  // namespace option_screener
