#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace ctsafety {

/**
 * @brief Request budget over a rolling time window, shared by all callers of one source.
 *
 * At most `max_requests` grants are issued within any window of length `window`.
 * The grant log is guarded by a mutex; waiting callers sleep outside the lock.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /// @throws InvalidParameterException if max_requests < 1 or window is not positive.
    RateLimiter(int max_requests, std::chrono::milliseconds window);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Take a slot if one is free right now.
    bool tryAcquire();

    /**
     * @brief Take a slot, sleeping until one frees up.
     * @return false if no slot frees up before `deadline`; nothing is consumed in that case.
     */
    bool acquire(Clock::time_point deadline);

    /// Slots still free in the current window.
    int available() const;

    std::size_t granted() const;
    std::size_t denied() const;

    int maxRequests() const { return max_requests_; }
    std::chrono::milliseconds window() const { return window_; }

private:
    void pruneLocked(Clock::time_point now) const;

    const int max_requests_;
    const std::chrono::milliseconds window_;

    mutable std::mutex mutex_;
    mutable std::deque<Clock::time_point> grants_;
    std::size_t granted_ = 0;
    std::size_t denied_ = 0;
};

} // namespace ctsafety

#endif // RATE_LIMITER_HPP
