#include "signal/RateLimiter.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <thread>

namespace ctsafety {

static Logger& logger = Logger::getInstance();
static const std::string LOG_SOURCE = "RATE_LIMITER";

RateLimiter::RateLimiter(int max_requests, std::chrono::milliseconds window)
    : max_requests_(max_requests), window_(window)
{
    if (max_requests < 1) {
        THROW_INVALID_PARAM("RateLimiter", "max_requests must be at least 1");
    }
    if (window.count() <= 0) {
        THROW_INVALID_PARAM("RateLimiter", "window must be positive");
    }
}

void RateLimiter::pruneLocked(Clock::time_point now) const {
    while (!grants_.empty() && grants_.front() + window_ <= now) {
        grants_.pop_front();
    }
}

bool RateLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    pruneLocked(now);
    if (static_cast<int>(grants_.size()) < max_requests_) {
        grants_.push_back(now);
        ++granted_;
        return true;
    }
    ++denied_;
    return false;
}

bool RateLimiter::acquire(Clock::time_point deadline) {
    while (true) {
        Clock::time_point wake;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = Clock::now();
            pruneLocked(now);
            if (static_cast<int>(grants_.size()) < max_requests_) {
                grants_.push_back(now);
                ++granted_;
                return true;
            }
            wake = grants_.front() + window_;
            if (wake > deadline) {
                ++denied_;
                logger.warning(LOG_SOURCE, "Request budget of " + std::to_string(max_requests_) +
                               " per window exhausted before the caller deadline");
                return false;
            }
        }
        logger.debug(LOG_SOURCE, "Budget exhausted, waiting for the oldest grant to expire");
        std::this_thread::sleep_until(wake);
    }
}

int RateLimiter::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    pruneLocked(Clock::now());
    return max_requests_ - static_cast<int>(grants_.size());
}

std::size_t RateLimiter::granted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return granted_;
}

std::size_t RateLimiter::denied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return denied_;
}

} // namespace ctsafety
