#include "rate_limiter.hpp"

#include <algorithm>
#include <thread>

namespace scan {

namespace {

RateConfig checked(double rate, uint32_t burst) {
    RateConfig config;
    config.requests_per_second = rate;
    config.burst_size = burst;
    config.validate();
    return config;
}

} // namespace

RateLimiter::RateLimiter(double rate, uint32_t burst)
    : RateLimiter(checked(rate, burst)) {
}

RateLimiter::RateLimiter(const RateConfig& config)
    : rate_((config.validate(), config.requests_per_second))
    , burst_(config.burst_size)
    , tokens_(static_cast<double>(config.burst_size))
    , last_refill_(Clock::now()) {
}

RateLimiter::Clock::duration RateLimiter::acquire() {
    const auto start = Clock::now();

    for (;;) {
        std::chrono::duration<double> wait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            refillLocked(Clock::now());
            if (tokens_ >= 1.0) {
                tokens_ -= 1.0;
                return Clock::now() - start;
            }
            wait = std::chrono::duration<double>((1.0 - tokens_) / rate_);
        }
        // other callers may take the refilled token first; loop and re-check
        std::this_thread::sleep_for(wait);
    }
}

bool RateLimiter::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    refillLocked(Clock::now());
    if (tokens_ >= 1.0) {
        tokens_ -= 1.0;
        return true;
    }
    return false;
}

double RateLimiter::availableTokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refillLocked(Clock::now());
    return tokens_;
}

void RateLimiter::refillLocked(Clock::time_point now) {
    std::chrono::duration<double> elapsed = now - last_refill_;
    if (elapsed.count() > 0.0) {
        tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed.count() * rate_);
    }
    last_refill_ = now;
}

} // namespace scan
