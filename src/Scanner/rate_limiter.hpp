#ifndef rate_limiter_hpp
#define rate_limiter_hpp

#include <chrono>
#include <cstdint>
#include <mutex>

#include "scan_types.hpp"

namespace scan {

/**
 * Token bucket shared by every scanner in the process.
 *
 * Starts full with burst tokens and refills continuously at rate tokens/second,
 * never above burst. acquire() never drops a request: it sleeps for the computed
 * deficit outside the lock and re-checks.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /// Throws std::invalid_argument unless rate > 0 and burst > 0
    RateLimiter(double rate, uint32_t burst);
    explicit RateLimiter(const RateConfig& config);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Take one token, waiting as long as needed.
     * @return time spent waiting
     */
    Clock::duration acquire();

    /// Take one token only if one is available now
    bool tryAcquire();

    double availableTokens();

    double rate() const { return rate_; }
    uint32_t burst() const { return burst_; }

private:
    void refillLocked(Clock::time_point now);

private:
    const double rate_;
    const uint32_t burst_;

    std::mutex mutex_;
    double tokens_;
    Clock::time_point last_refill_;
};

} // namespace scan

#endif // rate_limiter_hpp
