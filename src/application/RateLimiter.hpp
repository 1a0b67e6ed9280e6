/**
 * @file RateLimiter.hpp
 * @brief Process-local token bucket gating operation throughput.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>

namespace scratchpad::application {

/**
 * @class RateLimiter
 * @brief Token bucket refilled continuously so that the long-run rate is
 *        @c capacity admissions per @c window.
 *
 * State lives in memory only and starts full; it is not shared across processes.
 * All members are safe to call from multiple threads.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    /**
     * @struct Admission
     * @brief Outcome of admit(). retryAfterSeconds is positive only when denied.
     */
    struct Admission {
        bool allowed = false;
        double retryAfterSeconds = 0.0;
    };

    RateLimiter(std::size_t capacity = 60,
                std::chrono::seconds window = std::chrono::seconds(60),
                TimeSource now = nullptr);

    /** @brief Consumes one token if available; otherwise reports the wait until one is. */
    Admission admit();

    /** @brief Returns a token taken by a call that later failed. Never exceeds capacity. */
    void refund();

    /** @brief Tokens currently available (after refill). */
    double available();

private:
    void refill(Clock::time_point now);

    double m_capacity;
    double m_tokensPerSecond;
    TimeSource m_now;

    std::mutex m_mutex;
    double m_tokens;
    Clock::time_point m_lastRefill;
};

} // namespace scratchpad::application
