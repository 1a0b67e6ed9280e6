/**
 * @file RateLimiter.cpp
 * @brief Implementation of RateLimiter.
 */

#include "application/RateLimiter.hpp"
#include <algorithm>

namespace scratchpad::application {

RateLimiter::RateLimiter(std::size_t capacity, std::chrono::seconds window, TimeSource now)
    : m_capacity(static_cast<double>(std::max<std::size_t>(capacity, 1))),
      m_tokensPerSecond(m_capacity / static_cast<double>(std::max<std::chrono::seconds::rep>(window.count(), 1))),
      m_now(now ? std::move(now) : TimeSource([] { return Clock::now(); })),
      m_tokens(m_capacity),
      m_lastRefill(m_now()) {}

void RateLimiter::refill(Clock::time_point now) {
    if (now <= m_lastRefill) {
        return;
    }
    std::chrono::duration<double> elapsed = now - m_lastRefill;
    m_tokens = std::min(m_capacity, m_tokens + elapsed.count() * m_tokensPerSecond);
    m_lastRefill = now;
}

RateLimiter::Admission RateLimiter::admit() {
    std::lock_guard<std::mutex> lock(m_mutex);
    refill(m_now());

    Admission result;
    if (m_tokens >= 1.0) {
        m_tokens -= 1.0;
        result.allowed = true;
        return result;
    }

    result.allowed = false;
    result.retryAfterSeconds = (1.0 - m_tokens) / m_tokensPerSecond;
    return result;
}

void RateLimiter::refund() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_tokens = std::min(m_capacity, m_tokens + 1.0);
}

double RateLimiter::available() {
    std::lock_guard<std::mutex> lock(m_mutex);
    refill(m_now());
    return m_tokens;
}

} // namespace scratchpad::application
