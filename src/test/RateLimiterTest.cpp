#include <atomic>
#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

#include "application/RateLimiter.hpp"

using scratchpad::application::RateLimiter;

int main() {
    std::cout << "[Test] Starting RateLimiter Test..." << std::endl;

    RateLimiter::Clock::time_point now = RateLimiter::Clock::now();
    RateLimiter limiter(60, std::chrono::seconds(60), [&now]() { return now; });

    // 60 back-to-back admissions pass, the 61st waits about one second.
    int allowed = 0;
    for (int i = 0; i < 60; ++i) {
        if (limiter.admit().allowed) ++allowed;
    }
    assert(allowed == 60);
    auto denied = limiter.admit();
    assert(!denied.allowed);
    assert(denied.retryAfterSeconds > 0.0);
    assert(std::fabs(denied.retryAfterSeconds - 1.0) < 1e-6);

    // Refill is continuous.
    now += std::chrono::seconds(1);
    assert(limiter.admit().allowed);
    assert(!limiter.admit().allowed);

    // Refunds restore a token.
    limiter.refund();
    assert(limiter.admit().allowed);

    // The bucket never grows past its capacity.
    now += std::chrono::seconds(600);
    assert(std::fabs(limiter.available() - 60.0) < 1e-6);
    limiter.refund();
    assert(std::fabs(limiter.available() - 60.0) < 1e-6);

    // Concurrent callers share one bucket.
    RateLimiter::Clock::time_point frozen = RateLimiter::Clock::now();
    RateLimiter shared(60, std::chrono::seconds(60), [frozen]() { return frozen; });
    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&shared, &admitted]() {
            for (int i = 0; i < 20; ++i) {
                if (shared.admit().allowed) admitted++;
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(admitted == 60);

    std::cout << "[PASS] RateLimiter Test." << std::endl;
    return 0;
}
