#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"

/**
 * Bounded retry with exponential backoff.
 *
 * After failed attempt k (1-indexed) the caller sleeps baseDelay * 2^(k-1).
 * A rate-limited attempt sleeps rateLimitDelay instead and does not move the
 * backoff forward, but it still uses up one attempt.
 */
struct RetryPolicy
{
    int maxAttempts = kMaxAttempts;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds rateLimitDelay{5000};

    std::chrono::milliseconds delayAfter(int backoffStep) const
    {
        return baseDelay * (1LL << (backoffStep - 1));
    }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper threadSleeper()
{
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

/**
 * Run fn until it succeeds or the policy gives up.
 *
 * Only TransientError and RateLimitedError are retried; anything else is
 * rethrown immediately.
 *
 * @param policy Attempt count and delays
 * @param what Short description used in log lines and the final error
 * @param fn Callable performing one attempt
 * @param sleep Delay function (injectable for tests)
 * @return Whatever fn returns on the first successful attempt
 * @throws RetryExhaustedError after the last attempt fails
 */
template <typename Fn>
auto retryWithBackoff(const RetryPolicy &policy, const std::string &what, Fn &&fn,
                      const Sleeper &sleep = threadSleeper()) -> decltype(fn())
{
    int backoffStep = 0;
    for (int attempt = 1;; ++attempt)
    {
        try
        {
            return fn();
        }
        catch (const RateLimitedError &e)
        {
            if (attempt >= policy.maxAttempts)
            {
                throw RetryExhaustedError(attempt, fmt::format("{} failed after {} attempts: {}",
                                                               what, attempt, e.what()));
            }
            spdlog::warn("Rate limit hit, retrying after {}s...",
                         std::chrono::duration_cast<std::chrono::seconds>(policy.rateLimitDelay).count());
            sleep(policy.rateLimitDelay);
        }
        catch (const TransientError &e)
        {
            if (attempt >= policy.maxAttempts)
            {
                throw RetryExhaustedError(attempt, fmt::format("{} failed after {} attempts: {}",
                                                               what, attempt, e.what()));
            }
            auto delay = policy.delayAfter(++backoffStep);
            spdlog::warn("{} attempt {} failed: {}. Retrying in {} seconds...",
                         what, attempt, e.what(),
                         std::chrono::duration_cast<std::chrono::seconds>(delay).count());
            sleep(delay);
        }
    }
}
