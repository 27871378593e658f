#include "test_helpers.hpp"

#include "errors.hpp"
#include "retry.hpp"

using namespace testing_support;
using std::chrono::milliseconds;

int main()
{
    quietLogs();

    // Test 1: Backoff schedule doubles from the base delay
    {
        RetryPolicy policy;
        check(policy.delayAfter(1) == milliseconds(1000), "delay after first failure is 1s");
        check(policy.delayAfter(2) == milliseconds(2000), "delay after second failure is 2s");
        policy.baseDelay = milliseconds(2000);
        check(policy.delayAfter(2) == milliseconds(4000), "2s base doubles to 4s");
    }

    // Test 2: Fails twice then succeeds
    {
        RecordingSleeper sleeper;
        int calls = 0;
        int value = retryWithBackoff(RetryPolicy{}, "Download", [&]() {
            if (++calls < 3)
            {
                throw TransportError("connection reset");
            }
            return 42;
        }, sleeper.sleeper());

        check(value == 42, "success value is returned after retries");
        check(calls == 3, "three attempts in total");
        check(sleeper.delays.size() == 2, "two retries (two sleeps)");
        check(sleeper.delays == std::vector<milliseconds>{milliseconds(1000), milliseconds(2000)},
              "sleeps 1s then 2s");
    }

    // Test 3: Always fails
    {
        RecordingSleeper sleeper;
        int calls = 0;
        checkThrows<RetryExhaustedError>(
            [&]() {
                retryWithBackoff(RetryPolicy{}, "Download", [&]() -> int {
                    ++calls;
                    throw TransportError("Could not resolve host: clients2.google.com");
                }, sleeper.sleeper());
            },
            "gives up with RetryExhaustedError",
            [](const RetryExhaustedError &e) {
                return e.attempts() == 3 &&
                       contains(e.what(), "Download failed after 3 attempts") &&
                       contains(e.what(), "Could not resolve host");
            });
        check(calls == 3, "exactly three attempts before giving up");
        check(sleeper.delays.size() == 2, "no sleep after the final attempt");
    }

    // Test 4: Non-transient errors are not retried
    {
        RecordingSleeper sleeper;
        int calls = 0;
        checkThrows<HttpStatusError>(
            [&]() {
                retryWithBackoff(RetryPolicy{}, "Download", [&]() -> int {
                    ++calls;
                    throw HttpStatusError(403, "HTTP 403: Forbidden");
                }, sleeper.sleeper());
            },
            "HTTP status errors propagate unchanged",
            [](const HttpStatusError &e) { return e.status() == 403; });
        check(calls == 1, "status error attempted once");
        check(sleeper.delays.empty(), "no sleep for status error");
    }

    // Test 5: Rate limit waits 5s and does not grow the backoff
    {
        RecordingSleeper sleeper;
        int calls = 0;
        std::string result = retryWithBackoff(RetryPolicy{}, "API fetch", [&]() -> std::string {
            ++calls;
            if (calls == 1)
            {
                throw RateLimitedError("HTTP 429");
            }
            if (calls == 2)
            {
                throw TransportError("timeout");
            }
            return "ok";
        }, sleeper.sleeper());

        check(result == "ok", "rate-limited call eventually succeeds");
        check(sleeper.delays == std::vector<milliseconds>{milliseconds(5000), milliseconds(1000)},
              "429 sleeps 5s, next transient failure still starts at 1s");
    }

    // Test 6: Rate limiting still uses up attempts
    {
        RecordingSleeper sleeper;
        checkThrows<RetryExhaustedError>(
            [&]() {
                retryWithBackoff(RetryPolicy{}, "API fetch", []() -> int {
                    throw RateLimitedError("HTTP 429");
                }, sleeper.sleeper());
            },
            "persistent 429 gives up after three attempts",
            [](const RetryExhaustedError &e) { return e.attempts() == 3 && contains(e.what(), "429"); });
    }

    return finish();
}
