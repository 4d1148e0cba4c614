#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>

namespace retrier {

// Retry budget value that keeps retrying until success or cancellation.
constexpr int kUnlimitedRetries = -1;

// Backoff installed by a freshly constructed Retrier.
constexpr int64_t kDefaultFixedBackoffMs = 1000;

enum class BackoffType : uint8_t { FIXED = 0, EXPONENTIAL = 1 };

/**
 * Called once per failed attempt.
 *
 * @param error the exception thrown by the attempt
 * @param attempt 1-indexed attempt number
 * @param will_retry whether another attempt follows
 * @param next_delay wait before the next attempt, zero when will_retry is false
 */
using FailureObserver = std::function<
    void(const std::exception_ptr& error, int attempt, bool will_retry, std::chrono::milliseconds next_delay)>;

/**
 * Unit of work retried by a Retrier. Failure is signalled by throwing.
 */
using RetryableOperation = std::function<void(int attempt)>;

template <typename T>
using RetryableCallable = std::function<T(int attempt)>;

} // namespace retrier
