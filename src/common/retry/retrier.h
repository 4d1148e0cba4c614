#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "common/retry/backoff_policy.h"
#include "common/retry/cancellation_token.h"
#include "retrier/types.h"

namespace retrier {

/**
 * Keeps invoking an operation, pausing between attempts according to a
 * BackoffPolicy, until one of the following happens:
 * - the operation returns normally
 * - the retry budget is exhausted, the last failure is rethrown
 * - the operation throws NonRetryableException, it is rethrown
 * - the CancellationToken is done, its error is rethrown
 *
 * With max_retries = N up to N + 1 attempts are made: the first attempt is
 * not a retry.
 *
 * Configuration is not synchronized. Concurrent Execute calls on one Retrier
 * are fine, reconfiguring it while they run is a data race.
 */
class Retrier {
 public:
    /**
     * Constructs a retrier with a fixed backoff of kDefaultFixedBackoffMs.
     *
     * @param max_retries number of retries after the first attempt, negative to retry forever
     * @param on_failure notified of every failed attempt, may be empty
     */
    explicit Retrier(int max_retries, FailureObserver on_failure = nullptr);

    void SetMaxRetries(int max_retries);

    [[nodiscard]] int GetMaxRetries() const { return max_retries_; }
    [[nodiscard]] bool IsUnlimited() const { return unlimited_; }

    /**
     * @param period_ms pause before every retry, in milliseconds
     */
    void SetFixedBackoff(int64_t period_ms);

    /**
     * @param init_delay_ms pause after the first attempt, in milliseconds
     * @param max_delay_ms upper bound of any pause, in milliseconds
     * @param factor base of the power by which the pause grows
     */
    void SetExponentialBackoff(int64_t init_delay_ms, int64_t max_delay_ms, double factor);

    void SetBackoffPolicy(std::shared_ptr<const BackoffPolicy> backoff);

    [[nodiscard]] std::shared_ptr<const BackoffPolicy> GetBackoffPolicy() const { return backoff_; }

    void SetFailureObserver(FailureObserver on_failure) { on_failure_ = std::move(on_failure); }

    /**
     * Runs operation until it succeeds. Rethrows the last failure once the
     * budget is exhausted, or the token's error once it is done.
     *
     * @param token checked before every attempt and raced against every pause
     * @param operation receives the 1-indexed attempt number, fails by throwing
     */
    void Execute(const CancellationToken& token, const RetryableOperation& operation) const;

    void Execute(const RetryableOperation& operation) const;

    /**
     * Same as Execute, returning the value of the first successful attempt.
     */
    template <typename T>
    T Execute(const CancellationToken& token, const RetryableCallable<T>& callable) const;

    template <typename T>
    T Execute(const RetryableCallable<T>& callable) const;

 private:
    [[nodiscard]] bool CanRetry(int attempt) const { return unlimited_ || attempt <= max_retries_; }

    [[nodiscard]] std::chrono::milliseconds NextDelay(int attempt) const;

    void NotifyFailure(const std::exception_ptr& error, int attempt, bool will_retry, std::chrono::milliseconds delay)
        const;

    int max_retries_;
    bool unlimited_;
    FailureObserver on_failure_;
    std::shared_ptr<const BackoffPolicy> backoff_;
};

template <typename T>
T Retrier::Execute(const CancellationToken& token, const RetryableCallable<T>& callable) const {
    if (!callable) {
        throw std::invalid_argument("Retryable callable must not be empty");
    }
    std::optional<T> result;
    Execute(token, [&result, &callable](int attempt) { result.emplace(callable(attempt)); });
    return std::move(*result);
}

template <typename T>
T Retrier::Execute(const RetryableCallable<T>& callable) const {
    CancellationToken token;
    return Execute<T>(token, callable);
}

} // namespace retrier
