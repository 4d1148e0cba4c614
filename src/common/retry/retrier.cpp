#include "common/retry/retrier.h"

#include <exception>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "common/retry/exponential_backoff.h"
#include "common/retry/fixed_backoff.h"
#include "common/retry/retry_exceptions.h"

namespace retrier {

Retrier::Retrier(int max_retries, FailureObserver on_failure)
    : max_retries_(0),
      unlimited_(false),
      on_failure_(std::move(on_failure)) {
    SetFixedBackoff(kDefaultFixedBackoffMs);
    SetMaxRetries(max_retries);
}

void Retrier::SetMaxRetries(int max_retries) {
    max_retries_ = max_retries;
    unlimited_ = max_retries < 0;
}

void Retrier::SetFixedBackoff(int64_t period_ms) {
    backoff_ = std::make_shared<FixedBackoff>(std::chrono::milliseconds(period_ms));
}

void Retrier::SetExponentialBackoff(int64_t init_delay_ms, int64_t max_delay_ms, double factor) {
    backoff_ = std::make_shared<ExponentialBackoff>(
        std::chrono::milliseconds(init_delay_ms), std::chrono::milliseconds(max_delay_ms), factor);
}

void Retrier::SetBackoffPolicy(std::shared_ptr<const BackoffPolicy> backoff) {
    if (backoff == nullptr) {
        throw std::invalid_argument("Backoff policy must not be null");
    }
    backoff_ = std::move(backoff);
}

void Retrier::Execute(const CancellationToken& token, const RetryableOperation& operation) const {
    if (!operation) {
        throw std::invalid_argument("Retryable operation must not be empty");
    }

    int attempt = 0;
    while (true) {
        if (token.IsCancelled()) {
            SPDLOG_DEBUG("Retry loop cancelled before attempt {}", attempt + 1);
            std::rethrow_exception(token.Error());
        }

        attempt++;
        std::exception_ptr error;
        bool retryable = true;
        try {
            operation(attempt);
            return;
        } catch (const NonRetryableException&) {
            error = std::current_exception();
            retryable = false;
        } catch (...) {
            error = std::current_exception();
        }

        if (!retryable || !CanRetry(attempt)) {
            NotifyFailure(error, attempt, false, std::chrono::milliseconds(0));
            std::rethrow_exception(error);
        }

        auto delay = NextDelay(attempt);
        NotifyFailure(error, attempt, true, delay);

        if (token.WaitFor(delay)) {
            SPDLOG_DEBUG("Retry loop cancelled while waiting {}ms after attempt {}", delay.count(), attempt);
            std::rethrow_exception(token.Error());
        }
    }
}

void Retrier::Execute(const RetryableOperation& operation) const {
    CancellationToken token;
    Execute(token, operation);
}

std::chrono::milliseconds Retrier::NextDelay(int attempt) const {
    // Execute counts attempts from 1, policies are never asked about attempt 0
    if (attempt < 1) {
        throw std::logic_error("Backoff requested for attempt " + std::to_string(attempt));
    }
    auto delay = backoff_->ComputeDelay(attempt);
    if (delay < std::chrono::milliseconds(0)) {
        SPDLOG_ERROR("Backoff policy returned negative delay {}ms for attempt {}", delay.count(), attempt);
        throw std::logic_error("Backoff policy returned a negative delay");
    }
    return delay;
}

void Retrier::NotifyFailure(
    const std::exception_ptr& error, int attempt, bool will_retry, std::chrono::milliseconds delay) const {
    if (on_failure_) {
        on_failure_(error, attempt, will_retry, delay);
    }
}

} // namespace retrier
