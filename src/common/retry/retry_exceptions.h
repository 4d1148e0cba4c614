#pragma once

#include <stdexcept>
#include <string>

namespace retrier {

/**
 * Thrown out of Retrier::Execute when its CancellationToken was cancelled.
 */
class CancelledException : public std::runtime_error {
 public:
    explicit CancelledException(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * Thrown out of Retrier::Execute when its CancellationToken passed its deadline.
 */
class DeadlineExceededException : public CancelledException {
 public:
    explicit DeadlineExceededException(const std::string& msg)
        : CancelledException(msg) {}
};

/**
 * Base exception class for non-retryable errors.
 * When an operation throws it, the retry loop gives up immediately regardless
 * of the remaining budget.
 */
class NonRetryableException : public std::runtime_error {
 public:
    explicit NonRetryableException(const std::string& msg)
        : std::runtime_error(msg) {}
};

} // namespace retrier
