#pragma once

#include <chrono>
#include <functional>

namespace retrier {

/**
 * Computes how long to pause before the next attempt.
 *
 * Implementations must be pure functions of the attempt number and their own
 * immutable configuration, and must never return a negative delay.
 */
class BackoffPolicy {
 public:
    virtual ~BackoffPolicy() = default;

    /**
     * @param attempt 1-indexed number of attempts made so far, never less than 1
     * @return the delay before the next attempt
     */
    [[nodiscard]] virtual std::chrono::milliseconds ComputeDelay(int attempt) const = 0;
};

/**
 * Adapts a callable into a BackoffPolicy.
 */
class FunctionBackoffPolicy : public BackoffPolicy {
 public:
    using DelayFunction = std::function<std::chrono::milliseconds(int attempt)>;

    explicit FunctionBackoffPolicy(DelayFunction func);

    [[nodiscard]] std::chrono::milliseconds ComputeDelay(int attempt) const override;

 private:
    DelayFunction func_;
};

} // namespace retrier
