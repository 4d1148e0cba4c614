#pragma once

#include <chrono>

#include "common/retry/backoff_policy.h"

namespace retrier {

/**
 * A BackoffPolicy whose delay grows geometrically with each attempt:
 *
 *     delay(attempt) = min(factor^(attempt - 1) * init_delay, max_delay)
 *
 * The first retry waits init_delay. Fractions of a millisecond are truncated.
 */
class ExponentialBackoff : public BackoffPolicy {
 public:
    /**
     * @param init_delay delay after the first attempt
     * @param max_delay upper bound of any delay
     * @param factor base of the power by which the delay grows, at least 1
     */
    ExponentialBackoff(std::chrono::milliseconds init_delay, std::chrono::milliseconds max_delay, double factor);

    [[nodiscard]] std::chrono::milliseconds ComputeDelay(int attempt) const override;

    [[nodiscard]] std::chrono::milliseconds GetInitDelay() const { return init_delay_; }
    [[nodiscard]] std::chrono::milliseconds GetMaxDelay() const { return max_delay_; }
    [[nodiscard]] double GetFactor() const { return factor_; }

 private:
    std::chrono::milliseconds init_delay_;
    std::chrono::milliseconds max_delay_;
    double factor_;
};

} // namespace retrier
