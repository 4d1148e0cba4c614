#pragma once

#include <chrono>

#include "common/retry/backoff_policy.h"

namespace retrier {

/**
 * A BackoffPolicy that pauses for the same period before every retry.
 */
class FixedBackoff : public BackoffPolicy {
 public:
    explicit FixedBackoff(std::chrono::milliseconds period);

    [[nodiscard]] std::chrono::milliseconds ComputeDelay(int attempt) const override;

    [[nodiscard]] std::chrono::milliseconds GetPeriod() const { return period_; }

 private:
    std::chrono::milliseconds period_;
};

} // namespace retrier
