#include "common/retry/exponential_backoff.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace retrier {

ExponentialBackoff::ExponentialBackoff(
    std::chrono::milliseconds init_delay, std::chrono::milliseconds max_delay, double factor)
    : init_delay_(init_delay),
      max_delay_(max_delay),
      factor_(factor) {
    if (init_delay < std::chrono::milliseconds(0)) {
        throw std::invalid_argument("Init delay must be a positive number, or 0");
    }
    if (max_delay < std::chrono::milliseconds(0)) {
        throw std::invalid_argument("Max delay must be a positive number, or 0");
    }
    if (!std::isfinite(factor) || factor < 1.0) {
        throw std::invalid_argument("Factor must be a finite number not less than 1, got " + std::to_string(factor));
    }
}

std::chrono::milliseconds ExponentialBackoff::ComputeDelay(int attempt) const {
    if (init_delay_.count() == 0) {
        return init_delay_;
    }

    // pow() overflows to inf for large attempts, the clamp absorbs it
    double delay = std::pow(factor_, static_cast<double>(attempt - 1)) * static_cast<double>(init_delay_.count());
    if (!(delay < static_cast<double>(max_delay_.count()))) {
        return max_delay_;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

} // namespace retrier
