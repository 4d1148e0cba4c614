#include "common/retry/fixed_backoff.h"

#include <stdexcept>

namespace retrier {

FixedBackoff::FixedBackoff(std::chrono::milliseconds period)
    : period_(period) {
    if (period < std::chrono::milliseconds(0)) {
        throw std::invalid_argument("Backoff period must be a positive number, or 0");
    }
}

std::chrono::milliseconds FixedBackoff::ComputeDelay(int /*attempt*/) const {
    return period_;
}

} // namespace retrier
