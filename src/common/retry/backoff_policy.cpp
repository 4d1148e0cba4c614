#include "common/retry/backoff_policy.h"

#include <stdexcept>
#include <utility>

namespace retrier {

FunctionBackoffPolicy::FunctionBackoffPolicy(DelayFunction func)
    : func_(std::move(func)) {
    if (!func_) {
        throw std::invalid_argument("Delay function must not be empty");
    }
}

std::chrono::milliseconds FunctionBackoffPolicy::ComputeDelay(int attempt) const {
    return func_(attempt);
}

} // namespace retrier
