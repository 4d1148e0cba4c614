#include "common/retry/retry_utils.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "common/retry/exponential_backoff.h"
#include "common/retry/fixed_backoff.h"
#include "common/string_utils.h"

namespace retrier {

BackoffType RetryUtils::ParseBackoffType(const std::string& name) {
    auto upper = ToUpper(TrimCopy(name));
    if (upper == "FIXED") {
        return BackoffType::FIXED;
    }
    if (upper == "EXPONENTIAL") {
        return BackoffType::EXPONENTIAL;
    }
    SPDLOG_ERROR("Invalid backoff type: {}", name);
    throw std::invalid_argument("Invalid backoff type: " + name);
}

std::shared_ptr<const BackoffPolicy> RetryUtils::CreateBackoffPolicy(const Options& options) {
    auto type = ParseBackoffType(GetOptionValue<std::string>(options, RETRIER_BACKOFF_TYPE));
    switch (type) {
        case BackoffType::FIXED:
            return std::make_shared<FixedBackoff>(
                std::chrono::milliseconds(GetOptionValue<int64_t>(options, RETRIER_FIXED_BACKOFF_MS)));
        case BackoffType::EXPONENTIAL:
            return std::make_shared<ExponentialBackoff>(
                std::chrono::milliseconds(GetOptionValue<int64_t>(options, RETRIER_EXPONENTIAL_INIT_DELAY_MS)),
                std::chrono::milliseconds(GetOptionValue<int64_t>(options, RETRIER_EXPONENTIAL_MAX_DELAY_MS)),
                GetOptionValue<double>(options, RETRIER_EXPONENTIAL_FACTOR));
    }
    throw std::invalid_argument("Unsupported backoff type: " + std::to_string(static_cast<int>(type)));
}

std::unique_ptr<Retrier> RetryUtils::CreateRetrier(const Options& options, FailureObserver on_failure) {
    auto retrier = std::make_unique<Retrier>(GetOptionValue<int>(options, RETRIER_MAX_RETRIES), std::move(on_failure));
    retrier->SetBackoffPolicy(CreateBackoffPolicy(options));
    return retrier;
}

FailureObserver RetryUtils::MakeLoggingObserver(const std::string& action) {
    return [action](const std::exception_ptr& error, int attempt, bool will_retry, std::chrono::milliseconds delay) {
        if (will_retry) {
            SPDLOG_WARN(
                "Failed to {} on attempt {}: {}, retry in {}ms", action, attempt, DescribeError(error), delay.count());
        } else {
            SPDLOG_ERROR("Failed to {} on attempt {}: {}, giving up", action, attempt, DescribeError(error));
        }
    };
}

std::string RetryUtils::DescribeError(const std::exception_ptr& error) {
    if (error == nullptr) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace retrier
