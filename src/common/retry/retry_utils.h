#pragma once

#include <exception>
#include <memory>
#include <string>

#include "common/option.h"
#include "common/retry/backoff_policy.h"
#include "common/retry/retrier.h"
#include "retrier/types.h"

namespace retrier {

/**
 * Utilities for building retriers from configuration and observing them.
 */
class RetryUtils {
 public:
    RetryUtils() = delete; // prevent instantiation

    /**
     * @param name case-insensitive "FIXED" or "EXPONENTIAL"
     * @throw std::invalid_argument for any other name
     */
    static BackoffType ParseBackoffType(const std::string& name);

    /**
     * Builds the backoff selected by RETRIER_BACKOFF_TYPE from the
     * RETRIER_FIXED_* or RETRIER_EXPONENTIAL_* options.
     */
    static std::shared_ptr<const BackoffPolicy> CreateBackoffPolicy(const Options& options);

    /**
     * Builds a retrier with RETRIER_MAX_RETRIES and the configured backoff.
     */
    static std::unique_ptr<Retrier> CreateRetrier(const Options& options, FailureObserver on_failure = nullptr);

    /**
     * @param action a description of the action that fits the phrase "Failed to ${action}"
     * @return an observer that logs retried failures as warnings and the final one as an error
     *
     * Messages go to the spdlog default logger, so call InitRetrierLog first to
     * route them to the configured console and daily-file sinks:
     *
     *   InitRetrierLog("my_app", options);
     *   auto retrier = RetryUtils::CreateRetrier(options, RetryUtils::MakeLoggingObserver("connect to server"));
     */
    static FailureObserver MakeLoggingObserver(const std::string& action);

    /**
     * @return the what() of a std::exception, or a placeholder for anything else
     */
    static std::string DescribeError(const std::exception_ptr& error);
};

} // namespace retrier
