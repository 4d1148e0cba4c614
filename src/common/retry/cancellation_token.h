#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>

#include "common/macro_utils.h"

namespace retrier {

enum class CancelReason : uint8_t { NONE = 0, CANCELLED = 1, DEADLINE_EXCEEDED = 2 };

/**
 * Caller-owned signal that aborts a retry loop, including while it waits
 * between attempts.
 *
 * A token becomes done either through Cancel() or by reaching its deadline.
 * Once done it stays done, and the first reason wins. All members are thread
 * safe.
 */
class CancellationToken {
 public:
    /**
     * A token that is only ever done through Cancel().
     */
    CancellationToken();

    /**
     * A token that is done timeout after construction, or earlier through Cancel().
     * A non-positive timeout gives a token that is already done, and a timeout
     * beyond the range of steady_clock gives a token without a deadline.
     */
    explicit CancellationToken(std::chrono::milliseconds timeout);

    RETRIER_DISALLOW_COPY_AND_MOVE(CancellationToken);

    ~CancellationToken() = default;

    /**
     * Marks the token cancelled and wakes every waiter. No effect once done.
     */
    void Cancel();

    [[nodiscard]] bool IsCancelled() const;

    [[nodiscard]] CancelReason GetReason() const;

    /**
     * @return null while the token is not done, otherwise a CancelledException
     * or DeadlineExceededException describing why
     */
    [[nodiscard]] std::exception_ptr Error() const;

    /**
     * Blocks until the token is done or timeout elapses, whichever is first.
     *
     * @return true if the token is done
     */
    bool WaitFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> GetDeadline() const { return deadline_; }

 private:
    [[nodiscard]] CancelReason ReasonLocked(std::chrono::steady_clock::time_point now) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable cond_;
    CancelReason reason_;
    const std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace retrier
