#include "common/retry/cancellation_token.h"

#include "common/retry/retry_exceptions.h"

namespace retrier {

namespace {

// A deadline past the end of the clock's range can never be reached
std::optional<std::chrono::steady_clock::time_point> DeadlineAfter(std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;

    auto now = Clock::now();
    if (timeout <= std::chrono::milliseconds(0)) {
        return now;
    }
    if (timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now)) {
        return std::nullopt;
    }
    return now + timeout;
}

} // namespace

CancellationToken::CancellationToken()
    : reason_(CancelReason::NONE),
      deadline_(std::nullopt) {
}

CancellationToken::CancellationToken(std::chrono::milliseconds timeout)
    : reason_(CancelReason::NONE),
      deadline_(DeadlineAfter(timeout)) {
}

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto current = ReasonLocked(std::chrono::steady_clock::now());
        reason_ = current == CancelReason::NONE ? CancelReason::CANCELLED : current;
    }
    cond_.notify_all();
}

bool CancellationToken::IsCancelled() const {
    return GetReason() != CancelReason::NONE;
}

CancelReason CancellationToken::GetReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReasonLocked(std::chrono::steady_clock::now());
}

std::exception_ptr CancellationToken::Error() const {
    switch (GetReason()) {
        case CancelReason::CANCELLED:
            return std::make_exception_ptr(CancelledException("operation cancelled"));
        case CancelReason::DEADLINE_EXCEEDED:
            return std::make_exception_ptr(DeadlineExceededException("deadline exceeded"));
        default:
            return nullptr;
    }
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
    using Clock = std::chrono::steady_clock;

    std::unique_lock<std::mutex> lock(mutex_);
    auto now = Clock::now();
    if (ReasonLocked(now) != CancelReason::NONE) {
        return true;
    }
    if (timeout <= std::chrono::milliseconds(0)) {
        return false;
    }

    // now + timeout overflows the clock for enormous timeouts, treat those as unbounded
    Clock::time_point wake_time = Clock::time_point::max();
    bool bounded = timeout < std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (bounded) {
        wake_time = now + timeout;
    }
    if (deadline_.has_value() && (!bounded || *deadline_ < wake_time)) {
        wake_time = *deadline_;
        bounded = true;
    }

    auto done = [this] { return reason_ != CancelReason::NONE; };
    if (bounded) {
        cond_.wait_until(lock, wake_time, done);
    } else {
        cond_.wait(lock, done);
    }
    return ReasonLocked(Clock::now()) != CancelReason::NONE;
}

CancelReason CancellationToken::ReasonLocked(std::chrono::steady_clock::time_point now) const {
    if (reason_ != CancelReason::NONE) {
        return reason_;
    }
    if (deadline_.has_value() && now >= *deadline_) {
        return CancelReason::DEADLINE_EXCEEDED;
    }
    return CancelReason::NONE;
}

} // namespace retrier
