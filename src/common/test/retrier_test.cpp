#include "common/retry/retrier.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "common/retry/backoff_policy.h"
#include "common/retry/cancellation_token.h"
#include "common/retry/retry_exceptions.h"

namespace retrier {

class TestException : public std::runtime_error {
 public:
    explicit TestException(const std::string& msg)
        : std::runtime_error(msg) {}
};

struct FailureRecord {
    int attempt;
    bool will_retry;
    std::chrono::milliseconds delay;
};

class RetrierTest : public ::testing::Test {
 protected:
    FailureObserver Recorder() {
        return [this](const std::exception_ptr& error, int attempt, bool will_retry, std::chrono::milliseconds delay) {
            EXPECT_NE(error, nullptr);
            failures_.push_back({attempt, will_retry, delay});
        };
    }

    int64_t SumDelayMs() const {
        int64_t sum = 0;
        for (const auto& failure : failures_) {
            sum += failure.delay.count();
        }
        return sum;
    }

    // Fails for the first three attempts
    static void FailThreeTimes(int attempt) {
        if (attempt <= 3) {
            throw TestException("attempt " + std::to_string(attempt));
        }
    }

    std::vector<FailureRecord> failures_;
};

TEST_F(RetrierTest, Defaults) {
    Retrier retrier(3);
    EXPECT_EQ(retrier.GetMaxRetries(), 3);
    EXPECT_FALSE(retrier.IsUnlimited());
    ASSERT_NE(retrier.GetBackoffPolicy(), nullptr);
    EXPECT_EQ(retrier.GetBackoffPolicy()->ComputeDelay(1), std::chrono::milliseconds(kDefaultFixedBackoffMs));
    EXPECT_EQ(retrier.GetBackoffPolicy()->ComputeDelay(7), std::chrono::milliseconds(kDefaultFixedBackoffMs));
}

TEST_F(RetrierTest, NegativeRetriesMeansUnlimited) {
    Retrier retrier(kUnlimitedRetries);
    EXPECT_TRUE(retrier.IsUnlimited());

    retrier.SetMaxRetries(2);
    EXPECT_FALSE(retrier.IsUnlimited());
    EXPECT_EQ(retrier.GetMaxRetries(), 2);

    retrier.SetMaxRetries(-5);
    EXPECT_TRUE(retrier.IsUnlimited());
}

TEST_F(RetrierTest, SuccessOnFirstAttempt) {
    Retrier retrier(3, Recorder());
    int calls = 0;

    EXPECT_NO_THROW(retrier.Execute([&calls](int attempt) {
        calls++;
        EXPECT_EQ(attempt, 1);
    }));

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(failures_.empty());
}

TEST_F(RetrierTest, FixedBackoffSuccess) {
    Retrier retrier(3, Recorder());
    retrier.SetFixedBackoff(500);

    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    EXPECT_NO_THROW(retrier.Execute(token, &RetrierTest::FailThreeTimes));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    ASSERT_EQ(failures_.size(), 3);
    EXPECT_EQ(SumDelayMs(), 1500);
    for (size_t i = 0; i < failures_.size(); ++i) {
        EXPECT_EQ(failures_[i].attempt, static_cast<int>(i) + 1);
        EXPECT_TRUE(failures_[i].will_retry);
    }
    EXPECT_GE(elapsed.count(), 1500);
}

TEST_F(RetrierTest, FixedBackoffExhausted) {
    Retrier retrier(2, Recorder());
    retrier.SetFixedBackoff(500);

    CancellationToken token;
    try {
        retrier.Execute(token, &RetrierTest::FailThreeTimes);
        FAIL() << "Expected the last failure to be rethrown";
    } catch (const TestException& e) {
        EXPECT_STREQ(e.what(), "attempt 3");
    }

    ASSERT_EQ(failures_.size(), 3);
    EXPECT_EQ(SumDelayMs(), 1000);
    EXPECT_TRUE(failures_[0].will_retry);
    EXPECT_TRUE(failures_[1].will_retry);
    EXPECT_FALSE(failures_[2].will_retry);
    EXPECT_EQ(failures_[2].delay, std::chrono::milliseconds(0));
}

TEST_F(RetrierTest, PermanentFailureMakesRetriesPlusOneAttempts) {
    const int retries = 4;
    const int64_t period_ms = 20;
    Retrier retrier(retries, Recorder());
    retrier.SetFixedBackoff(period_ms);
    int calls = 0;

    EXPECT_THROW(
        retrier.Execute([&calls](int /*attempt*/) {
            calls++;
            throw TestException("always");
        }),
        TestException);

    EXPECT_EQ(calls, retries + 1);
    ASSERT_EQ(failures_.size(), retries + 1);
    EXPECT_EQ(SumDelayMs(), retries * period_ms);
    EXPECT_FALSE(failures_.back().will_retry);
    EXPECT_EQ(failures_.back().delay, std::chrono::milliseconds(0));
}

TEST_F(RetrierTest, ZeroRetriesMakesSingleAttempt) {
    Retrier retrier(0, Recorder());
    int calls = 0;

    EXPECT_THROW(
        retrier.Execute([&calls](int /*attempt*/) {
            calls++;
            throw TestException("once");
        }),
        TestException);

    EXPECT_EQ(calls, 1);
    ASSERT_EQ(failures_.size(), 1);
    EXPECT_FALSE(failures_[0].will_retry);
}

TEST_F(RetrierTest, ExponentialBackoffSuccess) {
    Retrier retrier(3, Recorder());
    retrier.SetExponentialBackoff(500, 5000, 2);

    EXPECT_NO_THROW(retrier.Execute(&RetrierTest::FailThreeTimes));

    ASSERT_EQ(failures_.size(), 3);
    EXPECT_EQ(failures_[0].delay, std::chrono::milliseconds(500));
    EXPECT_EQ(failures_[1].delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(failures_[2].delay, std::chrono::milliseconds(2000));
    EXPECT_EQ(SumDelayMs(), 3500);
}

TEST_F(RetrierTest, ExponentialBackoffMaxDelay) {
    Retrier retrier(3, Recorder());
    retrier.SetExponentialBackoff(500, 900, 2);

    EXPECT_NO_THROW(retrier.Execute(&RetrierTest::FailThreeTimes));

    ASSERT_EQ(failures_.size(), 3);
    EXPECT_EQ(failures_[0].delay, std::chrono::milliseconds(500));
    EXPECT_EQ(failures_[1].delay, std::chrono::milliseconds(900));
    EXPECT_EQ(failures_[2].delay, std::chrono::milliseconds(900));
    EXPECT_EQ(SumDelayMs(), 2300);
}

TEST_F(RetrierTest, ExponentialBackoffExhausted) {
    Retrier retrier(2, Recorder());
    retrier.SetExponentialBackoff(500, 5000, 2);

    EXPECT_THROW(retrier.Execute(&RetrierTest::FailThreeTimes), TestException);

    ASSERT_EQ(failures_.size(), 3);
    EXPECT_EQ(SumDelayMs(), 1500);
    EXPECT_FALSE(failures_.back().will_retry);
}

TEST_F(RetrierTest, CancelledBeforeFirstAttempt) {
    Retrier retrier(3, Recorder());
    CancellationToken token;
    token.Cancel();
    int calls = 0;

    EXPECT_THROW(retrier.Execute(token, [&calls](int /*attempt*/) { calls++; }), CancelledException);

    EXPECT_EQ(calls, 0);
    EXPECT_TRUE(failures_.empty());
}

TEST_F(RetrierTest, CancelledFromObserver) {
    CancellationToken token;
    int observed = 0;
    int64_t sum_delay_ms = 0;
    Retrier retrier(
        3,
        [&](const std::exception_ptr& /*error*/, int attempt, bool /*will_retry*/, std::chrono::milliseconds delay) {
            observed++;
            sum_delay_ms += delay.count();
            if (attempt > 2) {
                token.Cancel();
            }
        });
    retrier.SetFixedBackoff(500);

    EXPECT_THROW(retrier.Execute(token, &RetrierTest::FailThreeTimes), CancelledException);

    EXPECT_EQ(observed, 3);
    EXPECT_EQ(sum_delay_ms, 1500);
}

TEST_F(RetrierTest, CancelledInsideOperation) {
    Retrier retrier(3, Recorder());
    retrier.SetFixedBackoff(500);
    CancellationToken token;

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(
        retrier.Execute(
            token,
            [&token](int attempt) {
                if (attempt == 1) {
                    token.Cancel();
                    throw TestException("cancel and fail");
                }
            }),
        CancelledException);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    ASSERT_EQ(failures_.size(), 1);
    EXPECT_TRUE(failures_[0].will_retry);
    EXPECT_EQ(SumDelayMs(), 500);
    EXPECT_LT(elapsed.count(), 500);
}

TEST_F(RetrierTest, CancelPreemptsWait) {
    Retrier retrier(kUnlimitedRetries, Recorder());
    retrier.SetFixedBackoff(10000);
    CancellationToken token;
    std::atomic<int> calls{0};

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.Cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(
        retrier.Execute(
            token,
            [&calls](int /*attempt*/) {
                calls++;
                throw TestException("always");
            }),
        CancelledException);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    canceller.join();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(failures_.size(), 1);
    EXPECT_LT(elapsed.count(), 5000);
}

TEST_F(RetrierTest, DeadlineExceededDuringWait) {
    Retrier retrier(kUnlimitedRetries, Recorder());
    retrier.SetFixedBackoff(10000);
    CancellationToken token(std::chrono::milliseconds(100));

    EXPECT_THROW(
        retrier.Execute(token, [](int /*attempt*/) { throw TestException("always"); }), DeadlineExceededException);

    EXPECT_EQ(failures_.size(), 1);
    EXPECT_EQ(token.GetReason(), CancelReason::DEADLINE_EXCEEDED);
}

TEST_F(RetrierTest, EnormousDeadlineStillRunsOperation) {
    Retrier retrier(3, Recorder());
    retrier.SetFixedBackoff(1);
    CancellationToken token(std::chrono::milliseconds(std::numeric_limits<int64_t>::max() / 2));

    EXPECT_NO_THROW(retrier.Execute(token, &RetrierTest::FailThreeTimes));
    EXPECT_EQ(failures_.size(), 3);
}

TEST_F(RetrierTest, UnlimitedRetriesUntilSuccess) {
    Retrier retrier(kUnlimitedRetries, Recorder());
    retrier.SetFixedBackoff(1);

    EXPECT_NO_THROW(retrier.Execute([](int attempt) {
        if (attempt < 20) {
            throw TestException("not yet");
        }
    }));

    EXPECT_EQ(failures_.size(), 19);
    for (const auto& failure : failures_) {
        EXPECT_TRUE(failure.will_retry);
    }
}

TEST_F(RetrierTest, NonRetryableStopsImmediately) {
    Retrier retrier(5, Recorder());
    retrier.SetFixedBackoff(1);
    int calls = 0;

    EXPECT_THROW(
        retrier.Execute([&calls](int /*attempt*/) {
            calls++;
            throw NonRetryableException("fatal");
        }),
        NonRetryableException);

    EXPECT_EQ(calls, 1);
    ASSERT_EQ(failures_.size(), 1);
    EXPECT_FALSE(failures_[0].will_retry);
    EXPECT_EQ(failures_[0].delay, std::chrono::milliseconds(0));
}

TEST_F(RetrierTest, MissingObserverDoesNotCrash) {
    Retrier retrier(2);
    retrier.SetFixedBackoff(1);

    EXPECT_THROW(retrier.Execute([](int /*attempt*/) { throw TestException("always"); }), TestException);
    EXPECT_NO_THROW(retrier.Execute(&RetrierTest::FailThreeTimes));
}

TEST_F(RetrierTest, FailureIsPassedThroughUnchanged) {
    Retrier retrier(1, [](const std::exception_ptr& error, int attempt, bool, std::chrono::milliseconds) {
        try {
            std::rethrow_exception(error);
        } catch (const TestException& e) {
            EXPECT_EQ(std::string(e.what()), "attempt " + std::to_string(attempt));
        }
    });
    retrier.SetFixedBackoff(1);

    EXPECT_THROW(retrier.Execute(&RetrierTest::FailThreeTimes), TestException);
}

TEST_F(RetrierTest, CallableReturnsValue) {
    Retrier retrier(3, Recorder());
    retrier.SetFixedBackoff(1);

    int result = 0;
    EXPECT_NO_THROW({
        result = retrier.Execute<int>([](int attempt) -> int {
            if (attempt < 3) {
                throw TestException("test error");
            }
            return 42;
        });
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(failures_.size(), 2);
}

TEST_F(RetrierTest, CallableWithToken) {
    Retrier retrier(1);
    CancellationToken token;
    token.Cancel();

    EXPECT_THROW(retrier.Execute<std::string>(token, [](int) { return std::string("never"); }), CancelledException);
}

TEST_F(RetrierTest, CustomBackoffPolicy) {
    Retrier retrier(3, Recorder());
    retrier.SetBackoffPolicy(std::make_shared<FunctionBackoffPolicy>(
        [](int attempt) { return std::chrono::milliseconds(attempt * 10); }));

    EXPECT_NO_THROW(retrier.Execute(&RetrierTest::FailThreeTimes));

    ASSERT_EQ(failures_.size(), 3);
    EXPECT_EQ(failures_[0].delay, std::chrono::milliseconds(10));
    EXPECT_EQ(failures_[1].delay, std::chrono::milliseconds(20));
    EXPECT_EQ(failures_[2].delay, std::chrono::milliseconds(30));
}

TEST_F(RetrierTest, PolicyOnlySeesAttemptsFromOne) {
    std::vector<int> consulted;
    Retrier retrier(kUnlimitedRetries, Recorder());
    retrier.SetBackoffPolicy(std::make_shared<FunctionBackoffPolicy>([&consulted](int attempt) {
        consulted.push_back(attempt);
        return std::chrono::milliseconds(0);
    }));

    EXPECT_NO_THROW(retrier.Execute(&RetrierTest::FailThreeTimes));
    EXPECT_EQ(consulted, (std::vector<int>{1, 2, 3}));

    consulted.clear();
    failures_.clear();
    retrier.SetMaxRetries(1);
    EXPECT_THROW(retrier.Execute([](int) { throw TestException("fail"); }), TestException);
    // the give-up attempt never reaches the policy
    EXPECT_EQ(consulted, (std::vector<int>{1}));
    EXPECT_EQ(failures_.size(), 2);
}

TEST_F(RetrierTest, NegativeDelayFromCustomPolicy) {
    Retrier retrier(3, Recorder());
    retrier.SetBackoffPolicy(
        std::make_shared<FunctionBackoffPolicy>([](int) { return std::chrono::milliseconds(-1); }));

    EXPECT_THROW(retrier.Execute([](int) { throw TestException("fail"); }), std::logic_error);
    EXPECT_TRUE(failures_.empty());
}

TEST_F(RetrierTest, InvalidArguments) {
    Retrier retrier(3);
    EXPECT_THROW(retrier.SetBackoffPolicy(nullptr), std::invalid_argument);
    EXPECT_THROW(retrier.SetFixedBackoff(-1), std::invalid_argument);
    EXPECT_THROW(retrier.SetExponentialBackoff(100, 1000, 0.5), std::invalid_argument);
    EXPECT_THROW(retrier.Execute(RetryableOperation()), std::invalid_argument);
}

TEST_F(RetrierTest, ReconfigureBetweenExecutions) {
    Retrier retrier(1, Recorder());
    retrier.SetFixedBackoff(5);
    EXPECT_THROW(retrier.Execute([](int) { throw TestException("fail"); }), TestException);
    ASSERT_EQ(failures_.size(), 2);
    EXPECT_EQ(failures_[0].delay, std::chrono::milliseconds(5));

    retrier.SetFixedBackoff(7);
    EXPECT_EQ(failures_[0].delay, std::chrono::milliseconds(5));

    failures_.clear();
    EXPECT_THROW(retrier.Execute([](int) { throw TestException("fail"); }), TestException);
    ASSERT_EQ(failures_.size(), 2);
    EXPECT_EQ(failures_[0].delay, std::chrono::milliseconds(7));
}

TEST_F(RetrierTest, ObserverExceptionPropagates) {
    Retrier retrier(3, [](const std::exception_ptr&, int, bool, std::chrono::milliseconds) {
        throw std::runtime_error("observer failed");
    });
    int calls = 0;

    EXPECT_THROW(
        retrier.Execute([&calls](int) {
            calls++;
            throw TestException("fail");
        }),
        std::runtime_error);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetrierTest, ConcurrentExecutionsAreIndependent) {
    Retrier retrier(3);
    retrier.SetFixedBackoff(5);
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&retrier, &successes]() {
            int calls = 0;
            retrier.Execute([&calls](int attempt) {
                calls++;
                EXPECT_EQ(attempt, calls);
                if (attempt < 3) {
                    throw TestException("not yet");
                }
            });
            successes++;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successes.load(), 4);
}

} // namespace retrier
