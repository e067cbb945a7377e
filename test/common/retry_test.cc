#include <gtest/gtest.h>
#include "common/retry.h"

#include <stdexcept>

using namespace Chronicle;

namespace {

RetryPolicy FastPolicy(int attempts) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.wait = std::chrono::milliseconds(0);
    return policy;
}

} // namespace

TEST(RetryTest, ReturnsFirstSuccess) {
    int calls = 0;
    int result = RetryOnConcurrencyError(FastPolicy(5), [&]() {
        ++calls;
        if (calls < 3) {
            throw ConcurrencyError("taken");
        }
        return 42;
    });
    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, RethrowsWhenExhausted) {
    int calls = 0;
    EXPECT_THROW(RetryOnConcurrencyError(FastPolicy(4), [&]() -> int {
                     ++calls;
                     throw ConcurrencyError("taken");
                 }),
                 ConcurrencyError);
    EXPECT_EQ(calls, 4);
}

TEST(RetryTest, OtherErrorsAreNotRetried) {
    int calls = 0;
    EXPECT_THROW(RetryOnConcurrencyError(FastPolicy(10), [&]() -> int {
                     ++calls;
                     throw StorageError("unavailable");
                 }),
                 StorageError);
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, DefaultPolicy) {
    RetryPolicy policy;
    EXPECT_EQ(policy.max_attempts, 50);
    EXPECT_EQ(policy.wait, std::chrono::milliseconds(10));
}
