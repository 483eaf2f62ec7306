// tests/retry_policy_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <vector>

#include "errors.hpp"
#include "retry_policy.hpp"

using namespace ChannelStore;
using ChannelStore::Transfer::RetryPolicy;
using ChannelStore::Transfer::runWithRetry;
using std::chrono::milliseconds;

namespace {

struct RecordingPolicy {
    std::vector<milliseconds> waits;
    RetryPolicy policy;

    RecordingPolicy() {
        policy.sleep = [this](milliseconds d) { waits.push_back(d); };
    }
};

} // namespace

TEST(RetryPolicyTest, BackoffDoublesUpToTheCap) {
    RetryPolicy policy;
    policy.base_delay = milliseconds(100);
    policy.max_delay = milliseconds(1000);
    EXPECT_EQ(policy.backoffFor(1), milliseconds(100));
    EXPECT_EQ(policy.backoffFor(2), milliseconds(200));
    EXPECT_EQ(policy.backoffFor(3), milliseconds(400));
    EXPECT_EQ(policy.backoffFor(4), milliseconds(800));
    EXPECT_EQ(policy.backoffFor(5), milliseconds(1000));
    EXPECT_EQ(policy.backoffFor(60), milliseconds(1000));
}

TEST(RetryPolicyTest, SucceedsAfterTransientFailures) {
    RecordingPolicy rec;
    rec.policy.base_delay = milliseconds(10);
    int calls = 0;
    int result = runWithRetry(rec.policy, ErrorKind::UploadFailed, "test", nullptr, [&]() {
        if (++calls < 3) throw TransportError("flaky");
        return 7;
    });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(rec.waits, (std::vector<milliseconds>{milliseconds(10), milliseconds(20)}));
}

TEST(RetryPolicyTest, GivesUpAfterMaxAttempts) {
    RecordingPolicy rec;
    rec.policy.max_attempts = 3;
    int calls = 0;
    try {
        runWithRetry(rec.policy, ErrorKind::DownloadFailed, "test", nullptr, [&]() -> int {
            ++calls;
            throw TransportError("down");
        });
        FAIL() << "expected TransferFailed";
    } catch (const TransferFailed& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadFailed);
        EXPECT_EQ(e.attempts(), 3);
    }
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(rec.waits.size(), 2u);
}

TEST(RetryPolicyTest, RateLimitWaitsTheSignalledDelay) {
    RecordingPolicy rec;
    int calls = 0;
    runWithRetry(rec.policy, ErrorKind::UploadFailed, "test", nullptr, [&]() {
        if (++calls <= 2) throw RateLimited(milliseconds(1234), "slow down");
        return 0;
    });
    EXPECT_EQ(rec.waits, (std::vector<milliseconds>{milliseconds(1234), milliseconds(1234)}));
}

TEST(RetryPolicyTest, RateLimitHasItsOwnBudget) {
    RecordingPolicy rec;
    rec.policy.max_attempts = 1;
    rec.policy.max_rate_limit_retries = 2;
    int calls = 0;
    EXPECT_THROW(runWithRetry(rec.policy, ErrorKind::UploadFailed, "test", nullptr, [&]() -> int {
                     ++calls;
                     throw RateLimited(milliseconds(1), "slow down");
                 }),
                 TransferFailed);
    // Two retries allowed, the third rate limit gives up
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, OtherErrorsAreNotRetried) {
    RecordingPolicy rec;
    int calls = 0;
    EXPECT_THROW(runWithRetry(rec.policy, ErrorKind::UploadFailed, "test", nullptr, [&]() -> int {
                     ++calls;
                     throw PayloadTooLarge("too big");
                 }),
                 PayloadTooLarge);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(rec.waits.empty());
}

TEST(RetryPolicyTest, StopCheckCancelsBeforeTheNextAttempt) {
    RecordingPolicy rec;
    std::atomic<bool> stop(false);
    int calls = 0;
    EXPECT_THROW(runWithRetry(rec.policy, ErrorKind::UploadFailed, "test",
                              [&stop]() { return stop.load(); },
                              [&]() -> int {
                                  ++calls;
                                  stop = true;
                                  throw TransportError("flaky");
                              }),
                 Cancelled);
    EXPECT_EQ(calls, 1);
}
