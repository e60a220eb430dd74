/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2025-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#include "batch_compaction.h"
#include "compaction_mocks.h"

#include <folly/portability/GTest.h>

#include <sstream>
#include <stdexcept>

using namespace relay;
using namespace relay::compaction;
using namespace relay::compaction::test;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class BatchCompactionTest : public ::testing::Test {
protected:
    BatchCompactionDriver createDriver() {
        return BatchCompactionDriver(
                store, metrics, createStreamLogger(log), config);
    }

    CompactorConfig config;
    ::testing::StrictMock<MockShardStore> store;
    NiceMock<MockCompactionMetrics> metrics;
    std::stringstream log;
};

TEST_F(BatchCompactionTest, NullLogger) {
    EXPECT_THROW(BatchCompactionDriver(store, metrics, nullptr),
                 std::invalid_argument);
}

TEST_F(BatchCompactionTest, DryRun) {
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(5)));
    EXPECT_CALL(store, compactAccountShards(_, _, _)).Times(0);
    EXPECT_CALL(metrics, observeCompactionDuration(_)).Times(0);

    auto driver = createDriver();
    const auto result = driver.run(0, true, false, folly::CancellationToken{});
    EXPECT_EQ(createTargets(5), result.targets);
    EXPECT_TRUE(result.completed.empty());
}

TEST_F(BatchCompactionTest, CompactAll) {
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(3)));
    {
        InSequence s;
        for (uint64_t uid = 1; uid <= 3; ++uid) {
            EXPECT_CALL(store, compactAccountShards(AccountId(uid), true, _))
                    .WillOnce(Return(createStats(uid)));
        }
    }
    EXPECT_CALL(metrics, observeCompactionDuration(_)).Times(3);

    auto driver = createDriver();
    const auto result = driver.run(0, false, true, folly::CancellationToken{});
    EXPECT_EQ(createTargets(3), result.targets);
    ASSERT_EQ(3, result.completed.size());
    for (uint64_t uid = 1; uid <= 3; ++uid) {
        EXPECT_EQ(createStats(uid), result.completed.at(AccountId(uid)));
    }
    EXPECT_EQ(1, countOccurrences(log.str(), "info Batch compaction finished"))
            << log.str();
}

/// A failing account is logged and skipped
TEST_F(BatchCompactionTest, PartialFailure) {
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(3)));
    EXPECT_CALL(store, compactAccountShards(AccountId(1), false, _))
            .WillOnce(Return(createStats(1)));
    EXPECT_CALL(store, compactAccountShards(AccountId(2), false, _))
            .WillOnce(Throw(std::runtime_error("corrupt shard")));
    EXPECT_CALL(store, compactAccountShards(AccountId(3), false, _))
            .WillOnce(Return(createStats(3)));
    EXPECT_CALL(metrics, observeCompactionDuration(_)).Times(2);

    auto driver = createDriver();
    const auto result = driver.run(0, false, false, folly::CancellationToken{});
    EXPECT_EQ(3, result.targets.size());
    ASSERT_EQ(2, result.completed.size());
    EXPECT_EQ(1, result.completed.count(AccountId(1)));
    EXPECT_EQ(0, result.completed.count(AccountId(2)));
    EXPECT_EQ(1, result.completed.count(AccountId(3)));

    const auto output = log.str();
    EXPECT_EQ(1,
              countOccurrences(output,
                               R"(error Failed to compact repo {"source":)"
                               R"("batch_compaction","uid":2)"))
            << output;
    EXPECT_EQ(1, countOccurrences(output, "corrupt shard")) << output;
}

/// Cancelling the token stops the batch before the next account, and the
/// result gathered so far is returned
TEST_F(BatchCompactionTest, Cancellation) {
    folly::CancellationSource source;
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(3)));
    EXPECT_CALL(store, compactAccountShards(AccountId(1), false, _))
            .WillOnce(Invoke([&source](AccountId id,
                                       bool,
                                       folly::CancellationToken) {
                source.requestCancellation();
                return createStats(id.get());
            }));

    auto driver = createDriver();
    const auto result = driver.run(0, false, false, source.getToken());
    EXPECT_EQ(createTargets(3), result.targets);
    ASSERT_EQ(1, result.completed.size());
    EXPECT_EQ(createStats(1), result.completed.at(AccountId(1)));
    EXPECT_EQ(1, countOccurrences(log.str(), "Batch compaction cancelled"))
            << log.str();
}

/// Cancelling the batch lets the compaction in progress finish
TEST_F(BatchCompactionTest, CancellationDuringCompaction) {
    folly::CancellationSource source;
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(3)));
    {
        InSequence s;
        EXPECT_CALL(store, compactAccountShards(AccountId(1), false, _))
                .WillOnce(Return(createStats(1)));
        EXPECT_CALL(store, compactAccountShards(AccountId(2), false, _))
                .WillOnce(Invoke([&source](AccountId id,
                                           bool,
                                           folly::CancellationToken token) {
                    source.requestCancellation();
                    EXPECT_FALSE(token.isCancellationRequested());
                    if (token.isCancellationRequested()) {
                        throw std::runtime_error("compaction interrupted");
                    }
                    return createStats(id.get());
                }));
    }

    auto driver = createDriver();
    const auto result = driver.run(0, false, false, source.getToken());
    EXPECT_EQ(createTargets(3), result.targets);
    ASSERT_EQ(2, result.completed.size());
    EXPECT_EQ(createStats(1), result.completed.at(AccountId(1)));
    EXPECT_EQ(createStats(2), result.completed.at(AccountId(2)));

    const auto output = log.str();
    EXPECT_EQ(0, countOccurrences(output, "Failed to compact repo")) << output;
    EXPECT_EQ(1, countOccurrences(output, "Batch compaction cancelled"))
            << output;
}

TEST_F(BatchCompactionTest, Tracing) {
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(2)));

    auto driver = createDriver();
    startTracing();
    driver.run(0, true, false, folly::CancellationToken{});
    const auto trace = stopTracing();

    EXPECT_EQ(1, countOccurrences(trace, R"("name":"runBatchCompaction")"))
            << trace;
}

TEST_F(BatchCompactionTest, Limit) {
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(10)));
    EXPECT_CALL(store, compactAccountShards(_, false, _))
            .Times(4)
            .WillRepeatedly(Return(createStats(0)));

    auto driver = createDriver();
    const auto result = driver.run(4, false, false, folly::CancellationToken{});
    EXPECT_EQ(createTargets(4), result.targets);
    EXPECT_EQ(4, result.completed.size());
}

TEST_F(BatchCompactionTest, ConfiguredThreshold) {
    config.batchShardCountThreshold = 7;
    EXPECT_CALL(store, getCompactionTargets(7, _))
            .WillOnce(Return(std::vector<CompactionTarget>{}));

    auto driver = createDriver();
    const auto result = driver.run(0, false, false, folly::CancellationToken{});
    EXPECT_TRUE(result.targets.empty());
    EXPECT_TRUE(result.completed.empty());
}

TEST_F(BatchCompactionTest, ListingFailure) {
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Throw(std::runtime_error("db down")));

    auto driver = createDriver();
    try {
        driver.run(0, false, false, folly::CancellationToken{});
        FAIL() << "run should throw when the candidates can't be listed";
    } catch (const compaction_error& e) {
        EXPECT_EQ(compaction_errc::candidate_listing_failed,
                  e.compaction_code());
    }
}

/// Progress is logged after the first item and then every
/// progressLogInterval items
TEST_F(BatchCompactionTest, ProgressLogging) {
    config.progressLogInterval = 2;
    EXPECT_CALL(store, getCompactionTargets(50, _))
            .WillOnce(Return(createTargets(5)));
    EXPECT_CALL(store, compactAccountShards(_, false, _))
            .Times(5)
            .WillRepeatedly(Return(createStats(0)));

    auto driver = createDriver();
    driver.run(0, false, false, folly::CancellationToken{});

    const auto output = log.str();
    EXPECT_EQ(3, countOccurrences(output, "info Batch compaction progress"))
            << output;
    EXPECT_EQ(1, countOccurrences(output, R"("processed":1,)")) << output;
    EXPECT_EQ(1, countOccurrences(output, R"("processed":3,)")) << output;
    EXPECT_EQ(1, countOccurrences(output, R"("processed":5,)")) << output;
}
