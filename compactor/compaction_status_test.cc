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

#include "compaction_status.h"

#include <folly/portability/GTest.h>

#include <atomic>
#include <string>
#include <thread>

using namespace relay;
using relay::compaction::CompactionStatus;

TEST(CompactionStatusTest, InitialState) {
    CompactionStatus status;
    const auto state = status.getState();
    EXPECT_EQ(AccountId(0), state.account);
    EXPECT_EQ("unknown", state.did);
    EXPECT_EQ(CompactionStage::unknown, state.stage);
    EXPECT_FALSE(state.stats.has_value());
}

TEST(CompactionStatusTest, SetStateOverwrites) {
    CompactionStatus status;
    CompactionStats stats;
    stats.totalRefs = 10;
    stats.newShards = 1;
    status.setState(AccountId(1), "did:plc:one", CompactionStage::done, stats);
    status.setState(AccountId(2), "unknown", CompactionStage::getting_user);

    const auto state = status.getState();
    EXPECT_EQ(AccountId(2), state.account);
    EXPECT_EQ("unknown", state.did);
    EXPECT_EQ(CompactionStage::getting_user, state.stage);
    // The stats from the previous item must not leak into the new state
    EXPECT_FALSE(state.stats.has_value());
}

TEST(CompactionStatusTest, ReturnsACopy) {
    CompactionStatus status;
    status.setState(AccountId(1), "did:plc:one", CompactionStage::compacting);

    auto state = status.getState();
    state.account = AccountId(99);
    state.did = "did:plc:changed";
    state.stage = CompactionStage::failed_compacting;
    state.stats = CompactionStats{};

    const auto actual = status.getState();
    EXPECT_EQ(AccountId(1), actual.account);
    EXPECT_EQ("did:plc:one", actual.did);
    EXPECT_EQ(CompactionStage::compacting, actual.stage);
    EXPECT_FALSE(actual.stats.has_value());
}

/// A reader must never see a mix of two updates
TEST(CompactionStatusTest, ReadersSeeConsistentState) {
    CompactionStatus status;
    std::atomic<bool> done{false};

    std::thread writer{[&status, &done]() {
        for (int ii = 0; ii < 10000; ++ii) {
            if (ii % 2 == 0) {
                status.setState(AccountId(1),
                                "did:plc:one",
                                CompactionStage::compacting);
            } else {
                CompactionStats stats;
                stats.totalRefs = 2;
                status.setState(AccountId(2),
                                "did:plc:two",
                                CompactionStage::done,
                                stats);
            }
        }
        done = true;
    }};

    while (!done) {
        const auto state = status.getState();
        if (state.account == AccountId(1)) {
            EXPECT_EQ("did:plc:one", state.did);
            EXPECT_EQ(CompactionStage::compacting, state.stage);
            EXPECT_FALSE(state.stats.has_value());
        } else if (state.account == AccountId(2)) {
            EXPECT_EQ("did:plc:two", state.did);
            EXPECT_EQ(CompactionStage::done, state.stage);
            ASSERT_TRUE(state.stats.has_value());
            EXPECT_EQ(2, state.stats->totalRefs);
        }
    }
    writer.join();
}
