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

#include "compactor_config.h"

#include <folly/portability/GTest.h>
#include <nlohmann/json.hpp>

using relay::compaction::CompactorConfig;
using namespace std::chrono_literals;

/// Allow an "empty" JSON blob -> all default values
TEST(CompactorConfigTest, AllDefault) {
    const auto config = nlohmann::json::parse("{}").get<CompactorConfig>();
    EXPECT_EQ(5000ms, config.emptyQueueBackoff);
    EXPECT_EQ(100ms, config.errorBackoff);
    EXPECT_EQ(50, config.defaultShardCountThreshold);
    EXPECT_EQ(50, config.batchShardCountThreshold);
    EXPECT_EQ(100, config.progressLogInterval);
    EXPECT_EQ(CompactorConfig{}, config);
}

TEST(CompactorConfigTest, ToFromJson) {
    CompactorConfig config;
    config.emptyQueueBackoff = 1000ms;
    config.errorBackoff = 0ms;
    config.defaultShardCountThreshold = 20;
    config.batchShardCountThreshold = 30;
    config.progressLogInterval = 5;

    const nlohmann::json json = config;
    EXPECT_EQ(1000, json["empty_queue_backoff_ms"].get<int>());
    EXPECT_EQ(0, json["error_backoff_ms"].get<int>());
    EXPECT_EQ(20, json["default_shard_count_threshold"].get<int>());
    EXPECT_EQ(30, json["batch_shard_count_threshold"].get<int>());
    EXPECT_EQ(5, json["progress_log_interval"].get<int>());
    EXPECT_EQ(config, json.get<CompactorConfig>());
}

TEST(CompactorConfigTest, PartialConfig) {
    const auto config =
            CompactorConfig(nlohmann::json{{"error_backoff_ms", 250}});
    EXPECT_EQ(250ms, config.errorBackoff);
    EXPECT_EQ(5000ms, config.emptyQueueBackoff);
    EXPECT_EQ(50, config.defaultShardCountThreshold);
}

TEST(CompactorConfigTest, NegativeBackoff) {
    EXPECT_THROW(
            CompactorConfig(nlohmann::json{{"empty_queue_backoff_ms", -1}}),
            std::invalid_argument);
    EXPECT_THROW(CompactorConfig(nlohmann::json{{"error_backoff_ms", -100}}),
                 std::invalid_argument);
}

TEST(CompactorConfigTest, ZeroThreshold) {
    using nlohmann::json;
    EXPECT_THROW(CompactorConfig(json{{"default_shard_count_threshold", 0}}),
                 std::invalid_argument);
    EXPECT_THROW(CompactorConfig(json{{"batch_shard_count_threshold", -5}}),
                 std::invalid_argument);
    EXPECT_THROW(CompactorConfig(nlohmann::json{{"progress_log_interval", 0}}),
                 std::invalid_argument);
}

TEST(CompactorConfigTest, InvalidType) {
    EXPECT_THROW(CompactorConfig(nlohmann::json{{"error_backoff_ms", "100ms"}}),
                 nlohmann::json::type_error);
}
