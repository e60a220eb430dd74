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
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>

namespace relay::compaction {

/**
 * The tunables for the Compactor and the BatchCompactionDriver.
 *
 * The JSON representation use the following keys (all optional):
 *
 *     {
 *       "empty_queue_backoff_ms": 5000,
 *       "error_backoff_ms": 100,
 *       "default_shard_count_threshold": 50,
 *       "batch_shard_count_threshold": 50,
 *       "progress_log_interval": 100
 *     }
 */
struct CompactorConfig {
    CompactorConfig() = default;

    /**
     * Parse the configuration from JSON. Missing keys keep their default
     * value.
     *
     * @throws std::invalid_argument for out of range values
     * @throws nlohmann::json::exception for values of the wrong type
     */
    explicit CompactorConfig(const nlohmann::json& json);

    bool operator==(const CompactorConfig& other) const;
    bool operator!=(const CompactorConfig& other) const {
        return !(*this == other);
    }

    /// How long to wait before polling again when the queue is empty
    std::chrono::milliseconds emptyQueueBackoff{5000};
    /// How long to wait after an item failed
    std::chrono::milliseconds errorBackoff{100};
    /// The shard count threshold used by enqueueAllRepos when called with 0
    size_t defaultShardCountThreshold = 50;
    /// The shard count threshold used by the batch driver
    size_t batchShardCountThreshold = 50;
    /// The batch driver logs its progress every n items
    size_t progressLogInterval = 100;
};

void to_json(nlohmann::json& json, const CompactorConfig& config);
void from_json(const nlohmann::json& json, CompactorConfig& config);

} // namespace relay::compaction
