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

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace relay::compaction {

static std::chrono::milliseconds getBackoff(const nlohmann::json& json,
                                            const char* key,
                                            std::chrono::milliseconds dflt) {
    const auto iter = json.find(key);
    if (iter == json.end()) {
        return dflt;
    }
    const auto value = iter->get<int64_t>();
    if (value < 0) {
        throw std::invalid_argument(fmt::format(
                R"(CompactorConfig: "{}" must be >= 0 (was {}))", key, value));
    }
    return std::chrono::milliseconds{value};
}

static size_t getPositive(const nlohmann::json& json,
                          const char* key,
                          size_t dflt) {
    const auto iter = json.find(key);
    if (iter == json.end()) {
        return dflt;
    }
    const auto value = iter->get<int64_t>();
    if (value <= 0) {
        throw std::invalid_argument(fmt::format(
                R"(CompactorConfig: "{}" must be > 0 (was {}))", key, value));
    }
    return static_cast<size_t>(value);
}

CompactorConfig::CompactorConfig(const nlohmann::json& json) {
    emptyQueueBackoff =
            getBackoff(json, "empty_queue_backoff_ms", emptyQueueBackoff);
    errorBackoff = getBackoff(json, "error_backoff_ms", errorBackoff);
    defaultShardCountThreshold = getPositive(
            json, "default_shard_count_threshold", defaultShardCountThreshold);
    batchShardCountThreshold = getPositive(
            json, "batch_shard_count_threshold", batchShardCountThreshold);
    progressLogInterval =
            getPositive(json, "progress_log_interval", progressLogInterval);
}

bool CompactorConfig::operator==(const CompactorConfig& other) const {
    return emptyQueueBackoff == other.emptyQueueBackoff &&
           errorBackoff == other.errorBackoff &&
           defaultShardCountThreshold == other.defaultShardCountThreshold &&
           batchShardCountThreshold == other.batchShardCountThreshold &&
           progressLogInterval == other.progressLogInterval;
}

void to_json(nlohmann::json& json, const CompactorConfig& config) {
    json = {{"empty_queue_backoff_ms", config.emptyQueueBackoff.count()},
            {"error_backoff_ms", config.errorBackoff.count()},
            {"default_shard_count_threshold",
             config.defaultShardCountThreshold},
            {"batch_shard_count_threshold", config.batchShardCountThreshold},
            {"progress_log_interval", config.progressLogInterval}};
}

void from_json(const nlohmann::json& json, CompactorConfig& config) {
    config = CompactorConfig(json);
}

} // namespace relay::compaction
