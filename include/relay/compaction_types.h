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

#include <relay/account_id.h>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relay {

/**
 * The stages an account passes through while the compactor works on it.
 *
 *   unknown -> getting_user -> failed_getting_user
 *                           -> compacting -> failed_compacting
 *                                         -> done
 *
 * failed_getting_user, failed_compacting and done are terminal for the item.
 */
enum class CompactionStage {
    /// Nothing has been attempted yet
    unknown,
    /// Resolving the account in the directory
    getting_user,
    /// The directory lookup failed
    failed_getting_user,
    /// The shard store is compacting the shards of the account
    compacting,
    /// The shard store failed to compact the account
    failed_compacting,
    /// The account was compacted
    done
};

std::string to_string(CompactionStage stage);
std::ostream& operator<<(std::ostream& os, CompactionStage stage);
void to_json(nlohmann::json& json, CompactionStage stage);

/**
 * Statistics returned from the shard store after compacting the shards
 * belonging to a single account. The compactor never interprets the
 * values, it only passes them on to the log and the admin interface.
 */
struct CompactionStats {
    /// Number of block references inspected
    uint64_t totalRefs = 0;
    /// Number of shards before compaction
    uint64_t startShards = 0;
    /// Number of shards written by the compaction
    uint64_t newShards = 0;
    /// Number of (large) shards left alone by a "fast" compaction
    uint64_t skippedShards = 0;
    /// Number of shards removed once the new ones were written
    uint64_t shardsDeleted = 0;
    /// Number of duplicate blocks dropped
    uint64_t dupeCount = 0;

    bool operator==(const CompactionStats& other) const;
    bool operator!=(const CompactionStats& other) const {
        return !(*this == other);
    }
};

void to_json(nlohmann::json& json, const CompactionStats& stats);
void to_json(nlohmann::ordered_json& json, const CompactionStats& stats);

/**
 * An account the shard store considers eligible for compaction
 */
struct CompactionTarget {
    AccountId account;
    /// The number of shards the account currently has
    uint64_t numShards = 0;

    bool operator==(const CompactionTarget& other) const {
        return account == other.account && numShards == other.numShards;
    }
};

void to_json(nlohmann::json& json, const CompactionTarget& target);

/**
 * Snapshot of what the compactor is doing (or did last)
 */
struct CompactionState {
    /// The placeholder used for the DID until the account is resolved
    static constexpr std::string_view UnknownDid = "unknown";

    AccountId account;
    std::string did{UnknownDid};
    CompactionStage stage = CompactionStage::unknown;
    std::optional<CompactionStats> stats;
};

void to_json(nlohmann::json& json, const CompactionState& state);

/**
 * The outcome of a batch compaction run. targets contains every candidate
 * selected for the run (after the limit was applied), completed the stats
 * for each of the accounts which was successfully compacted.
 */
struct BatchResult {
    std::vector<CompactionTarget> targets;
    std::unordered_map<AccountId, CompactionStats> completed;
};

void to_json(nlohmann::json& json, const BatchResult& result);

} // namespace relay
