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

#include <relay/compaction_types.h>

#include <nlohmann/json.hpp>
#include <ostream>
#include <stdexcept>

namespace relay {

std::string to_string(CompactionStage stage) {
    switch (stage) {
    case CompactionStage::unknown:
        return "unknown";
    case CompactionStage::getting_user:
        return "getting_user";
    case CompactionStage::failed_getting_user:
        return "failed_getting_user";
    case CompactionStage::compacting:
        return "compacting";
    case CompactionStage::failed_compacting:
        return "failed_compacting";
    case CompactionStage::done:
        return "done";
    }
    throw std::invalid_argument(
            "to_string(CompactionStage): Invalid stage: " +
            std::to_string(int(stage)));
}

std::ostream& operator<<(std::ostream& os, CompactionStage stage) {
    return os << to_string(stage);
}

void to_json(nlohmann::json& json, CompactionStage stage) {
    json = to_string(stage);
}

bool CompactionStats::operator==(const CompactionStats& other) const {
    return totalRefs == other.totalRefs && startShards == other.startShards &&
           newShards == other.newShards &&
           skippedShards == other.skippedShards &&
           shardsDeleted == other.shardsDeleted &&
           dupeCount == other.dupeCount;
}

template <typename JsonType>
static void statsToJson(JsonType& json, const CompactionStats& stats) {
    json = {{"total_refs", stats.totalRefs},
            {"start_shards", stats.startShards},
            {"new_shards", stats.newShards},
            {"skipped_shards", stats.skippedShards},
            {"shards_deleted", stats.shardsDeleted},
            {"dupe_count", stats.dupeCount}};
}

void to_json(nlohmann::json& json, const CompactionStats& stats) {
    statsToJson(json, stats);
}

void to_json(nlohmann::ordered_json& json, const CompactionStats& stats) {
    statsToJson(json, stats);
}

void to_json(nlohmann::json& json, const CompactionTarget& target) {
    json = {{"uid", target.account}, {"num_shards", target.numShards}};
}

void to_json(nlohmann::json& json, const CompactionState& state) {
    json = {{"uid", state.account},
            {"did", state.did},
            {"status", state.stage}};
    if (state.stats) {
        json["stats"] = *state.stats;
    } else {
        json["stats"] = nullptr;
    }
}

void to_json(nlohmann::json& json, const BatchResult& result) {
    auto completed = nlohmann::json::object();
    for (const auto& [account, stats] : result.completed) {
        completed[std::to_string(account.get())] = stats;
    }
    json = {{"targets", result.targets}, {"completed", std::move(completed)}};
}

} // namespace relay
