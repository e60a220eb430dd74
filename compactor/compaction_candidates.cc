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

#include "compaction_candidates.h"

#include <fmt/format.h>
#include <relay/compaction_error.h>

namespace relay::compaction {

std::vector<CompactionTarget> getCompactionCandidates(
        ShardStoreIface& store,
        size_t shardCountThreshold,
        size_t limit,
        folly::CancellationToken cancellationToken) {
    std::vector<CompactionTarget> targets;
    try {
        targets = store.getCompactionTargets(shardCountThreshold,
                                             std::move(cancellationToken));
    } catch (const std::exception& e) {
        throw compaction_error(
                compaction_errc::candidate_listing_failed,
                fmt::format("getCompactionCandidates(threshold:{}): {}",
                            shardCountThreshold,
                            e.what()));
    }

    if (limit > 0 && targets.size() > limit) {
        targets.resize(limit);
    }
    return targets;
}

} // namespace relay::compaction
