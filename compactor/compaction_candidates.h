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

#include <relay/compaction_iface.h>

#include <folly/CancellationToken.h>

#include <cstddef>
#include <vector>

namespace relay::compaction {

/**
 * Get the compaction candidates from the shard store.
 *
 * @param store the store to ask
 * @param shardCountThreshold the minimum number of shards for a candidate
 * @param limit if non-zero only the first limit candidates (in the order
 *              returned from the store) are returned
 * @param cancellationToken passed on to the store
 * @throws compaction_error(candidate_listing_failed) if the store failed
 */
std::vector<CompactionTarget> getCompactionCandidates(
        ShardStoreIface& store,
        size_t shardCountThreshold,
        size_t limit,
        folly::CancellationToken cancellationToken);

} // namespace relay::compaction
