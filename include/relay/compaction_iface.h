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
#include <relay/compaction_types.h>

#include <folly/CancellationToken.h>

#include <chrono>
#include <cstddef>
#include <vector>

namespace relay {

/**
 * The interface to the account directory the compactor use to resolve
 * the numeric account id to the account (and its DID).
 */
class AccountDirectoryIface {
public:
    virtual ~AccountDirectoryIface() = default;

    /**
     * Look up the account with the provided id
     *
     * @param id the account to look up
     * @param cancellationToken cancelled when the caller is shutting down
     * @return the account
     * @throws compaction_error(account_not_found) if the account is unknown
     * @throws std::exception for all other (possibly temporary) failures
     */
    virtual Account lookupAccount(AccountId id,
                                  folly::CancellationToken cancellationToken) = 0;
};

/**
 * The interface to the storage layer keeping the repository shards.
 *
 * The store owns the shard files and serializes access to them. It must
 * tolerate a compaction request for an account which is already being
 * compacted.
 */
class ShardStoreIface {
public:
    virtual ~ShardStoreIface() = default;

    /**
     * Get the accounts with at least the provided number of shards, in the
     * order the store wants them compacted.
     *
     * @throws std::exception if the candidates can't be listed
     */
    virtual std::vector<CompactionTarget> getCompactionTargets(
            size_t shardCountThreshold,
            folly::CancellationToken cancellationToken) = 0;

    /**
     * Merge the shards belonging to the account into fewer shards.
     *
     * @param id the account to compact
     * @param fast skip the large shards to get a quicker, partial pass
     * @return statistics describing the compaction
     * @throws std::exception if the compaction failed
     */
    virtual CompactionStats compactAccountShards(
            AccountId id,
            bool fast,
            folly::CancellationToken cancellationToken) = 0;
};

/// The sink for the metrics produced by the compactor
class CompactionMetricsIface {
public:
    virtual ~CompactionMetricsIface() = default;

    /// Record the wall clock time spent compacting a single account
    virtual void observeCompactionDuration(
            std::chrono::duration<double> duration) = 0;
};

} // namespace relay
