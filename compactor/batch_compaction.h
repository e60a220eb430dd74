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

#include "compactor_config.h"

#include <relay/compaction_iface.h>

#include <folly/CancellationToken.h>

#include <cstddef>
#include <memory>

namespace relay::logger {
class Logger;
class PrefixLogger;
} // namespace relay::logger

namespace relay::compaction {

/**
 * Compacts a batch of accounts synchronously, bypassing the Compactor's
 * queue. Used for administrative (one-off) runs.
 */
class BatchCompactionDriver {
public:
    /**
     * @param store the store holding the shards (must outlive the driver)
     * @param metrics receives the compaction durations (must outlive the
     *                driver)
     * @param logger where to send the log messages
     * @param config the tunables to use (batchShardCountThreshold and
     *               progressLogInterval)
     * @throws std::invalid_argument if logger is null
     */
    BatchCompactionDriver(ShardStoreIface& store,
                          CompactionMetricsIface& metrics,
                          std::shared_ptr<logger::Logger> logger,
                          CompactorConfig config = {});

    ~BatchCompactionDriver();

    /**
     * Compact the accounts with at least batchShardCountThreshold shards,
     * one by one in the order provided by the store.
     *
     * A failure to compact an account is logged and the account is skipped.
     * If the cancellation token is cancelled the run stops before the next
     * account, and the result gathered so far is returned. The compaction
     * in progress is not interrupted.
     *
     * @param limit the maximum number of accounts to compact (0 = no limit)
     * @param dryRun just return the candidates without compacting them
     * @param fast passed on to the store for each account
     * @param cancellationToken checked before each account
     * @return the candidates and the stats of the compacted accounts
     * @throws compaction_error(candidate_listing_failed) if the store failed
     *         to list the candidates
     */
    BatchResult run(size_t limit,
                    bool dryRun,
                    bool fast,
                    folly::CancellationToken cancellationToken);

protected:
    ShardStoreIface& store;
    CompactionMetricsIface& metrics;
    std::shared_ptr<logger::PrefixLogger> logger;
    const CompactorConfig config;
};

} // namespace relay::compaction
