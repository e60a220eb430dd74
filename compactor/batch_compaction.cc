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

#include "batch_compaction.h"
#include "compaction_candidates.h"

#include "logger/prefix_logger.h"

#include <phosphor/phosphor.h>

#include <chrono>
#include <stdexcept>

namespace relay::compaction {

BatchCompactionDriver::BatchCompactionDriver(
        ShardStoreIface& store,
        CompactionMetricsIface& metrics,
        std::shared_ptr<logger::Logger> baseLogger,
        CompactorConfig config)
    : store(store), metrics(metrics), config(std::move(config)) {
    if (!baseLogger) {
        throw std::invalid_argument(
                "BatchCompactionDriver::BatchCompactionDriver: logger can't "
                "be null");
    }
    logger = std::make_shared<logger::PrefixLogger>("batch_compaction",
                                                    std::move(baseLogger));
    logger->setPrefix({{"source", "batch_compaction"}});
}

BatchCompactionDriver::~BatchCompactionDriver() = default;

BatchResult BatchCompactionDriver::run(
        size_t limit,
        bool dryRun,
        bool fast,
        folly::CancellationToken cancellationToken) {
    TRACE_EVENT2("relay/compactor",
                 "runBatchCompaction",
                 "limit",
                 limit,
                 "dryRun",
                 dryRun);

    BatchResult result;
    result.targets = getCompactionCandidates(
            store, config.batchShardCountThreshold, limit, cancellationToken);

    logger->infoWithContext("Starting batch compaction",
                            {{"lim", limit},
                             {"shardCount", config.batchShardCountThreshold},
                             {"fast", fast},
                             {"dry_run", dryRun},
                             {"candidates", result.targets.size()}});
    if (dryRun) {
        return result;
    }

    const auto batchStart = std::chrono::steady_clock::now();
    size_t failed = 0;
    for (size_t ii = 0; ii < result.targets.size(); ++ii) {
        if (cancellationToken.isCancellationRequested()) {
            logger->warnWithContext("Batch compaction cancelled",
                                    {{"processed", ii},
                                     {"total", result.targets.size()},
                                     {"completed", result.completed.size()}});
            return result;
        }

        const auto& target = result.targets[ii];
        const auto start = std::chrono::steady_clock::now();
        try {
            // A compaction which has started runs to completion, the token
            // only stops the batch between accounts
            auto stats = store.compactAccountShards(
                    target.account, fast, folly::CancellationToken{});
            metrics.observeCompactionDuration(std::chrono::steady_clock::now() -
                                              start);
            result.completed[target.account] = stats;
        } catch (const std::exception& e) {
            ++failed;
            logger->errorWithContext("Failed to compact repo",
                                     {{"uid", target.account.get()},
                                      {"num_shards", target.numShards},
                                      {"error", e.what()}});
        }

        if (ii % config.progressLogInterval == 0) {
            logger->infoWithContext("Batch compaction progress",
                                    {{"processed", ii + 1},
                                     {"total", result.targets.size()},
                                     {"completed", result.completed.size()},
                                     {"failed", failed}});
        }
    }

    const std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - batchStart;
    logger->infoWithContext("Batch compaction finished",
                            {{"total", result.targets.size()},
                             {"completed", result.completed.size()},
                             {"failed", failed},
                             {"duration", elapsed.count()}});
    return result;
}

} // namespace relay::compaction
