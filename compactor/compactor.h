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

#include "compaction_status.h"
#include "compactor_config.h"
#include "dedup_queue.h"

#include <relay/compaction_iface.h>

#include <folly/CancellationToken.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace relay::logger {
class Logger;
class PrefixLogger;
} // namespace relay::logger

namespace relay::compaction {

/**
 * The Compactor owns the queue of accounts waiting to get their shards
 * compacted, and a worker loop which processes the queue one account at
 * a time.
 *
 * Each item moves through the following stages (see CompactionStage):
 *
 *     getting_user -> compacting -> done
 *
 * where a failure in the lookup or the compaction terminates the item
 * (failed_getting_user / failed_compacting). Failed items are not
 * re-queued.
 *
 * The worker loop may either run on a thread owned by the Compactor
 * (start() / stop()), or on the callers thread (run()). In the latter case
 * stop() must be called from another thread to make run() return.
 */
class Compactor {
public:
    /**
     * Create a new Compactor
     *
     * @param directory used to resolve the accounts (must outlive the
     *                  Compactor)
     * @param store the store holding the shards (must outlive the Compactor)
     * @param metrics receives the compaction durations (must outlive the
     *                Compactor)
     * @param logger where to send the log messages
     * @param config the tunables to use
     * @throws std::invalid_argument if logger is null
     */
    Compactor(AccountDirectoryIface& directory,
              ShardStoreIface& store,
              CompactionMetricsIface& metrics,
              std::shared_ptr<logger::Logger> logger,
              CompactorConfig config = {});

    Compactor(const Compactor&) = delete;
    Compactor& operator=(const Compactor&) = delete;

    /// Stops the worker thread (if running)
    ~Compactor();

    /**
     * Pop the next item from the queue and compact it.
     *
     * @param cancellationToken passed on to the collaborators
     * @return the state of the item after it was compacted
     * @throws compaction_error(no_work_available) if the queue is empty
     * @throws compaction_error(account_lookup_failed) if the account could
     *         not be resolved
     * @throws compaction_error(compaction_failed) if the store failed to
     *         compact the shards
     */
    CompactionState compactNext(folly::CancellationToken cancellationToken);

    /**
     * Run the worker loop on the calling thread until stop() is called.
     * Per item failures are logged and never terminate the loop.
     *
     * @throws std::logic_error if the worker loop is already running (on
     *         the thread created by start() or in another call to run())
     */
    void run();

    /**
     * Start a thread running the worker loop
     *
     * @throws std::logic_error if the worker was started (or stopped) before
     *         or run() is active
     */
    void start();

    /**
     * Tell the worker loop to stop, cancel the operations in flight and
     * wait for the worker thread (if started) to terminate. May be called
     * multiple times, but not from the worker loop itself.
     */
    void stop();

    /// Add the account to the tail of the queue (unless already queued)
    void enqueueRepo(const Account& account, bool fast);

    /**
     * Add all accounts with at least shardCount shards to the queue
     *
     * @param limit the maximum number of accounts to add (0 = no limit)
     * @param shardCount the shard threshold to use (0 = the configured
     *                   defaultShardCountThreshold)
     * @param fast the fast flag for the new items
     * @param cancellationToken passed on to the store
     * @throws compaction_error(candidate_listing_failed) if the store failed
     *         to list the candidates
     */
    void enqueueAllRepos(size_t limit,
                         size_t shardCount,
                         bool fast,
                         folly::CancellationToken cancellationToken);

    bool isQueued(AccountId account) const {
        return queue.contains(account);
    }

    /// Remove the account from the queue (if queued)
    void dequeueRepo(AccountId account);

    size_t getQueueDepth() const {
        return queue.size();
    }

    /// Get a copy of the current compaction state
    CompactionState getState() const {
        return status.getState();
    }

    const CompactorConfig& getConfig() const {
        return config;
    }

    bool isStopRequested() const;

protected:
    /// The worker loop, entered with running set
    void runLoop();

    /**
     * Update the status and log the transition
     *
     * @param start when the work on the item started
     */
    void setState(std::chrono::steady_clock::time_point start,
                  AccountId account,
                  std::string did,
                  CompactionStage stage,
                  std::optional<CompactionStats> stats = {});

    /**
     * Wait for the provided duration or until stop() is called
     *
     * @return true if stop was requested
     */
    bool waitForStop(std::chrono::milliseconds timeout);

    AccountDirectoryIface& directory;
    ShardStoreIface& store;
    CompactionMetricsIface& metrics;
    std::shared_ptr<logger::PrefixLogger> logger;
    const CompactorConfig config;

    DedupQueue queue;
    CompactionStatus status;

    /// Cancelled by stop() to abort the collaborator calls in flight
    folly::CancellationSource cancellationSource;

    mutable std::mutex mutex;
    /// Notified by stop() to wake up the worker loop
    std::condition_variable stopCv;
    bool stopRequested = false;
    bool started = false;
    /// Set while a thread is inside the worker loop
    bool running = false;
    std::thread worker;
};

} // namespace relay::compaction
