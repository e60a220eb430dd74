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

#include "compactor.h"
#include "compaction_candidates.h"

#include "logger/prefix_logger.h"

#include <fmt/format.h>
#include <folly/system/ThreadName.h>
#include <nlohmann/json.hpp>
#include <phosphor/phosphor.h>
#include <relay/compaction_error.h>
#include <stdexcept>

namespace relay::compaction {

using logger::Json;

/// The context logged for an item: who, where it is and how long it took
static Json toContext(const CompactionState& state,
                      std::chrono::duration<double> elapsed) {
    return {{"uid", state.account.get()},
            {"did", state.did},
            {"stage", to_string(state.stage)},
            {"stats", state.stats ? Json(*state.stats) : Json(nullptr)},
            {"duration", elapsed.count()}};
}

Compactor::Compactor(AccountDirectoryIface& directory,
                     ShardStoreIface& store,
                     CompactionMetricsIface& metrics,
                     std::shared_ptr<logger::Logger> baseLogger,
                     CompactorConfig config)
    : directory(directory),
      store(store),
      metrics(metrics),
      config(std::move(config)) {
    if (!baseLogger) {
        throw std::invalid_argument(
                "Compactor::Compactor: logger can't be null");
    }
    logger = std::make_shared<logger::PrefixLogger>("compactor",
                                                    std::move(baseLogger));
    logger->setPrefix({{"source", "compactor"}});
}

Compactor::~Compactor() {
    stop();
}

void Compactor::setState(std::chrono::steady_clock::time_point start,
                         AccountId account,
                         std::string did,
                         CompactionStage stage,
                         std::optional<CompactionStats> stats) {
    status.setState(account, std::move(did), stage, std::move(stats));
    logger->debugWithContext(
            "Compaction stage changed",
            toContext(status.getState(),
                      std::chrono::steady_clock::now() - start));
}

CompactionState Compactor::compactNext(
        folly::CancellationToken cancellationToken) {
    const auto item = queue.pop();
    if (!item) {
        throw compaction_error(compaction_errc::no_work_available,
                               "Compactor::compactNext");
    }
    const auto account = item->account;
    TRACE_EVENT2("relay/compactor",
                 "compactNext",
                 "uid",
                 account.get(),
                 "fast",
                 item->fast);

    const auto start = std::chrono::steady_clock::now();
    setState(start,
             account,
             std::string{CompactionState::UnknownDid},
             CompactionStage::getting_user);
    Account resolved;
    try {
        resolved = directory.lookupAccount(account, cancellationToken);
    } catch (const std::exception& e) {
        setState(start,
                 account,
                 std::string{CompactionState::UnknownDid},
                 CompactionStage::failed_getting_user);
        throw compaction_error(
                compaction_errc::account_lookup_failed,
                fmt::format("Compactor::compactNext: failed to get user {}: {}",
                            account.to_string(),
                            e.what()));
    }

    setState(start, account, resolved.did, CompactionStage::compacting);
    CompactionStats stats;
    const auto compactStart = std::chrono::steady_clock::now();
    try {
        stats = store.compactAccountShards(
                account, item->fast, std::move(cancellationToken));
    } catch (const std::exception& e) {
        setState(start,
                 account,
                 resolved.did,
                 CompactionStage::failed_compacting);
        throw compaction_error(
                compaction_errc::compaction_failed,
                fmt::format("Compactor::compactNext: failed to compact shards "
                            "for {} ({}): {}",
                            account.to_string(),
                            resolved.did,
                            e.what()));
    }
    metrics.observeCompactionDuration(std::chrono::steady_clock::now() -
                                      compactStart);

    setState(start, account, resolved.did, CompactionStage::done, stats);
    return status.getState();
}

void Compactor::run() {
    {
        std::lock_guard<std::mutex> guard(mutex);
        if (running) {
            throw std::logic_error(
                    "Compactor::run: the worker loop is already running");
        }
        running = true;
    }
    runLoop();
}

void Compactor::runLoop() {
    logger->infoWithContext(
            "Compaction worker started",
            {{"empty_queue_backoff_ms", config.emptyQueueBackoff.count()},
             {"error_backoff_ms", config.errorBackoff.count()}});

    while (!isStopRequested()) {
        const auto start = std::chrono::steady_clock::now();
        std::chrono::milliseconds backoff{0};
        try {
            const auto state = compactNext(cancellationSource.getToken());
            logger->infoWithContext(
                    "Compacted repo",
                    toContext(state, std::chrono::steady_clock::now() - start));
            continue;
        } catch (const compaction_error& e) {
            if (e.compaction_code() == compaction_errc::no_work_available) {
                auto ctx = toContext(status.getState(),
                                     std::chrono::steady_clock::now() - start);
                ctx["backoff_ms"] = config.emptyQueueBackoff.count();
                logger->warnWithContext(
                        "No repos to compact, waiting and retrying",
                        std::move(ctx));
                backoff = config.emptyQueueBackoff;
            } else {
                auto ctx = toContext(status.getState(),
                                     std::chrono::steady_clock::now() - start);
                ctx["error"] = e.what();
                logger->errorWithContext("Failed to compact repo",
                                         std::move(ctx));
                backoff = config.errorBackoff;
            }
        } catch (const std::exception& e) {
            auto ctx = toContext(status.getState(),
                                 std::chrono::steady_clock::now() - start);
            ctx["error"] = e.what();
            logger->errorWithContext("Unexpected error in compaction worker",
                                     std::move(ctx));
            backoff = config.errorBackoff;
        }

        if (waitForStop(backoff)) {
            break;
        }
    }

    {
        std::lock_guard<std::mutex> guard(mutex);
        running = false;
    }
    logger->info("Compaction worker stopped");
}

void Compactor::start() {
    std::lock_guard<std::mutex> guard(mutex);
    if (started) {
        throw std::logic_error("Compactor::start: already started");
    }
    if (running) {
        throw std::logic_error(
                "Compactor::start: the worker loop is already running");
    }
    started = true;
    running = true;
    worker = std::thread{[this]() {
        folly::setThreadName("rl:compactor");
        runLoop();
    }};
}

void Compactor::stop() {
    std::thread thread;
    {
        std::lock_guard<std::mutex> guard(mutex);
        stopRequested = true;
        // A later start() must not bring the worker back to life
        started = true;
        thread = std::move(worker);
    }
    cancellationSource.requestCancellation();
    stopCv.notify_all();
    if (thread.joinable()) {
        thread.join();
    }
}

bool Compactor::isStopRequested() const {
    std::lock_guard<std::mutex> guard(mutex);
    return stopRequested;
}

bool Compactor::waitForStop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return stopCv.wait_for(lock, timeout, [this] { return stopRequested; });
}

void Compactor::enqueueRepo(const Account& account, bool fast) {
    const auto added = queue.append(account.id, fast);
    logger->infoWithContext("Enqueueing repo for compaction",
                            {{"did", account.did},
                             {"uid", account.id.get()},
                             {"fast", fast},
                             {"already_queued", !added}});
}

void Compactor::enqueueAllRepos(size_t limit,
                                size_t shardCount,
                                bool fast,
                                folly::CancellationToken cancellationToken) {
    if (shardCount == 0) {
        shardCount = config.defaultShardCountThreshold;
    }

    TRACE_EVENT2("relay/compactor",
                 "enqueueAllRepos",
                 "limit",
                 limit,
                 "shardCount",
                 shardCount);

    Json ctx{{"lim", limit}, {"shardCount", shardCount}, {"fast", fast}};
    logger->infoWithContext("Enqueueing all repos", ctx);

    const auto targets = getCompactionCandidates(
            store, shardCount, limit, std::move(cancellationToken));
    for (const auto& target : targets) {
        queue.append(target.account, fast);
    }

    ctx["candidates"] = targets.size();
    logger->infoWithContext("Done enqueueing all repos", std::move(ctx));
}

void Compactor::dequeueRepo(AccountId account) {
    queue.remove(account);
    logger->infoWithContext("Dequeued repo", {{"uid", account.get()}});
}

} // namespace relay::compaction
