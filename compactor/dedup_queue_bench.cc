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

#include "dedup_queue.h"

#include <benchmark/benchmark.h>

#include <cstdlib>

using relay::AccountId;
using relay::compaction::DedupQueue;

/// Fill the queue with state.range(0) accounts, then drain it
static void append_and_pop(benchmark::State& state) {
    const auto count = static_cast<uint64_t>(state.range(0));
    DedupQueue queue;
    while (state.KeepRunning()) {
        for (uint64_t ii = 0; ii < count; ++ii) {
            queue.append(AccountId(ii), false);
        }
        while (queue.pop()) {
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

/// Adding an account which is already queued
static void append_duplicate(benchmark::State& state) {
    DedupQueue queue;
    for (int64_t ii = 0; ii < state.range(0); ++ii) {
        queue.append(AccountId(ii), false);
    }
    const AccountId account(state.range(0) / 2);
    while (state.KeepRunning()) {
        benchmark::DoNotOptimize(queue.append(account, true));
    }
}

/// Remove (and put back) an account in the middle of the queue
static void remove_middle(benchmark::State& state) {
    DedupQueue queue;
    for (int64_t ii = 0; ii < state.range(0); ++ii) {
        queue.append(AccountId(ii), false);
    }
    const AccountId account(state.range(0) / 2);
    while (state.KeepRunning()) {
        queue.remove(account);
        queue.append(account, false);
    }
}

/// Multiple threads appending to (and popping from) the same queue
static void concurrent_append_pop(benchmark::State& state) {
    static DedupQueue queue;
    const auto base = static_cast<uint64_t>(state.thread_index()) << 32;
    uint64_t next = 0;
    while (state.KeepRunning()) {
        queue.append(AccountId(base + next++), false);
        if (!queue.pop()) {
            std::abort();
        }
    }
}

BENCHMARK(append_and_pop)->RangeMultiplier(10)->Range(10, 100000);
BENCHMARK(append_duplicate)->Arg(1000);
BENCHMARK(remove_middle)->RangeMultiplier(10)->Range(10, 10000);
BENCHMARK(concurrent_append_pop)->Threads(1)->Threads(4);

BENCHMARK_MAIN();
