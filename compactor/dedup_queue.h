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

#include <folly/Synchronized.h>

#include <cstddef>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace relay::compaction {

/// A request to compact the shards of a single account
struct WorkItem {
    AccountId account;
    /// Skip the large shards (quicker, partial compaction)
    bool fast = false;

    bool operator==(const WorkItem& other) const {
        return account == other.account && fast == other.fast;
    }
};

std::ostream& operator<<(std::ostream& os, const WorkItem& item);

/**
 * An ordered queue of WorkItems which holds at most one entry per account.
 *
 * Adding an account which is already queued is a no-op; the existing entry
 * (and its fast flag) is left as is. All methods are thread safe and each
 * call is a single critical section.
 */
class DedupQueue {
public:
    /**
     * Add the account to the tail of the queue
     *
     * @return true if the account was added, false if it was already queued
     */
    bool append(AccountId account, bool fast);

    /**
     * Add the account to the head of the queue
     *
     * @return true if the account was added, false if it was already queued
     */
    bool prepend(AccountId account, bool fast);

    bool contains(AccountId account) const;

    /// Remove the account from the queue (if present)
    void remove(AccountId account);

    /// Remove and return the head of the queue (if any)
    std::optional<WorkItem> pop();

    size_t size() const;

protected:
    struct State {
        std::deque<WorkItem> items;
        /// The accounts present in items
        std::unordered_set<AccountId> members;
    };

    folly::Synchronized<State, std::mutex> state;
};

} // namespace relay::compaction
