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

#include "compaction_status.h"

namespace relay::compaction {

void CompactionStatus::setState(AccountId account,
                                std::string did,
                                CompactionStage stage,
                                std::optional<CompactionStats> stats) {
    CompactionState next;
    next.account = account;
    next.did = std::move(did);
    next.stage = stage;
    next.stats = std::move(stats);
    *state.wlock() = std::move(next);
}

} // namespace relay::compaction
