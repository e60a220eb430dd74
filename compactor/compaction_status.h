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

#include <relay/compaction_types.h>

#include <folly/Synchronized.h>

#include <optional>
#include <string>

namespace relay::compaction {

/**
 * Keeps track of the account the compactor is working on (or the last one
 * it worked on).
 *
 * The state is replaced as a whole on every update and readers get a copy,
 * so a reader never sees fields from two different updates.
 */
class CompactionStatus {
public:
    void setState(AccountId account,
                  std::string did,
                  CompactionStage stage,
                  std::optional<CompactionStats> stats = {});

    CompactionState getState() const {
        return state.copy();
    }

protected:
    folly::Synchronized<CompactionState> state;
};

} // namespace relay::compaction
