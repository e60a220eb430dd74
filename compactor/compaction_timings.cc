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

#include "compaction_timings.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

namespace relay::compaction {

static constexpr int64_t MaxTrackedDuration =
        std::chrono::microseconds(std::chrono::hours(1)).count();

CompactionTimings::CompactionTimings() : histogram(1, MaxTrackedDuration, 2) {
}

void CompactionTimings::observeCompactionDuration(
        std::chrono::duration<double> duration) {
    const auto us =
            std::chrono::duration_cast<std::chrono::microseconds>(duration)
                    .count();
    // Values outside the trackable range are clamped so that they are still
    // counted
    histogram.addValue(static_cast<uint64_t>(
            std::clamp<int64_t>(us, 0, MaxTrackedDuration)));
}

std::chrono::microseconds CompactionTimings::getMean() const {
    return std::chrono::microseconds(
            static_cast<int64_t>(std::llround(histogram.getMean())));
}

nlohmann::json CompactionTimings::to_json() const {
    return histogram.to_json();
}

} // namespace relay::compaction
