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

#include "utilities/hdrhistogram.h"

#include <relay/compaction_iface.h>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>

namespace relay::compaction {

/**
 * The default CompactionMetricsIface: keeps the compaction durations in
 * an HdrHistogram with microsecond resolution (tracking up to one hour).
 */
class CompactionTimings : public CompactionMetricsIface {
public:
    CompactionTimings();

    void observeCompactionDuration(
            std::chrono::duration<double> duration) override;

    uint64_t getCount() const {
        return histogram.getValueCount();
    }

    std::chrono::microseconds getMin() const {
        return std::chrono::microseconds(histogram.getMinValue());
    }

    std::chrono::microseconds getMax() const {
        return std::chrono::microseconds(histogram.getMaxValue());
    }

    std::chrono::microseconds getMean() const;

    std::chrono::microseconds getPercentile(double percentile) const {
        return std::chrono::microseconds(
                histogram.getValueAtPercentile(percentile));
    }

    void reset() {
        histogram.reset();
    }

    /// Summary of the histogram (count, min, max, mean and percentiles in us)
    nlohmann::json to_json() const;

protected:
    HdrHistogram histogram;
};

} // namespace relay::compaction
