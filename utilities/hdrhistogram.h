/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2018-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#pragma once

#include <folly/Synchronized.h>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <memory>

#include <hdr_histogram.h>

/**
 * Thread safe wrapper around the hdr_histogram from HdrHistogram_c.
 *
 * Recording takes the shared lock and uses the atomic record function so
 * that multiple threads may record at the same time; reset() takes the
 * exclusive lock.
 */
class HdrHistogram {
    struct HdrDeleter {
        void operator()(struct hdr_histogram* val);
    };

    using SyncHdrHistogramPtr = folly::Synchronized<
            std::unique_ptr<struct hdr_histogram, HdrDeleter>>;

public:
    /**
     * @param lowestDiscernibleValue the smallest value which can be told
     *        apart from 0 (must be > 0)
     * @param highestTrackableValue the largest value which may be recorded
     * @param significantFigures the precision of the histogram [1, 5]
     * @throws std::invalid_argument if lowestDiscernibleValue is 0
     * @throws std::system_error if hdr_init rejects the parameters
     */
    HdrHistogram(uint64_t lowestDiscernibleValue,
                 int64_t highestTrackableValue,
                 int significantFigures);

    HdrHistogram(const HdrHistogram&) = delete;
    HdrHistogram& operator=(const HdrHistogram&) = delete;

    /**
     * Record a single occurrence of v
     *
     * @return false if v is outside the trackable range
     */
    bool addValue(uint64_t v);

    /// The number of values recorded
    uint64_t getValueCount() const;

    /// The smallest value recorded (0 if nothing was recorded)
    uint64_t getMinValue() const;

    uint64_t getMaxValue() const;

    /// Drop all recorded values
    void reset();

    /// Get the value at the given percentile [0.0, 100.0]
    uint64_t getValueAtPercentile(double percentage) const;

    double getMean() const;

    /**
     * Summary of the histogram: {"count": n} when empty, otherwise count,
     * min, max, mean and the 50th, 90th and 99th percentiles
     */
    nlohmann::json to_json() const;

private:
    SyncHdrHistogramPtr histogram;
};
