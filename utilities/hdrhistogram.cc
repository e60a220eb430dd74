/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2019-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#include "hdrhistogram.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <system_error>

void HdrHistogram::HdrDeleter::operator()(struct hdr_histogram* val) {
    hdr_close(val);
}

HdrHistogram::HdrHistogram(uint64_t lowestDiscernibleValue,
                           int64_t highestTrackableValue,
                           int significantFigures) {
    // hdr_init would just return EINVAL
    if (lowestDiscernibleValue == 0) {
        throw std::invalid_argument(fmt::format(
                "HdrHistogram lowestDiscernibleValue:{} must be greater than 0",
                lowestDiscernibleValue));
    }

    struct hdr_histogram* hist = nullptr;
    auto status = hdr_init(static_cast<int64_t>(lowestDiscernibleValue),
                           highestTrackableValue,
                           significantFigures,
                           &hist);

    if (status != 0) {
        throw std::system_error(
                status,
                std::generic_category(),
                fmt::format("HdrHistogram init failed, "
                            "params lowestDiscernibleValue:{} "
                            "highestTrackableValue:{} significantFigures:{}",
                            lowestDiscernibleValue,
                            highestTrackableValue,
                            significantFigures));
    }

    histogram.wlock()->reset(hist);
}

bool HdrHistogram::addValue(uint64_t v) {
    return hdr_record_value_atomic(histogram.rlock()->get(),
                                   static_cast<int64_t>(v));
}

uint64_t HdrHistogram::getValueCount() const {
    return static_cast<uint64_t>(histogram.rlock()->get()->total_count);
}

uint64_t HdrHistogram::getMinValue() const {
    auto locked = histogram.rlock();
    // hdr_min reports INT64_MAX until the first value is recorded
    if (locked->get()->total_count == 0) {
        return 0;
    }
    return static_cast<uint64_t>(hdr_min(locked->get()));
}

uint64_t HdrHistogram::getMaxValue() const {
    return static_cast<uint64_t>(hdr_max(histogram.rlock()->get()));
}

void HdrHistogram::reset() {
    hdr_reset(histogram.wlock()->get());
}

uint64_t HdrHistogram::getValueAtPercentile(double percentage) const {
    return hdr_value_at_percentile(histogram.rlock()->get(), percentage);
}

double HdrHistogram::getMean() const {
    return hdr_mean(histogram.rlock()->get());
}

nlohmann::json HdrHistogram::to_json() const {
    auto locked = histogram.rlock();
    const auto* hist = locked->get();
    if (hist->total_count == 0) {
        return {{"count", 0}};
    }
    return {{"count", hist->total_count},
            {"min", hdr_min(hist)},
            {"max", hdr_max(hist)},
            {"mean", hdr_mean(hist)},
            {"p50", hdr_value_at_percentile(hist, 50.0)},
            {"p90", hdr_value_at_percentile(hist, 90.0)},
            {"p99", hdr_value_at_percentile(hist, 99.0)}};
}
