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

/*
 * Mock implementations of the compaction collaborators and a logger
 * writing to a stream, shared by the compactor unit tests.
 */

#pragma once

#include <folly/portability/GMock.h>

#include "logger/logger.h"

#include <phosphor/phosphor.h>
#include <phosphor/tools/export.h>
#include <relay/compaction_error.h>
#include <relay/compaction_iface.h>
#include <spdlog/sinks/ostream_sink.h>

#include <chrono>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace relay::compaction::test {

class MockAccountDirectory : public AccountDirectoryIface {
public:
    MOCK_METHOD2(lookupAccount, Account(AccountId, folly::CancellationToken));
};

class MockShardStore : public ShardStoreIface {
public:
    MOCK_METHOD2(getCompactionTargets,
                 std::vector<CompactionTarget>(size_t,
                                               folly::CancellationToken));
    MOCK_METHOD3(compactAccountShards,
                 CompactionStats(AccountId, bool, folly::CancellationToken));
};

class MockCompactionMetrics : public CompactionMetricsIface {
public:
    MOCK_METHOD1(observeCompactionDuration,
                 void(std::chrono::duration<double>));
};

/// Create a (synchronous) logger writing "<level> <message>" lines to os
inline std::shared_ptr<logger::Logger> createStreamLogger(std::ostream& os) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(os);
    auto inner = std::make_shared<spdlog::logger>("compaction_test", sink);
    inner->set_pattern("%l %v");
    inner->set_level(spdlog::level::debug);
    return std::make_shared<logger::Logger>("compaction_test_wrapper", inner);
}

/// Build the candidate list 1..count where account n has 100 + n shards
inline std::vector<CompactionTarget> createTargets(size_t count) {
    std::vector<CompactionTarget> targets;
    for (size_t ii = 1; ii <= count; ++ii) {
        targets.push_back({AccountId(ii), 100 + ii});
    }
    return targets;
}

inline CompactionStats createStats(uint64_t seed) {
    CompactionStats stats;
    stats.totalRefs = seed * 10;
    stats.startShards = seed + 100;
    stats.newShards = 1;
    stats.skippedShards = 0;
    stats.shardsDeleted = seed + 100;
    stats.dupeCount = seed;
    return stats;
}

inline void startTracing() {
    PHOSPHOR_INSTANCE.start(
            phosphor::TraceConfig(phosphor::BufferMode::ring, 1024 * 1024));
}

/// Stop tracing and return the events recorded as JSON
inline std::string stopTracing() {
    PHOSPHOR_INSTANCE.stop();
    auto context = PHOSPHOR_INSTANCE.getTraceContext();
    phosphor::tools::JSONExport exporter(context);

    static const std::size_t chunksize = 64 * 1024;
    std::string formatted;
    size_t lastWrote;
    do {
        formatted.resize(formatted.size() + chunksize);
        lastWrote = exporter.read(&formatted[formatted.size() - chunksize],
                                  chunksize);
    } while (!exporter.done());
    formatted.resize(formatted.size() - (chunksize - lastWrote));
    return formatted;
}

/// Count the number of times needle appears in text
inline size_t countOccurrences(const std::string& text,
                               const std::string& needle) {
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}

} // namespace relay::compaction::test
