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

// folly's portability headers must come before spdlog's
#include <folly/portability/GTest.h>

#include "logger.h"
#include "logger_config.h"

#include <string>
#include <vector>

/**
 * Gives every test a fresh process logger writing synchronously to
 * <config.filename>.txt in the working directory. The log files are
 * removed when the test ends.
 */
class ProcessLoggerTest : public ::testing::Test {
protected:
    ProcessLoggerTest();

    void SetUp() override;
    void TearDown() override;

    /// Replace the process logger with one created from config
    void initializeLogger();

    /**
     * Shut the logger down, fail the test if anybody still holds on to
     * one of the registered loggers, and remove the log files
     */
    void shutdownAndCleanup();

    /// The log files created from config.filename, sorted by name
    std::vector<std::string> getLogFiles() const;

    /**
     * Shut the logger down (flushing everything) and return the contents
     * of the log file. Fails the test unless exactly one file exists.
     */
    std::string shutdownAndReadLog();

    static int countOccurrences(const std::string& text,
                                const std::string& needle);

    relay::logger::Config config;
};
