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
#include "logger_test_fixture.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

ProcessLoggerTest::ProcessLoggerTest() {
    config.log_level = spdlog::level::level_enum::debug;
    config.filename = "process_logger_test";
    config.unit_test = true;
    config.console = false;
}

void ProcessLoggerTest::SetUp() {
    initializeLogger();
}

void ProcessLoggerTest::TearDown() {
    shutdownAndCleanup();
}

void ProcessLoggerTest::initializeLogger() {
    shutdownAndCleanup();

    const auto error = relay::logger::initialize(config);
    ASSERT_FALSE(error) << error.value();
    relay::logger::get()->set_level(config.log_level);
}

std::vector<std::string> ProcessLoggerTest::getLogFiles() const {
    std::vector<std::string> ret;
    for (const auto& entry : std::filesystem::directory_iterator(".")) {
        if (entry.path().filename().string().rfind(config.filename, 0) == 0) {
            ret.push_back(entry.path().string());
        }
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

void ProcessLoggerTest::shutdownAndCleanup() {
    std::vector<std::weak_ptr<spdlog::logger>> registered;
    spdlog::apply_all(
            [&registered](const auto& l) { registered.push_back(l); });

    relay::logger::shutdown();

    for (const auto& weak : registered) {
        if (auto l = weak.lock()) {
            ADD_FAILURE() << "Logger '" << l->name()
                          << "' is still referenced after shutdown";
        }
    }

    ASSERT_FALSE(config.filename.empty());
    for (const auto& file : getLogFiles()) {
        std::filesystem::remove(file);
    }
}

std::string ProcessLoggerTest::shutdownAndReadLog() {
    relay::logger::shutdown();
    const auto files = getLogFiles();
    if (files.size() != 1) {
        ADD_FAILURE() << "Expected a single log file, found " << files.size();
        return {};
    }
    std::ifstream stream(files.front());
    return {std::istreambuf_iterator<char>(stream),
            std::istreambuf_iterator<char>()};
}

int ProcessLoggerTest::countOccurrences(const std::string& text,
                                        const std::string& needle) {
    int count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}
