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

#include <nlohmann/json_fwd.hpp>
#include <spdlog/common.h>

#include <cstddef>
#include <string>

namespace relay::logger {

/**
 * Settings for the process logger. Every key of the JSON form is optional;
 * a missing key keeps the default below.
 */
struct Config {
    Config() = default;

    /**
     * @throws std::invalid_argument for an unknown log_level
     * @throws nlohmann::json::type_error if a value has the wrong type
     */
    explicit Config(const nlohmann::json& json);

    bool operator==(const Config& other) const;

    /// Log to <filename>.txt (rotated to <filename>.<n>.txt); empty
    /// disables the file sink
    std::string filename;
    /// Entries in the async queue
    size_t buffersize = 8192;
    /// Rotate the file when it grows past this many bytes
    size_t cyclesize = 100 * 1024 * 1024;
    size_t max_files = 10;
    /// Log synchronously and send everything to stderr (when enabled)
    bool unit_test = false;
    /// Errors (or everything in unit_test mode) go to stderr as well
    bool console = true;
    spdlog::level::level_enum log_level = spdlog::level::level_enum::info;
};

void to_json(nlohmann::json& json, const Config& config);
void from_json(const nlohmann::json& json, Config& config);

} // namespace relay::logger
