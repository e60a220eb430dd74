/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2017-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#include "logger_config.h"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <stdexcept>

namespace relay::logger {

static spdlog::level::level_enum parseLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str returns off for anything it doesn't know
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument(
                R"(relay::logger::Config: Unknown "log_level": )" + name);
    }
    return level;
}

Config::Config(const nlohmann::json& json) {
    filename = json.value("filename", filename);
    buffersize = json.value("buffersize", buffersize);
    cyclesize = json.value("cyclesize", cyclesize);
    max_files = json.value("max_files", max_files);
    unit_test = json.value("unit_test", unit_test);
    console = json.value("console", console);
    const auto iter = json.find("log_level");
    if (iter != json.end()) {
        log_level = parseLevel(iter->get<std::string>());
    }
}

bool Config::operator==(const Config& other) const {
    return filename == other.filename && buffersize == other.buffersize &&
           cyclesize == other.cyclesize && max_files == other.max_files &&
           unit_test == other.unit_test && console == other.console &&
           log_level == other.log_level;
}

void to_json(nlohmann::json& json, const Config& config) {
    const auto level = spdlog::level::to_string_view(config.log_level);
    const std::string levelName(level.data(), level.size());
    json = nlohmann::json{{"filename", config.filename},
                          {"buffersize", config.buffersize},
                          {"cyclesize", config.cyclesize},
                          {"max_files", config.max_files},
                          {"unit_test", config.unit_test},
                          {"console", config.console},
                          {"log_level", levelName}};
}

void from_json(const nlohmann::json& json, Config& config) {
    config = Config(json);
}

} // namespace relay::logger
