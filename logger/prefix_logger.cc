/*
 *     Copyright 2025-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#include "prefix_logger.h"

relay::logger::PrefixLogger::PrefixLogger(const std::string& name,
                                          std::shared_ptr<Logger> baseLogger)
    : Logger(name, baseLogger->getSpdLogger()),
      contextPrefix(Json::object()) {
}

void relay::logger::PrefixLogger::setPrefix(Json prefix) {
    fixupContext(prefix);
    contextPrefix = std::move(prefix);
}

void relay::logger::PrefixLogger::logWithContext(spdlog::level::level_enum lvl,
                                                 std::string_view msg,
                                                 Json ctx) {
    fixupContext(ctx);
    auto merged = contextPrefix;
    for (auto iter = ctx.begin(); iter != ctx.end(); ++iter) {
        merged[iter.key()] = std::move(*iter);
    }
    Logger::logWithContext(lvl, msg, std::move(merged));
}
