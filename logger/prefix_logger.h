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

#include "logger/logger.h"

namespace relay::logger {

/**
 * Logger adding a fixed set of keys to the context of every message
 * (e.g. {"source":"compactor"}). Keys present in both the prefix and the
 * message context take the value from the message.
 */
class PrefixLogger : public Logger {
public:
    PrefixLogger(const std::string& name, std::shared_ptr<Logger> baseLogger);

    void logWithContext(spdlog::level::level_enum lvl,
                        std::string_view msg,
                        Json ctx) override;

    /// Replace the keys added to each message
    void setPrefix(Json prefix);

private:
    Json contextPrefix;
};

} // namespace relay::logger
