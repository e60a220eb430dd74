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

/*
 * Logging for the relay. There is one process logger (initialize() / get(),
 * used through the LOG_ macros); the compactor and the batch driver get a
 * relay::logger::Logger injected instead.
 *
 * initialize() and shutdown() replace the process logger and must not race
 * with threads logging through get().
 */

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relay::logger {

struct Config;

/// The type used for the context object added to log messages
using Json = nlohmann::ordered_json;

/**
 * Wrapper around an spdlog::logger which extends the interface with
 * the ability to add a JSON context object to the log messages.
 *
 * The wrapper does not own any sinks; every message is passed on to the
 * inner logger (which does the actual formatting and writing).
 */
class Logger : public spdlog::logger,
               public std::enable_shared_from_this<Logger> {
public:
    Logger(const std::string& name, std::shared_ptr<spdlog::logger> inner);

    /**
     * Record a log message with additional context.
     * Format: <MSG> <JSON>
     *
     * NOTE: If present, the characters {} in the message are replaced by [].
     *
     * @param lvl The log level to report at
     * @param msg The message to log
     * @param ctx The context object (anything but an object is wrapped in
     *            {"context": ctx})
     */
    virtual void logWithContext(spdlog::level::level_enum lvl,
                                std::string_view msg,
                                Json ctx);

    void debugWithContext(std::string_view msg, Json ctx) {
        logWithContext(spdlog::level::debug, msg, std::move(ctx));
    }

    void infoWithContext(std::string_view msg, Json ctx) {
        logWithContext(spdlog::level::info, msg, std::move(ctx));
    }

    void warnWithContext(std::string_view msg, Json ctx) {
        logWithContext(spdlog::level::warn, msg, std::move(ctx));
    }

    void errorWithContext(std::string_view msg, Json ctx) {
        logWithContext(spdlog::level::err, msg, std::move(ctx));
    }

    /// Get the spdlog::logger interface of this object
    std::shared_ptr<spdlog::logger> getSpdLogger();

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override;

    /// Make sure ctx is a JSON object
    void fixupContext(Json& ctx) const;

    /// The logger all messages are sent to
    const std::shared_ptr<spdlog::logger> baseLogger;
};

/**
 * Create the process logger
 *
 * @param logger_settings where to log and at which level
 * @return an error message if spdlog failed to create the sinks
 */
std::optional<std::string> initialize(const Config& logger_settings);

/**
 * Get the process logger, or null if initialize() was not called (or the
 * logger was shut down since)
 */
const std::shared_ptr<Logger>& get();

/// Flush the sinks of the process logger
void flush();

/**
 * Flush and release the process logger and every other logger in the
 * spdlog registry. initialize() must be called again before logging.
 */
void shutdown();

} // namespace relay::logger

#define RELAY_LOG_ENTRY(severity, fmt, ...)                \
    do {                                                   \
        auto& _logger_ = relay::logger::get();             \
        if (_logger_ && _logger_->should_log(severity)) {  \
            _logger_->log(severity, fmt, __VA_ARGS__);     \
        }                                                  \
    } while (false)

#define RELAY_LOG_ENTRY_CTX(severity, msg, ...)                     \
    do {                                                            \
        auto& _logger_ = relay::logger::get();                      \
        if (_logger_ && _logger_->should_log(severity)) {           \
            _logger_->logWithContext(severity, msg, {__VA_ARGS__}); \
        }                                                           \
    } while (false)

#define LOG_DEBUG(...) \
    RELAY_LOG_ENTRY(spdlog::level::level_enum::debug, __VA_ARGS__)
#define LOG_INFO(...) \
    RELAY_LOG_ENTRY(spdlog::level::level_enum::info, __VA_ARGS__)
#define LOG_WARNING(...) \
    RELAY_LOG_ENTRY(spdlog::level::level_enum::warn, __VA_ARGS__)
#define LOG_ERROR(...) \
    RELAY_LOG_ENTRY(spdlog::level::level_enum::err, __VA_ARGS__)
#define LOG_CRITICAL(...) \
    RELAY_LOG_ENTRY(spdlog::level::level_enum::critical, __VA_ARGS__)

#define LOG_DEBUG_CTX(msg, ...) \
    RELAY_LOG_ENTRY_CTX(spdlog::level::level_enum::debug, msg, __VA_ARGS__)
#define LOG_INFO_CTX(msg, ...) \
    RELAY_LOG_ENTRY_CTX(spdlog::level::level_enum::info, msg, __VA_ARGS__)
#define LOG_WARNING_CTX(msg, ...) \
    RELAY_LOG_ENTRY_CTX(spdlog::level::level_enum::warn, msg, __VA_ARGS__)
#define LOG_ERROR_CTX(msg, ...) \
    RELAY_LOG_ENTRY_CTX(spdlog::level::level_enum::err, msg, __VA_ARGS__)
#define LOG_CRITICAL_CTX(msg, ...) \
    RELAY_LOG_ENTRY_CTX(spdlog::level::level_enum::critical, msg, __VA_ARGS__)
