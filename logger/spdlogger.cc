/* -*- MODE: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2018-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#include "logger.h"
#include "logger_config.h"

#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace relay::logger {

static const std::string processLoggerName{"relay"};
static const std::string wrapperLoggerName{"relay_wrapper"};

/// ISO-8601 timestamp, level name and the message
static const std::string logPattern{"%^%Y-%m-%dT%T.%f%z %l %v%$"};

/// Owns the sinks
static std::shared_ptr<spdlog::logger> processLogger;
/// Handed out by get(), forwards to processLogger
static std::shared_ptr<Logger> processLoggerWrapper;

Logger::Logger(const std::string& name, std::shared_ptr<spdlog::logger> inner)
    : spdlog::logger(name), baseLogger(std::move(inner)) {
    if (!baseLogger) {
        throw std::invalid_argument(
                "relay::logger::Logger: inner logger can't be null");
    }
    set_level(baseLogger->level());
}

void Logger::sink_it_(const spdlog::details::log_msg& msg) {
    baseLogger->log(msg.level, msg.payload);
}

void Logger::flush_() {
    baseLogger->flush();
}

void Logger::fixupContext(Json& ctx) const {
    if (ctx.is_null()) {
        ctx = Json::object();
    } else if (!ctx.is_object()) {
        ctx = Json{{"context", std::move(ctx)}};
    }
}

void Logger::logWithContext(spdlog::level::level_enum lvl,
                            std::string_view msg,
                            Json ctx) {
    if (!should_log(lvl)) {
        return;
    }
    fixupContext(ctx);

    // The context is appended as JSON, so the message itself must not
    // contain braces
    std::string line(msg);
    std::replace(line.begin(), line.end(), '{', '[');
    std::replace(line.begin(), line.end(), '}', ']');
    line.erase(line.find_last_not_of(' ') + 1);

    if (!ctx.empty()) {
        line.push_back(' ');
        line.append(ctx.dump());
    }

    // Already formatted; log the string as is
    spdlog::logger::log(lvl, spdlog::string_view_t{line.data(), line.size()});
}

std::shared_ptr<spdlog::logger> Logger::getSpdLogger() {
    return std::static_pointer_cast<spdlog::logger>(shared_from_this());
}

/**
 * Everything is passed on to a dist_sink, which feeds
 *
 *   <filename>.txt   rotating file, every level (if a filename is set)
 *   stderr           errors, or every level in unit_test mode (if console)
 *
 * so the level of the logger alone controls what gets logged.
 */
static std::shared_ptr<spdlog::sinks::dist_sink_mt> createSinks(
        const Config& config) {
    auto sinks = std::make_shared<spdlog::sinks::dist_sink_mt>();
    sinks->set_level(spdlog::level::trace);

    if (!config.filename.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filename + ".txt", config.cyclesize, config.max_files);
        file->set_level(spdlog::level::trace);
        sinks->add_sink(std::move(file));
    }

    if (config.console) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(config.unit_test ? spdlog::level::trace
                                            : spdlog::level::err);
        sinks->add_sink(std::move(console));
    }
    return sinks;
}

std::optional<std::string> initialize(const Config& config) {
    try {
        auto sinks = createSinks(config);
        spdlog::drop(processLoggerName);
        spdlog::drop(wrapperLoggerName);

        if (config.unit_test) {
            processLogger = std::make_shared<spdlog::logger>(processLoggerName,
                                                             std::move(sinks));
        } else {
            // A single background thread; callers block when the queue is
            // full
            spdlog::init_thread_pool(config.buffersize, 1);
            processLogger = std::make_shared<spdlog::async_logger>(
                    processLoggerName,
                    std::move(sinks),
                    spdlog::thread_pool(),
                    spdlog::async_overflow_policy::block);
        }
        processLogger->set_pattern(logPattern);
        processLogger->set_level(config.log_level);
        spdlog::flush_every(std::chrono::seconds(1));

        processLoggerWrapper =
                std::make_shared<Logger>(wrapperLoggerName, processLogger);
        spdlog::register_logger(processLogger);
        spdlog::register_logger(processLoggerWrapper);
    } catch (const spdlog::spdlog_ex& e) {
        return fmt::format("Log initialization failed: {}", e.what());
    }
    return {};
}

const std::shared_ptr<Logger>& get() {
    return processLoggerWrapper;
}

void flush() {
    if (processLogger) {
        processLogger->flush();
    }
}

void shutdown() {
    flush();
    processLoggerWrapper.reset();
    processLogger.reset();
    // Drains the async queue and joins the thread pool
    spdlog::shutdown();
}

} // namespace relay::logger
