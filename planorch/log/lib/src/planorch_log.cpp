/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <algorithm>   // for transform
#include <atomic>      // for atomic
#include <cctype>      // for tolower
#include <memory>      // for shared_ptr, unique_ptr
#include <mutex>       // for mutex, lock_guard
#include <optional>    // for optional, nullopt
#include <stdexcept>   // for invalid_argument
#include <string>      // for string, to_string
#include <string_view> // for string_view
#include <utility>     // for move

#include <quill/Backend.h>                      // for Backend
#include <quill/LogMacros.h>                    // for QUILL_LOG_INFO
#include <quill/backend/BackendOptions.h>       // for BackendOptions
#include <quill/core/Common.h>                  // for Timezone, ClockSourceType
#include <quill/core/LogLevel.h>                // for LogLevel
#include <quill/core/PatternFormatterOptions.h> // for PatternFormatterOptions
#include <quill/sinks/ConsoleSink.h>            // for ConsoleSink
#include <quill/sinks/FileSink.h>               // for FileSink, FileSinkConfig
#include <quill/sinks/JsonSink.h>               // for JsonFileSink
#include <quill/sinks/RotatingFileSink.h>       // for RotatingFileSink
#include <quill/sinks/Sink.h>                   // for Sink
#include <quill/sinks/StreamSink.h>             // for FileEventNotifier

#include <wise_enum.h> // for to_string, from_string

#include "log/components.hpp"   // for LogLevel
#include "log/planorch_log.hpp" // for Logger, LoggerConfig

namespace planorch::log {

namespace {

LoggerConfig make_config(SinkType sink_type, LogLevel level, bool colors, std::string path) {
    LoggerConfig config{};
    config.sink_type = sink_type;
    config.min_level = level;
    config.enable_colors = colors;
    config.log_file = std::move(path);
    return config;
}

void require_path(const LoggerConfig &config) {
    if (config.log_file.empty()) {
        throw std::invalid_argument(
                std::string{::wise_enum::to_string(config.sink_type)} +
                " sink requires a log file path");
    }
}

} // namespace

LoggerConfig LoggerConfig::console(LogLevel level, bool colors) {
    return make_config(SinkType::Console, level, colors, {});
}

LoggerConfig LoggerConfig::file(std::string path, LogLevel level) {
    return make_config(SinkType::File, level, false, std::move(path));
}

LoggerConfig LoggerConfig::rotating_file(std::string path, LogLevel level) {
    return make_config(SinkType::RotatingFile, level, false, std::move(path));
}

LoggerConfig LoggerConfig::json_file(std::string path, LogLevel level) {
    return make_config(SinkType::JsonFile, level, false, std::move(path));
}

LoggerConfig &LoggerConfig::with_file_line(bool enable) {
    enable_file_line = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_thread_name(bool enable) {
    enable_thread_name = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_colors(bool enable) {
    enable_colors = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_rotation_size(std::size_t bytes) {
    rotation_bytes = bytes;
    return *this;
}

LoggerConfig &LoggerConfig::with_max_backup_files(std::uint32_t count) {
    max_backup_files = count;
    return *this;
}

Logger::Logger(const LoggerConfig &config) : sink_type_{config.sink_type} {
    if (!quill::Backend::is_running()) {
        quill::BackendOptions backend_options;
        backend_options.thread_name = "LogBackend";
        backend_options.enable_yield_when_idle = false;
        backend_options.sleep_duration = config.backend_sleep_duration;
        quill::Backend::start(backend_options);
    }

    auto sink = create_sink(config);

    std::string pattern = "%(time) [%(log_level)]";
    if (config.enable_thread_name) {
        pattern += " [%(thread_name)]";
    }
    if (config.enable_file_line) {
        pattern += " [%(short_source_location)]";
    }
    pattern += " %(message)";

    const quill::PatternFormatterOptions formatter_opts{
            pattern, "%Y-%m-%dT%H:%M:%S.%Qms", quill::Timezone::LocalTime};

    static std::atomic<int> logger_counter{0};
    const std::string logger_name = "planorch_" + std::to_string(logger_counter.fetch_add(1));

    quill_logger_ = ServiceFrontend::create_or_get_logger(
            logger_name, std::move(sink), formatter_opts, quill::ClockSourceType::System);
    quill_logger_->set_log_level(to_quill_level(config.min_level));

    QUILL_LOG_DEBUG(
            quill_logger_,
            "Logger configured - Sink: {}, Level: {}, File: '{}'",
            ::wise_enum::to_string(config.sink_type),
            ::wise_enum::to_string(config.min_level),
            actual_log_file_.empty() ? "none" : actual_log_file_);
}

Logger::~Logger() noexcept {
    if (quill_logger_ != nullptr) {
        quill_logger_->flush_log();
        ServiceFrontend::remove_logger(quill_logger_);
    }
}

std::unique_ptr<Logger> &Logger::get_instance() {
    static std::unique_ptr<Logger> instance =
            std::unique_ptr<Logger>(new Logger(LoggerConfig::console()));
    return instance;
}

void Logger::configure(const LoggerConfig &config) {
    static std::mutex configure_mutex;
    const std::lock_guard<std::mutex> lock(configure_mutex);
    auto &instance = get_instance();
    // Build the replacement first so a bad config leaves the old logger usable
    auto replacement = std::unique_ptr<Logger>(new Logger(config));
    instance = std::move(replacement);
}

void Logger::set_level(LogLevel level) {
    auto &instance = get_instance();
    instance->quill_logger_->set_log_level(to_quill_level(level));
}

void Logger::flush() { get_instance()->quill_logger_->flush_log(); }

SinkType Logger::get_sink_type() { return get_instance()->sink_type_; }

LogLevel Logger::get_current_level() {
    return from_quill_level(get_instance()->quill_logger_->get_log_level());
}

std::string Logger::get_actual_log_file() { return get_instance()->actual_log_file_; }

std::shared_ptr<quill::Sink> Logger::create_sink(const LoggerConfig &config) {
    switch (config.sink_type) {
    case SinkType::Console: {
        quill::ConsoleSinkConfig console_config;
        console_config.set_colour_mode(
                config.enable_colors ? quill::ConsoleSinkConfig::ColourMode::Automatic
                                     : quill::ConsoleSinkConfig::ColourMode::Never);
        actual_log_file_.clear();
        return std::make_shared<quill::ConsoleSink>(console_config);
    }

    case SinkType::File: {
        require_path(config);
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('a');
        auto file_sink = std::make_shared<quill::FileSink>(
                config.log_file, cfg, quill::FileEventNotifier{});
        actual_log_file_ = file_sink->get_filename().string();
        return file_sink;
    }

    case SinkType::RotatingFile: {
        require_path(config);
        quill::RotatingFileSinkConfig cfg;
        cfg.set_open_mode('a');
        cfg.set_rotation_max_file_size(config.rotation_bytes);
        cfg.set_max_backup_files(config.max_backup_files);
        auto rotating_sink = std::make_shared<quill::RotatingFileSink>(config.log_file, cfg);
        actual_log_file_ = rotating_sink->get_filename().string();
        return rotating_sink;
    }

    case SinkType::JsonFile: {
        require_path(config);
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('a');
        auto json_sink = std::make_shared<quill::JsonFileSink>(config.log_file, cfg);
        actual_log_file_ = json_sink->get_filename().string();
        return json_sink;
    }
    }

    throw std::invalid_argument("Unknown sink type");
}

quill::LogLevel Logger::to_quill_level(LogLevel level) {
    switch (level) {
    case LogLevel::TraceL1:
        return quill::LogLevel::TraceL1;
    case LogLevel::Debug:
        return quill::LogLevel::Debug;
    case LogLevel::Info:
        return quill::LogLevel::Info;
    case LogLevel::Notice:
        return quill::LogLevel::Notice;
    case LogLevel::Warn:
        return quill::LogLevel::Warning;
    case LogLevel::Error:
        return quill::LogLevel::Error;
    case LogLevel::Critical:
        return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

LogLevel Logger::from_quill_level(quill::LogLevel level) {
    switch (level) {
    case quill::LogLevel::TraceL3:
    case quill::LogLevel::TraceL2:
    case quill::LogLevel::TraceL1:
        return LogLevel::TraceL1;
    case quill::LogLevel::Debug:
        return LogLevel::Debug;
    case quill::LogLevel::Info:
        return LogLevel::Info;
    case quill::LogLevel::Notice:
        return LogLevel::Notice;
    case quill::LogLevel::Warning:
        return LogLevel::Warn;
    case quill::LogLevel::Error:
        return LogLevel::Error;
    case quill::LogLevel::Critical:
        return LogLevel::Critical;
    default:
        return LogLevel::Info;
    }
}

LogLevel get_logger_default_level() { return LogLevel::Info; }

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (const auto exact = ::wise_enum::from_string<LogLevel>(name); exact.has_value()) {
        return exact.value();
    }
    std::string lowered{name};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto &value_and_name : ::wise_enum::range<LogLevel>) {
        std::string candidate{value_and_name.name.data(), value_and_name.name.size()};
        std::transform(candidate.begin(), candidate.end(), candidate.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (candidate == lowered) {
            return value_and_name.value;
        }
    }
    if (lowered == "warning") {
        return LogLevel::Warn;
    }
    if (lowered == "trace") {
        return LogLevel::TraceL1;
    }
    return std::nullopt;
}

namespace detail {
ServiceLogger *get_quill_logger() { return Logger::get_instance()->quill_logger_; }
} // namespace detail

} // namespace planorch::log
