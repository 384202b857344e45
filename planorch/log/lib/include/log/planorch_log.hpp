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

#ifndef PLANORCH_LOG_PLANORCH_LOG_HPP
#define PLANORCH_LOG_PLANORCH_LOG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Disable Quill's non-prefixed macros to avoid conflicts
#define QUILL_DISABLE_NON_PREFIXED_MACROS

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/Sink.h>

#include <wise_enum.h>

#include "log/components.hpp"

namespace planorch::log {

/**
 * Frontend options for the orchestrator processes
 *
 * The daemon is a long-running control-plane service: losing a state
 * transition log line is worse than briefly blocking a worker thread, so the
 * queue blocks instead of dropping when full.
 */
struct ServiceFrontendOptions final {
    static constexpr quill::QueueType queue_type = // NOLINT(readability-identifier-naming)
            quill::QueueType::BoundedBlocking;     //!< Block producers when the queue is full
    static constexpr uint32_t initial_queue_capacity = // NOLINT(readability-identifier-naming)
            1024 * 1024;                               //!< 1 MB per-thread queue
    static constexpr uint32_t
            blocking_queue_retry_interval_ns = // NOLINT(readability-identifier-naming)
            800;                               //!< Retry interval while blocked
    static constexpr size_t unbounded_queue_max_capacity = // NOLINT(readability-identifier-naming)
            0;                                             //!< Unused for bounded queues
    static constexpr quill::HugePagesPolicy
            huge_pages_policy =            // NOLINT(readability-identifier-naming)
            quill::HugePagesPolicy::Never; //!< Disable huge pages for compatibility
};

using ServiceFrontend = quill::FrontendImpl<ServiceFrontendOptions>;
using ServiceLogger = quill::LoggerImpl<ServiceFrontendOptions>;

/**
 * Supported sink types for log output destinations
 */
enum class SinkType {
    Console,      //!< Console output
    File,         //!< Single file output
    RotatingFile, //!< Size-rotated file output
    JsonFile      //!< JSON lines file output
};

} // namespace planorch::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(planorch::log::SinkType, Console, File, RotatingFile, JsonFile)

namespace planorch::log {

/**
 * Configuration for logger initialization
 *
 * Built through the static factories and refined with the fluent setters:
 * @code
 * Logger::configure(LoggerConfig::rotating_file("/var/log/planorchd.log", LogLevel::Debug)
 *                           .with_rotation_size(64 * 1024 * 1024));
 * @endcode
 */
struct LoggerConfig final {
    static constexpr std::size_t DEFAULT_ROTATION_BYTES =
            static_cast<std::size_t>(10 * 1024 * 1024); //!< Default rotation threshold
    static constexpr std::uint32_t DEFAULT_MAX_BACKUP_FILES = 5; //!< Default rotated files kept

    SinkType sink_type{SinkType::Console}; //!< Type of log output sink to use
    std::string log_file;                  //!< Path to log file (file-based sinks only)
    LogLevel min_level{LogLevel::Info};    //!< Minimum log level to process
    bool enable_colors{true};              //!< Enable color output for console sinks
    bool enable_file_line{false};          //!< Include file and line number in log output
    bool enable_thread_name{true};         //!< Include thread name in log output
    std::size_t rotation_bytes{DEFAULT_ROTATION_BYTES};      //!< Rotating sink size threshold
    std::uint32_t max_backup_files{DEFAULT_MAX_BACKUP_FILES}; //!< Rotated files kept on disk
    std::chrono::milliseconds backend_sleep_duration{
            std::chrono::milliseconds{1}}; //!< Backend thread idle sleep

    /**
     * Create console logger configuration (default)
     *
     * @param[in] level Minimum log level to process
     * @param[in] colors Enable color output
     * @return LoggerConfig configured for console output
     */
    [[nodiscard]] static LoggerConfig console(LogLevel level = LogLevel::Info, bool colors = true);

    /**
     * Create file logger configuration
     *
     * @param[in] path Path to the log file
     * @param[in] level Minimum log level to process
     * @return LoggerConfig configured for file output
     */
    [[nodiscard]] static LoggerConfig file(std::string path, LogLevel level = LogLevel::Info);

    /**
     * Create rotating file logger configuration
     *
     * @param[in] path Path to the log file
     * @param[in] level Minimum log level to process
     * @return LoggerConfig configured for rotating file output
     */
    [[nodiscard]] static LoggerConfig
    rotating_file(std::string path, LogLevel level = LogLevel::Info);

    /**
     * Create JSON file logger configuration
     *
     * @param[in] path Path to the JSON log file
     * @param[in] level Minimum log level to process
     * @return LoggerConfig configured for JSON file output
     */
    [[nodiscard]] static LoggerConfig json_file(std::string path, LogLevel level = LogLevel::Info);

    LoggerConfig &with_file_line(bool enable = true);
    LoggerConfig &with_thread_name(bool enable = true);
    LoggerConfig &with_colors(bool enable = true);
    LoggerConfig &with_rotation_size(std::size_t bytes);
    LoggerConfig &with_max_backup_files(std::uint32_t count);
};

namespace detail {
/**
 * Get the active Quill logger instance
 *
 * @return Pointer to the logger used by the PLANORCH_LOG* macros
 */
ServiceLogger *get_quill_logger();
} // namespace detail

/**
 * Process-wide logger
 *
 * Wraps the Quill backend and a single frontend logger. The default instance
 * logs to the console at Info; executables call configure() once during
 * startup after parsing their command line.
 */
class Logger final {
public:
    /**
     * Replace the process logger
     *
     * @param[in] config Logger configuration
     * @throws std::invalid_argument if a file sink is requested without a path
     */
    static void configure(const LoggerConfig &config);

    /**
     * Set the global log level
     *
     * @param[in] level New log level
     */
    static void set_level(LogLevel level);

    /**
     * Flush all pending log messages, blocking until written
     */
    static void flush();

    [[nodiscard]] static SinkType get_sink_type();
    [[nodiscard]] static LogLevel get_current_level();

    /**
     * Get the log file path in use
     *
     * @return Path to the log file, or empty string for console output
     */
    [[nodiscard]] static std::string get_actual_log_file();

    ~Logger() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

private:
    explicit Logger(const LoggerConfig &config);

    [[nodiscard]] static std::unique_ptr<Logger> &get_instance();

    [[nodiscard]] static quill::LogLevel to_quill_level(LogLevel level);
    [[nodiscard]] static LogLevel from_quill_level(quill::LogLevel level);

    [[nodiscard]] std::shared_ptr<quill::Sink> create_sink(const LoggerConfig &config);

    SinkType sink_type_{SinkType::Console}; //!< Configured sink type
    std::string actual_log_file_;           //!< Log file path in use
    ServiceLogger *quill_logger_{nullptr};  //!< Underlying Quill logger

    friend ServiceLogger *detail::get_quill_logger();
};

} // namespace planorch::log

#endif // PLANORCH_LOG_PLANORCH_LOG_HPP
