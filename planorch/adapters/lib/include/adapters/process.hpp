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

/**
 * @file process.hpp
 * @brief Child process execution with captured output
 */

#ifndef PLANORCH_ADAPTERS_PROCESS_HPP
#define PLANORCH_ADAPTERS_PROCESS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "engine/engine_errors.hpp"
#include "engine/time.hpp"

namespace planorch::adapters {

/**
 * What to run
 */
struct ProcessSpec final {
    static constexpr std::size_t DEFAULT_MAX_OUTPUT_BYTES = 1024UL * 1024UL;
    static constexpr engine::Millis DEFAULT_KILL_GRACE{1000};

    std::string executable;             //!< Resolved through PATH when it has no slash
    std::vector<std::string> args;      //!< Arguments after argv[0]
    std::filesystem::path working_dir;  //!< Empty keeps the current directory
    engine::Millis timeout{};           //!< Zero waits forever
    engine::Millis kill_grace{DEFAULT_KILL_GRACE}; //!< SIGTERM to SIGKILL delay after a timeout
    std::size_t max_output_bytes{DEFAULT_MAX_OUTPUT_BYTES}; //!< Per stream; the rest is dropped
};

/**
 * How it ended
 */
struct ProcessResult final {
    std::optional<int> exit_code;    //!< Set when the child exited normally
    std::optional<int> term_signal;  //!< Set when a signal ended the child
    bool timed_out{};                //!< The timeout elapsed and the child was killed
    bool output_truncated{};         //!< A stream exceeded max_output_bytes
    std::string out;                 //!< Captured stdout
    std::string err;                 //!< Captured stderr
    engine::Millis duration{};

    [[nodiscard]] bool succeeded() const noexcept {
        return !timed_out && exit_code.has_value() && *exit_code == 0;
    }
};

/**
 * Run a child process to completion
 *
 * stdin is /dev/null; stdout and stderr are captured concurrently so a
 * chatty child never blocks on a full pipe.
 *
 * @param[in] spec Command, arguments and limits
 * @return Result, or IoError if the process could not be started
 */
[[nodiscard]] engine::Result<ProcessResult> run_process(const ProcessSpec &spec);

/**
 * Split output into lines, dropping empty ones and trailing '\r'
 */
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);

/**
 * Last lines of output
 *
 * @param[in] text Captured output
 * @param[in] max_lines Number of non-empty lines to keep
 * @return Lines joined with '\n'
 */
[[nodiscard]] std::string tail_lines(const std::string &text, std::size_t max_lines);

} // namespace planorch::adapters

#endif // PLANORCH_ADAPTERS_PROCESS_HPP
