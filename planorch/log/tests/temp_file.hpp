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
 * @file temp_file.hpp
 * @brief Scratch directory management for planorch tests
 */

#ifndef PLANORCH_LOG_TESTS_TEMP_FILE_HPP
#define PLANORCH_LOG_TESTS_TEMP_FILE_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace planorch::testing {

/**
 * @brief RAII scratch directory for tests
 *
 * Creates a uniquely named directory under the system temp directory and
 * removes it recursively on destruction. State directories, lock files,
 * event logs and sockets created by a test all live inside it.
 */
class TempDir final {
public:
    /**
     * @brief Create a scratch directory
     * @param prefix Prefix for the directory name
     */
    explicit TempDir(const std::string &prefix = "planorch_test");

    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;
    TempDir(TempDir &&) = delete;
    TempDir &operator=(TempDir &&) = delete;

    /**
     * @brief Directory path
     */
    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    /**
     * @brief Path of an entry inside the directory (not created)
     * @param name Relative entry name
     */
    [[nodiscard]] std::filesystem::path file(const std::string &name) const;

private:
    std::filesystem::path path_;
};

/**
 * @brief Read the contents of a file
 * @param filepath Path to the file to read
 * @return File contents, or an empty string if the file cannot be opened
 */
std::string read_file_contents(const std::filesystem::path &filepath);

/**
 * @brief Write a file, replacing any existing contents
 */
void write_file_contents(const std::filesystem::path &filepath, const std::string &contents);

/**
 * @brief Read a file as a list of lines (without trailing newlines)
 */
std::vector<std::string> read_file_lines(const std::filesystem::path &filepath);

/**
 * @brief Check if a file contains the specified text
 */
bool file_contains(const std::filesystem::path &filepath, const std::string &search_text);

} // namespace planorch::testing

#endif // PLANORCH_LOG_TESTS_TEMP_FILE_HPP
