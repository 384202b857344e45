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
 * @file temp_file.cpp
 * @brief Implementation of scratch directory management for tests
 */

#include <atomic>       // for atomic
#include <chrono>       // for duration_cast, steady_clock
#include <fstream>      // for ifstream, ofstream
#include <iostream>     // for cerr
#include <sstream>      // for stringstream
#include <string>       // for string, getline, to_string
#include <system_error> // for error_code
#include <vector>       // for vector

#include <unistd.h> // for getpid

#include "temp_file.hpp"

namespace planorch::testing {

TempDir::TempDir(const std::string &prefix) {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::duration_cast<std::chrono::microseconds>(
                               std::chrono::steady_clock::now().time_since_epoch())
                               .count();
    // Short names keep socket paths under the sun_path limit
    const std::string name = prefix + "_" + std::to_string(::getpid()) + "_" +
                             std::to_string(stamp % 1000000) + "_" +
                             std::to_string(counter.fetch_add(1));
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "Warning: Failed to remove temporary directory " << path_ << ": "
                  << ec.message() << '\n';
    }
}

std::filesystem::path TempDir::file(const std::string &name) const { return path_ / name; }

std::string read_file_contents(const std::filesystem::path &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return "";
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file_contents(const std::filesystem::path &filepath, const std::string &contents) {
    std::ofstream file(filepath, std::ios::trunc);
    file << contents;
}

std::vector<std::string> read_file_lines(const std::filesystem::path &filepath) {
    std::vector<std::string> lines;
    std::ifstream file(filepath);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
bool file_contains(const std::filesystem::path &filepath, const std::string &search_text) {
    const std::string contents = read_file_contents(filepath);
    return contents.find(search_text) != std::string::npos;
}

} // namespace planorch::testing
