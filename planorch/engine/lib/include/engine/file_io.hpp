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
 * @file file_io.hpp
 * @brief Crash-safe file replacement and advisory inter-process locks
 */

#ifndef PLANORCH_ENGINE_FILE_IO_HPP
#define PLANORCH_ENGINE_FILE_IO_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "engine/engine_errors.hpp"
#include "engine/time.hpp"

namespace planorch::engine {

/**
 * Replace a file atomically
 *
 * Writes to a sibling temp file "<path>.tmp.<pid>.<n>", fsyncs it, renames
 * it over path and fsyncs the parent directory. Readers observe either the
 * previous or the new complete contents. The temp file is removed on failure.
 *
 * @param[in] path Destination path
 * @param[in] contents New file contents
 * @return Empty on success, IoError naming the failed step otherwise
 */
[[nodiscard]] Status
write_file_atomic(const std::filesystem::path &path, std::string_view contents);

/**
 * Read a whole file
 *
 * @param[in] path File to read
 * @return Contents, PlanNotFound when the file does not exist, IoError otherwise
 */
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/**
 * Exclusive advisory lock on a lock file (flock)
 *
 * Acquisition polls with exponential backoff until the timeout expires. The
 * lock is released when the object is destroyed. Because flock() locks are
 * tied to the open file description, two FileLock objects on the same path
 * exclude each other even within one process.
 */
class FileLock final {
public:
    /**
     * Acquire the lock, creating the lock file if needed
     *
     * @param[in] path Lock file path
     * @param[in] timeout Maximum time to wait
     * @return Held lock, LockTimeout when the deadline passes, IoError if the file cannot be opened
     */
    [[nodiscard]] static Result<FileLock>
    acquire(const std::filesystem::path &path, Millis timeout);

    FileLock(FileLock &&other) noexcept;
    FileLock &operator=(FileLock &&other) noexcept;
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;
    ~FileLock();

    [[nodiscard]] bool is_held() const noexcept { return fd_ >= 0; }

    /**
     * Release the lock early
     */
    void release() noexcept;

private:
    explicit FileLock(int fd) noexcept : fd_{fd} {}

    int fd_{-1}; //!< Locked descriptor, -1 when released
};

} // namespace planorch::engine

#endif // PLANORCH_ENGINE_FILE_IO_HPP
