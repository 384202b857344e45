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

#include <algorithm>    // for min
#include <atomic>       // for atomic
#include <cerrno>       // for errno, EINTR, EWOULDBLOCK
#include <chrono>       // for milliseconds
#include <cstdio>       // for rename
#include <cstring>      // for strerror
#include <filesystem>   // for path
#include <format>       // for format
#include <fstream>      // for ifstream
#include <sstream>      // for stringstream
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <thread>       // for sleep_for

#include <fcntl.h>    // for open, O_*
#include <sys/file.h> // for flock, LOCK_EX, LOCK_NB
#include <unistd.h>   // for close, fsync, write, getpid

#include <gsl-lite/gsl-lite.hpp>

#include "engine/engine_errors.hpp"
#include "engine/file_io.hpp"
#include "engine/time.hpp"

namespace planorch::engine {

namespace {

constexpr Millis INITIAL_LOCK_BACKOFF{2};
constexpr Millis MAX_LOCK_BACKOFF{50};

tl::unexpected<Error> io_error(const std::string_view step, const std::filesystem::path &path) {
    const int err = errno;
    return make_error(
            OrchErrc::IoError, std::format("{} '{}': {}", step, path.string(), std::strerror(err)));
}

Status fsync_directory(const std::filesystem::path &dir) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
    const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
        return io_error("open directory", dir);
    }
    const auto close_dir = gsl_lite::finally([dir_fd] { ::close(dir_fd); });
    if (::fsync(dir_fd) != 0) {
        return io_error("fsync directory", dir);
    }
    return {};
}

} // namespace

Status write_file_atomic(const std::filesystem::path &path, const std::string_view contents) {
    static std::atomic<unsigned> temp_counter{0};
    const auto temp_path = std::filesystem::path{std::format(
            "{}.tmp.{}.{}", path.string(), ::getpid(), temp_counter.fetch_add(1))};

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error("open temp file", temp_path);
    }

    bool committed = false;
    const auto cleanup = gsl_lite::finally([&temp_path, &committed] {
        if (!committed) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
        }
    });

    {
        const auto close_fd = gsl_lite::finally([fd] { ::close(fd); });
        const char *data = contents.data();
        std::size_t remaining = contents.size();
        while (remaining > 0) {
            const ssize_t written = ::write(fd, data, remaining);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return io_error("write", temp_path);
            }
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            data += written;
            remaining -= static_cast<std::size_t>(written);
        }
        if (::fsync(fd) != 0) {
            return io_error("fsync", temp_path);
        }
    }

    if (::rename(temp_path.c_str(), path.c_str()) != 0) {
        return io_error("rename", path);
    }
    committed = true;

    const auto parent = path.has_parent_path() ? path.parent_path() : std::filesystem::path{"."};
    return fsync_directory(parent);
}

Result<std::string> read_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error(
                OrchErrc::PlanNotFound, std::format("'{}' does not exist", path.string()));
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return io_error("open", path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

Result<FileLock> FileLock::acquire(const std::filesystem::path &path, const Millis timeout) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg,hicpp-vararg)
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error("open lock file", path);
    }

    const auto deadline = Time::steady_now() + timeout;
    Millis backoff = INITIAL_LOCK_BACKOFF;
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return FileLock{fd};
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            auto error = io_error("flock", path);
            ::close(fd);
            return error;
        }
        const auto now = Time::steady_now();
        if (now >= deadline) {
            ::close(fd);
            return make_error(
                    OrchErrc::LockTimeout,
                    std::format(
                            "lock '{}' not acquired within {} ms", path.string(), timeout.count()));
        }
        const auto left = std::chrono::duration_cast<Millis>(deadline - now);
        std::this_thread::sleep_for(std::min({backoff, left, MAX_LOCK_BACKOFF}));
        backoff = std::min(backoff * 2, MAX_LOCK_BACKOFF);
    }
}

FileLock::FileLock(FileLock &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }

FileLock &FileLock::operator=(FileLock &&other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

FileLock::~FileLock() { release(); }

void FileLock::release() noexcept {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace planorch::engine
