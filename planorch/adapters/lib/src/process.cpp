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
 * @file process.cpp
 * @brief Child process execution with captured output
 */

#include <algorithm>   // for min
#include <array>       // for array
#include <cerrno>      // for errno, EINTR, EAGAIN
#include <chrono>      // for duration_cast
#include <cstddef>     // for size_t
#include <cstring>     // for strerror
#include <format>      // for format
#include <optional>    // for optional
#include <string>      // for string
#include <string_view> // for string_view
#include <thread>      // for sleep_for
#include <utility>     // for move
#include <vector>      // for vector

#include <fcntl.h>    // for O_CLOEXEC, O_RDONLY, open
#include <poll.h>     // for poll, pollfd, POLLIN
#include <signal.h>   // for kill, SIGTERM, SIGKILL
#include <sys/wait.h> // for waitpid, WIFEXITED, WNOHANG
#include <unistd.h>   // for fork, execvp, pipe2, dup2, _exit

#include <quill/LogMacros.h>

#include "adapters/adapters_log.hpp"
#include "adapters/process.hpp"
#include "engine/engine_errors.hpp"
#include "engine/time.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::adapters {

namespace {

namespace pe = planorch::engine;

constexpr int EXEC_FAILED_STATUS = 127;
constexpr std::size_t READ_CHUNK = 4096;
constexpr int REAP_POLL_MS = 10;

tl::unexpected<pe::Error> errno_error(const std::string_view step, const int err) {
    return pe::make_error(pe::OrchErrc::IoError, std::format("{}: {}", step, std::strerror(err)));
}

/// Pipe whose ends close on destruction
class Pipe final {
public:
    Pipe() = default;
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;
    Pipe(Pipe &&) = delete;
    Pipe &operator=(Pipe &&) = delete;

    [[nodiscard]] pe::Status open() {
        std::array<int, 2> fds{-1, -1};
        if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
            return errno_error("pipe2", errno);
        }
        read_fd_ = fds[0];
        write_fd_ = fds[1];
        return {};
    }

    [[nodiscard]] int read_fd() const noexcept { return read_fd_; }
    [[nodiscard]] int write_fd() const noexcept { return write_fd_; }

    void close_read() noexcept { close_fd(read_fd_); }
    void close_write() noexcept { close_fd(write_fd_); }

private:
    static void close_fd(int &fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    int read_fd_{-1};
    int write_fd_{-1};
};

int reap(const pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    return status;
}

int poll_timeout_ms(
        const std::optional<pe::Time::SteadyPoint> &wake, const pe::Time::SteadyPoint now) {
    if (!wake.has_value()) {
        return -1;
    }
    if (*wake <= now) {
        return 0;
    }
    const auto remaining = std::chrono::ceil<pe::Millis>(*wake - now).count();
    return static_cast<int>(std::min<long long>(remaining, 60'000));
}

} // namespace

pe::Result<ProcessResult> run_process(const ProcessSpec &spec) {
    if (spec.executable.empty()) {
        return pe::make_error(pe::OrchErrc::InvalidParameter, "no executable given");
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argv_storage{spec.executable};
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char *> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto &arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string workdir = spec.working_dir.string();

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;
    for (Pipe *pipe : {&out_pipe, &err_pipe, &exec_pipe}) {
        if (auto opened = pipe->open(); !opened) {
            return tl::unexpected(opened.error());
        }
    }

    const auto started = pe::Time::steady_now();
    const pid_t pid = ::fork();
    if (pid < 0) {
        return errno_error("fork", errno);
    }
    if (pid == 0) {
        // Child: async-signal-safe calls only
        if (const int null_fd = ::open("/dev/null", O_RDONLY); null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
        }
        ::dup2(out_pipe.write_fd(), STDOUT_FILENO);
        ::dup2(err_pipe.write_fd(), STDERR_FILENO);
        if (workdir.empty() || ::chdir(workdir.c_str()) == 0) {
            ::execvp(argv[0], argv.data());
        }
        const int err = errno;
        [[maybe_unused]] const auto written = ::write(exec_pipe.write_fd(), &err, sizeof(err));
        ::_exit(EXEC_FAILED_STATUS);
    }

    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    // The exec pipe closes on a successful exec and carries errno otherwise
    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(exec_pipe.read_fd(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        reap(pid);
        PLANORCH_LOGC_WARN(
                AdapterLog::Process,
                "Cannot start '{}': {}",
                spec.executable,
                std::strerror(exec_errno));
        return errno_error(std::format("cannot start '{}'", spec.executable), exec_errno);
    }
    PLANORCH_LOGC_DEBUG(AdapterLog::Process, "Started '{}' as pid {}", spec.executable, pid);

    ProcessResult result{};
    std::array<pollfd, 2> fds{
            {{out_pipe.read_fd(), POLLIN, 0}, {err_pipe.read_fd(), POLLIN, 0}}};
    const std::array<std::string *, 2> sinks{&result.out, &result.err};
    std::array<char, READ_CHUNK> buffer{};
    std::size_t open_streams = fds.size();

    std::optional<pe::Time::SteadyPoint> deadline;
    if (spec.timeout.count() > 0) {
        deadline = started + spec.timeout;
    }
    std::optional<pe::Time::SteadyPoint> kill_at;
    bool killed = false;

    // SIGTERM at the deadline, SIGKILL after the grace period; true once killed
    const auto enforce_deadlines = [&](const pe::Time::SteadyPoint now) {
        if (deadline.has_value() && now >= *deadline) {
            PLANORCH_LOGC_WARN(
                    AdapterLog::Process,
                    "'{}' (pid {}) exceeded {} ms, terminating",
                    spec.executable,
                    pid,
                    spec.timeout.count());
            ::kill(pid, SIGTERM);
            result.timed_out = true;
            deadline.reset();
            kill_at = now + spec.kill_grace;
        }
        if (kill_at.has_value() && now >= *kill_at) {
            ::kill(pid, SIGKILL);
            return true;
        }
        return false;
    };

    while (open_streams > 0) {
        const auto now = pe::Time::steady_now();
        if (enforce_deadlines(now)) {
            // Grandchildren may hold the pipes open, stop reading
            killed = true;
            break;
        }

        const int wait_ms = poll_timeout_ms(kill_at.has_value() ? kill_at : deadline, now);
        const int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            ::kill(pid, SIGKILL);
            reap(pid);
            return errno_error("poll", err);
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            auto &entry = fds.at(i);
            if (entry.fd < 0 || (entry.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const auto n = ::read(entry.fd, buffer.data(), buffer.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                entry.fd = -1;
                --open_streams;
                continue;
            }
            auto &sink = *sinks.at(i);
            const auto room = spec.max_output_bytes - std::min(sink.size(), spec.max_output_bytes);
            const auto keep = std::min(room, static_cast<std::size_t>(n));
            sink.append(buffer.data(), keep);
            if (keep < static_cast<std::size_t>(n)) {
                result.output_truncated = true;
            }
        }
    }

    // The child may outlive its output streams, so the deadlines still apply
    int status = 0;
    while (!killed) {
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno_error("waitpid", errno);
        }
        const auto now = pe::Time::steady_now();
        if (enforce_deadlines(now)) {
            killed = true;
            break;
        }
        const int wait_ms = poll_timeout_ms(kill_at.has_value() ? kill_at : deadline, now);
        std::this_thread::sleep_for(
                pe::Millis{wait_ms < 0 ? REAP_POLL_MS : std::min(wait_ms, REAP_POLL_MS)});
    }
    if (killed) {
        status = reap(pid);
    }
    result.duration = std::chrono::duration_cast<pe::Millis>(pe::Time::steady_now() - started);
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }
    PLANORCH_LOGC_DEBUG(
            AdapterLog::Process,
            "'{}' (pid {}) finished in {} ms, exit {}",
            spec.executable,
            pid,
            result.duration.count(),
            result.exit_code.value_or(-1));
    return result;
}

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::size_t begin = 0;
    while (begin <= text.size()) {
        auto end = text.find('\n', begin);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(begin, end - begin);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
        begin = end + 1;
    }
    return lines;
}

std::string tail_lines(const std::string &text, const std::size_t max_lines) {
    const auto lines = split_lines(text);
    const auto first = lines.size() > max_lines ? lines.size() - max_lines : 0;
    std::string tail;
    for (auto i = first; i < lines.size(); ++i) {
        if (!tail.empty()) {
            tail += '\n';
        }
        tail += lines[i];
    }
    return tail;
}

} // namespace planorch::adapters
