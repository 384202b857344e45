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
 * @file unix_socket.cpp
 * @brief Unix-domain stream sockets and newline framing
 */

#include <algorithm>    // for find, min
#include <array>        // for array
#include <cerrno>       // for errno, EINTR, EAGAIN
#include <chrono>       // for duration_cast
#include <cstddef>      // for size_t
#include <cstring>      // for strerror, memcpy
#include <filesystem>   // for path, exists, remove
#include <format>       // for format
#include <iterator>     // for next
#include <optional>     // for optional, nullopt
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for exchange, move

#include <poll.h>       // for poll, pollfd, POLLIN
#include <sys/socket.h> // for socket, bind, listen, accept4, send, recv
#include <sys/stat.h>   // for chmod, umask
#include <sys/un.h>     // for sockaddr_un
#include <unistd.h>     // for close

#include <quill/LogMacros.h>

#include "engine/engine_errors.hpp"
#include "engine/time.hpp"
#include "ipc/ipc_log.hpp"
#include "ipc/unix_socket.hpp"
#include "log/planorch_log_macros.hpp"

namespace planorch::ipc {

namespace {

/// Process umask replaced for the lifetime of the guard
class ScopedUmask final {
public:
    explicit ScopedUmask(const mode_t mask) noexcept : previous_{::umask(mask)} {}
    ~ScopedUmask() { ::umask(previous_); }

    ScopedUmask(const ScopedUmask &) = delete;
    ScopedUmask &operator=(const ScopedUmask &) = delete;
    ScopedUmask(ScopedUmask &&) = delete;
    ScopedUmask &operator=(ScopedUmask &&) = delete;

private:
    mode_t previous_;
};

namespace pe = planorch::engine;

constexpr std::size_t READ_CHUNK = 4096;

tl::unexpected<pe::Error>
socket_error(const std::string_view step, const std::filesystem::path &path) {
    const int err = errno;
    return pe::make_error(
            pe::OrchErrc::IoError,
            std::format("{} '{}': {}", step, path.string(), std::strerror(err)));
}

tl::unexpected<pe::Error> errno_error(const std::string_view step) {
    const int err = errno;
    return pe::make_error(pe::OrchErrc::IoError, std::format("{}: {}", step, std::strerror(err)));
}

pe::Result<sockaddr_un> make_address(const std::filesystem::path &path) {
    sockaddr_un address{};
    address.sun_family = AF_UNIX;
    const auto &native = path.native();
    if (native.empty() || native.size() >= sizeof(address.sun_path)) {
        return pe::make_error(
                pe::OrchErrc::InvalidParameter,
                std::format(
                        "socket path '{}' must be 1..{} bytes",
                        native,
                        sizeof(address.sun_path) - 1));
    }
    std::memcpy(static_cast<char *>(address.sun_path), native.data(), native.size());
    return address;
}

pe::Result<UnixSocket> open_socket(const std::filesystem::path &path) {
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return socket_error("create socket for", path);
    }
    return UnixSocket{fd};
}

/// Wait for input; returns false on timeout
pe::Result<bool> wait_readable(const int fd, const pe::Millis timeout) {
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    while (true) {
        const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno_error("poll");
        }
        return ready > 0;
    }
}

} // namespace

UnixSocket::~UnixSocket() { close(); }

UnixSocket::UnixSocket(UnixSocket &&other) noexcept : fd_{std::exchange(other.fd_, -1)} {}

UnixSocket &UnixSocket::operator=(UnixSocket &&other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void UnixSocket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void UnixSocket::shutdown() const noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

pe::Result<UnixSocket> UnixSocket::listen(const std::filesystem::path &path, const int backlog) {
    auto address = make_address(path);
    if (!address) {
        return tl::unexpected(address.error());
    }

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        if (auto live = connect(path); live) {
            return pe::make_error(
                    pe::OrchErrc::AlreadyRunning,
                    std::format("another server is listening on '{}'", path.string()));
        }
        PLANORCH_LOGC_WARN(IpcLog::Server, "Removing stale socket '{}'", path.string());
        std::filesystem::remove(path, ec);
        if (ec) {
            return pe::make_error(
                    pe::OrchErrc::IoError,
                    std::format("remove stale socket '{}': {}", path.string(), ec.message()));
        }
    }

    auto socket = open_socket(path);
    if (!socket) {
        return socket;
    }
    {
        // bind creates the socket file, never group or world accessible
        const ScopedUmask mask{S_IRWXG | S_IRWXO};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto *addr = reinterpret_cast<const sockaddr *>(&*address);
        if (::bind(socket->fd(), addr, sizeof(sockaddr_un)) != 0) {
            return socket_error("bind", path);
        }
    }
    if (::chmod(path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        return socket_error("chmod", path);
    }
    if (::listen(socket->fd(), backlog) != 0) {
        return socket_error("listen on", path);
    }
    return socket;
}

pe::Result<UnixSocket> UnixSocket::connect(const std::filesystem::path &path) {
    auto address = make_address(path);
    if (!address) {
        return tl::unexpected(address.error());
    }
    auto socket = open_socket(path);
    if (!socket) {
        return socket;
    }
    while (::connect(
                   socket->fd(),
                   // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
                   reinterpret_cast<const sockaddr *>(&*address),
                   sizeof(sockaddr_un)) != 0) {
        if (errno != EINTR) {
            return socket_error("connect to", path);
        }
    }
    return socket;
}

pe::Result<std::optional<UnixSocket>> UnixSocket::accept(const pe::Millis timeout) const {
    const auto readable = wait_readable(fd_, timeout);
    if (!readable) {
        return tl::unexpected(readable.error());
    }
    if (!*readable) {
        return std::optional<UnixSocket>{};
    }
    const int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
            return std::optional<UnixSocket>{};
        }
        return errno_error("accept");
    }
    return std::optional<UnixSocket>{UnixSocket{client}};
}

pe::Status UnixSocket::write_all(const std::string_view data) const {
    std::size_t written = 0;
    while (written < data.size()) {
        const auto sent = ::send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno_error("send");
        }
        written += static_cast<std::size_t>(sent);
    }
    return {};
}

LineReader::LineReader(const UnixSocket &socket, const std::size_t max_line)
        : socket_{&socket}, max_line_{max_line} {}

pe::Result<std::optional<std::string>> LineReader::read_line(const pe::Millis timeout) {
    const auto deadline = pe::Time::steady_now() + timeout;
    std::array<char, READ_CHUNK> chunk{};
    std::size_t scanned = 0;

    while (true) {
        const auto newline = std::find(
                std::next(buffer_.begin(), static_cast<std::ptrdiff_t>(scanned)),
                buffer_.end(),
                '\n');
        if (newline != buffer_.end()) {
            std::string line{buffer_.begin(), newline};
            buffer_.erase(buffer_.begin(), std::next(newline));
            if (line.size() > max_line_) {
                return pe::make_error(
                        pe::OrchErrc::ProtocolError,
                        std::format(
                                "line of {} bytes exceeds the {} byte limit",
                                line.size(),
                                max_line_));
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return std::optional<std::string>{std::move(line)};
        }
        scanned = buffer_.size();
        if (buffer_.size() > max_line_) {
            return pe::make_error(
                    pe::OrchErrc::ProtocolError,
                    std::format("line exceeds the {} byte limit", max_line_));
        }

        const auto remaining =
                std::chrono::duration_cast<pe::Millis>(deadline - pe::Time::steady_now());
        if (remaining.count() <= 0) {
            return pe::make_error(pe::OrchErrc::IpcTimeout, "no complete line before the deadline");
        }
        const auto readable = wait_readable(socket_->fd(), remaining);
        if (!readable) {
            return tl::unexpected(readable.error());
        }
        if (!*readable) {
            continue;
        }

        const auto received = ::recv(socket_->fd(), chunk.data(), chunk.size(), 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return errno_error("recv");
        }
        if (received == 0) {
            if (!buffer_.empty()) {
                PLANORCH_LOGC_DEBUG(
                        IpcLog::Connection,
                        "Discarding {} bytes of an unterminated line",
                        buffer_.size());
                buffer_.clear();
            }
            return std::optional<std::string>{};
        }
        buffer_.append(chunk.data(), static_cast<std::size_t>(received));
    }
}

} // namespace planorch::ipc
