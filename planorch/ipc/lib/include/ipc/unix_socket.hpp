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
 * @file unix_socket.hpp
 * @brief Unix-domain stream sockets and newline framing
 */

#ifndef PLANORCH_IPC_UNIX_SOCKET_HPP
#define PLANORCH_IPC_UNIX_SOCKET_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "engine/engine_errors.hpp"
#include "engine/time.hpp"

namespace planorch::ipc {

/**
 * @class UnixSocket
 * @brief Owning handle of a Unix-domain stream socket
 */
class UnixSocket final {
public:
    UnixSocket() = default;

    /**
     * Adopt an open descriptor
     */
    explicit UnixSocket(int fd) noexcept : fd_{fd} {}

    ~UnixSocket();

    UnixSocket(const UnixSocket &) = delete;
    UnixSocket &operator=(const UnixSocket &) = delete;
    UnixSocket(UnixSocket &&other) noexcept;
    UnixSocket &operator=(UnixSocket &&other) noexcept;

    /**
     * Bind and listen on a path with mode 0600
     *
     * A stale socket file left by a dead process is removed first.
     *
     * @param[in] path Socket path
     * @param[in] backlog Pending connection queue length
     * @return Listening socket; AlreadyRunning if another process accepts on
     *         the path; InvalidParameter if the path is too long; IoError
     */
    [[nodiscard]] static engine::Result<UnixSocket>
    listen(const std::filesystem::path &path, int backlog);

    /**
     * Connect to a listening path
     *
     * @return Connected socket; IoError if nothing accepts on the path
     */
    [[nodiscard]] static engine::Result<UnixSocket> connect(const std::filesystem::path &path);

    /**
     * Accept one connection
     *
     * @param[in] timeout Maximum wait
     * @return Connected socket, std::nullopt on timeout, or IoError
     */
    [[nodiscard]] engine::Result<std::optional<UnixSocket>> accept(engine::Millis timeout) const;

    /**
     * Write every byte, retrying short writes
     */
    [[nodiscard]] engine::Status write_all(std::string_view data) const;

    /**
     * Shut down both directions, waking any thread blocked on the socket
     */
    void shutdown() const noexcept;

    void close() noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
};

/**
 * @class LineReader
 * @brief Splits a socket byte stream into newline-terminated lines
 *
 * Bytes after a returned line stay buffered for the next call, so a timeout
 * never loses a partial line.
 */
class LineReader final {
public:
    /**
     * @param[in] socket Socket to read; must outlive the reader
     * @param[in] max_line Largest accepted line, newline excluded
     */
    LineReader(const UnixSocket &socket, std::size_t max_line);

    /**
     * Read the next line
     *
     * @param[in] timeout Maximum wait for a complete line
     * @return Line without its newline; std::nullopt at end of stream;
     *         IpcTimeout on timeout; ProtocolError if the line exceeds the
     *         limit; IoError on a read failure
     */
    [[nodiscard]] engine::Result<std::optional<std::string>> read_line(engine::Millis timeout);

private:
    const UnixSocket *socket_;
    std::size_t max_line_;
    std::string buffer_;
};

} // namespace planorch::ipc

#endif // PLANORCH_IPC_UNIX_SOCKET_HPP
