// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2026 Recede Authors
//
// Blocking POSIX TCP helpers for the solver wire protocol. Each exchange
// uses one connection: the client writes its request, half-closes, and
// reads the response until the server closes.

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace recede::session::tcp {

/// Owns a socket descriptor; closes it on destruction.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) noexcept : fd_(fd) {}
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    /// Throws std::system_error on failure.
    void writeAll(std::string_view data);

    /// Read until the peer closes; throws std::system_error on failure or timeout.
    [[nodiscard]] std::string readToEnd();

    /// No more writes from this side.
    void shutdownWrite() noexcept;

    /// Receive/send timeout; zero disables it.
    void setTimeout(std::chrono::milliseconds timeout);

private:
    int fd_{-1};
};

/// A port on `host` that was free when probed (bind to port 0).
/// Throws std::system_error.
[[nodiscard]] int findFreePort(const std::string& host = "127.0.0.1");

/// Connect, send `request`, read the full response. Throws std::system_error
/// on connection or I/O failure.
[[nodiscard]] std::string exchange(const std::string& host, int port,
                                   std::string_view request,
                                   std::chrono::milliseconds timeout);

/// Listening socket bound to host:port (port 0 picks a free one).
class Listener {
public:
    /// Throws std::system_error when the address cannot be bound.
    Listener(const std::string& host, int port);

    [[nodiscard]] int port() const noexcept { return port_; }

    /// Blocks until a client connects. Throws std::system_error.
    [[nodiscard]] Socket accept();

private:
    Socket socket_;
    int port_{0};
};

}  // namespace recede::session::tcp
