// SPDX-License-Identifier: BSD-3-Clause
#include "recede/session/tcp.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <string>
#include <system_error>

namespace recede::session::tcp {

namespace {

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

sockaddr_in makeAddress(const std::string& host, int port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<std::uint16_t>(port));
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "invalid IPv4 address '" + host + "'");
    }
    return addr;
}

Socket openStream() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throwErrno("socket");
    return Socket(fd);
}

int boundPort(const Socket& s) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(s.fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        throwErrno("getsockname");
    return ntohs(addr.sin_port);
}

}  // namespace

// ─── Socket ──────────────────────────────────────────────────────────────────

Socket::~Socket() {
    if (fd_ >= 0) ::close(fd_);
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void Socket::writeAll(std::string_view data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throwErrno("send");
        }
        sent += static_cast<std::size_t>(n);
    }
}

std::string Socket::readToEnd() {
    std::string out;
    std::array<char, 4096> buf{};
    while (true) {
        ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            throwErrno("recv");
        }
        out.append(buf.data(), static_cast<std::size_t>(n));
    }
    return out;
}

void Socket::shutdownWrite() noexcept {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_WR);
}

void Socket::setTimeout(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        throwErrno("setsockopt");
    }
}

// ─── Free functions ──────────────────────────────────────────────────────────

int findFreePort(const std::string& host) {
    Socket s = openStream();
    sockaddr_in addr = makeAddress(host, 0);
    if (::bind(s.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        throwErrno("bind");
    return boundPort(s);
}

std::string exchange(const std::string& host, int port, std::string_view request,
                     std::chrono::milliseconds timeout) {
    Socket s = openStream();
    s.setTimeout(timeout);
    sockaddr_in addr = makeAddress(host, port);
    if (::connect(s.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        throwErrno("connect to " + host + ":" + std::to_string(port));
    s.writeAll(request);
    s.shutdownWrite();
    return s.readToEnd();
}

// ─── Listener ────────────────────────────────────────────────────────────────

Listener::Listener(const std::string& host, int port) : socket_(openStream()) {
    int reuse = 1;
    if (::setsockopt(socket_.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0)
        throwErrno("setsockopt");

    sockaddr_in addr = makeAddress(host, port);
    if (::bind(socket_.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0)
        throwErrno("bind " + host + ":" + std::to_string(port));
    if (::listen(socket_.fd(), 8) != 0) throwErrno("listen");
    port_ = boundPort(socket_);
}

Socket Listener::accept() {
    while (true) {
        int fd = ::accept4(socket_.fd(), nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) return Socket(fd);
        if (errno != EINTR) throwErrno("accept");
    }
}

}  // namespace recede::session::tcp
