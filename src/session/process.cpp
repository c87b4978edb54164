// SPDX-License-Identifier: BSD-3-Clause
#include "recede/session/process.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace recede::session {

ChildProcess::~ChildProcess() { release(); }

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
    }
    return *this;
}

ChildProcess ChildProcess::spawn(const std::string& executable,
                                 const std::vector<std::string>& args) {
    // argv is built before fork so the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) {
        ::execvp(executable.c_str(), argv.data());
        ::_exit(127);
    }
    return ChildProcess(pid);
}

bool ChildProcess::isRunning() {
    if (pid_ <= 0 || reaped_) return false;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (r == pid_) {
        reaped_ = true;
        if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
        return false;
    }
    // ECHILD: reaped elsewhere
    reaped_ = true;
    return false;
}

void ChildProcess::terminate() noexcept {
    if (pid_ > 0 && !reaped_) ::kill(pid_, SIGTERM);
}

void ChildProcess::kill() noexcept {
    if (pid_ > 0 && !reaped_) ::kill(pid_, SIGKILL);
}

void ChildProcess::release() noexcept {
    if (pid_ <= 0 || reaped_) return;
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
}

}  // namespace recede::session
